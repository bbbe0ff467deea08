#include "protocol/json_rpc.hpp"
#include "protocol/json_text.hpp"

namespace json_rpc {

const char *const JSONRPC_VERSION = "2.0";

static const char *const INVALID_REQUEST_MESSAGE = "Invalid JSON-RPC 2.0 request";

static bool is_valid_id(const json &id) {
    return id.is_null() || id.is_string() || id.is_number();
}

static DecodeResult decode_failure(int error_code, const std::string &error_message, const json &request_id) {
    DecodeResult result;
    result.success = false;
    result.error_code = error_code;
    result.error_message = error_message;
    result.request_id = request_id;
    return result;
}

DecodeResult decode_request(const std::string &line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        return decode_failure(PARSE_ERROR, error.what(), nullptr);
    }

    if (!message.is_object()) {
        return decode_failure(PARSE_ERROR, "Request must be a JSON object", nullptr);
    }

    // Shape checks first: a field of the wrong type means the line does not
    // describe a request at all.
    json request_id = nullptr;
    auto id_iterator = message.find("id");
    if (id_iterator != message.end()) {
        if (!is_valid_id(*id_iterator)) {
            return decode_failure(PARSE_ERROR, "Request id must be a string, a number or null", nullptr);
        }
        request_id = *id_iterator;
    }

    auto method_iterator = message.find("method");
    if (method_iterator != message.end() && !method_iterator->is_string() && !method_iterator->is_null()) {
        return decode_failure(PARSE_ERROR, "Request method must be a string", request_id);
    }

    auto params_iterator = message.find("params");
    if (params_iterator != message.end() && !params_iterator->is_object() && !params_iterator->is_null()) {
        return decode_failure(PARSE_ERROR, "Request params must be an object", request_id);
    }

    // "jsonrpc" is the JSON-RPC 2.0 field; "protocolVersion" is accepted as an alias.
    auto version_iterator = message.find("jsonrpc");
    if (version_iterator == message.end()) {
        version_iterator = message.find("protocolVersion");
    }
    if (version_iterator == message.end() || !version_iterator->is_string() ||
        version_iterator->get<std::string>() != JSONRPC_VERSION) {
        return decode_failure(INVALID_REQUEST, INVALID_REQUEST_MESSAGE, request_id);
    }

    if (method_iterator == message.end() || method_iterator->is_null()) {
        return decode_failure(INVALID_REQUEST, INVALID_REQUEST_MESSAGE, request_id);
    }

    DecodeResult result;
    result.success = true;
    result.request.protocol_version = JSONRPC_VERSION;
    result.request.id = request_id;
    result.request.method = method_iterator->get<std::string>();
    if (params_iterator != message.end() && params_iterator->is_object()) {
        result.request.params = *params_iterator;
        json_text::member_text(line, "params", result.request.raw_params);
    }
    result.request_id = request_id;
    return result;
}

json to_json(const Response &response) {
    json output;
    output["jsonrpc"] = JSONRPC_VERSION;
    if (!response.id.is_null()) {
        output["id"] = response.id;
    }
    if (response.has_result) {
        output["result"] = response.result;
    }
    if (response.has_error) {
        output["error"]["code"] = response.error.code;
        output["error"]["message"] = response.error.message;
    }
    return output;
}

std::string encode_response(const Response &response) {
    // Invalid UTF-8 is replaced rather than thrown; callers sanitize text
    // from the database but error messages can come from anywhere.
    return to_json(response).dump(-1, ' ', false, json::error_handler_t::replace);
}

Response decode_response(const std::string &line) {
    json message = json::parse(line);

    Response response;
    if (message.contains("id")) {
        response.id = message["id"];
    }
    if (message.contains("result")) {
        response.has_result = true;
        response.result = message["result"];
    }
    if (message.contains("error")) {
        response.has_error = true;
        response.error.code = message["error"].at("code").get<int>();
        response.error.message = message["error"].at("message").get<std::string>();
    }
    return response;
}

Response build_response(const json &request_id, const json &result_payload) {
    Response response;
    response.id = request_id;
    response.has_result = true;
    response.result = result_payload;
    return response;
}

Response build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    Response response;
    response.id = request_id;
    response.has_error = true;
    response.error.code = error_code;
    response.error.message = error_message;
    return response;
}

json build_tool_result(const json &payload) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = false;
    return result;
}

json build_tool_error_result(const std::string &message) {
    json error_content;
    error_content["type"] = "text";
    error_content["text"] = message;

    json result;
    result["content"] = json::array({error_content});
    result["isError"] = true;
    return result;
}

} // namespace json_rpc
