// Tests for request decoding and response encoding.

#include "protocol/json_rpc.hpp"
#include "protocol/json_text.hpp"
#include "test_support.hpp"

#include <string>
#include <utility>
#include <vector>

using json = json_rpc::json;
using test_support::expect;

namespace test_json_rpc {

static bool test_decode_valid_request() {
    auto decoded = json_rpc::decode_request(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"get_databases"}})");
    return expect(decoded.success && decoded.request.method == "tools/call" && decoded.request.id == 7 &&
                      decoded.request.params["name"] == "get_databases",
                  "Valid request decodes with method, id and params");
}

static bool test_decode_protocol_version_alias() {
    auto decoded = json_rpc::decode_request(R"({"protocolVersion":"2.0","id":1,"method":"tools/list"})");
    return expect(decoded.success && decoded.request.method == "tools/list",
                  "protocolVersion is accepted in place of jsonrpc");
}

static bool test_decode_without_params() {
    auto decoded = json_rpc::decode_request(R"({"jsonrpc":"2.0","id":"abc","method":"initialize"})");
    return expect(decoded.success && decoded.request.params.is_object() && decoded.request.params.empty() &&
                      decoded.request.id == "abc",
                  "Missing params decode as an empty object, string id kept");
}

static bool test_decode_malformed_json() {
    auto decoded = json_rpc::decode_request("{not json");
    return expect(!decoded.success && decoded.error_code == json_rpc::PARSE_ERROR &&
                      !decoded.error_message.empty() && decoded.request_id.is_null(),
                  "Malformed JSON is a ParseError without id");
}

static bool test_decode_empty_line() {
    auto decoded = json_rpc::decode_request("");
    return expect(!decoded.success && decoded.error_code == json_rpc::PARSE_ERROR, "Empty line is a ParseError");
}

static bool test_decode_non_object() {
    auto decoded = json_rpc::decode_request("[1,2,3]");
    return expect(!decoded.success && decoded.error_code == json_rpc::PARSE_ERROR,
                  "A JSON array is a ParseError");
}

static bool test_decode_wrong_field_types() {
    bool all_passed = true;
    auto method_number = json_rpc::decode_request(R"({"jsonrpc":"2.0","id":1,"method":5})");
    all_passed &= expect(!method_number.success && method_number.error_code == json_rpc::PARSE_ERROR,
                         "Numeric method is a ParseError");
    auto params_array = json_rpc::decode_request(R"({"jsonrpc":"2.0","id":1,"method":"x","params":[1]})");
    all_passed &= expect(!params_array.success && params_array.error_code == json_rpc::PARSE_ERROR,
                         "Array params is a ParseError");
    auto id_object = json_rpc::decode_request(R"({"jsonrpc":"2.0","id":{"a":1},"method":"x"})");
    all_passed &= expect(!id_object.success && id_object.error_code == json_rpc::PARSE_ERROR,
                         "Object id is a ParseError");
    return all_passed;
}

static bool test_decode_missing_version() {
    auto decoded = json_rpc::decode_request(R"({"id":4,"method":"tools/list"})");
    return expect(!decoded.success && decoded.error_code == json_rpc::INVALID_REQUEST &&
                      decoded.error_message == "Invalid JSON-RPC 2.0 request" && decoded.request_id == 4,
                  "Missing version is an InvalidRequest that keeps the id");
}

static bool test_decode_wrong_version() {
    bool all_passed = true;
    auto old_version = json_rpc::decode_request(R"({"jsonrpc":"1.0","id":4,"method":"tools/list"})");
    all_passed &= expect(!old_version.success && old_version.error_code == json_rpc::INVALID_REQUEST,
                         "Version 1.0 is an InvalidRequest");
    auto numeric_version = json_rpc::decode_request(R"({"jsonrpc":2.0,"id":4,"method":"tools/list"})");
    all_passed &= expect(!numeric_version.success && numeric_version.error_code == json_rpc::INVALID_REQUEST,
                         "Numeric version is an InvalidRequest");
    return all_passed;
}

static bool test_decode_missing_method() {
    auto decoded = json_rpc::decode_request(R"({"jsonrpc":"2.0","id":9})");
    return expect(!decoded.success && decoded.error_code == json_rpc::INVALID_REQUEST,
                  "Missing method is an InvalidRequest");
}

static bool test_encode_success() {
    auto line = json_rpc::encode_response(json_rpc::build_response(3, json{{"tools", json::array()}}));
    return expect(line == R"({"jsonrpc":"2.0","id":3,"result":{"tools":[]}})",
                  "Success response encodes on one line with jsonrpc, id, result");
}

static bool test_encode_omits_null_id() {
    auto line = json_rpc::encode_response(json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "bad"));
    return expect(line == R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"bad"}})",
                  "Null id is omitted and error is complete");
}

static bool test_response_round_trip() {
    bool all_passed = true;

    json_rpc::Response success = json_rpc::build_response("req-1", json{{"a", 1}, {"b", json::array({true})}});
    json_rpc::Response decoded_success = json_rpc::decode_response(json_rpc::encode_response(success));
    all_passed &= expect(decoded_success.id == success.id && decoded_success.has_result &&
                             decoded_success.result == success.result && !decoded_success.has_error,
                         "Success response survives encode/decode");

    json_rpc::Response failure = json_rpc::build_error_response(12, json_rpc::INVALID_PARAMS, "Procedure not found");
    failure.has_result = true;
    failure.result = json_rpc::build_tool_error_result("Procedure not found");
    json_rpc::Response decoded_failure = json_rpc::decode_response(json_rpc::encode_response(failure));
    all_passed &= expect(decoded_failure.id == 12 && decoded_failure.has_error &&
                             decoded_failure.error.code == json_rpc::INVALID_PARAMS &&
                             decoded_failure.error.message == "Procedure not found" &&
                             decoded_failure.result == failure.result,
                         "Tool error response survives encode/decode with both members");
    return all_passed;
}

static bool test_tool_result_envelopes() {
    bool all_passed = true;

    json wrapped = json_rpc::build_tool_result(json{{"tables", json::array()}});
    all_passed &= expect(wrapped["content"].size() == 1 && wrapped["content"][0]["type"] == "text" &&
                             wrapped["content"][0]["text"] == R"({"tables":[]})" && wrapped["isError"] == false,
                         "Tool result carries the payload as JSON text with isError false");

    json error = json_rpc::build_tool_error_result("Database name is required");
    all_passed &= expect(error["content"][0]["text"] == "Database name is required" && error["isError"] == true,
                         "Tool error result carries the plain message with isError true");
    return all_passed;
}

static bool test_raw_params_kept() {
    auto decoded = json_rpc::decode_request(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params": {"name":"x","arguments":{"n":1.50}} })");
    return expect(decoded.success && decoded.request.raw_params == R"({"name":"x","arguments":{"n":1.50}})",
                  "Params object is kept as written on the line");
}

static bool test_object_members_source_text() {
    std::vector<std::pair<std::string, std::string>> members;
    bool parsed = json_text::object_members(
        R"( { "a" : 1.50, "b":1e2 ,"c\u00e9":"x\"y", "d":[1, {"e":"]"}], "f":null } )", members);
    bool all_passed = true;
    all_passed &= expect(parsed && members.size() == 5, "All members of the object are found");
    if (members.size() != 5) {
        return false;
    }
    all_passed &= expect(members[0].first == "a" && members[0].second == "1.50", "Number keeps its trailing zero");
    all_passed &= expect(members[1].first == "b" && members[1].second == "1e2", "Exponent form is kept");
    all_passed &= expect(members[2].first == "c\xC3\xA9" && members[2].second == R"("x\"y")",
                         "Escaped key is decoded, string value keeps its escapes");
    all_passed &= expect(members[3].second == R"([1, {"e":"]"}])", "Nested value is taken whole");
    all_passed &= expect(members[4].second == "null", "Literal is taken whole");
    return all_passed;
}

static bool test_member_text_lookup() {
    std::string value;
    bool all_passed = true;
    all_passed &= expect(json_text::member_text(R"({"k":1,"k":2.0})", "k", value) && value == "2.0",
                         "Repeated key resolves to the last occurrence");
    all_passed &= expect(!json_text::member_text(R"({"k":1})", "missing", value), "Absent key is reported");
    all_passed &= expect(!json_text::member_text("[1,2]", "k", value), "Non-object text has no members");
    all_passed &= expect(!json_text::member_text("", "k", value), "Empty text has no members");
    std::vector<std::pair<std::string, std::string>> members;
    all_passed &= expect(json_text::object_members("{ }", members) && members.empty(), "Empty object has no members");
    return all_passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_decode_valid_request();
    all_passed &= test_decode_protocol_version_alias();
    all_passed &= test_decode_without_params();
    all_passed &= test_decode_malformed_json();
    all_passed &= test_decode_empty_line();
    all_passed &= test_decode_non_object();
    all_passed &= test_decode_wrong_field_types();
    all_passed &= test_decode_missing_version();
    all_passed &= test_decode_wrong_version();
    all_passed &= test_decode_missing_method();
    all_passed &= test_encode_success();
    all_passed &= test_encode_omits_null_id();
    all_passed &= test_response_round_trip();
    all_passed &= test_tool_result_envelopes();
    all_passed &= test_raw_params_kept();
    all_passed &= test_object_members_source_text();
    all_passed &= test_member_text_lookup();
    return all_passed;
}

} // namespace test_json_rpc
