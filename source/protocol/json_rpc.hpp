#ifndef SQLMCPS_JSON_RPC_HPP
#define SQLMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization. Objects keep insertion
// order so that row columns and payload fields come out as they were built.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::ordered_json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// The only protocol version we accept.
extern const char *const JSONRPC_VERSION;

// A decoded request. id is null when the request carried none (notification).
// raw_params is the params object exactly as it appeared on the line.
struct Request {
    std::string protocol_version;
    json id;
    std::string method;
    json params = json::object();
    std::string raw_params;
};

// Result of decoding one input line.
// On failure error_code is PARSE_ERROR or INVALID_REQUEST and request_id holds
// the id when one could be read before the failure.
struct DecodeResult {
    bool success = false;
    Request request;
    int error_code = 0;
    std::string error_message;
    json request_id;
};

struct ErrorObject {
    int code = 0;
    std::string message;
};

// An outgoing response. Null id and absent members are omitted when encoded.
struct Response {
    json id;
    bool has_result = false;
    json result;
    bool has_error = false;
    ErrorObject error;
};

// Decode one line of input into a request.
DecodeResult decode_request(const std::string &line);

// Serialize a response as a single line (no trailing newline).
std::string encode_response(const Response &response);

// Parse a serialized response. Throws json::exception on malformed input.
Response decode_response(const std::string &line);

// Convert a response to its JSON object form.
json to_json(const Response &response);

// Build a JSON-RPC 2.0 success response.
Response build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
Response build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Tool result envelope carrying the payload serialized as text, isError false.
json build_tool_result(const json &payload);

// Tool result envelope carrying a plain message, isError true.
json build_tool_error_result(const std::string &message);

} // namespace json_rpc

#endif // SQLMCPS_JSON_RPC_HPP
