#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_text.hpp"

#include <exception>

namespace mcp_dispatch {

// MCP protocol revision reported to clients.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "SQL Server MCP";
static const std::string SERVER_VERSION = "1.0.0";

static Reply success_reply(const json &request_id, const json &payload, bool wrap_as_tool) {
    Reply reply;
    reply.id = request_id;
    reply.success = true;
    reply.payload = payload;
    reply.wrap_as_tool = wrap_as_tool;
    return reply;
}

static Reply error_reply(const json &request_id, int error_code, const std::string &error_message,
                         bool wrap_as_tool) {
    Reply reply;
    reply.id = request_id;
    reply.success = false;
    reply.error_code = error_code;
    reply.error_message = error_message;
    reply.wrap_as_tool = wrap_as_tool;
    return reply;
}

json build_initialize_result() {
    json capabilities;
    capabilities["databases"] = true;
    capabilities["tables"] = true;
    capabilities["columns"] = true;
    capabilities["procedures"] = true;
    capabilities["queryExecution"] = true;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["name"] = SERVER_NAME;
    result["version"] = SERVER_VERSION;
    result["capabilities"] = capabilities;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["serverInfo"] = server_info;
    return result;
}

// Handle the "tools/call" request. Everything after the tool lookup is
// reported inside the tool result envelope.
static Reply handle_tools_call(const json_rpc::Request &request, const mcp_tools::ToolContext &context) {
    const json &params = request.params;
    if (!params.contains("name") || !params["name"].is_string()) {
        return error_reply(request.id, json_rpc::INVALID_PARAMS, "Tool name is required", false);
    }
    std::string tool_name = params["name"].get<std::string>();

    const mcp_tools::ToolDefinition *tool = mcp_tools::find_tool(tool_name);
    if (tool == nullptr) {
        return error_reply(request.id, json_rpc::METHOD_NOT_FOUND, "Unknown tool: " + tool_name, false);
    }

    json arguments = json::object();
    if (params.contains("arguments")) {
        arguments = params["arguments"];
    }

    mcp_tools::ToolContext call_context = context;
    call_context.raw_arguments.clear();
    json_text::member_text(request.raw_params, "arguments", call_context.raw_arguments);

    try {
        mcp_tools::ToolOutcome outcome = tool->handler(arguments, call_context);
        if (outcome.success) {
            return success_reply(request.id, outcome.payload, true);
        }
        return error_reply(request.id, outcome.error_code, outcome.error_message, true);
    } catch (const std::exception &error) {
        Reply reply = error_reply(request.id, json_rpc::INTERNAL_ERROR, error.what(), true);
        reply.failure_detail = std::string("Tool ") + tool_name + " failed: " + error.what();
        return reply;
    }
}

Reply dispatch_request(const json_rpc::Request &request, const mcp_tools::ToolContext &context) {
    try {
        if (request.method == "initialize") {
            return success_reply(request.id, build_initialize_result(), false);
        }
        if (request.method == "notifications/initialized") {
            // Acknowledged with an empty result even though it is a notification.
            return success_reply(request.id, json::object(), false);
        }
        if (request.method == "tools/list") {
            return success_reply(request.id, mcp_tools::build_tools_list_response(), false);
        }
        if (request.method == "tools/call") {
            return handle_tools_call(request, context);
        }

        return error_reply(request.id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + request.method, false);
    } catch (const std::exception &error) {
        Reply reply = error_reply(request.id, json_rpc::INTERNAL_ERROR, error.what(), false);
        reply.failure_detail = "Request " + request.method + " failed: " + error.what();
        return reply;
    }
}

Reply dispatch_line(const std::string &line, const mcp_tools::ToolContext &context) {
    json_rpc::DecodeResult decoded = json_rpc::decode_request(line);
    if (!decoded.success) {
        return error_reply(decoded.request_id, decoded.error_code, decoded.error_message, false);
    }
    return dispatch_request(decoded.request, context);
}

} // namespace mcp_dispatch
