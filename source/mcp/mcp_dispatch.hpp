#ifndef SQLMCPS_MCP_DISPATCH_HPP
#define SQLMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes one incoming line to the appropriate handler and describes the reply.

#include <string>

#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_dispatch {

using json = json_rpc::json;

// What to send back for one input line. wrap_as_tool is set once a tool was
// identified, so the reply goes out inside a tool result envelope.
// failure_detail is set when an exception was caught, for logging.
struct Reply {
    json id;
    bool success = false;
    json payload;
    int error_code = 0;
    std::string error_message;
    bool wrap_as_tool = false;
    std::string failure_detail;
};

// Static answer to "initialize".
json build_initialize_result();

// Decode and dispatch one line of input.
Reply dispatch_line(const std::string &line, const mcp_tools::ToolContext &context);

// Dispatch an already decoded request.
Reply dispatch_request(const json_rpc::Request &request, const mcp_tools::ToolContext &context);

} // namespace mcp_dispatch

#endif // SQLMCPS_MCP_DISPATCH_HPP
