#ifndef SQLMCPS_MCP_TOOLS_HPP
#define SQLMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and lookup of tools.
// A tool's descriptor and its handler are registered together, so the list
// returned by tools/list and the set of callable tools cannot drift apart.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

#include "database/database_driver_abi.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_tools {

using json = json_rpc::json;

// Everything a handler needs besides its arguments.
struct ToolContext {
    database_driver::ConnectionFactory open_connection;
    // Source text of the call's arguments object; empty when not called from a request line.
    std::string raw_arguments;
};

// Outcome of one tool invocation. On success payload is the tool's result
// object; on failure error_code/error_message describe what went wrong.
struct ToolOutcome {
    bool success = false;
    json payload;
    int error_code = 0;
    std::string error_message;
};

ToolOutcome tool_success(const json &payload);
ToolOutcome tool_failure(int error_code, const std::string &error_message);

// A tool handler function: receives the "arguments" object of tools/call.
// Database failures are thrown as database_driver::DatabaseError.
using ToolHandler = std::function<ToolOutcome(const json &arguments, const ToolContext &context)>;

// One documented argument of a tool.
struct ToolParameter {
    std::string name;
    std::string description;
};

// Description of a registered tool.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::vector<std::string> required;
    ToolHandler handler;
};

// Register a tool. A second registration under the same name replaces the first.
void register_tool(const ToolDefinition &definition);

// Descriptor of one tool as sent to clients: name, description, parameters,
// required, plus the equivalent JSON Schema as inputSchema.
json describe_tool(const ToolDefinition &definition);

// Build the response payload for tools/list, in registration order.
json build_tools_list_response();

// Find a tool by exact name. Returns nullptr when none is registered.
const ToolDefinition *find_tool(const std::string &tool_name);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

} // namespace mcp_tools

#endif // SQLMCPS_MCP_TOOLS_HPP
