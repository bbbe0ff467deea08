#ifndef SQLMCPS_TOOL_HANDLERS_HPP
#define SQLMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include <memory>
#include <string>

#include "database/database_driver_abi.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry.
void register_all_tools();

// Open a fresh connection and switch it to the given database with USE.
std::unique_ptr<database_driver::Connection> open_database(const mcp_tools::ToolContext &context,
                                                           const std::string &database);

} // namespace tool_handlers

#endif // SQLMCPS_TOOL_HANDLERS_HPP
