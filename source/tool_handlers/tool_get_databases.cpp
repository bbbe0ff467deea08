#include "tool_handlers/tool_handlers.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "get_databases".
// Lists user databases; the four system databases (master, tempdb, model, msdb)
// have the lowest ids and are left out.

static mcp_tools::ToolOutcome handle_get_databases(const json &arguments, const mcp_tools::ToolContext &context) {
    (void)arguments; // No arguments.

    debug_log::log("get_databases invoked");
    std::unique_ptr<database_driver::Connection> connection = context.open_connection();
    std::unique_ptr<database_driver::ResultCursor> cursor =
        connection->execute_query("SELECT name FROM sys.databases WHERE database_id > 4");

    json databases = json::array();
    for (auto &row : row_materializer::materialize(*cursor)) {
        databases.push_back(row["name"]);
    }

    json payload;
    payload["databases"] = databases;
    return mcp_tools::tool_success(payload);
}

namespace tool_get_databases {

void register_tool() {
    mcp_tools::register_tool({
        "get_databases",
        "List all available SQL Server databases, response is in jsonrpc 2.0 format",
        {},
        {},
        handle_get_databases
    });
}

} // namespace tool_get_databases
