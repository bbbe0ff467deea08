#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "get_procedures".
// Lists the stored procedures of one database across all schemas. The
// documented "schema" argument is accepted but not used as a filter.

static mcp_tools::ToolOutcome handle_get_procedures(const json &arguments, const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    if (!reader.ok()) {
        return reader.failure("Database name is required");
    }

    debug_log::log("get_procedures invoked for database " + database);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_query(
        "SELECT SCHEMA_NAME(p.schema_id) AS [Schema], p.name AS [Name] "
        "FROM sys.procedures p "
        "ORDER BY [Schema], [Name]");

    json procedures = json::array();
    for (auto &row : row_materializer::materialize(*cursor)) {
        json procedure;
        procedure["schema"] = row["Schema"];
        procedure["name"] = row["Name"];
        procedures.push_back(procedure);
    }

    json payload;
    payload["procedures"] = procedures;
    return mcp_tools::tool_success(payload);
}

namespace tool_get_procedures {

void register_tool() {
    mcp_tools::register_tool({
        "get_procedures",
        "List all stored procedures in a specified database",
        {
            {"database", "Database name"},
            {"schema", "Optional schema name, defaults to 'dbo'"}
        },
        {"database"},
        handle_get_procedures
    });
}

} // namespace tool_get_procedures
