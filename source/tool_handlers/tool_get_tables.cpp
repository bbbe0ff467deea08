#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "get_tables".
// Lists tables and views of one database, ordered by schema then name.
// Like get_procedures, the documented "schema" argument does not filter.

static mcp_tools::ToolOutcome handle_get_tables(const json &arguments, const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    if (!reader.ok()) {
        return reader.failure("Database name is required");
    }

    debug_log::log("get_tables invoked for database " + database);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_query(
        "SELECT t.TABLE_SCHEMA, t.TABLE_NAME, t.TABLE_TYPE "
        "FROM INFORMATION_SCHEMA.TABLES t "
        "ORDER BY t.TABLE_SCHEMA, t.TABLE_NAME");

    json tables = json::array();
    for (auto &row : row_materializer::materialize(*cursor)) {
        json table;
        table["schema"] = row["TABLE_SCHEMA"];
        table["name"] = row["TABLE_NAME"];
        table["type"] = row["TABLE_TYPE"];
        tables.push_back(table);
    }

    json payload;
    payload["tables"] = tables;
    return mcp_tools::tool_success(payload);
}

namespace tool_get_tables {

void register_tool() {
    mcp_tools::register_tool({
        "get_tables",
        "List all tables in a specified database",
        {
            {"database", "Database name"},
            {"schema", "Optional schema name, defaults to 'dbo'"}
        },
        {"database"},
        handle_get_tables
    });
}

} // namespace tool_get_tables
