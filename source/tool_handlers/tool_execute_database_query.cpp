#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "execute_database_query".
// Runs caller-supplied SQL in the context of one database and returns its rows.

static mcp_tools::ToolOutcome handle_execute_database_query(const json &arguments,
                                                            const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    std::string query = reader.required_string("query");
    if (!reader.ok()) {
        return reader.failure("Parameters are required");
    }

    debug_log::log("execute_database_query invoked for database " + database);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_query(query);

    json payload;
    payload["results"] = row_materializer::materialize(*cursor);
    return mcp_tools::tool_success(payload);
}

namespace tool_execute_database_query {

void register_tool() {
    mcp_tools::register_tool({
        "execute_database_query",
        "Execute a SQL query in the context of a specific database",
        {
            {"database", "Database name"},
            {"query", "SQL query to execute"}
        },
        {"database", "query"},
        handle_execute_database_query
    });
}

} // namespace tool_execute_database_query
