#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "execute_system_query".
// Runs caller-supplied SQL at server level, in whatever database the login defaults to.

static mcp_tools::ToolOutcome handle_execute_system_query(const json &arguments,
                                                          const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string query = reader.required_string("query");
    if (!reader.ok()) {
        return reader.failure("SQL query is required");
    }

    debug_log::log("execute_system_query invoked");
    std::unique_ptr<database_driver::Connection> connection = context.open_connection();
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_query(query);

    json payload;
    payload["results"] = row_materializer::materialize(*cursor);
    return mcp_tools::tool_success(payload);
}

namespace tool_execute_system_query {

void register_tool() {
    mcp_tools::register_tool({
        "execute_system_query",
        "Execute a SQL query at the server instance level (no database context required)",
        {
            {"query", "SQL query to execute"}
        },
        {"query"},
        handle_execute_system_query
    });
}

} // namespace tool_execute_system_query
