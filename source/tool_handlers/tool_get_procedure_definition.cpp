#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "get_procedure_definition".
// Returns the source text of one stored procedure.

static mcp_tools::ToolOutcome handle_get_procedure_definition(const json &arguments,
                                                              const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    std::string schema = reader.required_string("schema");
    std::string name = reader.required_string("name");
    if (!reader.ok()) {
        return reader.failure("Database, schema and procedure name are required");
    }

    debug_log::log("get_procedure_definition invoked for " + database + "." + schema + "." + name);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_parameterized_query(
        "SELECT pm.definition AS [Definition] "
        "FROM sys.procedures p "
        "INNER JOIN sys.sql_modules pm ON p.object_id = pm.object_id "
        "WHERE SCHEMA_NAME(p.schema_id) = ? AND p.name = ?",
        {schema, name});

    json rows = row_materializer::materialize(*cursor);
    if (rows.empty()) {
        return mcp_tools::tool_failure(json_rpc::INVALID_PARAMS, "Procedure not found");
    }

    // Encrypted modules have no readable definition.
    json definition = rows[0]["Definition"];
    if (!definition.is_string()) {
        return mcp_tools::tool_failure(json_rpc::INVALID_PARAMS, "Procedure definition is not available");
    }

    json payload;
    payload["definition"] = definition;
    return mcp_tools::tool_success(payload);
}

namespace tool_get_procedure_definition {

void register_tool() {
    mcp_tools::register_tool({
        "get_procedure_definition",
        "Get the definition of a stored procedure",
        {
            {"database", "Database name"},
            {"schema", "Schema name"},
            {"name", "Procedure name"}
        },
        {"database", "schema", "name"},
        handle_get_procedure_definition
    });
}

} // namespace tool_get_procedure_definition
