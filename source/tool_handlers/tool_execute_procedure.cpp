#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "protocol/json_text.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <map>
#include <utility>
#include <vector>

using json = json_rpc::json;

// Tool handler for "execute_procedure".
// Invokes a stored procedure with named parameters. Every parameter value is
// passed as its JSON text exactly as the client wrote it: 42 goes over as "42",
// 1.50 as "1.50", "abc" as "\"abc\"".

// Prefix '@' when missing and check the name is a plain T-SQL parameter name,
// since it ends up in the EXEC statement text.
static bool normalize_parameter_name(const std::string &key, std::string &output_name) {
    output_name = (!key.empty() && key[0] == '@') ? key : "@" + key;
    if (output_name.size() < 2) {
        return false;
    }
    for (size_t index = 1; index < output_name.size(); ++index) {
        unsigned char character = static_cast<unsigned char>(output_name[index]);
        bool allowed = std::isalnum(character) || character == '_' || character == '#' || character == '$' ||
                       character >= 0x80u;
        if (!allowed) {
            return false;
        }
    }
    return true;
}

static mcp_tools::ToolOutcome handle_execute_procedure(const json &arguments, const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    std::string procedure = reader.required_string("procedure");
    std::string schema = reader.optional_string("schema", "dbo");
    json supplied_parameters = reader.optional_object("parameters");
    if (!reader.ok()) {
        return reader.failure("Database and Procedure Parameters are required");
    }

    // Source text of each value, keyed by name; later duplicates win as in the parsed tree.
    std::map<std::string, std::string> raw_values;
    std::string raw_parameters;
    std::vector<std::pair<std::string, std::string>> raw_members;
    if (json_text::member_text(context.raw_arguments, "parameters", raw_parameters) &&
        json_text::object_members(raw_parameters, raw_members)) {
        for (const auto &member : raw_members) {
            raw_values[member.first] = member.second;
        }
    }

    std::vector<database_driver::ProcedureParameter> parameters;
    for (auto iterator = supplied_parameters.begin(); iterator != supplied_parameters.end(); ++iterator) {
        database_driver::ProcedureParameter parameter;
        if (!normalize_parameter_name(iterator.key(), parameter.name)) {
            return mcp_tools::tool_failure(json_rpc::INVALID_PARAMS,
                                           "Invalid procedure parameter name: " + iterator.key());
        }
        auto raw_iterator = raw_values.find(iterator.key());
        parameter.value = raw_iterator != raw_values.end() ? raw_iterator->second : iterator.value().dump();
        parameters.push_back(parameter);
    }

    debug_log::log("execute_procedure invoked for " + database + "." + schema + "." + procedure);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor = connection->execute_procedure(schema, procedure, parameters);

    json payload;
    payload["results"] = row_materializer::materialize(*cursor);
    return mcp_tools::tool_success(payload);
}

namespace tool_execute_procedure {

void register_tool() {
    mcp_tools::register_tool({
        "execute_procedure",
        "Execute a stored procedure",
        {
            {"database", "Database name"},
            {"schema", "Optional schema name, defaults to 'dbo'"},
            {"procedure", "Procedure name"},
            {"parameters", "Dictionary of parameter names and values"}
        },
        {"database", "procedure"},
        handle_execute_procedure
    });
}

} // namespace tool_execute_procedure
