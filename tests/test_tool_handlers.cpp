// Tests for the tool handlers, run against the in-memory fake database.

#include "fake_database.hpp"
#include "mcp/mcp_tools.hpp"
#include "test_support.hpp"

#include <memory>
#include <string>

using json = json_rpc::json;
using test_support::expect;

namespace test_tool_handlers {

struct Harness {
    std::shared_ptr<fake_database::FakeServer> server = std::make_shared<fake_database::FakeServer>();
    mcp_tools::ToolContext context;

    Harness() {
        context.open_connection = fake_database::make_connection_factory(server);
    }

    mcp_tools::ToolOutcome call(const std::string &tool_name, const json &arguments) {
        const mcp_tools::ToolDefinition *tool = mcp_tools::find_tool(tool_name);
        if (tool == nullptr) {
            return mcp_tools::tool_failure(0, "tool not registered: " + tool_name);
        }
        return tool->handler(arguments, context);
    }
};

static bool starts_with(const std::string &text, const std::string &prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Every required argument is enforced before any connection is opened, and
// supplying all of them gets the handler past validation.
static bool test_required_arguments_match_descriptors() {
    bool all_passed = true;
    for (const auto &tool : mcp_tools::get_registered_tools()) {
        json complete = json::object();
        for (const auto &name : tool.required) {
            complete[name] = "x";
        }

        for (const auto &name : tool.required) {
            Harness harness;
            json partial = complete;
            partial.erase(name);
            mcp_tools::ToolOutcome outcome = harness.call(tool.name, partial);
            all_passed &= expect(!outcome.success && outcome.error_code == json_rpc::INVALID_PARAMS &&
                                     harness.server->connections_opened == 0,
                                 tool.name + " without '" + name + "' is InvalidParams before connecting");
        }

        Harness harness;
        harness.call(tool.name, complete);
        all_passed &= expect(harness.server->connections_opened == 1,
                             tool.name + " with all required arguments reaches the database");

        bool documented = true;
        for (const auto &name : tool.required) {
            bool found = false;
            for (const auto &parameter : tool.parameters) {
                found = found || parameter.name == name;
            }
            documented = documented && found;
        }
        all_passed &= expect(documented, tool.name + " documents every required argument");
    }
    return all_passed;
}

static bool test_missing_arguments_object() {
    Harness harness;
    mcp_tools::ToolOutcome outcome = harness.call("get_tables", json());
    return expect(!outcome.success && outcome.error_code == json_rpc::INVALID_PARAMS &&
                      outcome.error_message == "Database name is required",
                  "get_tables with no arguments object reports the missing database");
}

static bool test_wrong_argument_type() {
    Harness harness;
    mcp_tools::ToolOutcome outcome = harness.call("get_tables", json{{"database", 5}});
    return expect(!outcome.success && outcome.error_code == json_rpc::INVALID_PARAMS &&
                      outcome.error_message == "Argument 'database' must be a string" &&
                      harness.server->connections_opened == 0,
                  "Non-string database is InvalidParams naming the argument");
}

static bool test_get_databases() {
    Harness harness;
    fake_database::ResultSet result_set;
    result_set.columns = {"name"};
    result_set.rows = {{fake_database::text_cell("Sales")}, {fake_database::text_cell("Inventory")}};
    harness.server->results.push_back(result_set);

    mcp_tools::ToolOutcome outcome = harness.call("get_databases", json::object());
    bool all_passed = true;
    all_passed &= expect(outcome.success && outcome.payload.dump() == R"({"databases":["Sales","Inventory"]})",
                         "get_databases lists database names in order");
    all_passed &= expect(harness.server->statements.size() == 1 &&
                             harness.server->statements[0] == "SELECT name FROM sys.databases WHERE database_id > 4",
                         "get_databases skips system databases and switches no context");
    all_passed &= expect(harness.server->connections_closed == harness.server->connections_opened,
                         "get_databases releases its connection");
    return all_passed;
}

static bool test_get_tables_empty_database() {
    Harness harness;
    mcp_tools::ToolOutcome outcome = harness.call("get_tables", json{{"database", "Foo"}});
    bool all_passed = true;
    all_passed &= expect(outcome.success && outcome.payload.dump() == R"({"tables":[]})",
                         "get_tables on a database without tables returns an empty list");
    all_passed &= expect(!harness.server->statements.empty() && harness.server->statements[0] == "USE [Foo]",
                         "get_tables switches to the database first");
    return all_passed;
}

static bool test_get_tables_shape() {
    Harness harness;
    fake_database::ResultSet result_set;
    result_set.columns = {"TABLE_SCHEMA", "TABLE_NAME", "TABLE_TYPE"};
    result_set.rows = {{fake_database::text_cell("dbo"), fake_database::text_cell("Orders"),
                        fake_database::text_cell("BASE TABLE")}};
    harness.server->results.push_back(result_set);

    mcp_tools::ToolOutcome outcome = harness.call("get_tables", json{{"database", "Foo"}});
    return expect(outcome.success &&
                      outcome.payload.dump() == R"({"tables":[{"schema":"dbo","name":"Orders","type":"BASE TABLE"}]})",
                  "get_tables reports schema, name and type");
}

static bool test_get_columns_missing_table() {
    Harness harness;
    mcp_tools::ToolOutcome outcome = harness.call("get_columns", json{{"database", "Foo"}, {"table", "Bar"}});
    bool all_passed = true;
    all_passed &= expect(outcome.success && outcome.payload.dump() == R"({"columns":[]})",
                         "get_columns on a missing table returns an empty list, not an error");
    all_passed &= expect(harness.server->bound_parameters.size() == 1 &&
                             harness.server->bound_parameters[0] == std::vector<std::string>({"dbo", "Bar"}),
                         "get_columns binds schema (default dbo) and table as parameters");
    return all_passed;
}

static bool test_get_columns_shape() {
    Harness harness;
    fake_database::ResultSet result_set;
    result_set.columns = {"COLUMN_NAME", "DATA_TYPE", "CHARACTER_MAXIMUM_LENGTH", "NUMERIC_PRECISION",
                          "NUMERIC_SCALE", "IS_NULLABLE", "IS_IDENTITY", "IS_PRIMARY_KEY"};
    result_set.rows = {
        {fake_database::text_cell("Id"), fake_database::text_cell("int"), fake_database::null_cell(),
         fake_database::integer_cell(10), fake_database::integer_cell(0), fake_database::text_cell("NO"),
         fake_database::integer_cell(1), fake_database::integer_cell(1)},
        {fake_database::text_cell("Name"), fake_database::text_cell("nvarchar"), fake_database::integer_cell(50),
         fake_database::null_cell(), fake_database::null_cell(), fake_database::text_cell("YES"),
         fake_database::null_cell(), fake_database::integer_cell(0)},
    };
    harness.server->results.push_back(result_set);

    mcp_tools::ToolOutcome outcome =
        harness.call("get_columns", json{{"database", "Foo"}, {"schema", "sales"}, {"table", "Orders"}});
    bool all_passed = true;
    all_passed &= expect(outcome.success && outcome.payload["columns"].size() == 2, "get_columns returns both columns");
    if (!outcome.success) {
        return false;
    }
    const json &identifier = outcome.payload["columns"][0];
    const json &name = outcome.payload["columns"][1];
    all_passed &= expect(identifier.dump() ==
                             R"({"name":"Id","dataType":"int","precision":10,"scale":0,"isNullable":false,"isIdentity":true,"isPrimaryKey":true})",
                         "Numeric column exposes precision and scale but no length");
    all_passed &= expect(name.dump() ==
                             R"({"name":"Name","dataType":"nvarchar","maxLength":50,"isNullable":true,"isIdentity":false,"isPrimaryKey":false})",
                         "Character column exposes length only");
    all_passed &= expect(harness.server->bound_parameters[0] == std::vector<std::string>({"sales", "Orders"}),
                         "get_columns uses the schema argument when given");
    return all_passed;
}

static bool test_get_procedures_ignores_schema() {
    Harness with_schema;
    Harness without_schema;
    with_schema.call("get_procedures", json{{"database", "Foo"}, {"schema", "sales"}});
    without_schema.call("get_procedures", json{{"database", "Foo"}});
    return expect(with_schema.server->statements == without_schema.server->statements &&
                      with_schema.server->bound_parameters.empty(),
                  "get_procedures lists all schemas whatever schema is given");
}

static bool test_get_tables_documents_unused_schema() {
    const mcp_tools::ToolDefinition *tool = mcp_tools::find_tool("get_tables");
    if (!expect(tool != nullptr, "get_tables is registered")) {
        return false;
    }
    json descriptor = mcp_tools::describe_tool(*tool);

    Harness with_schema;
    Harness without_schema;
    with_schema.call("get_tables", json{{"database", "Foo"}, {"schema", "sales"}});
    without_schema.call("get_tables", json{{"database", "Foo"}});

    bool all_passed = true;
    all_passed &= expect(descriptor["parameters"].contains("schema") &&
                             descriptor["required"] == json::array({"database"}),
                         "get_tables documents an optional schema");
    all_passed &= expect(with_schema.server->statements == without_schema.server->statements,
                         "get_tables lists all schemas whatever schema is given");
    return all_passed;
}

static bool test_get_procedure_definition() {
    bool all_passed = true;

    Harness missing;
    mcp_tools::ToolOutcome not_found =
        missing.call("get_procedure_definition", json{{"database", "Foo"}, {"schema", "dbo"}, {"name", "nope"}});
    all_passed &= expect(!not_found.success && not_found.error_code == json_rpc::INVALID_PARAMS &&
                             not_found.error_message == "Procedure not found",
                         "Unknown procedure is InvalidParams 'Procedure not found'");

    Harness found;
    fake_database::ResultSet result_set;
    result_set.columns = {"Definition"};
    result_set.rows = {{fake_database::text_cell("CREATE PROCEDURE dbo.p AS SELECT 1")}};
    found.server->results.push_back(result_set);
    mcp_tools::ToolOutcome outcome =
        found.call("get_procedure_definition", json{{"database", "Foo"}, {"schema", "dbo"}, {"name", "p"}});
    all_passed &= expect(outcome.success && outcome.payload["definition"] == "CREATE PROCEDURE dbo.p AS SELECT 1",
                         "Procedure definition text is returned");
    all_passed &= expect(found.server->bound_parameters[0] == std::vector<std::string>({"dbo", "p"}),
                         "Schema and name are bound as parameters");
    return all_passed;
}

static bool test_execute_database_query() {
    Harness harness;
    fake_database::ResultSet result_set;
    result_set.columns = {"id", "note"};
    result_set.rows = {{fake_database::integer_cell(1), fake_database::null_cell()}};
    harness.server->results.push_back(result_set);

    mcp_tools::ToolOutcome outcome =
        harness.call("execute_database_query", json{{"database", "Foo"}, {"query", "SELECT id, note FROM t"}});
    bool all_passed = true;
    all_passed &= expect(outcome.success && outcome.payload.dump() == R"({"results":[{"id":1,"note":null}]})",
                         "execute_database_query returns materialized rows");
    all_passed &= expect(harness.server->statements == std::vector<std::string>({"USE [Foo]", "SELECT id, note FROM t"}),
                         "Query runs after the context switch, text untouched");
    return all_passed;
}

static bool test_execute_system_query() {
    Harness harness;
    mcp_tools::ToolOutcome outcome = harness.call("execute_system_query", json{{"query", "SELECT @@VERSION"}});
    return expect(outcome.success && harness.server->statements == std::vector<std::string>({"SELECT @@VERSION"}),
                  "execute_system_query issues no context switch");
}

static bool test_execute_procedure_raw_parameters() {
    Harness harness;
    json arguments = {
        {"database", "Foo"},
        {"procedure", "usp_report"},
        {"parameters", {{"p1", 42}, {"@label", "abc"}, {"flag", true}}}
    };
    mcp_tools::ToolOutcome outcome = harness.call("execute_procedure", arguments);

    bool all_passed = true;
    all_passed &= expect(outcome.success && harness.server->procedure_calls.size() == 1, "execute_procedure runs");
    if (harness.server->procedure_calls.size() != 1) {
        return false;
    }
    const fake_database::ProcedureCall &call = harness.server->procedure_calls[0];
    all_passed &= expect(call.schema == "dbo" && call.procedure == "usp_report", "Schema defaults to dbo");
    all_passed &= expect(call.parameters.size() == 3, "All three parameters are passed");
    if (call.parameters.size() != 3) {
        return false;
    }
    all_passed &= expect(call.parameters[0].name == "@p1" && call.parameters[0].value == "42",
                         "Number 42 is passed as the text 42");
    all_passed &= expect(call.parameters[1].name == "@label" && call.parameters[1].value == "\"abc\"",
                         "String is passed as its JSON text, quotes included");
    all_passed &= expect(call.parameters[2].name == "@flag" && call.parameters[2].value == "true",
                         "Boolean is passed as the text true");
    return all_passed;
}

static bool test_execute_procedure_bad_parameters() {
    bool all_passed = true;

    Harness bad_name;
    mcp_tools::ToolOutcome name_outcome = bad_name.call(
        "execute_procedure",
        json{{"database", "Foo"}, {"procedure", "p"}, {"parameters", {{"x; DROP TABLE t--", 1}}}});
    all_passed &= expect(!name_outcome.success && name_outcome.error_code == json_rpc::INVALID_PARAMS &&
                             bad_name.server->connections_opened == 0,
                         "Parameter name with SQL in it is rejected");

    Harness bad_type;
    mcp_tools::ToolOutcome type_outcome = bad_type.call(
        "execute_procedure", json{{"database", "Foo"}, {"procedure", "p"}, {"parameters", json::array({1})}});
    all_passed &= expect(!type_outcome.success && type_outcome.error_code == json_rpc::INVALID_PARAMS,
                         "Non-object parameters is InvalidParams");
    return all_passed;
}

static bool test_database_name_quoting() {
    Harness harness;
    harness.call("get_tables", json{{"database", "we]ird"}});
    return expect(!harness.server->statements.empty() && harness.server->statements[0] == "USE [we]]ird]",
                  "Closing bracket in a database name is doubled");
}

static bool test_metadata_tools_read_only() {
    bool all_passed = true;
    json arguments = {{"database", "Foo"}, {"table", "Bar"}, {"schema", "dbo"}, {"name", "p"}};
    for (const char *tool_name : {"get_databases", "get_tables", "get_columns", "get_procedures",
                                  "get_procedure_definition"}) {
        Harness harness;
        harness.call(tool_name, arguments);
        harness.call(tool_name, arguments);
        bool read_only = true;
        for (const auto &statement : harness.server->statements) {
            read_only = read_only && (starts_with(statement, "USE ") || starts_with(statement, "SELECT"));
        }
        all_passed &= expect(read_only && harness.server->procedure_calls.empty(),
                             std::string(tool_name) + " only switches context and selects");
    }
    return all_passed;
}

static bool test_database_error_propagates() {
    Harness harness;
    harness.server->query_error = "Invalid object name 'nope'.";
    bool thrown = false;
    try {
        harness.call("execute_database_query", json{{"database", "Foo"}, {"query", "SELECT * FROM nope"}});
    } catch (const database_driver::DatabaseError &error) {
        thrown = std::string(error.what()) == "Invalid object name 'nope'.";
    }
    return expect(thrown && harness.server->connections_closed == harness.server->connections_opened,
                  "Database errors propagate with their text and the connection is still released");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_required_arguments_match_descriptors();
    all_passed &= test_missing_arguments_object();
    all_passed &= test_wrong_argument_type();
    all_passed &= test_get_databases();
    all_passed &= test_get_tables_empty_database();
    all_passed &= test_get_tables_shape();
    all_passed &= test_get_columns_missing_table();
    all_passed &= test_get_columns_shape();
    all_passed &= test_get_procedures_ignores_schema();
    all_passed &= test_get_tables_documents_unused_schema();
    all_passed &= test_get_procedure_definition();
    all_passed &= test_execute_database_query();
    all_passed &= test_execute_system_query();
    all_passed &= test_execute_procedure_raw_parameters();
    all_passed &= test_execute_procedure_bad_parameters();
    all_passed &= test_database_name_quoting();
    all_passed &= test_metadata_tools_read_only();
    all_passed &= test_database_error_propagates();
    return all_passed;
}

} // namespace test_tool_handlers
