#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "database/row_materializer.hpp"
#include "utils/debug_log.hpp"

using json = json_rpc::json;

// Tool handler for "get_columns".
// Lists the columns of one table in declaration order, with type details,
// nullability, identity and primary key flags. A table that does not exist
// simply has no columns.

static const char *const kColumnsQuery =
    "SELECT "
    "c.COLUMN_NAME, "
    "c.DATA_TYPE, "
    "c.CHARACTER_MAXIMUM_LENGTH, "
    "c.NUMERIC_PRECISION, "
    "c.NUMERIC_SCALE, "
    "c.IS_NULLABLE, "
    "COLUMNPROPERTY(OBJECT_ID(QUOTENAME(c.TABLE_SCHEMA) + '.' + QUOTENAME(c.TABLE_NAME)), c.COLUMN_NAME, 'IsIdentity') AS IS_IDENTITY, "
    "CASE WHEN pk.COLUMN_NAME IS NOT NULL THEN 1 ELSE 0 END AS IS_PRIMARY_KEY "
    "FROM INFORMATION_SCHEMA.COLUMNS c "
    "LEFT JOIN ("
    "SELECT ku.TABLE_CATALOG, ku.TABLE_SCHEMA, ku.TABLE_NAME, ku.COLUMN_NAME "
    "FROM INFORMATION_SCHEMA.TABLE_CONSTRAINTS tc "
    "JOIN INFORMATION_SCHEMA.KEY_COLUMN_USAGE ku "
    "ON tc.CONSTRAINT_TYPE = 'PRIMARY KEY' "
    "AND tc.CONSTRAINT_NAME = ku.CONSTRAINT_NAME"
    ") pk "
    "ON c.TABLE_CATALOG = pk.TABLE_CATALOG "
    "AND c.TABLE_SCHEMA = pk.TABLE_SCHEMA "
    "AND c.TABLE_NAME = pk.TABLE_NAME "
    "AND c.COLUMN_NAME = pk.COLUMN_NAME "
    "WHERE c.TABLE_SCHEMA = ? AND c.TABLE_NAME = ? "
    "ORDER BY c.ORDINAL_POSITION";

static bool is_one(const json &value) {
    return value.is_number() && value.get<long long>() == 1;
}

static mcp_tools::ToolOutcome handle_get_columns(const json &arguments, const mcp_tools::ToolContext &context) {
    tool_arguments::ArgumentReader reader(arguments);
    std::string database = reader.required_string("database");
    std::string table_name = reader.required_string("table");
    std::string schema = reader.optional_string("schema", "dbo");
    if (!reader.ok()) {
        return reader.failure("Database and Table Parameters are required");
    }

    debug_log::log("get_columns invoked for " + database + "." + schema + "." + table_name);
    std::unique_ptr<database_driver::Connection> connection = tool_handlers::open_database(context, database);
    std::unique_ptr<database_driver::ResultCursor> cursor =
        connection->execute_parameterized_query(kColumnsQuery, {schema, table_name});

    json columns = json::array();
    for (auto &row : row_materializer::materialize(*cursor)) {
        json column;
        column["name"] = row["COLUMN_NAME"];
        column["dataType"] = row["DATA_TYPE"];
        // Only character types have a length, only numeric types precision and scale.
        if (!row["CHARACTER_MAXIMUM_LENGTH"].is_null()) {
            column["maxLength"] = row["CHARACTER_MAXIMUM_LENGTH"];
        }
        if (!row["NUMERIC_PRECISION"].is_null()) {
            column["precision"] = row["NUMERIC_PRECISION"];
        }
        if (!row["NUMERIC_SCALE"].is_null()) {
            column["scale"] = row["NUMERIC_SCALE"];
        }
        column["isNullable"] = row["IS_NULLABLE"] == "YES";
        column["isIdentity"] = is_one(row["IS_IDENTITY"]);
        column["isPrimaryKey"] = is_one(row["IS_PRIMARY_KEY"]);
        columns.push_back(column);
    }

    json payload;
    payload["columns"] = columns;
    return mcp_tools::tool_success(payload);
}

namespace tool_get_columns {

void register_tool() {
    mcp_tools::register_tool({
        "get_columns",
        "List all columns in a specified table",
        {
            {"database", "Database name"},
            {"schema", "Optional schema name, defaults to 'dbo'"},
            {"table", "Table name"}
        },
        {"database", "table"},
        handle_get_columns
    });
}

} // namespace tool_get_columns
