#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_get_databases { void register_tool(); }
namespace tool_get_tables { void register_tool(); }
namespace tool_get_columns { void register_tool(); }
namespace tool_get_procedures { void register_tool(); }
namespace tool_get_procedure_definition { void register_tool(); }
namespace tool_execute_procedure { void register_tool(); }
namespace tool_execute_database_query { void register_tool(); }
namespace tool_execute_system_query { void register_tool(); }

namespace tool_handlers {

// Registration order is the order tools/list reports.
void register_all_tools() {
    tool_get_databases::register_tool();
    tool_get_tables::register_tool();
    tool_get_columns::register_tool();
    tool_get_procedures::register_tool();
    tool_get_procedure_definition::register_tool();
    tool_execute_procedure::register_tool();
    tool_execute_database_query::register_tool();
    tool_execute_system_query::register_tool();
}

std::unique_ptr<database_driver::Connection> open_database(const mcp_tools::ToolContext &context,
                                                           const std::string &database) {
    std::unique_ptr<database_driver::Connection> connection = context.open_connection();
    connection->execute_non_query("USE " + database_driver::quote_identifier(database));
    return connection;
}

} // namespace tool_handlers
