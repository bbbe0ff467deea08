// sqlmcps – SQL Server MCP Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 requests from stdin, one per line, dispatches them to the
// SQL Server tools, writes one response line per request to stdout.
// Logs go to stderr (stdout carries protocol lines only) and, in debug mode, to read.log/write.log.

#include <exception>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "database/odbc/odbc_driver.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/response_emitter.hpp"
#include "platform/platform_abi.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/traffic_log.hpp"

static int handle_fatal_error(const std::string &message, traffic_log::TrafficLog &traffic_log) {
    std::cerr << "[sqlmcps] Fatal error: " << message << std::endl;
    traffic_log.record_write("Fatal error", message);
    traffic_log.close();
    return 1;
}

int main(int argc, char **argv) {
    std::cerr << "[sqlmcps] sqlmcps – SQL Server MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    // Sole owner of the log files; closed on every way out of main.
    traffic_log::TrafficLog traffic_log;

    try {
        platform::initialize_text_encoding();
        if (!platform::text_encoding_is_utf8()) {
            mcp_stdio::log_message("Warning: no UTF-8 locale available, non-ASCII text may be altered");
        }

        std::string base_directory = platform::executable_directory();
        std::string config_path = server_config::resolve_config_path(argc > 1 ? argv[1] : "", base_directory);
        server_config::ServerConfig config = server_config::load_config(config_path, base_directory);
        mcp_stdio::log_message("Configuration loaded from " + config_path);
        mcp_stdio::log_message(std::string("Debug mode: ") + (config.debug_mode ? "true" : "false"));
        mcp_stdio::log_message("Log path: " + config.log_path);

        if (config.debug_mode) {
            debug_log::set_debug_enabled(true);
            traffic_log.open(config.log_path);
            mcp_stdio::log_message("Log files initialized");
        }

        tool_handlers::register_all_tools();

        mcp_tools::ToolContext context;
        context.open_connection = odbc_driver::make_connection_factory(config.connection_string);

        response_emitter::ResponseEmitter emitter(std::cout, config.debug_mode ? &traffic_log : nullptr);
        int exit_code = mcp_stdio::run(std::cin, emitter, context, config.debug_mode ? &traffic_log : nullptr);

        traffic_log.close();
        return exit_code;
    } catch (const std::exception &error) {
        return handle_fatal_error(error.what(), traffic_log);
    }
}
