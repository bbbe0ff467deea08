#ifndef SQLMCPS_MCP_STDIO_HPP
#define SQLMCPS_MCP_STDIO_HPP

// MCP stdio transport: one JSON-RPC request per input line, one response per output line.

#include <istream>
#include <string>

#include "mcp/mcp_tools.hpp"
#include "mcp/response_emitter.hpp"
#include "utils/traffic_log.hpp"

namespace mcp_stdio {

// Read one line, without its line terminator. Returns false on end of input.
bool read_message(std::istream &input, std::string &output_line);

// Write a log message to stderr (stdout carries protocol lines only).
void log_message(const std::string &message);

// Serve requests until end of input. Every line is answered, in order, before
// the next one is read. traffic_log may be nullptr. Returns the exit code.
int run(std::istream &input, response_emitter::ResponseEmitter &emitter,
        const mcp_tools::ToolContext &context, traffic_log::TrafficLog *traffic_log);

} // namespace mcp_stdio

#endif // SQLMCPS_MCP_STDIO_HPP
