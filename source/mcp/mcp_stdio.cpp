#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_dispatch.hpp"

#include <exception>
#include <iostream>

namespace mcp_stdio {

bool read_message(std::istream &input, std::string &output_line) {
    if (!std::getline(input, output_line)) {
        return false;
    }
    if (!output_line.empty() && output_line.back() == '\r') {
        output_line.pop_back();
    }
    return true;
}

void log_message(const std::string &message) {
    std::cerr << "[sqlmcps] " << message << std::endl;
}

static void emit_reply(response_emitter::ResponseEmitter &emitter, const mcp_dispatch::Reply &reply) {
    if (reply.success) {
        emitter.emit_success(reply.id, reply.payload, reply.wrap_as_tool);
    } else {
        emitter.emit_error(reply.id, reply.error_code, reply.error_message, reply.wrap_as_tool);
    }
}

int run(std::istream &input, response_emitter::ResponseEmitter &emitter,
        const mcp_tools::ToolContext &context, traffic_log::TrafficLog *traffic_log) {
    log_message("Ready to process requests");

    std::string line;
    while (read_message(input, line)) {
        if (traffic_log != nullptr) {
            traffic_log->record_read(line);
            traffic_log->record_write("REQUEST", line);
        }

        try {
            mcp_dispatch::Reply reply = mcp_dispatch::dispatch_line(line, context);
            if (!reply.failure_detail.empty()) {
                log_message("Error processing request: " + reply.failure_detail);
                if (traffic_log != nullptr) {
                    traffic_log->record_write("Error", reply.failure_detail);
                }
            }
            emit_reply(emitter, reply);
        } catch (const std::exception &error) {
            // Only reached when writing the response itself failed.
            log_message(std::string("Error processing request: ") + error.what());
            if (traffic_log != nullptr) {
                traffic_log->record_write("Error", error.what());
            }
        }
    }

    log_message("End of input. Shutting down.");
    return 0;
}

} // namespace mcp_stdio
