#ifndef SQLMCPS_RESPONSE_EMITTER_HPP
#define SQLMCPS_RESPONSE_EMITTER_HPP

// Writes responses to the client, one line each, and mirrors them to the
// traffic log when debug mode is on.

#include <ostream>
#include <string>

#include "protocol/json_rpc.hpp"
#include "utils/traffic_log.hpp"

namespace response_emitter {

using json = json_rpc::json;

class ResponseEmitter {
public:
    // traffic_log may be nullptr (no mirroring).
    ResponseEmitter(std::ostream &output, traffic_log::TrafficLog *traffic_log);

    // Success. With wrap_as_tool the payload is serialized into a tool result
    // text block; otherwise it is the result itself.
    void emit_success(const json &request_id, const json &payload, bool wrap_as_tool);

    // Error. With wrap_as_tool a tool result carrying the message and
    // isError=true is sent alongside the error object.
    void emit_error(const json &request_id, int error_code, const std::string &message, bool wrap_as_tool);

private:
    void write_line(const std::string &label, const std::string &line);

    std::ostream &output_;
    traffic_log::TrafficLog *traffic_log_;
};

} // namespace response_emitter

#endif // SQLMCPS_RESPONSE_EMITTER_HPP
