#include "mcp/response_emitter.hpp"

namespace response_emitter {

ResponseEmitter::ResponseEmitter(std::ostream &output, traffic_log::TrafficLog *traffic_log)
    : output_(output), traffic_log_(traffic_log) {}

void ResponseEmitter::emit_success(const json &request_id, const json &payload, bool wrap_as_tool) {
    json result = wrap_as_tool ? json_rpc::build_tool_result(payload) : payload;
    json_rpc::Response response = json_rpc::build_response(request_id, result);
    write_line("RESPONSE", json_rpc::encode_response(response));
}

void ResponseEmitter::emit_error(const json &request_id, int error_code, const std::string &message,
                                 bool wrap_as_tool) {
    json_rpc::Response response = json_rpc::build_error_response(request_id, error_code, message);
    if (wrap_as_tool) {
        response.has_result = true;
        response.result = json_rpc::build_tool_error_result(message);
    }
    write_line("ERROR RESPONSE", json_rpc::encode_response(response));
}

void ResponseEmitter::write_line(const std::string &label, const std::string &line) {
    output_ << line << "\n";
    output_.flush();
    if (traffic_log_ != nullptr) {
        traffic_log_->record_write(label, line);
    }
}

} // namespace response_emitter
