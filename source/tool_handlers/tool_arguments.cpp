#include "tool_handlers/tool_arguments.hpp"

namespace tool_arguments {

ArgumentReader::ArgumentReader(const json &arguments) : arguments_(arguments) {}

const json *ArgumentReader::find(const std::string &key) const {
    if (!arguments_.is_object()) {
        return nullptr;
    }
    auto iterator = arguments_.find(key);
    if (iterator == arguments_.end() || iterator->is_null()) {
        return nullptr;
    }
    return &*iterator;
}

std::string ArgumentReader::required_string(const std::string &key) {
    const json *value = find(key);
    if (value == nullptr) {
        missing_ = true;
        return "";
    }
    if (!value->is_string()) {
        if (wrong_type_message_.empty()) {
            wrong_type_message_ = "Argument '" + key + "' must be a string";
        }
        return "";
    }
    return value->get<std::string>();
}

std::string ArgumentReader::optional_string(const std::string &key, const std::string &default_value) {
    const json *value = find(key);
    if (value == nullptr) {
        return default_value;
    }
    if (!value->is_string()) {
        if (wrong_type_message_.empty()) {
            wrong_type_message_ = "Argument '" + key + "' must be a string";
        }
        return default_value;
    }
    return value->get<std::string>();
}

json ArgumentReader::optional_object(const std::string &key) {
    const json *value = find(key);
    if (value == nullptr) {
        return json::object();
    }
    if (!value->is_object()) {
        if (wrong_type_message_.empty()) {
            wrong_type_message_ = "Argument '" + key + "' must be an object";
        }
        return json::object();
    }
    return *value;
}

bool ArgumentReader::ok() const {
    return !missing_ && wrong_type_message_.empty();
}

mcp_tools::ToolOutcome ArgumentReader::failure(const std::string &missing_message) const {
    if (missing_) {
        return mcp_tools::tool_failure(json_rpc::INVALID_PARAMS, missing_message);
    }
    return mcp_tools::tool_failure(json_rpc::INVALID_PARAMS, wrong_type_message_);
}

} // namespace tool_arguments
