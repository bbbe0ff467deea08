#include "config/server_config.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace server_config {

using json = nlohmann::json;

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

// DebugMode may be written as a JSON boolean or as the string "true" in any case.
static bool read_debug_mode(const json &root) {
    auto iterator = root.find("DebugMode");
    if (iterator == root.end()) {
        return false;
    }
    if (iterator->is_boolean()) {
        return iterator->get<bool>();
    }
    if (iterator->is_string()) {
        return to_lower(iterator->get<std::string>()) == "true";
    }
    return false;
}

ServerConfig parse_config(const std::string &contents, const std::string &default_log_path) {
    json root;
    try {
        root = json::parse(contents);
    } catch (const json::parse_error &error) {
        throw ConfigError(std::string("Configuration is not valid JSON: ") + error.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    ServerConfig config;

    auto strings_iterator = root.find("ConnectionStrings");
    if (strings_iterator != root.end() && strings_iterator->is_object()) {
        auto connection_iterator = strings_iterator->find("DefaultConnection");
        if (connection_iterator != strings_iterator->end() && connection_iterator->is_string()) {
            config.connection_string = connection_iterator->get<std::string>();
        }
    }
    if (config.connection_string.empty()) {
        throw ConfigError("Connection string 'DefaultConnection' not found in configuration");
    }

    config.debug_mode = read_debug_mode(root);

    auto log_path_iterator = root.find("LogPath");
    if (log_path_iterator != root.end() && log_path_iterator->is_string()) {
        config.log_path = log_path_iterator->get<std::string>();
    }
    if (config.log_path.empty()) {
        config.log_path = default_log_path;
    }

    return config;
}

std::string resolve_config_path(const std::string &argument_path, const std::string &base_directory) {
    if (!argument_path.empty()) {
        return argument_path;
    }
    const char *environment_path = std::getenv("SQLMCPS_CONFIG");
    if (environment_path != nullptr && environment_path[0] != '\0') {
        return environment_path;
    }
    return (std::filesystem::path(base_directory) / kConfigFileName).string();
}

ServerConfig load_config(const std::string &config_path, const std::string &default_log_path) {
    std::string contents;
    if (!platform::read_file_contents(config_path, contents)) {
        throw ConfigError("Cannot read configuration file " + config_path);
    }
    return parse_config(contents, default_log_path);
}

} // namespace server_config
