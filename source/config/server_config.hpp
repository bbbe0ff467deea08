#ifndef SQLMCPS_SERVER_CONFIG_HPP
#define SQLMCPS_SERVER_CONFIG_HPP

// Startup configuration, read from an appsettings.json file:
//
//   {
//     "ConnectionStrings": { "DefaultConnection": "Server=...;Database=...;" },
//     "DebugMode": true,
//     "LogPath": "/var/log/sqlmcps"
//   }

#include <stdexcept>
#include <string>

namespace server_config {

constexpr const char *kConfigFileName = "appsettings.json";

struct ServerConfig {
    std::string connection_string;
    bool debug_mode = false;
    std::string log_path;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

// Parse configuration text. LogPath falls back to default_log_path when absent or empty.
// Throws ConfigError when the text is not a JSON object or the connection string is missing.
ServerConfig parse_config(const std::string &contents, const std::string &default_log_path);

// Pick the configuration file: explicit argument, then SQLMCPS_CONFIG, then
// appsettings.json inside base_directory.
std::string resolve_config_path(const std::string &argument_path, const std::string &base_directory);

// Read and parse the configuration file. Throws ConfigError when it cannot be read.
ServerConfig load_config(const std::string &config_path, const std::string &default_log_path);

} // namespace server_config

#endif // SQLMCPS_SERVER_CONFIG_HPP
