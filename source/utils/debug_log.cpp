#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <string>

namespace debug_log {

// Set from the configuration once at startup.
static bool configured_debug = false;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool environment_debug_enabled() {
    const char *value = std::getenv("SQLMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    return configured_debug || environment_debug_enabled();
}

void set_debug_enabled(bool enabled) {
    configured_debug = enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[sqlmcps] " << message << std::endl;
}

} // namespace debug_log
