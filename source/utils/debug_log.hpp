#ifndef SQLMCPS_DEBUG_LOG_HPP
#define SQLMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if SQLMCPS_DEBUG env is set to a truthy value (1, true, yes),
// or debug mode was switched on from the configuration.
bool is_debug_enabled();

// Switch debug output on or off regardless of the environment.
void set_debug_enabled(bool enabled);

// Writes message to stderr with [sqlmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

} // namespace debug_log

#endif // SQLMCPS_DEBUG_LOG_HPP
