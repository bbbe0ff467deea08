#ifndef SQLMCPS_PLATFORM_ABI_HPP
#define SQLMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>

namespace platform {

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Directory containing the running executable. Falls back to the current
// working directory when it cannot be determined.
std::string executable_directory();

// Set the C library character locale to a UTF-8 one, so the ODBC driver
// exchanges character data as UTF-8. The environment's locale is kept when it
// already is UTF-8.
void initialize_text_encoding();

// True when the current character locale uses UTF-8.
bool text_encoding_is_utf8();

} // namespace platform

#endif // SQLMCPS_PLATFORM_ABI_HPP
