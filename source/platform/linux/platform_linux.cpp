#include "platform/platform_abi.hpp"

#include <algorithm>
#include <cctype>
#include <clocale>
#include <langinfo.h>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <system_error>

namespace platform {

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

std::string executable_directory() {
    std::error_code error;
    std::filesystem::path executable_path = std::filesystem::read_symlink("/proc/self/exe", error);
    if (!error && executable_path.has_parent_path()) {
        return executable_path.parent_path().string();
    }
    std::filesystem::path current = std::filesystem::current_path(error);
    if (!error) {
        return current.string();
    }
    return ".";
}

bool text_encoding_is_utf8() {
    std::string codeset = nl_langinfo(CODESET);
    std::transform(codeset.begin(), codeset.end(), codeset.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return codeset == "utf-8" || codeset == "utf8";
}

// The environment's locale is used only when it is UTF-8 (an unset LANG gives
// plain "C", which is ASCII). Otherwise fall back to a UTF-8 locale.
void initialize_text_encoding() {
    if (std::setlocale(LC_CTYPE, "") != nullptr && text_encoding_is_utf8()) {
        return;
    }
    for (const char *fallback : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
        if (std::setlocale(LC_CTYPE, fallback) != nullptr && text_encoding_is_utf8()) {
            return;
        }
    }
}

} // namespace platform
