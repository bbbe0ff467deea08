#include "database/odbc/odbc_driver.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace odbc_driver {

namespace {

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

// Split "key=value;key={va;lue};" into pairs. Braced and double-quoted values
// may contain ';'.
std::vector<std::pair<std::string, std::string>> split_pairs(const std::string &connection_string) {
    std::vector<std::pair<std::string, std::string>> pairs;
    size_t position = 0;

    while (position < connection_string.size()) {
        size_t equals = connection_string.find('=', position);
        if (equals == std::string::npos) {
            break;
        }
        std::string key = trim(connection_string.substr(position, equals - position));
        if (!key.empty() && key.front() == ';') {
            key = trim(key.substr(1));
        }

        size_t value_start = equals + 1;
        while (value_start < connection_string.size() &&
               std::isspace(static_cast<unsigned char>(connection_string[value_start]))) {
            ++value_start;
        }

        std::string value;
        size_t next = value_start;
        if (value_start < connection_string.size() &&
            (connection_string[value_start] == '{' || connection_string[value_start] == '"')) {
            char closing = connection_string[value_start] == '{' ? '}' : '"';
            next = value_start + 1;
            while (next < connection_string.size()) {
                if (connection_string[next] == closing) {
                    // A doubled closing character is an escaped literal.
                    if (next + 1 < connection_string.size() && connection_string[next + 1] == closing) {
                        value += closing;
                        next += 2;
                        continue;
                    }
                    ++next;
                    break;
                }
                value += connection_string[next];
                ++next;
            }
            next = connection_string.find(';', next);
        } else {
            next = connection_string.find(';', value_start);
            value = trim(connection_string.substr(value_start, next == std::string::npos
                                                                    ? std::string::npos
                                                                    : next - value_start));
        }

        if (!key.empty()) {
            pairs.emplace_back(key, value);
        }
        if (next == std::string::npos) {
            break;
        }
        position = next + 1;
    }

    return pairs;
}

// SqlClient true/false become the ODBC driver's yes/no.
std::string to_yes_no(const std::string &value) {
    std::string lowered = to_lower(value);
    if (lowered == "true" || lowered == "yes" || lowered == "sspi") {
        return "yes";
    }
    if (lowered == "false" || lowered == "no") {
        return "no";
    }
    return value;
}

std::string quote_value(const std::string &value) {
    bool needs_braces = value.find_first_of(";{}") != std::string::npos ||
                        (!value.empty() && (std::isspace(static_cast<unsigned char>(value.front())) ||
                                            std::isspace(static_cast<unsigned char>(value.back()))));
    if (!needs_braces) {
        return value;
    }
    std::string quoted = "{";
    for (char character : value) {
        quoted += character;
        if (character == '}') {
            quoted += '}';
        }
    }
    quoted += '}';
    return quoted;
}

} // namespace

std::string build_odbc_connection_string(const std::string &connection_string) {
    static const std::map<std::string, std::string> keyword_map = {
        {"driver", "Driver"},
        {"dsn", "DSN"},
        {"server", "Server"},
        {"data source", "Server"},
        {"address", "Server"},
        {"addr", "Server"},
        {"database", "Database"},
        {"initial catalog", "Database"},
        {"user id", "UID"},
        {"userid", "UID"},
        {"user", "UID"},
        {"uid", "UID"},
        {"password", "PWD"},
        {"pwd", "PWD"},
        {"application name", "APP"},
        {"app", "APP"},
        {"multipleactiveresultsets", "MARS_Connection"},
        {"mars_connection", "MARS_Connection"},
    };
    static const std::map<std::string, std::string> boolean_keyword_map = {
        {"encrypt", "Encrypt"},
        {"trustservercertificate", "TrustServerCertificate"},
        {"trust server certificate", "TrustServerCertificate"},
        {"integrated security", "Trusted_Connection"},
        {"trusted_connection", "Trusted_Connection"},
    };

    std::vector<std::pair<std::string, std::string>> output_pairs;
    bool has_driver = false;

    for (const auto &pair : split_pairs(connection_string)) {
        std::string lowered = to_lower(pair.first);

        auto keyword_iterator = keyword_map.find(lowered);
        if (keyword_iterator != keyword_map.end()) {
            std::string value = pair.second;
            if (keyword_iterator->second == "MARS_Connection") {
                value = to_yes_no(value);
            }
            if (keyword_iterator->second == "Driver" || keyword_iterator->second == "DSN") {
                has_driver = true;
            }
            output_pairs.emplace_back(keyword_iterator->second, value);
            continue;
        }

        auto boolean_iterator = boolean_keyword_map.find(lowered);
        if (boolean_iterator != boolean_keyword_map.end()) {
            output_pairs.emplace_back(boolean_iterator->second, to_yes_no(pair.second));
            continue;
        }

        output_pairs.emplace_back(pair.first, pair.second);
    }

    std::string result;
    if (!has_driver) {
        result += "Driver={";
        result += kDefaultDriver;
        result += "};";
    }
    for (const auto &pair : output_pairs) {
        result += pair.first;
        result += '=';
        // Driver names are conventionally braced.
        if (pair.first == "Driver") {
            result += "{" + pair.second + "}";
        } else {
            result += quote_value(pair.second);
        }
        result += ';';
    }
    return result;
}

} // namespace odbc_driver
