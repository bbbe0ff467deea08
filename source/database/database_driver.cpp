#include "database/database_driver_abi.hpp"

namespace database_driver {

std::string quote_identifier(const std::string &identifier) {
    std::string quoted;
    quoted.reserve(identifier.size() + 2);
    quoted += '[';
    for (char character : identifier) {
        if (character == ']') {
            quoted += "]]";
        } else {
            quoted += character;
        }
    }
    quoted += ']';
    return quoted;
}

} // namespace database_driver
