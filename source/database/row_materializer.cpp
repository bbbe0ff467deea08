#include "database/row_materializer.hpp"
#include "utils/text_encoding.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace row_materializer {

// Decimals up to this many significant digits survive the trip through a double.
constexpr int kExactDoubleDigits = 15;

// The driver writes values between -1 and 1 without the leading zero (".50", "-.25").
static std::string normalize_decimal_text(const std::string &text) {
    size_t digits_start = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    if (digits_start < text.size() && text[digits_start] == '.') {
        return text.substr(0, digits_start) + "0" + text.substr(digits_start);
    }
    return text;
}

static int significant_digits(const std::string &text) {
    std::string digits;
    size_t point = text.find('.');
    for (char character : text) {
        if (character >= '0' && character <= '9') {
            digits += character;
        }
    }
    // Trailing zeros after the decimal point carry no value.
    if (point != std::string::npos) {
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
    }
    size_t first = digits.find_first_not_of('0');
    return first == std::string::npos ? 0 : static_cast<int>(digits.size() - first);
}

// DECIMAL/NUMERIC arrive as text. They become JSON numbers when no digit is
// lost on the way; wider values keep their exact digits as a string.
static json decimal_to_json(const std::string &text) {
    std::string normalized = normalize_decimal_text(text);
    json number = json::parse(normalized, nullptr, false);
    if (number.is_discarded() || !number.is_number()) {
        return text;
    }
    if (number.is_number_integer()) {
        return number;
    }
    if (significant_digits(normalized) > kExactDoubleDigits) {
        return normalized;
    }
    return number;
}

json cell_to_json(const database_driver::CellValue &cell) {
    switch (cell.type) {
    case database_driver::CellType::Null:
        return nullptr;
    case database_driver::CellType::Integer:
        return cell.integer_value;
    case database_driver::CellType::Float:
        if (!std::isfinite(cell.float_value)) {
            return nullptr;
        }
        return cell.float_value;
    case database_driver::CellType::Decimal:
        return decimal_to_json(cell.text_value);
    case database_driver::CellType::Boolean:
        return cell.boolean_value;
    case database_driver::CellType::String:
    case database_driver::CellType::DateTime: {
        std::string text = cell.text_value;
        text_encoding::sanitize_utf8(text);
        return text;
    }
    case database_driver::CellType::Binary:
        return text_encoding::base64_encode(cell.binary_value);
    }
    return nullptr;
}

json materialize(database_driver::ResultCursor &cursor) {
    json rows = json::array();

    int column_count = cursor.column_count();
    std::vector<std::string> column_names;
    column_names.reserve(static_cast<size_t>(column_count));
    for (int column_index = 0; column_index < column_count; ++column_index) {
        std::string name = cursor.column_name(column_index);
        text_encoding::sanitize_utf8(name);
        column_names.push_back(name);
    }

    while (cursor.fetch_next()) {
        json row = json::object();
        for (int column_index = 0; column_index < column_count; ++column_index) {
            row[column_names[static_cast<size_t>(column_index)]] = cell_to_json(cursor.read_cell(column_index));
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace row_materializer
