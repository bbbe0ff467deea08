#ifndef SQLMCPS_JSON_TEXT_HPP
#define SQLMCPS_JSON_TEXT_HPP

// Access to the source text of JSON values, as the client wrote them.
// The parsed tree re-prints numbers (1.50 becomes 1.5, 1e2 becomes 100.0);
// these helpers return the exact characters instead. Input is expected to be
// well-formed JSON that already went through the parser.

#include <string>
#include <utility>
#include <vector>

namespace json_text {

// Members of the JSON object in text as (decoded key, raw value text) pairs,
// in document order. Returns false when text is not an object.
bool object_members(const std::string &text, std::vector<std::pair<std::string, std::string>> &output_members);

// Raw text of the member named key. When the key repeats, the last occurrence
// wins, as in the parsed tree. Returns false when absent or text is not an object.
bool member_text(const std::string &text, const std::string &key, std::string &output_value);

} // namespace json_text

#endif // SQLMCPS_JSON_TEXT_HPP
