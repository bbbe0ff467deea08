#ifndef SQLMCPS_TEXT_ENCODING_HPP
#define SQLMCPS_TEXT_ENCODING_HPP

// Text helpers for values read from the database before they are put into JSON.

#include <string>
#include <vector>

namespace text_encoding {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
void sanitize_utf8(std::string &text);

// Standard base64 (RFC 4648, with padding).
std::string base64_encode(const std::vector<unsigned char> &bytes);

} // namespace text_encoding

#endif // SQLMCPS_TEXT_ENCODING_HPP
