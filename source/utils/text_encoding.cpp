#include "utils/text_encoding.hpp"

#include <cstddef>

namespace text_encoding {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD"; // U+FFFD
const char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Length of the sequence introduced by a lead byte (1-4), or 0 if it cannot start one.
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

} // namespace

void sanitize_utf8(std::string &text) {
    size_t position = 0;
    while (position < text.size() && static_cast<unsigned char>(text[position]) < 0x80u) {
        ++position;
    }
    if (position == text.size()) {
        return; // plain ASCII, nothing to do
    }

    std::string result = text.substr(0, position);
    result.reserve(text.size());

    while (position < text.size()) {
        size_t length = sequence_length(static_cast<unsigned char>(text[position]));
        bool valid = length != 0 && position + length <= text.size();
        for (size_t offset = 1; valid && offset < length; ++offset) {
            valid = is_continuation(static_cast<unsigned char>(text[position + offset]));
        }

        if (!valid) {
            result += kReplacementCharacter;
            ++position;
            continue;
        }

        result.append(text, position, length);
        position += length;
    }

    text = std::move(result);
}

std::string base64_encode(const std::vector<unsigned char> &bytes) {
    std::string encoded;
    encoded.reserve(((bytes.size() + 2) / 3) * 4);

    size_t index = 0;
    while (index + 3 <= bytes.size()) {
        unsigned int triple = (bytes[index] << 16) | (bytes[index + 1] << 8) | bytes[index + 2];
        encoded += kBase64Alphabet[(triple >> 18) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 12) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 6) & 0x3F];
        encoded += kBase64Alphabet[triple & 0x3F];
        index += 3;
    }

    size_t remaining = bytes.size() - index;
    if (remaining == 1) {
        unsigned int triple = bytes[index] << 16;
        encoded += kBase64Alphabet[(triple >> 18) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 12) & 0x3F];
        encoded += "==";
    } else if (remaining == 2) {
        unsigned int triple = (bytes[index] << 16) | (bytes[index + 1] << 8);
        encoded += kBase64Alphabet[(triple >> 18) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 12) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 6) & 0x3F];
        encoded += '=';
    }

    return encoded;
}

} // namespace text_encoding
