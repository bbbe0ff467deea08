#include "protocol/json_text.hpp"

#include <nlohmann/json.hpp>

namespace json_text {

static const size_t NOT_FOUND = std::string::npos;

static size_t skip_whitespace(const std::string &text, size_t position) {
    while (position < text.size() &&
           (text[position] == ' ' || text[position] == '\t' || text[position] == '\n' || text[position] == '\r')) {
        ++position;
    }
    return position;
}

// position is at the opening quote; returns the index after the closing quote.
static size_t skip_string(const std::string &text, size_t position) {
    ++position;
    while (position < text.size()) {
        if (text[position] == '\\') {
            position += 2;
            continue;
        }
        if (text[position] == '"') {
            return position + 1;
        }
        ++position;
    }
    return NOT_FOUND;
}

// Returns the index just past the value starting at position.
static size_t skip_value(const std::string &text, size_t position) {
    if (position >= text.size()) {
        return NOT_FOUND;
    }
    char first = text[position];
    if (first == '"') {
        return skip_string(text, position);
    }
    if (first == '{' || first == '[') {
        int depth = 0;
        while (position < text.size()) {
            char character = text[position];
            if (character == '"') {
                position = skip_string(text, position);
                if (position == NOT_FOUND) {
                    return NOT_FOUND;
                }
                continue;
            }
            if (character == '{' || character == '[') {
                ++depth;
            } else if (character == '}' || character == ']') {
                --depth;
                if (depth == 0) {
                    return position + 1;
                }
            }
            ++position;
        }
        return NOT_FOUND;
    }
    // Number or literal: runs until a delimiter.
    while (position < text.size() && text[position] != ',' && text[position] != '}' && text[position] != ']' &&
           text[position] != ' ' && text[position] != '\t' && text[position] != '\n' && text[position] != '\r') {
        ++position;
    }
    return position;
}

bool object_members(const std::string &text, std::vector<std::pair<std::string, std::string>> &output_members) {
    output_members.clear();
    size_t position = skip_whitespace(text, 0);
    if (position >= text.size() || text[position] != '{') {
        return false;
    }
    position = skip_whitespace(text, position + 1);
    if (position < text.size() && text[position] == '}') {
        return true;
    }

    while (position < text.size()) {
        if (text[position] != '"') {
            return false;
        }
        size_t key_end = skip_string(text, position);
        if (key_end == NOT_FOUND) {
            return false;
        }
        // Let the parser undo escapes in the key.
        nlohmann::json key = nlohmann::json::parse(text.substr(position, key_end - position), nullptr, false);
        if (!key.is_string()) {
            return false;
        }

        position = skip_whitespace(text, key_end);
        if (position >= text.size() || text[position] != ':') {
            return false;
        }
        size_t value_start = skip_whitespace(text, position + 1);
        size_t value_end = skip_value(text, value_start);
        if (value_end == NOT_FOUND || value_end == value_start) {
            return false;
        }
        output_members.emplace_back(key.get<std::string>(), text.substr(value_start, value_end - value_start));

        position = skip_whitespace(text, value_end);
        if (position < text.size() && text[position] == ',') {
            position = skip_whitespace(text, position + 1);
            continue;
        }
        return position < text.size() && text[position] == '}';
    }
    return false;
}

bool member_text(const std::string &text, const std::string &key, std::string &output_value) {
    std::vector<std::pair<std::string, std::string>> members;
    if (!object_members(text, members)) {
        return false;
    }
    bool found = false;
    for (const auto &member : members) {
        if (member.first == key) {
            output_value = member.second;
            found = true;
        }
    }
    return found;
}

} // namespace json_text
