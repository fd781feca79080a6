#include "utils/text.hpp"

#include <algorithm>
#include <cctype>

namespace text {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD"; // U+FFFD

bool is_continuation_byte(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

} // namespace

size_t utf8_sequence_length(unsigned char lead_byte) {
    if (lead_byte < 0x80u) {
        return 1;
    }
    if (lead_byte >= 0xC2u && lead_byte <= 0xDFu) {
        return 2;
    }
    if (lead_byte >= 0xE0u && lead_byte <= 0xEFu) {
        return 3;
    }
    if (lead_byte >= 0xF0u && lead_byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

std::string sanitize_utf8(const std::string &input) {
    std::string output;
    output.reserve(input.size());

    size_t position = 0;
    while (position < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[position]);
        size_t length = utf8_sequence_length(lead);

        bool valid = length > 0 && position + length <= input.size();
        for (size_t offset = 1; valid && offset < length; ++offset) {
            valid = is_continuation_byte(static_cast<unsigned char>(input[position + offset]));
        }

        if (!valid) {
            output += kReplacementCharacter;
            ++position;
            continue;
        }

        output.append(input, position, length);
        position += length;
    }

    return output;
}

std::string trim(const std::string &input) {
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool starts_with(const std::string &input, const std::string &prefix) {
    return input.size() >= prefix.size() && input.compare(0, prefix.size(), prefix) == 0;
}

bool equals_ignore_case(const std::string &left, const std::string &right) {
    return to_lower(left) == to_lower(right);
}

} // namespace text
