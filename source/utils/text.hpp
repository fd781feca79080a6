#ifndef MCPLINK_TEXT_HPP
#define MCPLINK_TEXT_HPP

// Small string helpers shared by the codecs, the transports and the registry.

#include <string>

namespace text {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// Remote response bodies and child stderr pass through here before they are
// embedded in a JSON document, because nlohmann::json::dump() rejects invalid UTF-8.
std::string sanitize_utf8(const std::string &input);

// Strips leading and trailing ASCII whitespace.
std::string trim(const std::string &input);

// ASCII lower-casing.
std::string to_lower(const std::string &input);

bool starts_with(const std::string &input, const std::string &prefix);

bool equals_ignore_case(const std::string &left, const std::string &right);

// Number of bytes in the UTF-8 sequence introduced by lead_byte, or 0 if the
// byte cannot start a sequence.
size_t utf8_sequence_length(unsigned char lead_byte);

} // namespace text

#endif // MCPLINK_TEXT_HPP
