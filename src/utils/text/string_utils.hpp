#pragma once

#include <string>
#include <vector>

namespace Trawl {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);

// Runs of whitespace become a single space. Leading and trailing whitespace is dropped.
std::string collapse_whitespace(const std::string& str);

// Three or more consecutive newlines become exactly two.
std::string collapse_blank_lines(const std::string& str);

std::vector<std::string> split(const std::string& str, char delim);

// Lowercased whitespace-separated tokens.
std::vector<std::string> tokenize(const std::string& str);

// Cuts at max_len bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& str, size_t max_len);

// Copies well-formed UTF-8 through. Each byte of an invalid, overlong or truncated
// sequence becomes U+FFFD.
std::string sanitize_utf8(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
