#pragma once

#include <string>

namespace pdf_outline {

// UTF-8 aware helpers. Byte sequences are never split; only ASCII letters
// carry case information.

std::string trim(const std::string& text);

// Trims and replaces every run of whitespace (ASCII and U+00A0) with one space
std::string collapse_whitespace(const std::string& text);

// Removes any of `chars` (ASCII only) from both ends
std::string strip_chars(const std::string& text, const std::string& chars);

// Number of code points
size_t utf8_length(const std::string& text);

// Keeps at most `max_chars` code points
std::string utf8_truncate(const std::string& text, size_t max_chars);

// At least two ASCII uppercase letters and no ASCII lowercase letter
bool is_upper_case_line(const std::string& text);

} // namespace pdf_outline
