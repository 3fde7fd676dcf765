#include "pdf_outline/text_utils.h"

namespace pdf_outline {

namespace {

bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Length in bytes of a whitespace sequence starting at `pos`, 0 if none
size_t whitespace_at(const std::string& text, size_t pos) {
    auto c = static_cast<unsigned char>(text[pos]);
    if (is_ascii_space(c)) {
        return 1;
    }
    // U+00A0 NO-BREAK SPACE
    if (c == 0xC2 && pos + 1 < text.size() &&
        static_cast<unsigned char>(text[pos + 1]) == 0xA0) {
        return 2;
    }
    return 0;
}

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size()) {
        size_t ws = whitespace_at(text, begin);
        if (ws == 0) break;
        begin += ws;
    }

    size_t end = text.size();
    while (end > begin) {
        if (is_ascii_space(static_cast<unsigned char>(text[end - 1]))) {
            --end;
        } else if (end - begin >= 2 &&
                   static_cast<unsigned char>(text[end - 2]) == 0xC2 &&
                   static_cast<unsigned char>(text[end - 1]) == 0xA0) {
            end -= 2;
        } else {
            break;
        }
    }

    return text.substr(begin, end - begin);
}

std::string collapse_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t ws = whitespace_at(text, pos);
        if (ws > 0) {
            pending_space = !result.empty();
            pos += ws;
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += text[pos];
        ++pos;
    }

    return result;
}

std::string strip_chars(const std::string& text, const std::string& chars) {
    auto begin = text.find_first_not_of(chars);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(chars);
    return text.substr(begin, end - begin + 1);
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!is_continuation_byte(c)) {
            ++count;
        }
    }
    return count;
}

std::string utf8_truncate(const std::string& text, size_t max_chars) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (is_continuation_byte(static_cast<unsigned char>(text[pos]))) {
            continue;
        }
        if (count == max_chars) {
            return text.substr(0, pos);
        }
        ++count;
    }
    return text;
}

bool is_upper_case_line(const std::string& text) {
    int upper = 0;
    for (unsigned char c : text) {
        if (c >= 'a' && c <= 'z') {
            return false;
        }
        if (c >= 'A' && c <= 'Z') {
            ++upper;
        }
    }
    return upper >= 2;
}

} // namespace pdf_outline
