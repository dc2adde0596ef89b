#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace http_retry {
namespace util {

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x += 32;
        if (y >= 'A' && y <= 'Z') y += 32;
        if (x != y) return false;
    }
    return true;
}

/**
 * Strip leading and trailing spaces, tabs, CR and LF.
 */
inline std::string_view trim(std::string_view str) {
    constexpr std::string_view ws = " \t\r\n";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    size_t last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

/**
 * Parse a non-negative decimal integer, surrounding whitespace allowed.
 * Returns nullopt on empty input, any non-digit, or overflow.
 */
inline std::optional<uint64_t> parseUnsigned(std::string_view str) {
    str = trim(str);
    if (str.empty()) return std::nullopt;

    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// RFC 7230 tchar
inline bool isTokenChar(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
        return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

} // namespace util
} // namespace http_retry
