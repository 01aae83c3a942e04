#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace flatkv {

// Whitespace helpers shared by the command parser and the flat-file codec.
//
// "Whitespace" is the Unicode White_Space set as found in UTF-8 text: the
// ASCII controls \t \n \v \f \r and 0x1C-0x1F, space, U+0085, U+00A0,
// U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
// Any other byte sequence, valid UTF-8 or not, is token text.

// Byte length of the whitespace character starting at s[pos], or 0.
[[nodiscard]] inline std::size_t space_at(std::string_view s, std::size_t pos) noexcept {
    if (pos >= s.size()) {
        return 0;
    }
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) {
        return (b0 == ' ' || (b0 >= '\t' && b0 <= '\r') || (b0 >= 0x1C && b0 <= 0x1F)) ? 1 : 0;
    }
    if (pos + 1 >= s.size()) {
        return 0;
    }
    const auto b1 = static_cast<unsigned char>(s[pos + 1]);
    if (b0 == 0xC2) {
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    }
    if (pos + 2 >= s.size()) {
        return 0;
    }
    const auto b2 = static_cast<unsigned char>(s[pos + 2]);
    switch (b0) {
    case 0xE1: // U+1680
        return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    case 0xE2:
        if (b1 == 0x80) { // U+2000-U+200A, U+2028, U+2029, U+202F
            return ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) ? 3 : 0;
        }
        return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0; // U+205F
    case 0xE3: // U+3000
        return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

// Byte length of the whitespace character ending just before s[end], or 0.
[[nodiscard]] inline std::size_t space_before(std::string_view s, std::size_t end) noexcept {
    for (std::size_t len = 1; len <= 3 && len <= end; ++len) {
        if (space_at(s, end - len) == len) {
            return len;
        }
    }
    return 0;
}

// Strip leading and trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    while (const auto n = space_at(s, 0)) {
        s.remove_prefix(n);
    }
    while (const auto n = space_before(s, s.size())) {
        s.remove_suffix(n);
    }
    return s;
}

// Split on runs of whitespace. Leading/trailing whitespace yields no empty
// tokens.
[[nodiscard]] inline std::vector<std::string_view> split_whitespace(std::string_view s) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < s.size()) {
        while (const auto n = space_at(s, pos)) {
            pos += n;
        }
        if (pos >= s.size()) {
            break;
        }
        const std::size_t start = pos;
        while (pos < s.size() && space_at(s, pos) == 0) {
            ++pos;
        }
        tokens.emplace_back(s.substr(start, pos - start));
    }
    return tokens;
}

[[nodiscard]] inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace flatkv
