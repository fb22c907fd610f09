#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace quotebridge::market {

inline std::string trim(const std::string& value) {
    const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

inline std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

// Canonical ticker form: trimmed and upper-cased.
inline std::string normalize_symbol(const std::string& raw) {
    return to_upper(trim(raw));
}

}  // namespace quotebridge::market
