#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ticklist::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string_view strip_trailing_cr(std::string_view value) {
    if (!value.empty() && value.back() == '\r') {
        value.remove_suffix(1);
    }
    return value;
}

// Splits at the first occurrence of any character in separators.
//
// The separator itself is dropped. When no separator is present the second
// element is std::nullopt, which differs from a present-but-empty tail.
inline std::pair<std::string, std::optional<std::string>> split_once(std::string_view value,
                                                                      std::string_view separators) {
    const std::size_t pos = value.find_first_of(separators);
    if (pos == std::string_view::npos) {
        return {std::string(value), std::nullopt};
    }
    return {std::string(value.substr(0, pos)), std::string(value.substr(pos + 1))};
}

// Accepts only a non-empty run of ASCII digits that fits in an int.
inline std::optional<int> parse_digits(std::string_view value) {
    if (value.empty()) {
        return std::nullopt;
    }
    long long result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        result = result * 10 + (c - '0');
        if (result > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }
    return static_cast<int>(result);
}

}
