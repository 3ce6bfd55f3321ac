#pragma once

#include <array>
#include <cstddef>
#include <string_view>

// Splits `str` into at most N tokens on runs of `delim`. The last token holds
// the rest of the string; missing tokens are left empty.
template <std::size_t N>
constexpr std::array<std::string_view, N>
split_n(std::string_view str, char const delim = ' ') noexcept {
    std::array<std::string_view, N> tokens = {};
    if constexpr (N == 0) {
        return tokens;
    }
    std::size_t i = 0;
    for (;;) {
        std::size_t const begin = str.find_first_not_of(delim);
        if (begin == std::string_view::npos) {
            break;
        }
        str.remove_prefix(begin);
        if (i == N - 1) {
            tokens[i] = str;
            break;
        }
        std::size_t const delim_pos = str.find(delim);
        tokens[i++] = str.substr(0, delim_pos);
        if (delim_pos == std::string_view::npos) {
            break;
        }
        str.remove_prefix(delim_pos + 1);
    }
    return tokens;
}
