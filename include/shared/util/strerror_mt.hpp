#pragma once

#include <array>
#include <string>
#include <type_traits>

extern "C" {
#include <string.h>
}

// Thread-safe strerror(). Handles both the XSI and the GNU flavour of
// strerror_r().
inline std::string strerror_mt(int const errnum) {
    std::array<char, 256> buf = {};
    auto const* const msg = [&](auto const r) -> char const* {
        if constexpr (std::is_same_v<std::decay_t<decltype(r)>, int>) {
            return r == 0 ? buf.data() : "Unknown error";
        } else {
            return r;
        }
    }(strerror_r(errnum, buf.data(), buf.size()));
    return std::string(msg);
}
