#pragma once

#include <cstdint>
#include <exception>
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace srvlist {

using LineNum = std::uint_least32_t;

// Thrown when a server list or configuration file is malformed. `origin`
// names what was being parsed, usually a file path.
class ParseError final : public std::exception {
  private:
    std::string msg;

  public:
    template <typename... Args>
    ParseError(
        std::string_view const origin,
        fmt::format_string<Args...> fmt_str,
        Args&&... args
    )
      : msg(fmt::format("failed to parse '{}': ", origin)) {
        fmt::format_to(
            std::back_inserter(this->msg),
            fmt_str,
            std::forward<Args>(args)...
        );
    }

    template <typename... Args>
    ParseError(
        std::string_view const origin,
        LineNum const line_num,
        fmt::format_string<Args...> fmt_str,
        Args&&... args
    )
      : msg(fmt::format("failed to parse '{}', line {}: ", origin, line_num)) {
        fmt::format_to(
            std::back_inserter(this->msg),
            fmt_str,
            std::forward<Args>(args)...
        );
    }

    char const* what() const noexcept override;
};

} // namespace srvlist
