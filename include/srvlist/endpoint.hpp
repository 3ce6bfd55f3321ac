#pragma once

#include "shared/config.hpp"

#include <fmt/format.h>
#include <string>
#include <string_view>

extern "C" {
#include <netinet/in.h>
}

namespace srvlist {

// One server a client may connect to, written as `[network|]host[:port]`.
// `network` is the service domain the server belongs to and defaults to
// the host itself.
class Endpoint final {
  private:
    std::string m_network;
    std::string m_host;
    in_port_t m_port;

    Endpoint(std::string&& network, std::string&& host, in_port_t port);

  public:
    // Throws std::invalid_argument on malformed input.
    static Endpoint
    from_str(std::string_view str, in_port_t default_port = DEFAULT_PORT);

    std::string const& network() const noexcept;
    std::string const& host() const noexcept;
    in_port_t port() const noexcept;

    // Canonical form, always parses back to an equal Endpoint.
    std::string str() const;
};

bool operator==(Endpoint const& lhs, Endpoint const& rhs) noexcept;

} // namespace srvlist

template <>
struct fmt::formatter<srvlist::Endpoint> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(srvlist::Endpoint const& endpoint, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        if (endpoint.network() != endpoint.host()) {
            return format_to(
                ctx.out(),
                "{}|{}:{}",
                endpoint.network(),
                endpoint.host(),
                endpoint.port()
            );
        }
        return format_to(ctx.out(), "{}:{}", endpoint.host(), endpoint.port());
    }
};
