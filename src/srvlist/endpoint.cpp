#include "srvlist/endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace srvlist {

static constexpr char NETWORK_DELIM = '|';
static constexpr char PORT_DELIM = ':';

static void check_host_name(std::string_view name, std::string_view what);

static in_port_t parse_port(std::string_view port_str);

Endpoint::Endpoint(
    std::string&& network,
    std::string&& host,
    in_port_t const port
)
  : m_network(std::move(network)), m_host(std::move(host)), m_port(port) {}

Endpoint Endpoint::from_str(
    std::string_view str,
    in_port_t const default_port
) {
    std::string_view network;
    std::size_t const network_delim_pos = str.find(NETWORK_DELIM);
    if (network_delim_pos != std::string_view::npos) {
        network = str.substr(0, network_delim_pos);
        str.remove_prefix(network_delim_pos + 1);
        if (network.empty()) {
            throw std::invalid_argument("missing network before '|'");
        }
        check_host_name(network, "network");
    }

    std::string_view host = str;
    in_port_t port = default_port;
    std::size_t const port_delim_pos = str.rfind(PORT_DELIM);
    if (port_delim_pos != std::string_view::npos) {
        host = str.substr(0, port_delim_pos);
        port = parse_port(str.substr(port_delim_pos + 1));
    }
    if (host.empty()) {
        throw std::invalid_argument("missing server host");
    }
    check_host_name(host, "server host");

    if (network.empty()) {
        network = host;
    }
    return Endpoint(std::string(network), std::string(host), port);
}

std::string const& Endpoint::network() const noexcept {
    return m_network;
}

std::string const& Endpoint::host() const noexcept {
    return m_host;
}

in_port_t Endpoint::port() const noexcept {
    return m_port;
}

std::string Endpoint::str() const {
    return fmt::format("{}", *this);
}

bool operator==(Endpoint const& lhs, Endpoint const& rhs) noexcept {
    return lhs.network() == rhs.network() and lhs.host() == rhs.host()
       and lhs.port() == rhs.port();
}

// Accepts DNS names and IPv4 literals.
static void
check_host_name(std::string_view const name, std::string_view const what) {
    if (name.length() > MAX_HOST_NAME_LEN) {
        throw std::invalid_argument(fmt::format(
            "{} '{}' exceeds maximum length of {} characters",
            what,
            name,
            MAX_HOST_NAME_LEN
        ));
    }

    std::string_view labels = name;
    if (labels.ends_with('.')) {
        labels.remove_suffix(1);
    }
    for (;;) {
        std::size_t const dot_pos = labels.find('.');
        std::string_view const label = labels.substr(0, dot_pos);
        if (label.empty() or label.length() > MAX_HOST_LABEL_LEN) {
            throw std::invalid_argument(
                fmt::format("invalid {} '{}': bad label length", what, name)
            );
        }
        if (label.starts_with('-') or label.ends_with('-')) {
            throw std::invalid_argument(fmt::format(
                "invalid {} '{}': label '{}' starts or ends with '-'",
                what,
                name,
                label
            ));
        }
        auto const bad_char = std::ranges::find_if(label, [](char const c) {
            return not(std::isalnum(static_cast<unsigned char>(c)) or c == '-');
        });
        if (bad_char != label.end()) {
            throw std::invalid_argument(fmt::format(
                "invalid {} '{}': illegal character '{}'",
                what,
                name,
                *bad_char
            ));
        }
        if (dot_pos == std::string_view::npos) {
            break;
        }
        labels.remove_prefix(dot_pos + 1);
    }
}

static in_port_t parse_port(std::string_view const port_str) {
    char const* const port_begin = port_str.data();
    char const* const port_end = port_str.data() + port_str.size();
    in_port_t port;
    auto const [end, err] = std::from_chars(port_begin, port_end, port);
    if (err != std::errc() or end != port_end or port == 0) {
        throw std::invalid_argument(
            fmt::format("invalid server port '{}'", port_str)
        );
    }
    return port;
}

} // namespace srvlist
