#include "srvlist/network_oracle.hpp"

#include "shared/util/scope_guard.hpp"
#include "shared/util/strerror_mt.hpp"
#include "srvlist/log.hpp"

#include <cerrno>
#include <fmt/format.h>

extern "C" {
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>
}

namespace srvlist {

SystemNetworkOracle::SystemNetworkOracle(bool const offline_mode) noexcept
  : m_offline_mode(offline_mode) {}

bool SystemNetworkOracle::is_network_available() const {
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        Log::warn(fmt::format(
            "failed to list network interfaces: {}",
            strerror_mt(errno)
        ));
        return false;
    }
    ScopeGuard const _ifaddr_guard = [ifaddr]() noexcept {
        freeifaddrs(ifaddr);
    };

    for (ifaddrs const* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }
        int const family = ifa->ifa_addr->sa_family;
        if (family != AF_INET and family != AF_INET6) {
            continue;
        }
        unsigned const flags = ifa->ifa_flags;
        if ((flags & IFF_UP) and (flags & IFF_RUNNING)
            and not(flags & IFF_LOOPBACK)) {
            return true;
        }
    }
    return false;
}

bool SystemNetworkOracle::is_offline_mode_enabled() const {
    return m_offline_mode;
}

} // namespace srvlist
