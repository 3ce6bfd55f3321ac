#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

extern "C" {
#include <netinet/in.h>
}

namespace srvlist {

inline constexpr char PROG_NAME[] = "srvlist";

inline constexpr std::uint16_t VERSION_MAJOR = 0;
inline constexpr std::uint16_t VERSION_MINOR = 1;
inline constexpr std::uint16_t VERSION_PATCH = 0;

inline constexpr in_port_t DEFAULT_PORT = 5222;

inline constexpr std::chrono::milliseconds DEFAULT_REFRESH_TIMEOUT
    = std::chrono::seconds(30);

inline constexpr char DEFAULT_CONFIG_PATH[] = "/etc/srvlist/srvlist.conf";

// 9999-12-31T23:59:59Z
inline constexpr std::int64_t MAX_TIMESTAMP = 253402300799;

inline constexpr std::size_t MAX_HOST_NAME_LEN = 255;
inline constexpr std::size_t MAX_HOST_LABEL_LEN = 63;

} // namespace srvlist
