#pragma once

#include "srvlist/directory.hpp"
#include "srvlist/endpoint.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace srvlist {

class Log final {
  public:
    enum class Level {
        INFO,
        WARN,
        ERROR,
        FATAL,
        OFF,
    };

    Log() = delete;
    Log(Log const&) = delete;
    Log(Log&&) = delete;
    Log& operator=(Log const&) = delete;
    Log& operator=(Log&&) = delete;

    static void set_level(Level lvl);

    // Messages are also appended to `path` from now on, replacing any
    // previous log file. Safe while other threads are logging.
    static void set_log(std::filesystem::path const& path);

    static void flush_on(Level lvl);

    static void info(std::string_view what);

    static void warn(std::string_view what);

    static void error(std::string_view what);

    static void directory_loaded(
        std::string_view origin,
        Directory const& directory
    );

    static void directory_saved(
        std::filesystem::path const& path,
        Directory const& directory
    );

    static void update_started(Endpoint const& endpoint);

    static void update_aborted(std::string_view reason);

    static void list_requested(std::size_t times);

    static void list_received(std::size_t num_servers);

    static void entry_skipped(std::string_view entry, std::string_view reason);

    static void time_out(std::chrono::milliseconds timeout);
};

} // namespace srvlist
