#include "srvlist/log.hpp"

#include <atomic>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <vector>

namespace srvlist {

static constexpr char LOGGER_NAME[] = "srvlist";
static constexpr char LOG_PATTERN[] = "[%Y-%m-%dT%H:%M:%S.%e] %^%v%$";

// The sink list of a published logger never changes. set_log() publishes a
// new logger instead, so threads logging meanwhile keep using the old one.
struct LoggerState {
    std::mutex mtx;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink
        = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    spdlog::level::level_enum level = spdlog::level::info;
    spdlog::level::level_enum flush_level = spdlog::level::warn;
    std::atomic<std::shared_ptr<spdlog::logger>> current;
};

// Called with state.mtx held.
static std::shared_ptr<spdlog::logger> make_logger(LoggerState const& state) {
    std::vector<spdlog::sink_ptr> sinks = {state.console_sink};
    if (state.file_sink) {
        sinks.push_back(state.file_sink);
    }
    auto log = std::make_shared<spdlog::logger>(
        LOGGER_NAME,
        sinks.begin(),
        sinks.end()
    );
    log->set_pattern(LOG_PATTERN);
    log->set_level(state.level);
    log->flush_on(state.flush_level);
    return log;
}

static LoggerState& logger_state() {
    static LoggerState instance;
    static std::once_flag published;
    std::call_once(published, [] {
        auto _guard = std::lock_guard(instance.mtx);
        instance.current.store(make_logger(instance));
    });
    return instance;
}

static std::shared_ptr<spdlog::logger> logger() {
    return logger_state().current.load();
}

static spdlog::level::level_enum to_spdlog(Log::Level const lvl) noexcept {
    switch (lvl) {
        case Log::Level::INFO:
            return spdlog::level::info;
        case Log::Level::WARN:
            return spdlog::level::warn;
        case Log::Level::ERROR:
            return spdlog::level::err;
        case Log::Level::FATAL:
            return spdlog::level::critical;
        case Log::Level::OFF:
            break;
    }
    return spdlog::level::off;
}

void Log::set_level(Level const lvl) {
    LoggerState& state = logger_state();
    auto _guard = std::lock_guard(state.mtx);
    state.level = to_spdlog(lvl);
    state.current.load()->set_level(state.level);
}

void Log::set_log(std::filesystem::path const& path) {
    LoggerState& state = logger_state();
    auto _guard = std::lock_guard(state.mtx);
    std::error_code err;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), err);
        if (err) {
            throw fmt::system_error(
                err.value(),
                "failed to create log directory '{}'",
                path.parent_path().native()
            );
        }
    }
    state.file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        path.native()
    );
    state.current.exchange(make_logger(state))->flush();
}

void Log::flush_on(Level const lvl) {
    LoggerState& state = logger_state();
    auto _guard = std::lock_guard(state.mtx);
    state.flush_level = to_spdlog(lvl);
    state.current.load()->flush_on(state.flush_level);
}

void Log::info(std::string_view const what) {
    logger()->info("[EV - info] {}.", what);
}

void Log::warn(std::string_view const what) {
    logger()->warn("[EW - warning] {}.", what);
}

void Log::error(std::string_view const what) {
    logger()->error("[EE - error] {}.", what);
}

void Log::directory_loaded(
    std::string_view const origin,
    Directory const& directory
) {
    logger()->info(
        "[DL - directory loaded] origin: {}; timestamp: {}; servers: {}.",
        origin,
        directory.timestamp().time_since_epoch().count(),
        directory.size()
    );
}

void Log::directory_saved(
    std::filesystem::path const& path,
    Directory const& directory
) {
    logger()->info(
        "[DS - directory saved] path: {}; timestamp: {}; servers: {}.",
        path.native(),
        directory.timestamp().time_since_epoch().count(),
        directory.size()
    );
}

void Log::update_started(Endpoint const& endpoint) {
    logger()->info("[US - update started] server: {}.", endpoint);
}

void Log::update_aborted(std::string_view const reason) {
    logger()->warn("[UA - update aborted] {}.", reason);
}

void Log::list_requested(std::size_t const times) {
    logger()->info("[LQ - list requested] attempt: {}.", times);
}

void Log::list_received(std::size_t const num_servers) {
    logger()->info("[LR - list received] servers: {}.", num_servers);
}

void Log::entry_skipped(
    std::string_view const entry,
    std::string_view const reason
) {
    logger()->warn("[SK - entry skipped] '{}': {}.", entry, reason);
}

void Log::time_out(std::chrono::milliseconds const timeout) {
    logger()->warn("[TO - timeout] no server list after {}.", timeout);
}

} // namespace srvlist
