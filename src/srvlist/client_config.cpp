#include "srvlist/client_config.hpp"

#include "shared/config.hpp"
#include "shared/util/split_n.hpp"
#include "srvlist/endpoint.hpp"
#include "srvlist/parse_error.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace srvlist {

static constexpr std::string_view ENTRY_COMMENT_START = "#";
static constexpr std::string_view ENTRY_TYPE_TOKENS[]
    = {"BL", "CF", "LG", "SV", "OF", "TO"};
static constexpr std::string_view ENTRY_PARAM_TOKENS[]
    = {"builtin", "cache", "all", "server", "offline", "timeout"};
static constexpr std::string_view OFFLINE_ON = "on";
static constexpr std::string_view OFFLINE_OFF = "off";

static thread_local std::string const* config_path_ptr;
static thread_local LineNum line_num;

template <typename... Args>
[[noreturn]] static void
throw_parse_error(fmt::format_string<Args...> fmt_str, Args&&... args);

ClientConfig::ClientConfig() noexcept
  : m_refresh_timeout(DEFAULT_REFRESH_TIMEOUT) {}

ClientConfig ClientConfig::from_file(std::filesystem::path&& config_path) {
    errno = 0;
    auto config_file = std::ifstream(config_path);
    if (! config_file) {
        throw fmt::system_error(
            errno != 0 ? errno : EIO,
            "failed to open configuration file '{}'",
            std::move(config_path).native()
        );
    }

    ClientConfig config;
    config.m_path = std::move(config_path);

    std::string const path_str = config.m_path.native();
    config_path_ptr = &path_str;
    line_num = 0;

    for (std::string buf; std::getline(config_file, buf);
         config.parse_line(buf)) {}

    if (config.m_builtin_list_path.empty()) {
        throw ParseError(path_str, "missing builtin server list path (BL)");
    }
    if (config.m_cached_list_path.empty()) {
        throw ParseError(path_str, "missing cached server list path (CF)");
    }

    return config;
}

std::filesystem::path const& ClientConfig::path() const noexcept {
    return m_path;
}

std::filesystem::path const& ClientConfig::builtin_list_path() const noexcept {
    return m_builtin_list_path;
}

std::filesystem::path const& ClientConfig::cached_list_path() const noexcept {
    return m_cached_list_path;
}

std::filesystem::path const& ClientConfig::log_path() const noexcept {
    return m_log_path;
}

std::string const& ClientConfig::custom_server() const noexcept {
    return m_custom_server;
}

bool ClientConfig::offline_mode() const noexcept {
    return m_offline_mode;
}

std::chrono::milliseconds ClientConfig::refresh_timeout() const noexcept {
    return m_refresh_timeout;
}

void ClientConfig::set_refresh_timeout(std::chrono::milliseconds const timeout
) noexcept {
    m_refresh_timeout = timeout;
}

void ClientConfig::parse_line(std::string_view line) {
    ++line_num;

    if (line.ends_with('\r')) {
        line.remove_suffix(1);
    }
    if (line.empty() or line.starts_with(ENTRY_COMMENT_START)) {
        return;
    }

    std::array const tokens = split_n<3>(line);
    std::string_view const param = tokens[0];
    std::string_view const type = tokens[1];

    auto const match = std::ranges::find(ENTRY_TYPE_TOKENS, type);
    if (match == std::end(ENTRY_TYPE_TOKENS)) {
        throw_parse_error("unrecognized type '{}'", type);
    }

    auto const type_idx
        = static_cast<std::size_t>(match - std::begin(ENTRY_TYPE_TOKENS));
    if (param != ENTRY_PARAM_TOKENS[type_idx]) {
        throw_parse_error(
            "invalid parameter '{}' for type '{}', expected '{}'",
            param,
            type,
            ENTRY_PARAM_TOKENS[type_idx]
        );
    }
    if (tokens[2].empty()) {
        throw_parse_error("missing value for type '{}'", type);
    }

    using ParseFn = void (ClientConfig::*)(Tokens const&);

    static constexpr ParseFn PARSE_FN_TABLE[] = {
        &ClientConfig::parse_builtin_list_path,
        &ClientConfig::parse_cached_list_path,
        &ClientConfig::parse_log_path,
        &ClientConfig::parse_custom_server,
        &ClientConfig::parse_offline_mode,
        &ClientConfig::parse_refresh_timeout,
    };

    (this->*PARSE_FN_TABLE[type_idx])(tokens);
}

void ClientConfig::parse_builtin_list_path(Tokens const& tokens) {
    if (not m_builtin_list_path.empty()) {
        throw_parse_error("duplicate builtin server list path");
    }
    m_builtin_list_path = tokens[2];
}

void ClientConfig::parse_cached_list_path(Tokens const& tokens) {
    if (not m_cached_list_path.empty()) {
        throw_parse_error("duplicate cached server list path");
    }
    m_cached_list_path = tokens[2];
}

void ClientConfig::parse_log_path(Tokens const& tokens) {
    if (not m_log_path.empty()) {
        throw_parse_error("duplicate log file path");
    }
    m_log_path = tokens[2];
}

void ClientConfig::parse_custom_server(Tokens const& tokens) {
    if (not m_custom_server.empty()) {
        throw_parse_error("duplicate custom server");
    }
    try {
        (void) Endpoint::from_str(tokens[2]);
    } catch (std::invalid_argument const& err) {
        throw_parse_error("{}", err.what());
    }
    m_custom_server = tokens[2];
}

void ClientConfig::parse_offline_mode(Tokens const& tokens) {
    if (m_has_offline_mode) {
        throw_parse_error("duplicate offline mode");
    }
    std::string_view const value = tokens[2];
    if (value == OFFLINE_ON) {
        m_offline_mode = true;
    } else if (value == OFFLINE_OFF) {
        m_offline_mode = false;
    } else {
        throw_parse_error(
            "invalid offline mode '{}', expected '{}' or '{}'",
            value,
            OFFLINE_ON,
            OFFLINE_OFF
        );
    }
    m_has_offline_mode = true;
}

void ClientConfig::parse_refresh_timeout(Tokens const& tokens) {
    if (m_has_refresh_timeout) {
        throw_parse_error("duplicate refresh timeout");
    }
    std::string_view const value = tokens[2];
    std::uint32_t millis;
    char const* const value_end = value.data() + value.size();
    auto const [end, err] = std::from_chars(value.data(), value_end, millis);
    if (err != std::errc() or end != value_end) {
        throw_parse_error("invalid refresh timeout '{}'", value);
    }
    m_refresh_timeout = std::chrono::milliseconds(millis);
    m_has_refresh_timeout = true;
}

template <typename... Args>
[[noreturn]] static void
throw_parse_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    throw ParseError(
        *config_path_ptr,
        line_num,
        fmt_str,
        std::forward<Args>(args)...
    );
}

} // namespace srvlist
