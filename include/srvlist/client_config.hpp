#pragma once

#include <array>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace srvlist {

// Client configuration file. One entry per line, `<param> <TYPE> <value>`:
//
//     builtin BL /usr/share/srvlist/serverlist.properties
//     cache   CF /var/cache/srvlist/serverlist.properties
//     all     LG /var/log/srvlist.log
//     server  SV prime.example.net:5222
//     offline OF on
//     timeout TO 30000
//
// BL and CF are required. Lines starting with '#' are comments.
class ClientConfig final {
  private:
    std::filesystem::path m_path; // path to the file we parsed from.

    std::filesystem::path m_builtin_list_path;    // BL
    std::filesystem::path m_cached_list_path;     // CF
    std::filesystem::path m_log_path;             // LG
    std::string m_custom_server;                  // SV
    bool m_offline_mode = false;                  // OF
    std::chrono::milliseconds m_refresh_timeout;  // TO

    bool m_has_offline_mode = false;
    bool m_has_refresh_timeout = false;

    using Tokens = std::array<std::string_view, 3>;

    ClientConfig() noexcept;

    void parse_line(std::string_view line);
    void parse_builtin_list_path(Tokens const& tokens);
    void parse_cached_list_path(Tokens const& tokens);
    void parse_log_path(Tokens const& tokens);
    void parse_custom_server(Tokens const& tokens);
    void parse_offline_mode(Tokens const& tokens);
    void parse_refresh_timeout(Tokens const& tokens);

  public:
    static ClientConfig from_file(std::filesystem::path&& config_path);

    std::filesystem::path const& path() const noexcept;
    std::filesystem::path const& builtin_list_path() const noexcept;
    std::filesystem::path const& cached_list_path() const noexcept;
    std::filesystem::path const& log_path() const noexcept;
    std::string const& custom_server() const noexcept;
    bool offline_mode() const noexcept;
    std::chrono::milliseconds refresh_timeout() const noexcept;

    // Command line override of TO.
    void set_refresh_timeout(std::chrono::milliseconds timeout) noexcept;
};

} // namespace srvlist
