#include "srvlist/file_transport.hpp"

#include "srvlist/log.hpp"

#include <cerrno>
#include <fmt/format.h>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace srvlist {

static constexpr std::string_view ENTRY_COMMENT_START = "#";
static constexpr std::string_view WHITESPACE = " \t\r";

FileTransport::FileTransport(
    std::filesystem::path list_path,
    Executor& background,
    Executor& ordered
)
  : m_list_path(std::move(list_path)), m_bus(background, ordered) {}

Subscription FileTransport::subscribe(TransportHandlers handlers) {
    return m_bus.subscribe(std::move(handlers));
}

void FileTransport::connect(Endpoint const& endpoint) {
    Log::info(fmt::format(
        "serving {} from '{}'",
        endpoint,
        m_list_path.native()
    ));
    m_bus.publish_connected(ConnectedEvent {});
}

void FileTransport::post(ListRequest const& request) {
    if (request.target) {
        Log::info(fmt::format("list request for '{}'", *request.target));
    }
    try {
        m_bus.publish_list_received(ListReceivedEvent {
            .servers = read_servers(m_list_path),
        });
    } catch (std::system_error const& err) {
        // No answer; the updater times out.
        Log::error(err.what());
    }
}

std::vector<std::string>
FileTransport::read_servers(std::filesystem::path const& path) {
    errno = 0;
    auto file = std::ifstream(path);
    if (! file) {
        throw fmt::system_error(
            errno != 0 ? errno : EIO,
            "failed to open server file '{}'",
            path.native()
        );
    }

    std::vector<std::string> servers;
    for (std::string line; std::getline(file, line);) {
        std::size_t const begin = line.find_first_not_of(WHITESPACE);
        if (begin == std::string::npos) {
            continue;
        }
        std::size_t const end = line.find_last_not_of(WHITESPACE);
        std::string_view const entry
            = std::string_view(line).substr(begin, end - begin + 1);
        if (entry.starts_with(ENTRY_COMMENT_START)) {
            continue;
        }
        servers.emplace_back(entry);
    }
    if (file.bad()) {
        throw fmt::system_error(
            errno != 0 ? errno : EIO,
            "failed to read server file '{}'",
            path.native()
        );
    }
    return servers;
}

} // namespace srvlist
