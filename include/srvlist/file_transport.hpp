#pragma once

#include "srvlist/event_bus.hpp"
#include "srvlist/executor.hpp"
#include "srvlist/transport.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace srvlist {

// Loopback transport: "connecting" always succeeds and a list request is
// answered with the servers listed in a local file, one per line. Blank lines
// and lines starting with '#' are skipped.
class FileTransport final : public Transport {
  private:
    std::filesystem::path m_list_path;
    EventBus m_bus;

  public:
    FileTransport(
        std::filesystem::path list_path,
        Executor& background,
        Executor& ordered
    );

    Subscription subscribe(TransportHandlers handlers) override;

    void connect(Endpoint const& endpoint) override;

    void post(ListRequest const& request) override;

    // Throws std::system_error when the file cannot be read.
    static std::vector<std::string>
    read_servers(std::filesystem::path const& path);
};

} // namespace srvlist
