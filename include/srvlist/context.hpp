#pragma once

#include "srvlist/client_config.hpp"
#include "srvlist/directory_cache.hpp"
#include "srvlist/directory_store.hpp"
#include "srvlist/endpoint.hpp"
#include "srvlist/error_reporter.hpp"
#include "srvlist/network_oracle.hpp"
#include "srvlist/transport.hpp"
#include "srvlist/updater.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace srvlist {

// Owns everything that lives as long as the application: the list store,
// the current list and the collaborators updaters need.
class Context final {
  private:
    std::unique_ptr<ErrorReporter> m_reporter;
    std::unique_ptr<NetworkOracle> m_oracle;
    DirectoryStore m_store;
    DirectoryCache m_cache;
    std::string m_custom_server;
    std::chrono::milliseconds m_refresh_timeout;

  public:
    explicit Context(ClientConfig const& config);

    Context(
        DirectoryStore store,
        std::unique_ptr<NetworkOracle> oracle,
        std::unique_ptr<ErrorReporter> reporter,
        std::string custom_server,
        std::chrono::milliseconds refresh_timeout
    );

    Context(Context const&) = delete;
    Context& operator=(Context const&) = delete;

    DirectoryStore const& store() const noexcept;
    DirectoryCache& cache() noexcept;
    NetworkOracle const& oracle() const noexcept;

    // The server to connect to: the custom one or a random one from the
    // current list.
    std::optional<Endpoint> endpoint();

    std::unique_ptr<Updater> make_updater(Transport& transport);

    // Forgets the downloaded list, on disk and in memory. Used when the
    // account changes.
    void reset();
};

} // namespace srvlist
