#include "srvlist/context.hpp"

#include "srvlist/log.hpp"
#include "srvlist/resolver.hpp"

#include <utility>

namespace srvlist {

Context::Context(ClientConfig const& config)
  : Context(
      DirectoryStore(config.builtin_list_path(), config.cached_list_path()),
      std::make_unique<SystemNetworkOracle>(config.offline_mode()),
      std::make_unique<LogErrorReporter>(),
      config.custom_server(),
      config.refresh_timeout()
  ) {}

Context::Context(
    DirectoryStore store,
    std::unique_ptr<NetworkOracle> oracle,
    std::unique_ptr<ErrorReporter> reporter,
    std::string custom_server,
    std::chrono::milliseconds const refresh_timeout
)
  : m_reporter(std::move(reporter)),
    m_oracle(std::move(oracle)),
    m_store(std::move(store)),
    m_cache(m_store, *m_reporter),
    m_custom_server(std::move(custom_server)),
    m_refresh_timeout(refresh_timeout) {}

DirectoryStore const& Context::store() const noexcept {
    return m_store;
}

DirectoryCache& Context::cache() noexcept {
    return m_cache;
}

NetworkOracle const& Context::oracle() const noexcept {
    return *m_oracle;
}

std::optional<Endpoint> Context::endpoint() {
    std::shared_ptr<Directory const> const directory = m_cache.current();
    return resolve_endpoint(m_custom_server, directory.get());
}

std::unique_ptr<Updater> Context::make_updater(Transport& transport) {
    return std::make_unique<Updater>(
        m_cache,
        m_store,
        transport,
        *m_oracle,
        Updater::Options {
            .override_uri = m_custom_server,
            .timeout = m_refresh_timeout,
        }
    );
}

void Context::reset() {
    m_store.delete_cached();
    m_cache.invalidate();
    Log::info("server list reset");
}

} // namespace srvlist
