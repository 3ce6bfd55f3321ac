#pragma once

#include "srvlist/directory.hpp"
#include "srvlist/directory_store.hpp"
#include "srvlist/error_reporter.hpp"

#include <memory>
#include <mutex>

namespace srvlist {

// The best known server list of an application context. It is resolved
// lazily from the store on first use and then only replaced as a whole.
class DirectoryCache final {
  private:
    DirectoryStore const& m_store;
    ErrorReporter& m_reporter;

    mutable std::mutex m_mtx;
    std::shared_ptr<Directory const> m_current;
    bool m_resolved = false;

    void resolve();

  public:
    DirectoryCache(DirectoryStore const& store, ErrorReporter& reporter) noexcept;

    DirectoryCache(DirectoryCache const&) = delete;
    DirectoryCache& operator=(DirectoryCache const&) = delete;

    // Null when neither the builtin nor the cached list could be loaded.
    std::shared_ptr<Directory const> current();

    void replace(std::shared_ptr<Directory const> directory);

    // The next current() resolves from disk again.
    void invalidate();
};

} // namespace srvlist
