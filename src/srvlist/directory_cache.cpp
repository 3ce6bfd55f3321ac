#include "srvlist/directory_cache.hpp"

#include "srvlist/log.hpp"
#include "srvlist/parse_error.hpp"

#include <fmt/format.h>
#include <optional>
#include <system_error>
#include <utility>

namespace srvlist {

DirectoryCache::DirectoryCache(
    DirectoryStore const& store,
    ErrorReporter& reporter
) noexcept
  : m_store(store), m_reporter(reporter) {}

std::shared_ptr<Directory const> DirectoryCache::current() {
    auto _guard = std::lock_guard(m_mtx);
    if (not m_resolved) {
        resolve();
    }
    return m_current;
}

void DirectoryCache::replace(std::shared_ptr<Directory const> directory) {
    auto _guard = std::lock_guard(m_mtx);
    m_current = std::move(directory);
    m_resolved = true;
}

void DirectoryCache::invalidate() {
    auto _guard = std::lock_guard(m_mtx);
    m_current.reset();
    m_resolved = false;
}

// Called with m_mtx held.
void DirectoryCache::resolve() {
    std::optional<Directory> builtin;
    try {
        builtin = m_store.load_builtin();
    } catch (ParseError const& err) {
        m_reporter.report(err);
    } catch (std::system_error const& err) {
        m_reporter.report(err);
    }

    std::optional<Directory> cached;
    try {
        cached = m_store.load_cached();
    } catch (std::system_error const& err) {
        if (err.code() == std::errc::no_such_file_or_directory) {
            Log::info(fmt::format(
                "no cached server list at '{}'",
                m_store.cache_path().native()
            ));
        } else if (builtin) {
            Log::warn(err.what());
        } else {
            Log::error(err.what());
        }
    } catch (ParseError const& err) {
        if (builtin) {
            Log::warn(err.what());
        } else {
            Log::error(err.what());
        }
    }

    if (cached and (not builtin or not builtin->is_newer_than(*cached))) {
        m_current = std::make_shared<Directory const>(std::move(*cached));
    } else if (builtin) {
        m_current = std::make_shared<Directory const>(std::move(*builtin));
    } else {
        m_current.reset();
    }
    m_resolved = true;
}

} // namespace srvlist
