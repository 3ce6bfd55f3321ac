#include "srvlist/directory_store.hpp"

#include "shared/util/scope_guard.hpp"
#include "srvlist/log.hpp"

#include <cerrno>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace srvlist {

static constexpr std::string_view TMP_FILE_SUFFIX = ".tmp";

static Directory load(std::filesystem::path const& path);

DirectoryStore::DirectoryStore(
    std::filesystem::path builtin_path,
    std::filesystem::path cache_path
) noexcept
  : m_builtin_path(std::move(builtin_path)),
    m_cache_path(std::move(cache_path)) {}

std::filesystem::path const& DirectoryStore::builtin_path() const noexcept {
    return m_builtin_path;
}

std::filesystem::path const& DirectoryStore::cache_path() const noexcept {
    return m_cache_path;
}

Directory DirectoryStore::load_builtin() const {
    return load(m_builtin_path);
}

Directory DirectoryStore::load_cached() const {
    return load(m_cache_path);
}

void DirectoryStore::save_cached(Directory const& directory) const {
    std::error_code err;
    if (m_cache_path.has_parent_path()) {
        std::filesystem::create_directories(m_cache_path.parent_path(), err);
        if (err) {
            throw fmt::system_error(
                err.value(),
                "failed to create cache directory '{}'",
                m_cache_path.parent_path().native()
            );
        }
    }

    auto tmp_path = m_cache_path;
    tmp_path += TMP_FILE_SUFFIX;

    ScopeGuard _tmp_guard = [&tmp_path]() noexcept {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
    };

    {
        errno = 0;
        auto tmp_file = std::ofstream(tmp_path, std::ios::trunc);
        if (! tmp_file) {
            throw fmt::system_error(
                errno != 0 ? errno : EIO,
                "failed to open temporary cache file '{}'",
                tmp_path.native()
            );
        }
        std::string const contents = directory.serialize();
        tmp_file.write(
            contents.data(),
            static_cast<std::streamsize>(contents.size())
        );
        tmp_file.flush();
        if (! tmp_file) {
            throw fmt::system_error(
                errno != 0 ? errno : EIO,
                "failed to write temporary cache file '{}'",
                tmp_path.native()
            );
        }
    }

    std::filesystem::rename(tmp_path, m_cache_path, err);
    if (err) {
        throw fmt::system_error(
            err.value(),
            "failed to replace cache file '{}'",
            m_cache_path.native()
        );
    }
    _tmp_guard.dismiss();
    Log::directory_saved(m_cache_path, directory);
}

void DirectoryStore::delete_cached() const {
    std::error_code err;
    if (std::filesystem::remove(m_cache_path, err)) {
        Log::info(fmt::format("deleted cache file '{}'", m_cache_path.native()));
    } else if (err and err != std::errc::no_such_file_or_directory) {
        throw fmt::system_error(
            err.value(),
            "failed to delete cache file '{}'",
            m_cache_path.native()
        );
    }
}

static Directory load(std::filesystem::path const& path) {
    errno = 0;
    auto file = std::ifstream(path);
    if (! file) {
        throw fmt::system_error(
            errno != 0 ? errno : EIO,
            "failed to open server list file '{}'",
            path.native()
        );
    }
    std::string const contents(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    if (file.bad()) {
        throw fmt::system_error(
            errno != 0 ? errno : EIO,
            "failed to read server list file '{}'",
            path.native()
        );
    }
    Directory directory = Directory::parse(contents, path.native());
    Log::directory_loaded(path.native(), directory);
    return directory;
}

} // namespace srvlist
