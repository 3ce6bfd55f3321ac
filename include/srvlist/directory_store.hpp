#pragma once

#include "srvlist/directory.hpp"

#include <filesystem>

namespace srvlist {

// Reads the builtin server list and reads, writes and deletes the cached
// one. All failures are reported as exceptions: std::system_error for I/O,
// ParseError for bad content.
class DirectoryStore final {
  private:
    std::filesystem::path m_builtin_path;
    std::filesystem::path m_cache_path;

  public:
    DirectoryStore(
        std::filesystem::path builtin_path,
        std::filesystem::path cache_path
    ) noexcept;

    std::filesystem::path const& builtin_path() const noexcept;
    std::filesystem::path const& cache_path() const noexcept;

    Directory load_builtin() const;

    // A missing cache file throws std::system_error with
    // std::errc::no_such_file_or_directory.
    Directory load_cached() const;

    // Replaces the cache file through a temporary sibling file, so a failed
    // write never leaves a different valid list behind.
    void save_cached(Directory const& directory) const;

    // Missing file is not an error.
    void delete_cached() const;
};

} // namespace srvlist
