#pragma once

#include "srvlist/endpoint.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace srvlist {

// An ordered, timestamped list of endpoints. The timestamp records when the
// list was accepted as authoritative and never changes afterwards.
class Directory final {
  public:
    using Timestamp = std::chrono::sys_seconds;

  private:
    Timestamp m_timestamp;
    std::vector<Endpoint> m_endpoints;

  public:
    explicit Directory(Timestamp timestamp) noexcept;

    Directory(Timestamp timestamp, std::vector<Endpoint>&& endpoints) noexcept;

    // Throws ParseError. `origin` is used in error messages only.
    static Directory parse(std::string_view text, std::string_view origin);

    std::string serialize() const;

    Timestamp timestamp() const noexcept;

    std::span<Endpoint const> endpoints() const noexcept;

    std::size_t size() const noexcept;

    bool empty() const noexcept;

    void add(Endpoint endpoint);

    bool is_newer_than(Directory const& other) const noexcept;

    template <typename URBG>
    std::optional<Endpoint> pick_random(URBG& gen) const {
        if (m_endpoints.empty()) {
            return std::nullopt;
        }
        auto dist
            = std::uniform_int_distribution<std::size_t>(0, m_endpoints.size() - 1);
        return m_endpoints[dist(gen)];
    }

    std::optional<Endpoint> pick_random() const;
};

bool operator==(Directory const& lhs, Directory const& rhs) noexcept;

} // namespace srvlist
