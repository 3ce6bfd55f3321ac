#include "srvlist/directory.hpp"

#include "shared/config.hpp"
#include "srvlist/parse_error.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace srvlist {

static constexpr std::string_view KEY_TIMESTAMP = "timestamp";
static constexpr std::string_view KEY_SERVER_PREFIX = "server";
static constexpr std::string_view COMMENT_STARTS = "#!";
static constexpr std::string_view WHITESPACE = " \t\r\f\v";

static thread_local auto rand_generator
    = std::default_random_engine(std::random_device()());

static std::string_view trim(std::string_view str) noexcept;

static std::optional<std::uint32_t> server_index(std::string_view key) noexcept;

Directory::Directory(Timestamp const timestamp) noexcept
  : m_timestamp(timestamp) {}

Directory::Directory(
    Timestamp const timestamp,
    std::vector<Endpoint>&& endpoints
) noexcept
  : m_timestamp(timestamp), m_endpoints(std::move(endpoints)) {}

Directory Directory::parse(std::string_view text, std::string_view const origin) {
    std::optional<Timestamp> timestamp;
    // Servers are ordered by their index, not by their position in the text.
    std::map<std::uint32_t, std::pair<std::string_view, LineNum>> servers;

    LineNum line_num = 0;
    while (not text.empty()) {
        ++line_num;
        std::size_t const eol = text.find('\n');
        std::string_view const line = trim(text.substr(0, eol));
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        if (line.empty()
            or COMMENT_STARTS.find(line.front()) != std::string_view::npos) {
            continue;
        }

        std::size_t const sep_pos = line.find('=');
        if (sep_pos == std::string_view::npos) {
            throw ParseError(origin, line_num, "expected 'key=value'");
        }
        std::string_view const key = trim(line.substr(0, sep_pos));
        std::string_view const value = trim(line.substr(sep_pos + 1));

        if (key == KEY_TIMESTAMP) {
            std::int64_t secs;
            char const* const value_end = value.data() + value.size();
            auto const [end, err]
                = std::from_chars(value.data(), value_end, secs);
            if (err != std::errc() or end != value_end or secs < 0
                or secs > MAX_TIMESTAMP) {
                throw ParseError(origin, line_num, "invalid timestamp '{}'", value);
            }
            timestamp = Timestamp(std::chrono::seconds(secs));
        } else if (auto const idx = server_index(key)) {
            servers.insert_or_assign(*idx, std::pair(value, line_num));
        }
        // Unknown keys are left for newer versions.
    }

    if (not timestamp) {
        throw ParseError(origin, "missing '{}' entry", KEY_TIMESTAMP);
    }

    Directory directory(*timestamp);
    directory.m_endpoints.reserve(servers.size());
    for (auto const& [idx, value_and_line] : servers) {
        auto const& [value, value_line] = value_and_line;
        try {
            directory.m_endpoints.push_back(Endpoint::from_str(value));
        } catch (std::invalid_argument const& err) {
            throw ParseError(origin, value_line, "{}", err.what());
        }
    }
    return directory;
}

std::string Directory::serialize() const {
    std::string out;
    auto out_it = std::back_inserter(out);
    fmt::format_to(
        out_it,
        "# server list, {:%F %T} UTC\n",
        fmt::gmtime(
            static_cast<std::time_t>(m_timestamp.time_since_epoch().count())
        )
    );
    fmt::format_to(
        out_it,
        "{}={}\n",
        KEY_TIMESTAMP,
        m_timestamp.time_since_epoch().count()
    );
    std::uint32_t idx = 0;
    for (Endpoint const& endpoint : m_endpoints) {
        fmt::format_to(out_it, "{}{}={}\n", KEY_SERVER_PREFIX, ++idx, endpoint);
    }
    return out;
}

Directory::Timestamp Directory::timestamp() const noexcept {
    return m_timestamp;
}

std::span<Endpoint const> Directory::endpoints() const noexcept {
    return m_endpoints;
}

std::size_t Directory::size() const noexcept {
    return m_endpoints.size();
}

bool Directory::empty() const noexcept {
    return m_endpoints.empty();
}

void Directory::add(Endpoint endpoint) {
    m_endpoints.push_back(std::move(endpoint));
}

bool Directory::is_newer_than(Directory const& other) const noexcept {
    return m_timestamp > other.m_timestamp;
}

std::optional<Endpoint> Directory::pick_random() const {
    return pick_random(rand_generator);
}

bool operator==(Directory const& lhs, Directory const& rhs) noexcept {
    return lhs.timestamp() == rhs.timestamp()
       and std::ranges::equal(lhs.endpoints(), rhs.endpoints());
}

static std::string_view trim(std::string_view str) noexcept {
    std::size_t const begin = str.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }
    std::size_t const end = str.find_last_not_of(WHITESPACE);
    return str.substr(begin, end - begin + 1);
}

// `server<N>` with N >= 1.
static std::optional<std::uint32_t> server_index(std::string_view key) noexcept {
    if (not key.starts_with(KEY_SERVER_PREFIX)) {
        return std::nullopt;
    }
    key.remove_prefix(KEY_SERVER_PREFIX.size());
    std::uint32_t idx;
    char const* const key_end = key.data() + key.size();
    auto const [end, err] = std::from_chars(key.data(), key_end, idx);
    if (key.empty() or err != std::errc() or end != key_end or idx == 0) {
        return std::nullopt;
    }
    return idx;
}

} // namespace srvlist
