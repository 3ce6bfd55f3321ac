#include "srvlist/resolver.hpp"

#include "srvlist/log.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace srvlist {

std::optional<Endpoint> resolve_endpoint(
    std::string_view const override_uri,
    Directory const* const directory
) {
    if (not override_uri.empty()) {
        try {
            return Endpoint::from_str(override_uri);
        } catch (std::invalid_argument const& err) {
            Log::warn(fmt::format(
                "ignoring custom server '{}': {}",
                override_uri,
                err.what()
            ));
        }
    }
    if (directory == nullptr) {
        return std::nullopt;
    }
    return directory->pick_random();
}

} // namespace srvlist
