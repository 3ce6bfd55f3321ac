#pragma once

#include "srvlist/directory.hpp"
#include "srvlist/endpoint.hpp"

#include <optional>
#include <string_view>

namespace srvlist {

// Picks the server to contact. A valid `override_uri` always wins; an
// invalid one is logged and ignored. Returns std::nullopt when there is
// nothing to contact.
std::optional<Endpoint>
resolve_endpoint(std::string_view override_uri, Directory const* directory);

} // namespace srvlist
