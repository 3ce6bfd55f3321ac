#pragma once

#include <system_error>

namespace srvlist {

enum class UpdaterErrc {
    empty_result = 1, // the server sent no usable endpoint
    timeout,          // no server list within the session timeout
    io_error,         // the new list could not be stored
};

std::error_category const& updater_category() noexcept;

std::error_code make_error_code(UpdaterErrc errc) noexcept;

} // namespace srvlist

template <>
struct std::is_error_code_enum<srvlist::UpdaterErrc> : std::true_type {};
