#include "srvlist/updater_errc.hpp"

#include <string>

namespace srvlist {

namespace {
class UpdaterCategory final : public std::error_category {
  public:
    char const* name() const noexcept override {
        return "srvlist::updater";
    }

    std::string message(int const ev) const override {
        switch (static_cast<UpdaterErrc>(ev)) {
            case UpdaterErrc::empty_result:
                return "server list is empty";
            case UpdaterErrc::timeout:
                return "timed out waiting for server list";
            case UpdaterErrc::io_error:
                return "failed to store server list";
        }
        return "unknown updater error";
    }
};
} // namespace

std::error_category const& updater_category() noexcept {
    static UpdaterCategory const instance;
    return instance;
}

std::error_code make_error_code(UpdaterErrc const errc) noexcept {
    return {static_cast<int>(errc), updater_category()};
}

} // namespace srvlist
