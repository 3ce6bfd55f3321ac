#include "srvlist/parse_error.hpp"

namespace srvlist {

char const* ParseError::what() const noexcept {
    return this->msg.c_str();
}

} // namespace srvlist
