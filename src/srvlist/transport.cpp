#include "srvlist/transport.hpp"

#include <utility>

namespace srvlist {

Subscription::Subscription() noexcept = default;

Subscription::Subscription(std::function<void()> release) noexcept
  : m_release(std::move(release)) {}

Subscription::Subscription(Subscription&& other) noexcept
  : m_release(std::exchange(other.m_release, nullptr)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        release();
        m_release = std::exchange(other.m_release, nullptr);
    }
    return *this;
}

Subscription::~Subscription() {
    release();
}

void Subscription::release() noexcept {
    if (auto release_fn = std::exchange(m_release, nullptr)) {
        release_fn();
    }
}

bool Subscription::operator!() const noexcept {
    return not m_release;
}

} // namespace srvlist
