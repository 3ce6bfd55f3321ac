#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

// Runs `f` on scope exit unless dismissed. `f` must not throw.
template <std::invocable F>
    requires std::is_nothrow_invocable_v<F>
class ScopeGuard final {
  private:
    F f;
    bool active = true;

  public:
    template <typename... Args>
        requires std::constructible_from<F, Args...>
    explicit(false) ScopeGuard(Args&&... args)
      : f(std::forward<Args>(args)...) {}

    ScopeGuard() = delete;
    ScopeGuard(ScopeGuard const&) = delete;
    ScopeGuard(ScopeGuard&&) = delete;
    ScopeGuard& operator=(ScopeGuard const&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

    ~ScopeGuard() {
        if (active) {
            f();
        }
    }

    void dismiss() noexcept {
        active = false;
    }
};

template <typename F>
ScopeGuard(F&&) -> ScopeGuard<std::decay_t<F>>;
