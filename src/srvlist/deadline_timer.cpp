#include "srvlist/deadline_timer.hpp"

#include "shared/util/scope_guard.hpp"
#include "srvlist/log.hpp"

#include <algorithm>
#include <exception>
#include <fmt/format.h>
#include <utility>

namespace srvlist {

DeadlineTimer::DeadlineTimer() : m_state(std::make_shared<State>()) {}

DeadlineTimer::~DeadlineTimer() {
    cancel();
}

void DeadlineTimer::arm(
    std::chrono::milliseconds const timeout,
    std::function<void()> on_expiry
) {
    cancel();

    std::uint64_t generation;
    {
        auto _guard = std::lock_guard(m_state->mtx);
        generation = ++m_state->generation;
    }

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    std::thread([state = m_state,
                 generation,
                 deadline,
                 on_expiry = std::move(on_expiry)] {
        {
            auto lock = std::unique_lock(state->mtx);
            bool const cancelled = state->cv.wait_until(
                lock,
                deadline,
                [&] { return state->generation != generation; }
            );
            if (cancelled) {
                return;
            }
            state->firing.emplace(generation, std::this_thread::get_id());
        }
        ScopeGuard _firing_guard = [&state, generation]() noexcept {
            auto _guard = std::lock_guard(state->mtx);
            state->firing.erase(generation);
            state->cv.notify_all();
        };
        try {
            on_expiry();
        } catch (std::exception const& err) {
            Log::error(fmt::format("timer callback failed: {}", err.what()));
        }
    }).detach();
}

void DeadlineTimer::cancel() {
    auto lock = std::unique_lock(m_state->mtx);
    ++m_state->generation;
    m_state->cv.notify_all();
    auto const self = std::this_thread::get_id();
    m_state->cv.wait(lock, [this, self] {
        return std::ranges::all_of(m_state->firing, [self](auto const& entry) {
            return entry.second == self;
        });
    });
}

} // namespace srvlist
