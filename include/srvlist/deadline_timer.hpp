#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace srvlist {

// One-shot cancellable timer. The expiry callback runs on a detached thread
// owned by the timer.
class DeadlineTimer final {
  private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        std::uint64_t generation = 0;
        // Callbacks running now, by generation. A callback may re-arm the
        // timer, so more than one can be running.
        std::map<std::uint64_t, std::thread::id> firing;
    };

    std::shared_ptr<State> m_state;

  public:
    DeadlineTimer();

    DeadlineTimer(DeadlineTimer const&) = delete;
    DeadlineTimer& operator=(DeadlineTimer const&) = delete;

    ~DeadlineTimer();

    // Replaces any pending expiry.
    void arm(std::chrono::milliseconds timeout, std::function<void()> on_expiry);

    // Once this returns no callback is pending or running, except the one
    // cancel() is called from.
    void cancel();
};

} // namespace srvlist
