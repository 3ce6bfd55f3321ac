#pragma once

#include "srvlist/deadline_timer.hpp"
#include "srvlist/directory.hpp"
#include "srvlist/directory_cache.hpp"
#include "srvlist/directory_store.hpp"
#include "srvlist/network_oracle.hpp"
#include "srvlist/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

namespace srvlist {

// Outcome of one refresh cycle. Exactly one callback is invoked per started
// cycle, from whichever thread reached the outcome.
class UpdaterListener {
  public:
    virtual ~UpdaterListener() = default;

    // Neither a custom server nor a server list to pick one from.
    virtual void no_data() = 0;

    virtual void network_not_available() = 0;

    virtual void offline_mode_enabled() = 0;

    // `code` is either an UpdaterErrc or the I/O error that prevented the
    // list from being stored.
    virtual void error(std::error_code code, std::string_view reason) = 0;

    virtual void updated(std::shared_ptr<Directory const> directory) = 0;
};

// Downloads the current server list from a server picked from the best
// known list, stores it in the cache file and makes it the current list.
//
// One cycle runs at a time. There is no retry: the caller decides when to
// start again.
class Updater final {
  public:
    enum class State {
        IDLE,
        PRECONDITION_CHECK,
        AWAITING_CONNECTION,
        REQUEST_SENT,
        COMPLETED,
        FAILED,
    };

    struct Options final {
        // Custom server, wins over the server list when valid.
        std::string override_uri;
        // Zero disables the timeout.
        std::chrono::milliseconds timeout;
    };

  private:
    DirectoryCache& m_cache;
    DirectoryStore const& m_store;
    Transport& m_transport;
    NetworkOracle const& m_oracle;
    Options m_options;

    mutable std::mutex m_mtx;
    UpdaterListener* m_listener = nullptr;
    State m_state = State::IDLE;
    std::uint64_t m_session = 0;
    std::size_t m_requests = 0;
    bool m_claimed = false;
    std::size_t m_finishing = 0;
    std::condition_variable m_finished;
    Subscription m_subscription;
    DeadlineTimer m_timer;

    void on_connected(std::uint64_t session);
    void on_list_received(std::uint64_t session, ListReceivedEvent const& event);
    void on_timeout(std::uint64_t session);

    // Takes the subscription of `session` if it is still waiting for a list.
    // The caller must call done_finishing() afterwards.
    bool claim(std::uint64_t session, Subscription& subscription);
    void done_finishing() noexcept;

    // Returns the listener to notify, null if `session` was cancelled.
    UpdaterListener* finish(std::uint64_t session, State state);

  public:
    Updater(
        DirectoryCache& cache,
        DirectoryStore const& store,
        Transport& transport,
        NetworkOracle const& oracle,
        Options options
    );

    Updater(Updater const&) = delete;
    Updater& operator=(Updater const&) = delete;

    // Waits for a cycle that is storing its list. Must not be called from a
    // listener callback.
    ~Updater();

    void set_listener(UpdaterListener* listener);

    // Starts a cycle. Returns false without doing anything if a cycle is
    // already in flight.
    bool start();

    // Stops handling events of the current cycle. No callback is invoked for
    // a cancelled cycle.
    void cancel();

    State state() const;
};

} // namespace srvlist
