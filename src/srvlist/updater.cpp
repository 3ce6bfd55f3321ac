#include "srvlist/updater.hpp"

#include "shared/util/scope_guard.hpp"
#include "srvlist/log.hpp"
#include "srvlist/resolver.hpp"
#include "srvlist/updater_errc.hpp"

#include <exception>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <utility>

namespace srvlist {

static bool in_flight(Updater::State const state) noexcept {
    switch (state) {
        case Updater::State::PRECONDITION_CHECK:
        case Updater::State::AWAITING_CONNECTION:
        case Updater::State::REQUEST_SENT:
            return true;
        default:
            return false;
    }
}

static bool awaiting_list(Updater::State const state) noexcept {
    return state == Updater::State::AWAITING_CONNECTION
        or state == Updater::State::REQUEST_SENT;
}

Updater::Updater(
    DirectoryCache& cache,
    DirectoryStore const& store,
    Transport& transport,
    NetworkOracle const& oracle,
    Options options
)
  : m_cache(cache),
    m_store(store),
    m_transport(transport),
    m_oracle(oracle),
    m_options(std::move(options)) {}

Updater::~Updater() {
    cancel();
    auto lock = std::unique_lock(m_mtx);
    m_finished.wait(lock, [this] { return m_finishing == 0; });
}

void Updater::set_listener(UpdaterListener* const listener) {
    auto _guard = std::lock_guard(m_mtx);
    m_listener = listener;
}

bool Updater::start() {
    std::uint64_t session;
    {
        auto _guard = std::lock_guard(m_mtx);
        if (in_flight(m_state)) {
            Log::warn("server list update already in progress");
            return false;
        }
        m_state = State::PRECONDITION_CHECK;
        session = ++m_session;
        m_requests = 0;
        m_claimed = false;
    }

    // We have a server list, either builtin or cached. Pick a server from it
    // and ask it for the latest list.
    std::shared_ptr<Directory const> const directory = m_cache.current();
    std::optional<Endpoint> const endpoint
        = resolve_endpoint(m_options.override_uri, directory.get());
    if (not endpoint) {
        Log::update_aborted("no server list to pick a server from");
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->no_data();
        }
        return true;
    }

    if (not m_oracle.is_network_available()) {
        Log::update_aborted("network not available");
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->network_not_available();
        }
        return true;
    }

    if (m_oracle.is_offline_mode_enabled()) {
        Log::update_aborted("offline mode enabled");
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->offline_mode_enabled();
        }
        return true;
    }

    Log::update_started(*endpoint);

    // Subscribe before connecting, so the connected event cannot be missed.
    // An already connected transport may answer before subscribe() returns,
    // so the timer is armed first.
    {
        auto _guard = std::lock_guard(m_mtx);
        if (session != m_session) {
            return true;
        }
        m_state = State::AWAITING_CONNECTION;
    }
    if (m_options.timeout > std::chrono::milliseconds::zero()) {
        m_timer.arm(m_options.timeout, [this, session] { on_timeout(session); });
    }
    Subscription subscription = m_transport.subscribe(TransportHandlers {
        .on_connected = [this, session](ConnectedEvent const&) {
            on_connected(session);
        },
        .on_list_received = [this, session](ListReceivedEvent const& event) {
            on_list_received(session, event);
        },
    });
    {
        auto _guard = std::lock_guard(m_mtx);
        if (session != m_session or m_claimed) {
            // Cancelled, or already answered during subscribe().
            return true;
        }
        m_subscription = std::move(subscription);
    }

    // A list can only arrive on an established connection, so connecting
    // after an answer raced in is redundant but harmless.
    m_transport.connect(*endpoint);
    return true;
}

void Updater::cancel() {
    Subscription subscription;
    bool was_in_flight;
    {
        auto _guard = std::lock_guard(m_mtx);
        ++m_session;
        subscription = std::move(m_subscription);
        was_in_flight = in_flight(m_state);
        if (was_in_flight) {
            m_state = State::IDLE;
        }
    }
    subscription.release();
    m_timer.cancel();
    if (was_in_flight) {
        Log::update_aborted("cancelled");
    }
}

Updater::State Updater::state() const {
    auto _guard = std::lock_guard(m_mtx);
    return m_state;
}

void Updater::on_connected(std::uint64_t const session) {
    std::size_t requests;
    {
        auto _guard = std::lock_guard(m_mtx);
        if (session != m_session or m_claimed or not awaiting_list(m_state)) {
            return;
        }
        m_state = State::REQUEST_SENT;
        requests = ++m_requests;
    }
    // Every (re)connection gets its own request.
    Log::list_requested(requests);
    m_transport.post(ListRequest {.target = std::nullopt});
}

void Updater::on_list_received(
    std::uint64_t const session,
    ListReceivedEvent const& event
) {
    Subscription subscription;
    if (not claim(session, subscription)) {
        return;
    }
    ScopeGuard const _finishing_guard = [this]() noexcept {
        done_finishing();
    };
    // We don't need further events.
    subscription.release();
    m_timer.cancel();

    Log::list_received(event.servers.size());
    if (event.servers.empty()) {
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->error(
                make_error_code(UpdaterErrc::empty_result),
                "server sent an empty list"
            );
        }
        return;
    }

    auto const directory = std::make_shared<Directory>(
        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())
    );
    for (std::string const& server : event.servers) {
        try {
            directory->add(Endpoint::from_str(server));
        } catch (std::invalid_argument const& err) {
            Log::entry_skipped(server, err.what());
        }
    }
    if (directory->empty()) {
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->error(
                make_error_code(UpdaterErrc::empty_result),
                "server sent no valid entry"
            );
        }
        return;
    }

    // The list on disk and the current list must not disagree, so the new
    // list only becomes current once stored.
    try {
        m_store.save_cached(*directory);
    } catch (std::system_error const& err) {
        Log::error(err.what());
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->error(err.code(), err.what());
        }
        return;
    } catch (std::exception const& err) {
        Log::error(err.what());
        if (auto* const listener = finish(session, State::FAILED)) {
            listener->error(make_error_code(UpdaterErrc::io_error), err.what());
        }
        return;
    }

    m_cache.replace(directory);
    if (auto* const listener = finish(session, State::COMPLETED)) {
        listener->updated(directory);
    }
}

void Updater::on_timeout(std::uint64_t const session) {
    Subscription subscription;
    if (not claim(session, subscription)) {
        return;
    }
    ScopeGuard const _finishing_guard = [this]() noexcept {
        done_finishing();
    };
    subscription.release();

    Log::time_out(m_options.timeout);
    if (auto* const listener = finish(session, State::FAILED)) {
        listener->error(
            make_error_code(UpdaterErrc::timeout),
            fmt::format("no server list after {} ms", m_options.timeout.count())
        );
    }
}

bool Updater::claim(std::uint64_t const session, Subscription& subscription) {
    auto _guard = std::lock_guard(m_mtx);
    if (session != m_session or m_claimed or not awaiting_list(m_state)) {
        return false;
    }
    m_claimed = true;
    ++m_finishing;
    subscription = std::move(m_subscription);
    return true;
}

void Updater::done_finishing() noexcept {
    {
        auto _guard = std::lock_guard(m_mtx);
        --m_finishing;
    }
    m_finished.notify_all();
}

UpdaterListener*
Updater::finish(std::uint64_t const session, State const state) {
    auto _guard = std::lock_guard(m_mtx);
    if (session != m_session) {
        return nullptr;
    }
    m_state = state;
    return m_listener;
}

} // namespace srvlist
