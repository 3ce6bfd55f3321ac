#include "srvlist/event_bus.hpp"

#include "shared/util/scope_guard.hpp"

#include <algorithm>
#include <condition_variable>
#include <utility>
#include <vector>

namespace srvlist {

struct EventBus::Entry {
    TransportHandlers handlers;
    std::mutex mtx;
    std::condition_variable idle;
    bool active = true;
    std::size_t running = 0;
};

// Entries whose handlers are running on this thread, innermost last.
static thread_local std::vector<EventBus::Entry const*> running_entries;

static bool running_on_this_thread(EventBus::Entry const* entry) {
    return std::ranges::find(running_entries, entry) != running_entries.end();
}

template <typename Event>
static void dispatch(
    EventBus::Entry& entry,
    std::function<void(Event const&)> const& handler,
    Event const& event
) {
    running_entries.push_back(&entry);
    ScopeGuard _running_entries_guard = []() noexcept {
        running_entries.pop_back();
    };
    {
        auto _guard = std::lock_guard(entry.mtx);
        if (not entry.active) {
            return;
        }
        ++entry.running;
    }
    ScopeGuard _running_guard = [&entry]() noexcept {
        auto _guard = std::lock_guard(entry.mtx);
        --entry.running;
        entry.idle.notify_all();
    };
    if (handler) {
        handler(event);
    }
}

EventBus::EventBus(Executor& background, Executor& ordered)
  : m_background(background),
    m_ordered(ordered),
    m_state(std::make_shared<State>()) {}

Subscription EventBus::subscribe(TransportHandlers handlers) {
    auto entry = std::make_shared<Entry>();
    entry->handlers = std::move(handlers);

    std::uint64_t id;
    std::optional<ConnectedEvent> sticky;
    {
        auto _guard = std::lock_guard(m_state->mtx);
        id = m_state->next_id++;
        m_state->entries.emplace(id, entry);
        sticky = m_state->sticky_connected;
    }

    auto release = [weak_state = std::weak_ptr(m_state), id, entry] {
        if (auto const state = weak_state.lock()) {
            auto _guard = std::lock_guard(state->mtx);
            state->entries.erase(id);
        }
        auto lock = std::unique_lock(entry->mtx);
        entry->active = false;
        if (not running_on_this_thread(entry.get())) {
            entry->idle.wait(lock, [&entry] { return entry->running == 0; });
        }
    };

    if (sticky) {
        m_background.execute([entry, event = *sticky] {
            dispatch(*entry, entry->handlers.on_connected, event);
        });
    }
    return Subscription(std::move(release));
}

std::size_t EventBus::subscriber_count() const {
    auto _guard = std::lock_guard(m_state->mtx);
    return m_state->entries.size();
}

void EventBus::publish_connected(ConnectedEvent const& event) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        auto _guard = std::lock_guard(m_state->mtx);
        m_state->sticky_connected = event;
        for (auto const& [_, entry] : m_state->entries) {
            entries.push_back(entry);
        }
    }
    for (auto& entry : entries) {
        m_background.execute([entry = std::move(entry), event] {
            dispatch(*entry, entry->handlers.on_connected, event);
        });
    }
}

void EventBus::publish_disconnected() {
    auto _guard = std::lock_guard(m_state->mtx);
    m_state->sticky_connected.reset();
}

void EventBus::publish_list_received(ListReceivedEvent const& event) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        auto _guard = std::lock_guard(m_state->mtx);
        for (auto const& [_, entry] : m_state->entries) {
            entries.push_back(entry);
        }
    }
    for (auto& entry : entries) {
        m_ordered.execute([entry = std::move(entry), event] {
            dispatch(*entry, entry->handlers.on_list_received, event);
        });
    }
}

} // namespace srvlist
