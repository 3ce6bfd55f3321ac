#pragma once

#include "srvlist/executor.hpp"
#include "srvlist/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace srvlist {

// Subscription bookkeeping and delivery for transports. Connected events are
// delivered through `background`, list events through `ordered`, which must
// run tasks one at a time.
//
// The last connected event is sticky: a subscriber that arrives while the
// transport is connected receives it immediately.
class EventBus final {
  public:
    struct Entry;

  private:
    struct State {
        std::mutex mtx;
        std::uint64_t next_id = 0;
        std::map<std::uint64_t, std::shared_ptr<Entry>> entries;
        std::optional<ConnectedEvent> sticky_connected;
    };

    Executor& m_background;
    Executor& m_ordered;
    std::shared_ptr<State> m_state;

  public:
    EventBus(Executor& background, Executor& ordered);

    EventBus(EventBus const&) = delete;
    EventBus& operator=(EventBus const&) = delete;

    Subscription subscribe(TransportHandlers handlers);

    std::size_t subscriber_count() const;

    void publish_connected(ConnectedEvent const& event);

    // Clears the sticky connected event.
    void publish_disconnected();

    void publish_list_received(ListReceivedEvent const& event);
};

} // namespace srvlist
