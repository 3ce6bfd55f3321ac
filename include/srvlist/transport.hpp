#pragma once

#include "srvlist/endpoint.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace srvlist {

struct ConnectedEvent final {};

struct ListReceivedEvent final {
    std::vector<std::string> servers;
};

// `target` empty means "any server", i.e. a broadcast request.
struct ListRequest final {
    std::optional<std::string> target;
};

struct TransportHandlers final {
    std::function<void(ConnectedEvent const&)> on_connected;
    std::function<void(ListReceivedEvent const&)> on_list_received;
};

// Handle to an event subscription. The subscription ends when the handle is
// released or destroyed; once that returns no handler of it is running,
// unless release() was called from one of those handlers.
class Subscription final {
  private:
    std::function<void()> m_release;

  public:
    Subscription() noexcept;
    explicit Subscription(std::function<void()> release) noexcept;

    Subscription(Subscription const&) = delete;
    Subscription& operator=(Subscription const&) = delete;

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    ~Subscription();

    void release() noexcept;

    bool operator!() const noexcept;
};

// Connection layer able to reach one server and obtain the server list from
// it. Events are delivered asynchronously to subscribers.
class Transport {
  public:
    virtual ~Transport() = default;

    virtual Subscription subscribe(TransportHandlers handlers) = 0;

    // Does not wait for the connection to be established.
    virtual void connect(Endpoint const& endpoint) = 0;

    virtual void post(ListRequest const& request) = 0;
};

} // namespace srvlist
