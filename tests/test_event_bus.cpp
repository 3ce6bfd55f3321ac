#include "srvlist/event_bus.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using srvlist::ConnectedEvent;
using srvlist::EventBus;
using srvlist::InlineExecutor;
using srvlist::ListReceivedEvent;
using srvlist::SerialExecutor;
using srvlist::Subscription;
using srvlist::ThreadExecutor;
using srvlist::TransportHandlers;

using namespace std::chrono_literals;

namespace {
class EventBusTest : public ::testing::Test {
  protected:
    InlineExecutor executor;
    EventBus bus {executor, executor};
    int connected = 0;
    std::vector<std::vector<std::string>> lists;

    TransportHandlers recording_handlers() {
        return TransportHandlers {
            .on_connected = [this](ConnectedEvent const&) { ++connected; },
            .on_list_received =
                [this](ListReceivedEvent const& event) {
                    lists.push_back(event.servers);
                },
        };
    }
};
} // namespace

TEST_F(EventBusTest, DeliversToSubscriber) {
    auto subscription = bus.subscribe(recording_handlers());
    EXPECT_EQ(bus.subscriber_count(), 1u);

    bus.publish_connected(ConnectedEvent {});
    bus.publish_list_received(ListReceivedEvent {.servers = {"s1.example"}});

    EXPECT_EQ(connected, 1);
    ASSERT_EQ(lists.size(), 1u);
    EXPECT_EQ(lists[0], std::vector<std::string> {"s1.example"});
}

TEST_F(EventBusTest, ReleaseStopsDelivery) {
    auto subscription = bus.subscribe(recording_handlers());
    subscription.release();

    EXPECT_TRUE(!subscription);
    EXPECT_EQ(bus.subscriber_count(), 0u);

    bus.publish_connected(ConnectedEvent {});
    bus.publish_list_received(ListReceivedEvent {});
    EXPECT_EQ(connected, 0);
    EXPECT_TRUE(lists.empty());
}

TEST_F(EventBusTest, DestroyingHandleReleases) {
    {
        auto subscription = bus.subscribe(recording_handlers());
        EXPECT_EQ(bus.subscriber_count(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST_F(EventBusTest, MovedHandleKeepsSubscription) {
    Subscription outer;
    {
        auto inner = bus.subscribe(recording_handlers());
        outer = std::move(inner);
    }
    EXPECT_EQ(bus.subscriber_count(), 1u);

    bus.publish_connected(ConnectedEvent {});
    EXPECT_EQ(connected, 1);
}

TEST_F(EventBusTest, LateSubscriberGetsStickyConnected) {
    bus.publish_connected(ConnectedEvent {});

    auto subscription = bus.subscribe(recording_handlers());

    EXPECT_EQ(connected, 1);
}

TEST_F(EventBusTest, DisconnectClearsStickyConnected) {
    bus.publish_connected(ConnectedEvent {});
    bus.publish_disconnected();

    auto subscription = bus.subscribe(recording_handlers());

    EXPECT_EQ(connected, 0);
}

TEST_F(EventBusTest, ListEventsAreNotSticky) {
    bus.publish_list_received(ListReceivedEvent {.servers = {"s1.example"}});

    auto subscription = bus.subscribe(recording_handlers());

    EXPECT_TRUE(lists.empty());
}

TEST_F(EventBusTest, HandlerMayReleaseItsOwnSubscription) {
    Subscription subscription;
    int calls = 0;
    subscription = bus.subscribe(TransportHandlers {
        .on_connected = {},
        .on_list_received =
            [&](ListReceivedEvent const&) {
                ++calls;
                subscription.release();
            },
    });

    bus.publish_list_received(ListReceivedEvent {});
    bus.publish_list_received(ListReceivedEvent {});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count(), 0u);
}

TEST_F(EventBusTest, MissingHandlerIsIgnored) {
    auto subscription = bus.subscribe(TransportHandlers {});

    bus.publish_connected(ConnectedEvent {});
    bus.publish_list_received(ListReceivedEvent {});

    EXPECT_EQ(bus.subscriber_count(), 1u);
}

TEST(EventBusOrdering, ListEventsKeepPublishOrder) {
    ThreadExecutor background;
    SerialExecutor ordered;
    EventBus bus(background, ordered);

    std::mutex mtx;
    std::vector<std::string> seen;
    std::promise<void> all_seen;
    constexpr int COUNT = 50;

    auto subscription = bus.subscribe(TransportHandlers {
        .on_connected = {},
        .on_list_received =
            [&](ListReceivedEvent const& event) {
                auto _guard = std::lock_guard(mtx);
                seen.push_back(event.servers.at(0));
                if (seen.size() == COUNT) {
                    all_seen.set_value();
                }
            },
    });

    for (int i = 0; i < COUNT; ++i) {
        bus.publish_list_received(ListReceivedEvent {
            .servers = {std::to_string(i)},
        });
    }

    ASSERT_EQ(
        all_seen.get_future().wait_for(5s),
        std::future_status::ready
    );
    auto _guard = std::lock_guard(mtx);
    for (int i = 0; i < COUNT; ++i) {
        EXPECT_EQ(seen[i], std::to_string(i));
    }
}

TEST(EventBusRelease, WaitsForRunningHandler) {
    ThreadExecutor background;
    InlineExecutor ordered;
    EventBus bus(background, ordered);

    std::promise<void> entered;
    std::atomic<bool> finished = false;

    auto subscription = bus.subscribe(TransportHandlers {
        .on_connected =
            [&](ConnectedEvent const&) {
                entered.set_value();
                std::this_thread::sleep_for(100ms);
                finished = true;
            },
        .on_list_received = {},
    });

    bus.publish_connected(ConnectedEvent {});
    ASSERT_EQ(entered.get_future().wait_for(5s), std::future_status::ready);

    subscription.release();
    EXPECT_TRUE(finished);
}
