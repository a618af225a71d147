#include <catch2/catch_test_macros.hpp>

#include <thread>

#include "hindsight/core/events/event_broadcaster.hpp"
#include "support/test_support.hpp"

using namespace hindsight::core;
using hindsight::test::trace_id_of;

namespace {

events::TraceEvent started(uint8_t seed) {
    return events::TraceStarted{trace_id_of(seed), "root", "checkout"};
}

}  // namespace

TEST_CASE("Broadcaster fans out in publish order", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(16);
    auto first = broadcaster.subscribe();
    auto second = broadcaster.subscribe();
    REQUIRE(broadcaster.subscriber_count() == 2);

    for (uint8_t i = 1; i <= 3; ++i) {
        REQUIRE(broadcaster.publish(started(i)) == 2);
    }

    for (auto* subscription : {&first, &second}) {
        for (uint8_t i = 1; i <= 3; ++i) {
            auto event = subscription->try_next();
            REQUIRE(event.has_value());
            REQUIRE(events::event_trace_id(*event) == trace_id_of(i));
            REQUIRE(std::string(events::event_name(*event)) == "trace_started");
        }
        REQUIRE_FALSE(subscription->try_next().has_value());
    }
}

TEST_CASE("Slow subscriber loses the oldest events", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(4);
    auto slow = broadcaster.subscribe();
    auto fast = broadcaster.subscribe();

    for (uint8_t i = 1; i <= 10; ++i) {
        broadcaster.publish(started(i));
        auto event = fast.try_next();
        REQUIRE(event.has_value());
    }

    REQUIRE(slow.pending() == 4);
    REQUIRE(slow.dropped_count() == 6);
    REQUIRE(fast.dropped_count() == 0);
    REQUIRE(broadcaster.dropped_total() == 6);
    REQUIRE(broadcaster.published_total() == 10);

    for (uint8_t i = 7; i <= 10; ++i) {
        auto event = slow.try_next();
        REQUIRE(event.has_value());
        REQUIRE(events::event_trace_id(*event) == trace_id_of(i));
    }
}

TEST_CASE("Dropping a subscription unregisters it", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(8);

    SECTION("Explicit cancel") {
        auto subscription = broadcaster.subscribe();
        subscription.cancel();
        REQUIRE_FALSE(subscription.active());
        REQUIRE(broadcaster.subscriber_count() == 0);
        REQUIRE(broadcaster.publish(started(1)) == 0);
        REQUIRE_FALSE(subscription.next().has_value());
    }

    SECTION("Destructor") {
        {
            auto subscription = broadcaster.subscribe();
            REQUIRE(broadcaster.subscriber_count() == 1);
        }
        REQUIRE(broadcaster.subscriber_count() == 0);
    }

    SECTION("Moved-from subscription is inert") {
        auto original = broadcaster.subscribe();
        auto moved = std::move(original);
        REQUIRE_FALSE(original.active());
        REQUIRE(moved.active());
        REQUIRE(broadcaster.subscriber_count() == 1);
        broadcaster.publish(started(2));
        REQUIRE(moved.try_next().has_value());
    }
}

TEST_CASE("Shutdown closes every subscription", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(8);
    auto subscription = broadcaster.subscribe();
    broadcaster.publish(started(1));

    broadcaster.shutdown();
    REQUIRE_FALSE(subscription.active());
    REQUIRE_FALSE(subscription.next().has_value());
    REQUIRE(broadcaster.subscriber_count() == 0);

    auto late = broadcaster.subscribe();
    REQUIRE_FALSE(late.active());
    REQUIRE(broadcaster.publish(started(2)) == 0);
    REQUIRE_FALSE(late.next().has_value());
}

TEST_CASE("Blocking next wakes on publish", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(8);
    auto subscription = broadcaster.subscribe();

    std::optional<events::TraceEvent> received;
    std::thread reader([&] { received = subscription.next(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    broadcaster.publish(events::TraceCompleted{trace_id_of(3), uint64_t{500}, 2});
    reader.join();

    REQUIRE(received.has_value());
    REQUIRE(std::holds_alternative<events::TraceCompleted>(*received));
    REQUIRE(std::get<events::TraceCompleted>(*received).span_count == 2);

    REQUIRE_FALSE(subscription.next_for(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("Shutdown releases a blocked reader", "[events][broadcast]") {
    events::EventBroadcaster broadcaster(8);
    auto subscription = broadcaster.subscribe();

    std::optional<events::TraceEvent> received{started(1)};
    std::thread reader([&] { received = subscription.next(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    broadcaster.shutdown();
    reader.join();
    REQUIRE_FALSE(received.has_value());
}
