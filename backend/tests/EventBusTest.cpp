#include "engine/EventBus.hpp"
#include "engine/Events.hpp"

#include <string>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

using rt::engine::EventBus;
using rt::engine::Subscription;
using rt::engine::TransferRemovedEvent;

namespace
{

struct PingEvent
{
    int value = 0;
};

} // namespace

TEST_CASE("EventBus delivers events only to handlers of that type")
{
    EventBus bus;
    std::vector<std::string> removed;
    int pings = 0;
    bus.subscribe<TransferRemovedEvent>(
        [&](TransferRemovedEvent const &event) { removed.push_back(event.id); });
    bus.subscribe<PingEvent>([&](PingEvent const &event)
                             { pings += event.value; });

    bus.publish(TransferRemovedEvent{"abc"});
    bus.publish(PingEvent{2});
    bus.publish(PingEvent{3});

    REQUIRE(removed.size() == 1);
    CHECK(removed.front() == "abc");
    CHECK(pings == 5);
}

TEST_CASE("EventBus unsubscribe is idempotent")
{
    EventBus bus;
    int calls = 0;
    auto id = bus.subscribe<PingEvent>([&](PingEvent const &) { ++calls; });
    auto other = bus.subscribe<PingEvent>([&](PingEvent const &) { ++calls; });
    CHECK(bus.subscriber_count() == 2);

    bus.unsubscribe(id);
    bus.unsubscribe(id);
    bus.unsubscribe(9999);
    CHECK(bus.subscriber_count() == 1);

    bus.publish(PingEvent{});
    CHECK(calls == 1);

    bus.unsubscribe(other);
    bus.publish(PingEvent{});
    CHECK(calls == 1);
    CHECK(bus.subscriber_count() == 0);
}

TEST_CASE("EventBus handlers may unsubscribe themselves while publishing")
{
    EventBus bus;
    int calls = 0;
    rt::engine::SubscriptionId id = 0;
    id = bus.subscribe<PingEvent>(
        [&](PingEvent const &)
        {
            ++calls;
            bus.unsubscribe(id);
        });
    bus.publish(PingEvent{});
    bus.publish(PingEvent{});
    CHECK(calls == 1);
}

TEST_CASE("Subscription releases its handler when destroyed or reset")
{
    EventBus bus;
    int calls = 0;
    {
        Subscription scoped(
            &bus, bus.subscribe<PingEvent>([&](PingEvent const &) { ++calls; }));
        bus.publish(PingEvent{});
        CHECK(bus.subscriber_count() == 1);
    }
    CHECK(bus.subscriber_count() == 0);
    bus.publish(PingEvent{});
    CHECK(calls == 1);

    Subscription first(
        &bus, bus.subscribe<PingEvent>([&](PingEvent const &) { ++calls; }));
    Subscription moved(std::move(first));
    first.reset();
    CHECK(bus.subscriber_count() == 1);
    moved.reset();
    moved.reset();
    CHECK(bus.subscriber_count() == 0);
}
