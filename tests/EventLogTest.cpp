#include "engine/EventBus.hpp"
#include "engine/EventLog.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace rotor::engine;

namespace
{

PoolEvent make_event(std::string message)
{
    PoolEvent event;
    event.account_id = "a";
    event.kind = EventKind::TaskCompleted;
    event.message = std::move(message);
    return event;
}

} // namespace

TEST_CASE("event log stamps sequence numbers and keeps the newest")
{
    EventLog log(3);
    for (int i = 1; i <= 5; ++i)
    {
        auto const &stored = log.append(make_event("job " + std::to_string(i)));
        CHECK(stored.sequence == static_cast<std::uint64_t>(i));
    }
    CHECK(log.size() == 3);
    CHECK(log.last_sequence() == 5);

    auto recent = log.recent(10);
    REQUIRE(recent.size() == 3);
    CHECK(recent.front().message == "job 3");
    CHECK(recent.back().message == "job 5");

    auto last_two = log.recent(2);
    REQUIRE(last_two.size() == 2);
    CHECK(last_two[0].sequence == 4);
    CHECK(log.recent(0).empty());
}

TEST_CASE("event log capacity is at least one")
{
    EventLog log(0);
    log.append(make_event("only"));
    log.append(make_event("newest"));
    CHECK(log.capacity() == 1);
    REQUIRE(log.recent(5).size() == 1);
    CHECK(log.recent(5)[0].message == "newest");
}

TEST_CASE("event bus delivers by type until unsubscribed")
{
    EventBus bus;
    std::vector<std::string> seen;
    int other = 0;
    auto id = bus.subscribe<PoolEvent>([&](PoolEvent const &event)
                                       { seen.push_back(event.message); });
    bus.subscribe<int>([&](int const &) { ++other; });
    CHECK(bus.subscriber_count<PoolEvent>() == 1);

    bus.publish(make_event("first"));
    CHECK(bus.unsubscribe(id));
    CHECK_FALSE(bus.unsubscribe(id));
    bus.publish(make_event("second"));

    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == "first");
    CHECK(other == 0);
}

TEST_CASE("handlers may subscribe while an event is delivered")
{
    EventBus bus;
    int late = 0;
    bus.subscribe<int>(
        [&](int const &)
        { bus.subscribe<int>([&](int const &) { ++late; }); });
    bus.publish(1);
    CHECK(late == 0);
    bus.publish(2);
    CHECK(late == 1);
}
