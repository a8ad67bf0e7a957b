/**
 * @file TestLifecycleEvents.cpp
 * @brief Unit tests for LifecycleEventStream.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/net/session/LifecycleEvents.hpp>

#include "SessionHarness.hpp"

#include <vector>

using namespace rdv;
using namespace rdv::net::session;

namespace {

struct RecordingListener final : ILifecycleListener
{
    void onLifecycleEvent(const LifecycleEvent& event) override { seen.push_back(event); }

    std::vector<LifecycleEvent> seen;
};

int gFreeCalls = 0;

void countFreeCall(const LifecycleEvent&)
{
    ++gFreeCalls;
}

} // namespace

TEST_CASE("Subscribers receive events in registration order", "[session][events]")
{
    LifecycleEventStream stream;
    std::vector<int> order;

    stream.subscribe([&](const LifecycleEvent&) { order.push_back(1); });
    stream.subscribe([&](const LifecycleEvent&) { order.push_back(2); });
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "anon-1"});

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("A listener is registered at most once", "[session][events]")
{
    LifecycleEventStream stream;
    RecordingListener listener;

    REQUIRE(stream.addListener(listener));
    REQUIRE_FALSE(stream.addListener(listener));
    stream.publish(LifecycleEvent{LifecycleKind::kLeave, "anon-3"});

    REQUIRE(listener.seen.size() == 1);
    REQUIRE(listener.seen[0] == LifecycleEvent{LifecycleKind::kLeave, "anon-3"});

    REQUIRE(stream.removeListener(listener));
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "anon-4"});
    REQUIRE(listener.seen.size() == 1);
}

TEST_CASE("A callback is registered once per owner", "[session][events]")
{
    LifecycleEventStream stream;
    int calls = 0;
    const int owner = 0;
    auto callback = [&calls](const LifecycleEvent&) { ++calls; };

    const auto first = stream.subscribe(callback, &owner);
    const auto second = stream.subscribe(callback, &owner);

    REQUIRE(first != LifecycleEventStream::kInvalidSubscription);
    REQUIRE(second == first);
    REQUIRE(stream.subscriberCount() == 1);

    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "anon-1"});
    REQUIRE(calls == 1);

    REQUIRE(stream.unsubscribe(first));
    REQUIRE(stream.subscribe(callback, &owner) != first);
}

TEST_CASE("The same plain function is registered once", "[session][events]")
{
    LifecycleEventStream stream;
    gFreeCalls = 0;

    const auto first = stream.subscribe(&countFreeCall);
    REQUIRE(stream.subscribe(&countFreeCall) == first);
    stream.publish(LifecycleEvent{LifecycleKind::kLeave, "anon-2"});

    REQUIRE(gFreeCalls == 1);
}

TEST_CASE("Unowned lambdas subscribe independently", "[session][events]")
{
    LifecycleEventStream stream;
    int calls = 0;
    auto callback = [&calls](const LifecycleEvent&) { ++calls; };

    REQUIRE(stream.subscribe(callback) != stream.subscribe(callback));
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "anon-1"});
    REQUIRE(calls == 2);
}

TEST_CASE("Unsubscribing during publish takes effect on the next event", "[session][events]")
{
    LifecycleEventStream stream;
    int calls = 0;
    LifecycleEventStream::SubscriptionId id = LifecycleEventStream::kInvalidSubscription;

    id = stream.subscribe([&](const LifecycleEvent&)
    {
        ++calls;
        stream.unsubscribe(id);
    });

    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "a"});
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "b"});

    REQUIRE(calls == 1);
    REQUIRE(stream.subscriberCount() == 0);
}

TEST_CASE("Buffered events drain oldest first", "[session][events]")
{
    LifecycleEventStream stream{8};

    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "anon-1"});
    stream.publish(LifecycleEvent{LifecycleKind::kLeave, "anon-1"});

    const auto events = stream.drain();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == LifecycleKind::kJoin);
    REQUIRE(events[1].kind == LifecycleKind::kLeave);
    REQUIRE(stream.drain().empty());
}

TEST_CASE("A full buffer drops the oldest event with a warning", "[session][events]")
{
    test::ScopedLogCapture capture;
    LifecycleEventStream stream{2};

    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "a"});
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "b"});
    stream.publish(LifecycleEvent{LifecycleKind::kJoin, "c"});

    const auto events = stream.drain();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].peer == "b");
    REQUIRE(events[1].peer == "c");
    REQUIRE(capture.logger.count(core::LogLevel::kWarn) == 1);
}

TEST_CASE("Zero capacity disables buffering", "[session][events]")
{
    LifecycleEventStream stream{0};
    stream.publish(LifecycleEvent{LifecycleKind::kHostDisconnect, {}});
    REQUIRE(stream.buffered() == 0);
}

TEST_CASE("Lifecycle kinds have wire names", "[session][events]")
{
    REQUIRE(toString(LifecycleKind::kJoin) == "join");
    REQUIRE(toString(LifecycleKind::kLeave) == "leave");
    REQUIRE(toString(LifecycleKind::kHostDisconnect) == "host_disconnect");
}
