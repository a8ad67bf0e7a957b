/**
 * @file TestIdentityNegotiator.cpp
 * @brief Unit tests for identity acquisition and collision retries.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/net/session/IdentityNegotiator.hpp>

#include "SessionHarness.hpp"

#include <optional>
#include <string>

using namespace rdv;
using namespace rdv::net;
using namespace rdv::net::session;
using transport::TransportErrorKind;

namespace {

struct Outcome
{
    int                                calls{0};
    std::optional<core::Expected<std::string>> result;

    IdentityNegotiator::ResultCallback callback()
    {
        return [this](core::Expected<std::string> r)
        {
            ++calls;
            result = std::move(r);
        };
    }
};

} // namespace

TEST_CASE("Host identity granted on first attempt", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    negotiator.acquire("123456", Role::kHost, outcome.callback());
    REQUIRE(negotiator.state() == NegotiatorState::kAttempting);
    REQUIRE(negotiator.inProgress());

    h.pump();

    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.result->has_value());
    REQUIRE(**outcome.result == "123456");
    REQUIRE(negotiator.state() == NegotiatorState::kReady);
    REQUIRE(negotiator.localId() == "rdv-123456");
    REQUIRE(negotiator.attempts() == 1);
    REQUIRE(h.network.isRegistered("rdv-123456"));
    REQUIRE(h.codes.calls == 0);
}

TEST_CASE("Collisions retry with fresh codes, one peer at a time", "[session][identity]")
{
    test::ScopedLogCapture capture;
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    h.network.failNextPeers(2, TransportErrorKind::kUnavailableId);
    negotiator.acquire("123456", Role::kHost, outcome.callback());
    h.pump();

    REQUIRE(negotiator.state() == NegotiatorState::kRetrying);
    REQUIRE(negotiator.peer() == nullptr);
    REQUIRE(h.timers.pendingCount() == 1);

    // Nothing happens before the settle delay elapses.
    h.advance(h.config.collisionSettleDelay() - core::Millis{1});
    REQUIRE(negotiator.attempts() == 1);

    h.advance(core::Millis{1});
    REQUIRE(negotiator.attempts() == 2);
    REQUIRE(negotiator.state() == NegotiatorState::kRetrying);

    h.advance(h.config.collisionSettleDelay());

    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.result->has_value());
    REQUIRE(**outcome.result == "555555");
    REQUIRE(negotiator.attempts() == 3);
    REQUIRE(negotiator.localId() == "rdv-555555");
    REQUIRE(h.codes.calls == 2);

    REQUIRE(h.network.peersCreated() == 3);
    REQUIRE(h.network.peersDestroyed() == 2);
    REQUIRE(h.network.maxConcurrentPeers() == 1);
    REQUIRE(capture.logger.contains(core::LogLevel::kWarn, "is taken"));
}

TEST_CASE("Attempt cap rejects with kIdentifierTaken", "[session][identity]")
{
    test::Harness h{SessionConfig::Builder{}.maxIdentityAttempts(3).build()};
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    h.network.failNextPeers(100, TransportErrorKind::kUnavailableId);
    negotiator.acquire("123456", Role::kHost, outcome.callback());
    h.pump();
    for (int i = 0; i < 5; ++i)
        h.advance(h.config.collisionSettleDelay());

    REQUIRE(outcome.calls == 1);
    REQUIRE_FALSE(outcome.result->has_value());
    REQUIRE(outcome.result->error().code() == core::ErrorCode::kIdentifierTaken);
    REQUIRE(negotiator.attempts() == 3);
    REQUIRE(negotiator.state() == NegotiatorState::kFailed);
    REQUIRE(h.network.livePeerCount() == 0);
    REQUIRE(h.timers.pendingCount() == 0);
}

TEST_CASE("Non-collision failures do not retry", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    SECTION("network unavailable")
    {
        h.network.setAvailable(false);
        negotiator.acquire("123456", Role::kHost, outcome.callback());
        h.pump();
        REQUIRE(outcome.result->error().code() == core::ErrorCode::kTransportUnavailable);
    }
    SECTION("server error")
    {
        h.network.failNextPeers(1, TransportErrorKind::kServerError);
        negotiator.acquire("123456", Role::kHost, outcome.callback());
        h.pump();
        REQUIRE(outcome.result->error().code() == core::ErrorCode::kServerError);
    }

    REQUIRE(outcome.calls == 1);
    REQUIRE(negotiator.attempts() == 1);
    REQUIRE(negotiator.state() == NegotiatorState::kFailed);
    REQUIRE(h.timers.pendingCount() == 0);
    REQUIRE(h.network.livePeerCount() == 0);
}

TEST_CASE("Client identity is anonymous", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    negotiator.acquire("ignored", Role::kClient, outcome.callback());
    h.pump();

    REQUIRE(outcome.result->has_value());
    REQUIRE(**outcome.result == "anon-1");
    REQUIRE(negotiator.localId() == "anon-1");
}

TEST_CASE("Client does not retry on a taken identity", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    h.network.failNextPeers(1, TransportErrorKind::kUnavailableId);
    negotiator.acquire({}, Role::kClient, outcome.callback());
    h.pump();

    REQUIRE(outcome.result->error().code() == core::ErrorCode::kIdentifierTaken);
    REQUIRE(negotiator.attempts() == 1);
    REQUIRE(h.timers.pendingCount() == 0);
}

TEST_CASE("Second acquire while busy is rejected", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome first;
    Outcome second;

    negotiator.acquire("123456", Role::kHost, first.callback());
    negotiator.acquire("222222", Role::kHost, second.callback());

    REQUIRE(second.calls == 1);
    REQUIRE(second.result->error().code() == core::ErrorCode::kInvalidState);

    h.pump();
    REQUIRE(first.result->has_value());

    Outcome third;
    negotiator.acquire("333333", Role::kHost, third.callback());
    REQUIRE(third.result->error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(negotiator.localId() == "rdv-123456");
}

TEST_CASE("Abort during the settle delay cancels the retry", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    h.network.failNextPeers(1, TransportErrorKind::kUnavailableId);
    negotiator.acquire("123456", Role::kHost, outcome.callback());
    h.pump();
    REQUIRE(negotiator.state() == NegotiatorState::kRetrying);

    negotiator.abort();

    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.result->error().code() == core::ErrorCode::kCancelled);
    REQUIRE(negotiator.state() == NegotiatorState::kAborted);
    REQUIRE(h.timers.pendingCount() == 0);

    h.advance(h.config.collisionSettleDelay() * 2);
    REQUIRE(h.network.peersCreated() == 1);
    REQUIRE(outcome.calls == 1);
}

TEST_CASE("Abort while registering discards the late grant", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    negotiator.acquire("123456", Role::kHost, outcome.callback());
    negotiator.abort();
    h.pump();

    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.result->error().code() == core::ErrorCode::kCancelled);
    REQUIRE_FALSE(h.network.isRegistered("rdv-123456"));
}

TEST_CASE("Release frees the identity for a new acquire", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;

    negotiator.acquire("123456", Role::kHost, outcome.callback());
    h.pump();
    REQUIRE(h.network.isRegistered("rdv-123456"));

    negotiator.release();
    REQUIRE(negotiator.state() == NegotiatorState::kIdle);
    REQUIRE(negotiator.peer() == nullptr);
    REQUIRE(negotiator.localId().empty());
    REQUIRE_FALSE(h.network.isRegistered("rdv-123456"));

    Outcome again;
    negotiator.acquire("123456", Role::kHost, again.callback());
    h.pump();
    REQUIRE(again.result->has_value());
}

TEST_CASE("Offers are refused without a connection handler", "[session][identity]")
{
    test::Harness h;
    IdentityNegotiator negotiator{h.network, h.timers, h.config, h.codes};
    Outcome outcome;
    negotiator.acquire("123456", Role::kHost, outcome.callback());

    auto visitor = h.network.createPeer({});
    h.pump();

    int opens = 0;
    int closes = 0;
    auto conn = visitor->connect("rdv-123456", transport::ConnectOptions{});
    conn->setHandlers(transport::ConnectionHandlers{
        .onOpen = [&opens] { ++opens; },
        .onData = {},
        .onClose = [&closes] { ++closes; },
        .onError = {},
    });
    h.pump();

    REQUIRE(opens == 0);
    REQUIRE(closes == 1);
    REQUIRE_FALSE(conn->isOpen());
}
