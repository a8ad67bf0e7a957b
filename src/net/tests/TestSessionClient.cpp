/**
 * @file TestSessionClient.cpp
 * @brief Session tests from the client's side: connect path, timeout,
 *        failure classification and host loss.
 */

#include <catch2/catch_test_macros.hpp>

#include "SessionHarness.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace rdv;
using namespace rdv::net;
using namespace rdv::net::session;

namespace {

struct ConnectOutcome
{
    int                                  calls{0};
    std::optional<core::Expected<void>>  result;

    Session::ConnectCallback callback()
    {
        return [this](core::Expected<void> r)
        {
            ++calls;
            result = std::move(r);
        };
    }

    [[nodiscard]] core::ErrorCode code() const { return result->error().code(); }
};

/// Brings @p session up as a client without connecting it.
void openClient(test::Harness& h, Session& session)
{
    bool ready = false;
    session.initNetwork({}, Role::kClient, [&ready](core::Expected<std::string> r) { ready = r.has_value(); });
    h.pump();
    REQUIRE(ready);
}

/// Registers "rdv-<code>" without accepting connections, so attempts to
/// reach it stay pending.
std::unique_ptr<transport::IPeer> silentHost(test::Harness& h, const std::string& code)
{
    transport::PeerOptions options;
    options.requestedId = "rdv-" + code;
    auto peer = h.network.createPeer(options);
    h.pump();
    return peer;
}

} // namespace

TEST_CASE("Client connects to a host by invite code", "[session][client]")
{
    test::Harness h;
    auto host = h.makeSession();
    REQUIRE(h.openHost(host));
    auto client = h.makeSession();

    REQUIRE(h.joinHost(client, "123456"));
    REQUIRE(client.isConnected());
    REQUIRE(client.role() == Role::kClient);
    REQUIRE(client.connectedPeers().empty());

    const auto info = client.info();
    REQUIRE(info.hostId == "rdv-123456");
    REQUIRE(info.displayCode == "123456");
    REQUIRE(info.peerCount == 1);
    REQUIRE(info.localId == "anon-1");
    REQUIRE(info.displayCode != info.localId);
}

TEST_CASE("Connect times out after the configured delay", "[session][client]")
{
    test::ScopedLogCapture capture;
    test::Harness h;
    auto host = silentHost(h, "123456");
    auto client = h.makeSession();
    openClient(h, client);

    ConnectOutcome outcome;
    client.connectToHost("123456", outcome.callback());

    h.advance(h.config.connectTimeout() - core::Millis{1});
    REQUIRE(outcome.calls == 0);

    h.advance(core::Millis{1});
    REQUIRE(outcome.calls == 1);
    REQUIRE(outcome.code() == core::ErrorCode::kTimeout);
    REQUIRE(outcome.result->error().message().find("30000 ms") != std::string::npos);
    REQUIRE_FALSE(client.isConnected());

    SECTION("a new attempt is allowed afterwards")
    {
        ConnectOutcome retry;
        client.connectToHost("123456", retry.callback());
        REQUIRE(retry.calls == 0);
    }
}

TEST_CASE("Successful connect is resolved exactly once", "[session][client]")
{
    test::Harness h;
    auto host = h.makeSession();
    REQUIRE(h.openHost(host));
    auto client = h.makeSession();
    openClient(h, client);

    ConnectOutcome outcome;
    client.connectToHost("123456", outcome.callback());
    h.pump();
    REQUIRE(outcome.result->has_value());

    h.advance(h.config.connectTimeout() * 2);
    REQUIRE(outcome.calls == 1);
    REQUIRE(client.isConnected());
    REQUIRE(h.timers.pendingCount() == 0);
}

TEST_CASE("Connect failures are classified", "[session][client]")
{
    test::Harness h;
    auto client = h.makeSession();
    openClient(h, client);
    ConnectOutcome outcome;

    SECTION("unknown host")
    {
        client.connectToHost("404404", outcome.callback());
        h.pump();
        REQUIRE(outcome.code() == core::ErrorCode::kPeerUnreachable);
    }
    SECTION("rendezvous server unreachable")
    {
        h.network.setAvailable(false);
        client.connectToHost("123456", outcome.callback());
        h.pump();
        REQUIRE(outcome.code() == core::ErrorCode::kTransportUnavailable);
    }
    SECTION("host drops the offer before it opens")
    {
        auto host = silentHost(h, "123456");
        host->listen(true);
        host->setHandlers(transport::PeerHandlers{
            .onOpen = {},
            .onError = {},
            .onConnection = [](std::shared_ptr<transport::IConnection> c) { c->close(); },
        });
        client.connectToHost("123456", outcome.callback());
        h.pump();
        REQUIRE(outcome.code() == core::ErrorCode::kPeerUnreachable);
    }

    REQUIRE(outcome.calls == 1);
    REQUIRE_FALSE(client.isConnected());
    REQUIRE(h.timers.pendingCount() == 0);
}

TEST_CASE("Client initialization failure leaves the session idle", "[session][client]")
{
    test::Harness h;
    h.network.setAvailable(false);
    auto client = h.makeSession();

    std::optional<core::Expected<std::string>> result;
    client.initNetwork({}, Role::kClient, [&result](core::Expected<std::string> r) { result = r; });
    h.pump();

    REQUIRE(result->error().code() == core::ErrorCode::kTransportUnavailable);
    REQUIRE(client.phase() == SessionPhase::kIdle);
    REQUIRE_FALSE(client.role().has_value());

    h.network.setAvailable(true);
    openClient(h, client);
    REQUIRE(client.isInitialized());
}

TEST_CASE("connectToHost preconditions", "[session][client]")
{
    test::Harness h;
    ConnectOutcome outcome;

    SECTION("not initialized")
    {
        auto client = h.makeSession();
        client.connectToHost("123456", outcome.callback());
        REQUIRE(outcome.code() == core::ErrorCode::kInvalidState);
    }
    SECTION("host role")
    {
        auto host = h.makeSession();
        REQUIRE(h.openHost(host));
        host.connectToHost("123456", outcome.callback());
        REQUIRE(outcome.code() == core::ErrorCode::kInvalidState);
    }
    SECTION("already connecting")
    {
        auto host = silentHost(h, "123456");
        auto client = h.makeSession();
        openClient(h, client);
        ConnectOutcome first;
        client.connectToHost("123456", first.callback());
        client.connectToHost("123456", outcome.callback());
        REQUIRE(outcome.code() == core::ErrorCode::kInvalidState);
        REQUIRE(first.calls == 0);
    }
    SECTION("malformed code")
    {
        auto client = h.makeSession();
        openClient(h, client);
        client.connectToHost("12-456", outcome.callback());
        REQUIRE(outcome.code() == core::ErrorCode::kInvalidArgument);
    }

    REQUIRE(outcome.calls == 1);
}

TEST_CASE("Host loss is reported once", "[session][client]")
{
    test::Harness h;
    auto host = h.makeSession();
    REQUIRE(h.openHost(host));
    auto client = h.makeSession();
    REQUIRE(h.joinHost(client, "123456"));

    std::vector<LifecycleEvent> events;
    client.onConnectionChange([&events](const LifecycleEvent& e) { events.push_back(e); });

    SECTION("host disconnects")
    {
        host.disconnect();
    }
    SECTION("link lost")
    {
        h.network.sever(client.localId());
    }
    h.pump();
    h.advance(h.config.connectTimeout());

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == LifecycleKind::kHostDisconnect);
    REQUIRE(events[0].peer.empty());
    REQUIRE_FALSE(client.isConnected());
    REQUIRE(client.isInitialized());
}

TEST_CASE("Client transmission guards", "[session][client]")
{
    test::ScopedLogCapture capture;
    test::Harness h;
    auto client = h.makeSession();
    openClient(h, client);

    auto toHost = client.sendToHost("chat", {});
    REQUIRE(toHost.error().code() == core::ErrorCode::kNotFound);

    auto toPeer = client.sendToPeer("anon-2", "chat", {});
    REQUIRE(toPeer.error().code() == core::ErrorCode::kInvalidState);
    REQUIRE(client.broadcast("chat", {}) == 0);
    REQUIRE(capture.logger.count(core::LogLevel::kWarn) >= 3);
}
