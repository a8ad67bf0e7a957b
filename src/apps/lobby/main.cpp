// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Rendezvous lobby demo entry-point.
///
/// One host and two clients share an in-process loopback network. The host
/// publishes an invite code, both clients join with it, chat is relayed
/// through the host, then everyone leaves.
// /////////////////////////////////////////////////////////////////////////////

#include "PartyMessages.hpp"

#include <rdv/net/quality/LatencyMonitor.hpp>
#include <rdv/net/session/Session.hpp>
#include <rdv/net/transport/LoopbackTransport.hpp>
#include <rdv/runtime/EventLoop.hpp>
#include <rdv/runtime/TimerQueue.hpp>
#include <rdv/core/Log.hpp>

#include <array>
#include <chrono>
#include <map>
#include <string>

using namespace rdv;
using namespace rdv::apps::lobby;
using net::session::Role;
using net::session::Session;

namespace {

struct Member
{
    std::string name;
    Session     session;
    PartyRouter router;

    Member(std::string n, net::transport::ITransport& transport, runtime::TimerQueue& timers,
           const net::session::SessionConfig& config)
        : name{std::move(n)}
        , session{transport, timers, config}
        , router{session.dispatcher()}
    {}
};

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    core::Log::info("lobby", "=== Rendezvous Lobby ===");

    net::transport::LoopbackNetwork network;
    runtime::TimerQueue timers;
    runtime::EventLoop loop{timers};
    loop.addPump([&network] { return network.pump(); });

    const auto config = net::session::SessionConfig::Builder::localDevelopment().build();
    net::session::RandomInviteCodeSource codes;

    Member host{"host", network, timers, config};
    std::array<Member, 2> guests{Member{"alice", network, timers, config},
                                 Member{"bob", network, timers, config}};

    bool failed = false;

    // ------------------------------------------------------------------ //
    //  Host                                                              //
    // ------------------------------------------------------------------ //

    std::string inviteCode;
    host.session.initNetwork(codes.next(config.inviteCodeLength()), Role::kHost,
        [&](core::Expected<std::string> result)
        {
            if (!result)
            {
                core::Log::errorf("lobby", "Host failed: {}", result.error().message());
                failed = true;
                return;
            }
            inviteCode = *result;
            core::Log::infof("lobby", "Invite code: {}", inviteCode);
        });
    loop.runFor(core::Millis{100});
    if (failed || inviteCode.empty())
        return 1;

    std::map<net::PeerId, std::string> party;
    auto publishParty = [&]
    {
        PartyUpdate update{{host.name}};
        for (const auto& [id, name] : party)
            update.members.push_back(name);
        host.session.broadcast(PartyRouter::encode(update));
    };

    host.session.onConnectionChange([&](const net::session::LifecycleEvent& event)
    {
        core::Log::infof("lobby", "[host] {} {}", net::session::toString(event.kind), event.peer);
        if (event.kind == net::session::LifecycleKind::kLeave && party.erase(event.peer) > 0)
            publishParty();
    });
    host.router.on<JoinRequest>([&](const JoinRequest& request, const net::PeerId& from)
    {
        party[from] = request.name;
        publishParty();
    });
    host.router.on<Chat>([&](const Chat& chat, const net::PeerId& from)
    {
        const std::array<net::PeerId, 1> sender{from};
        const auto relayed = host.session.broadcast(PartyRouter::encode(chat), sender);
        core::Log::infof("lobby", "[host] relayed chat from {} to {} peer(s)", chat.author, relayed);
    });

    // ------------------------------------------------------------------ //
    //  Guests                                                            //
    // ------------------------------------------------------------------ //

    for (auto& guest : guests)
    {
        guest.router.on<PartyUpdate>([&guest](const PartyUpdate& update, const net::PeerId&)
        {
            std::string list;
            for (const auto& member : update.members)
                list += (list.empty() ? "" : ", ") + member;
            core::Log::infof("lobby", "[{}] party: {}", guest.name, list);
        });
        guest.router.on<Chat>([&guest](const Chat& chat, const net::PeerId&)
        {
            core::Log::infof("lobby", "[{}] {}: {}", guest.name, chat.author, chat.text);
        });
        guest.session.onConnectionChange([&guest](const net::session::LifecycleEvent&)
        {
            core::Log::warnf("lobby", "[{}] host left", guest.name);
        });

        guest.session.initNetwork({}, Role::kClient, [&](core::Expected<std::string> identity)
        {
            if (!identity)
            {
                core::Log::errorf("lobby", "[{}] no identity: {}", guest.name, identity.error().message());
                failed = true;
                return;
            }
            guest.session.connectToHost(inviteCode, [&](core::Expected<void> connected)
            {
                if (!connected)
                {
                    core::Log::errorf("lobby", "[{}] join failed: {}", guest.name, connected.error().message());
                    failed = true;
                    return;
                }
                if (!guest.session.sendToHost(PartyRouter::encode(JoinRequest{guest.name})))
                    failed = true;
            });
        });
    }
    loop.runFor(core::Millis{500});
    if (failed || host.session.connectedPeers().size() != guests.size())
    {
        core::Log::error("lobby", "Guests did not all join");
        return 1;
    }

    // ------------------------------------------------------------------ //
    //  Play                                                              //
    // ------------------------------------------------------------------ //

    net::quality::LatencyMonitor hostMonitor{host.session};
    net::quality::LatencyMonitor aliceMonitor{guests[0].session};
    hostMonitor.attach();
    aliceMonitor.attach();

    if (!guests[0].session.sendToHost(PartyRouter::encode(Chat{"alice", "ready when you are"})))
        failed = true;

    loop.runFor(std::chrono::seconds{5}, runtime::LoopCallbacks{
        .update = [&](core::TimePoint now)
        {
            hostMonitor.tick(now);
            aliceMonitor.tick(now);
        },
        .postFrame = {},
    });

    for (const auto& [id, latency] : hostMonitor.allPeerLatencies())
    {
        core::Log::infof("lobby", "[host] {} latency {} ({})", id, net::quality::formatLatency(latency),
                         net::quality::toString(net::quality::qualityLevel(latency)));
    }

    // ------------------------------------------------------------------ //
    //  Leave                                                             //
    // ------------------------------------------------------------------ //

    guests[1].session.disconnect();
    loop.runFor(core::Millis{100});
    if (host.session.connectedPeers().size() != 1)
    {
        core::Log::error("lobby", "Host still lists a departed guest");
        failed = true;
    }

    aliceMonitor.detach();
    hostMonitor.detach();
    host.session.disconnect();
    loop.runFor(core::Millis{100});
    guests[0].session.disconnect();

    core::Log::infof("lobby", "Peers created {}, destroyed {}", network.peersCreated(), network.peersDestroyed());
    core::Log::info("lobby", failed ? "Lobby demo failed" : "Lobby demo finished");
    return failed ? 1 : 0;
}
