// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.cpp
/// @brief LoopbackNetwork implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/transport/LoopbackTransport.hpp>
#include <rdv/net/protocol/EnvelopeCodec.hpp>
#include <rdv/core/Log.hpp>

#include <algorithm>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace rdv::net::transport {

std::string_view toString(TransportErrorKind kind) noexcept
{
    switch (kind)
    {
        case TransportErrorKind::kUnavailableId:   return "unavailable-id";
        case TransportErrorKind::kNetwork:         return "network";
        case TransportErrorKind::kPeerUnavailable: return "peer-unavailable";
        case TransportErrorKind::kServerError:     return "server-error";
        case TransportErrorKind::kDisconnected:    return "disconnected";
        case TransportErrorKind::kOther:           return "other";
    }
    return "other";
}

namespace {

constexpr core::u32 kMaxEventsPerPump = 1u << 20;

enum class LinkState : core::u8 { kPending, kOpen, kClosed };

class LoopbackConnection;

struct PeerState
{
    PeerId                                          id;
    PeerHandlers                                    handlers;
    bool                                            listening{false};
    bool                                            destroyed{false};
    std::vector<std::weak_ptr<LoopbackConnection>>  connections;
};

struct LoopbackHub
{
    LoopbackNetwork::Options                               options;
    std::deque<std::function<void()>>                      events;
    std::unordered_map<PeerId, std::weak_ptr<PeerState>>   registry;

    bool               available{true};
    core::u32          failCount{0};
    TransportErrorKind failKind{TransportErrorKind::kOther};

    core::u32 created{0};
    core::u32 destroyed{0};
    core::u32 live{0};
    core::u32 maxLive{0};
    core::u64 frames{0};
    core::u64 anonCounter{0};

    void post(std::function<void()> event) { events.push_back(std::move(event)); }

    [[nodiscard]] std::shared_ptr<PeerState> lookup(const PeerId& id) const
    {
        auto it = registry.find(id);
        if (it == registry.end())
        {
            return nullptr;
        }
        auto state = it->second.lock();
        return (state && !state->destroyed) ? state : nullptr;
    }
};

template <typename Fn, typename... Args>
void fire(const Fn& handler, Args&&... args)
{
    // Copy first: the callback may replace or clear the handler set.
    auto callback = handler;
    if (callback)
    {
        callback(std::forward<Args>(args)...);
    }
}

// /////////////////////////////////////////////////////////////////////////////
//  LoopbackConnection
// /////////////////////////////////////////////////////////////////////////////

class LoopbackConnection final : public IConnection,
                                 public std::enable_shared_from_this<LoopbackConnection>
{
public:
    LoopbackConnection(std::weak_ptr<LoopbackHub> hub, PeerId remoteId)
        : hub_{std::move(hub)}
        , remoteId_{std::move(remoteId)}
    {}

    const PeerId& remoteId() const noexcept override { return remoteId_; }
    bool isOpen() const noexcept override { return state_ == LinkState::kOpen; }

    core::Expected<void> send(const protocol::Envelope& envelope) override
    {
        if (state_ != LinkState::kOpen)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "Connection not open");
        }
        if (!envelope.isValid())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "Envelope does not fit a frame");
        }
        auto hub = hub_.lock();
        if (!hub)
        {
            return core::makeError(core::ErrorCode::kTransportUnavailable, "Loopback network gone");
        }

        hub->post([weakHub = hub_, target = other_, frame = protocol::EnvelopeCodec::encode(envelope)]
        {
            auto receiver = target.lock();
            auto hubNow = weakHub.lock();
            if (!receiver || !hubNow || receiver->state_ != LinkState::kOpen)
            {
                return;
            }
            auto decoded = protocol::EnvelopeCodec::decode(frame);
            if (!decoded)
            {
                core::Log::errorf("transport", "Loopback: dropping undecodable frame: {}",
                                  decoded.error().message());
                return;
            }
            ++hubNow->frames;
            fire(receiver->handlers_.onData, *decoded);
        });
        return {};
    }

    void close() override
    {
        if (state_ == LinkState::kClosed)
        {
            return;
        }
        state_ = LinkState::kClosed;

        auto hub = hub_.lock();
        if (!hub)
        {
            return;
        }

        auto self = shared_from_this();
        hub->post([self] { fire(self->handlers_.onClose); });

        hub->post([target = other_]
        {
            auto remote = target.lock();
            if (!remote || remote->state_ == LinkState::kClosed)
            {
                return;
            }
            remote->state_ = LinkState::kClosed;
            fire(remote->handlers_.onClose);
        });
    }

    void setHandlers(ConnectionHandlers handlers) override { handlers_ = std::move(handlers); }
    void clearHandlers() override { handlers_ = {}; }

    // ---- hub side -------------------------------------------------------

    void link(const std::shared_ptr<LoopbackConnection>& other) { other_ = other; }

    [[nodiscard]] LinkState state() const noexcept { return state_; }

    void open()
    {
        state_ = LinkState::kOpen;
        fire(handlers_.onOpen);
    }

    /// The attempt never reached the far end: error, no close event.
    void reject(TransportErrorKind kind, std::string message)
    {
        state_ = LinkState::kClosed;
        fire(handlers_.onError, TransportError{kind, std::move(message)});
    }

    void failAndClose(TransportErrorKind kind, std::string message)
    {
        if (state_ == LinkState::kClosed)
        {
            return;
        }
        if (auto hub = hub_.lock())
        {
            auto self = shared_from_this();
            hub->post([self, error = TransportError{kind, std::move(message)}]
            {
                fire(self->handlers_.onError, error);
            });
        }
        close();
    }

private:
    std::weak_ptr<LoopbackHub>          hub_;
    PeerId                              remoteId_;
    std::weak_ptr<LoopbackConnection>   other_;
    LinkState                           state_{LinkState::kPending};
    ConnectionHandlers                  handlers_;
};

// /////////////////////////////////////////////////////////////////////////////
//  LoopbackPeer
// /////////////////////////////////////////////////////////////////////////////

class LoopbackPeer final : public IPeer
{
public:
    LoopbackPeer(std::weak_ptr<LoopbackHub> hub, std::shared_ptr<PeerState> state)
        : hub_{std::move(hub)}
        , state_{std::move(state)}
    {}

    ~LoopbackPeer() override { destroy(); }

    const PeerId& id() const noexcept override { return state_->id; }

    void setHandlers(PeerHandlers handlers) override { state_->handlers = std::move(handlers); }

    void listen(bool enabled) override { state_->listening = enabled; }

    std::shared_ptr<IConnection> connect(const PeerId& remoteId, const ConnectOptions& /*options*/) override
    {
        auto conn = std::make_shared<LoopbackConnection>(hub_, remoteId);
        auto hub = hub_.lock();
        if (!hub || state_->destroyed)
        {
            if (hub)
            {
                hub->post([conn] { conn->reject(TransportErrorKind::kDisconnected, "Peer destroyed"); });
            }
            return conn;
        }

        state_->connections.push_back(conn);
        hub->post([weakHub = hub_, conn, remoteId, localId = state_->id]
        {
            auto hubNow = weakHub.lock();
            if (!hubNow || conn->state() != LinkState::kPending)
            {
                return;
            }
            if (!hubNow->available)
            {
                conn->reject(TransportErrorKind::kNetwork, "Rendezvous server unreachable");
                return;
            }

            auto target = hubNow->lookup(remoteId);
            if (!target)
            {
                if (hubNow->options.reportUnknownPeers)
                {
                    conn->reject(TransportErrorKind::kPeerUnavailable,
                                 "Could not connect to peer " + remoteId);
                }
                return;
            }
            if (!target->listening || !target->handlers.onConnection)
            {
                return;
            }

            auto remote = std::make_shared<LoopbackConnection>(weakHub, localId);
            conn->link(remote);
            remote->link(conn);
            target->connections.push_back(remote);
            fire(target->handlers.onConnection, std::static_pointer_cast<IConnection>(remote));

            hubNow->post([conn, remote]
            {
                if (conn->state() != LinkState::kPending || remote->state() != LinkState::kPending)
                {
                    // One side gave up before the handshake finished.
                    if (conn->state() != LinkState::kClosed)
                    {
                        conn->close();
                    }
                    if (remote->state() != LinkState::kClosed)
                    {
                        remote->close();
                    }
                    return;
                }
                remote->open();
                if (conn->state() == LinkState::kPending)
                {
                    conn->open();
                }
            });
        });
        return conn;
    }

    void destroy() override
    {
        if (state_->destroyed)
        {
            return;
        }
        state_->destroyed = true;

        if (auto hub = hub_.lock())
        {
            auto it = hub->registry.find(state_->id);
            if (it != hub->registry.end() && it->second.lock() == state_)
            {
                hub->registry.erase(it);
            }
            --hub->live;
            ++hub->destroyed;
        }

        auto connections = std::move(state_->connections);
        state_->connections.clear();
        for (auto& weak : connections)
        {
            if (auto conn = weak.lock())
            {
                conn->close();
            }
        }
        state_->handlers = {};
    }

    bool isDestroyed() const noexcept override { return state_->destroyed; }

private:
    std::weak_ptr<LoopbackHub>  hub_;
    std::shared_ptr<PeerState>  state_;
};

} // namespace

// /////////////////////////////////////////////////////////////////////////////
//  LoopbackNetwork
// /////////////////////////////////////////////////////////////////////////////

struct LoopbackNetwork::Impl
{
    std::shared_ptr<LoopbackHub> hub{std::make_shared<LoopbackHub>()};
};

LoopbackNetwork::LoopbackNetwork()
    : LoopbackNetwork(Options{})
{}

LoopbackNetwork::LoopbackNetwork(Options options)
    : impl_{std::make_unique<Impl>()}
{
    impl_->hub->options = std::move(options);
}

LoopbackNetwork::~LoopbackNetwork() = default;

std::unique_ptr<IPeer> LoopbackNetwork::createPeer(const PeerOptions& options)
{
    auto& hub = *impl_->hub;
    auto state = std::make_shared<PeerState>();

    ++hub.created;
    ++hub.live;
    hub.maxLive = std::max(hub.maxLive, hub.live);

    hub.post([weakHub = std::weak_ptr<LoopbackHub>{impl_->hub},
              weakState = std::weak_ptr<PeerState>{state},
              requested = options.requestedId]
    {
        auto hubNow = weakHub.lock();
        auto peer = weakState.lock();
        if (!hubNow || !peer || peer->destroyed)
        {
            return;
        }

        auto fail = [&peer](TransportErrorKind kind, std::string message)
        {
            fire(peer->handlers.onError, TransportError{kind, std::move(message)});
        };

        if (!hubNow->available)
        {
            fail(TransportErrorKind::kNetwork, "Rendezvous server unreachable");
            return;
        }
        if (hubNow->failCount > 0)
        {
            --hubNow->failCount;
            fail(hubNow->failKind, "Injected registration failure");
            return;
        }

        PeerId id;
        if (requested)
        {
            if (hubNow->lookup(*requested))
            {
                fail(TransportErrorKind::kUnavailableId, "ID \"" + *requested + "\" is taken");
                return;
            }
            id = *requested;
        }
        else
        {
            do
            {
                id = hubNow->options.anonymousPrefix + std::to_string(++hubNow->anonCounter);
            } while (hubNow->lookup(id));
        }

        hubNow->registry[id] = peer;
        peer->id = id;
        fire(peer->handlers.onOpen, id);
    });

    return std::make_unique<LoopbackPeer>(impl_->hub, std::move(state));
}

const char* LoopbackNetwork::name() const noexcept
{
    return "LoopbackNetwork";
}

core::u32 LoopbackNetwork::pump()
{
    auto& events = impl_->hub->events;
    core::u32 delivered = 0;

    while (!events.empty())
    {
        if (delivered >= kMaxEventsPerPump)
        {
            core::Log::warn("transport", "LoopbackNetwork: event budget exhausted, deferring");
            break;
        }
        auto event = std::move(events.front());
        events.pop_front();
        event();
        ++delivered;
    }
    return delivered;
}

bool LoopbackNetwork::idle() const noexcept
{
    return impl_->hub->events.empty();
}

void LoopbackNetwork::failNextPeers(core::u32 count, TransportErrorKind kind)
{
    impl_->hub->failCount = count;
    impl_->hub->failKind  = kind;
}

void LoopbackNetwork::setAvailable(bool available) noexcept
{
    impl_->hub->available = available;
}

void LoopbackNetwork::setReportUnknownPeers(bool enabled) noexcept
{
    impl_->hub->options.reportUnknownPeers = enabled;
}

void LoopbackNetwork::sever(const PeerId& id)
{
    auto peer = impl_->hub->lookup(id);
    if (!peer)
    {
        return;
    }
    for (auto& weak : peer->connections)
    {
        if (auto conn = weak.lock())
        {
            conn->failAndClose(TransportErrorKind::kDisconnected, "Link lost");
        }
    }
}

bool LoopbackNetwork::isRegistered(const PeerId& id) const
{
    return impl_->hub->lookup(id) != nullptr;
}

core::u32 LoopbackNetwork::peersCreated() const noexcept       { return impl_->hub->created; }
core::u32 LoopbackNetwork::peersDestroyed() const noexcept     { return impl_->hub->destroyed; }
core::u32 LoopbackNetwork::livePeerCount() const noexcept      { return impl_->hub->live; }
core::u32 LoopbackNetwork::maxConcurrentPeers() const noexcept { return impl_->hub->maxLive; }
core::u64 LoopbackNetwork::framesDelivered() const noexcept    { return impl_->hub->frames; }

} // namespace rdv::net::transport
