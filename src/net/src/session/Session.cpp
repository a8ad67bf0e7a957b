// /////////////////////////////////////////////////////////////////////////////
/// @file Session.cpp
/// @brief Session implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/Session.hpp>
#include <rdv/net/session/Completion.hpp>
#include <rdv/net/session/ConnectionRegistry.hpp>
#include <rdv/net/session/ErrorClassification.hpp>
#include <rdv/net/session/IdentityNegotiator.hpp>
#include <rdv/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>
#include <variant>

namespace rdv::net::session {

namespace {

constexpr std::string_view kTag = "session";

using ConnectionPtr = std::shared_ptr<transport::IConnection>;
using WeakConnection = std::weak_ptr<transport::IConnection>;

/// @brief Detaches every callback, then closes.
void detachAndClose(const ConnectionPtr& connection)
{
    if (connection)
    {
        connection->clearHandlers();
        connection->close();
    }
}

struct HostState
{
    ConnectionRegistry          registry;
    /// @brief Offers whose open handshake has not completed yet.
    std::vector<ConnectionPtr>  pending;
};

struct ClientState
{
    std::string             hostCode;
    PeerId                  hostId;
    ConnectionPtr           hostConnection;
    ConnectionPtr           pendingConnection;
    Completion<void>        pendingConnect;
    runtime::TimerId        connectTimer{runtime::kInvalidTimer};
};

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct Session::Impl
{
    Impl(transport::ITransport& t, runtime::TimerQueue& q, SessionConfig c, IInviteCodeSource* codes)
        : transport{t}
        , timers{q}
        , config{std::move(c)}
        , ownCodes{codes ? std::unique_ptr<IInviteCodeSource>{} : std::make_unique<RandomInviteCodeSource>()}
        , codeSource{codes ? *codes : *ownCodes}
        , negotiator{t, q, config, codeSource}
        , events{config.lifecycleBufferCapacity()}
    {
        negotiator.setConnectionHandler([this](ConnectionPtr connection)
        {
            onInboundOffer(std::move(connection));
        });
        negotiator.setErrorHandler([this](const transport::TransportError& error)
        {
            core::Log::errorf(kTag, "Identity '{}' reported {}: {}",
                              negotiator.localId(), transport::toString(error.kind), error.message);
        });
    }

    transport::ITransport&                               transport;
    runtime::TimerQueue&                                 timers;
    SessionConfig                                        config;
    std::unique_ptr<IInviteCodeSource>                   ownCodes;
    IInviteCodeSource&                                   codeSource;
    IdentityNegotiator                                   negotiator;
    MessageDispatcher                                    dispatcher;
    LifecycleEventStream                                 events;

    SessionPhase                                         phase{SessionPhase::kIdle};
    std::optional<Role>                                  role;
    std::string                                          displayCode;
    std::variant<std::monostate, HostState, ClientState> roleState;

    HostState*   host()   { return std::get_if<HostState>(&roleState); }
    ClientState* client() { return std::get_if<ClientState>(&roleState); }
    const HostState*   host()   const { return std::get_if<HostState>(&roleState); }
    const ClientState* client() const { return std::get_if<ClientState>(&roleState); }

    // ------------------------------------------------------------------ //
    //  Establishment                                                     //
    // ------------------------------------------------------------------ //

    void initNetwork(std::string code, Role requested, InitCallback done)
    {
        Completion<std::string> completion{std::move(done)};

        if (phase == SessionPhase::kActive)
        {
            core::Log::warnf(kTag, "Already initialized as {}", toString(*role));
            completion.resolve(std::move(code));
            return;
        }
        if (phase == SessionPhase::kOpening)
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidState,
                                          "Identity negotiation already in progress"});
            return;
        }
        if (requested == Role::kHost && !InviteCode::isValid(code, config.inviteCodeLength()))
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidArgument,
                std::format("Invite code '{}' is not {} digits", code, config.inviteCodeLength())});
            return;
        }

        phase = SessionPhase::kOpening;
        role  = requested;
        core::Log::infof(kTag, "Opening session as {}", toString(requested));

        negotiator.acquire(std::move(code), requested,
            [this, requested, completion](core::Expected<std::string> result) mutable
            {
                if (!result)
                {
                    core::Log::errorf(kTag, "Identity negotiation failed: {} ({})",
                                      result.error().message(), core::toString(result.error().code()));
                    phase = SessionPhase::kIdle;
                    role.reset();
                    completion.complete(std::move(result));
                    return;
                }

                phase = SessionPhase::kActive;
                if (requested == Role::kHost)
                {
                    roleState.emplace<HostState>();
                    displayCode = *result;
                }
                else
                {
                    roleState.emplace<ClientState>();
                }
                core::Log::infof(kTag, "Session active as {} ({})",
                                 toString(requested), negotiator.localId());
                completion.complete(std::move(result));
            });
    }

    void connectToHost(std::string hostCode, ConnectCallback done)
    {
        Completion<void> completion{std::move(done)};

        if (phase != SessionPhase::kActive)
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidState, "Session is not initialized"});
            return;
        }
        auto* state = client();
        if (!state)
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidState, "Only a client connects to a host"});
            return;
        }
        if (state->hostConnection || state->pendingConnection)
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidState,
                std::format("Already connected or connecting to '{}'", state->hostCode)});
            return;
        }
        if (!InviteCode::isValid(hostCode, config.inviteCodeLength()))
        {
            completion.reject(core::Error{core::ErrorCode::kInvalidArgument,
                std::format("Invite code '{}' is not {} digits", hostCode, config.inviteCodeLength())});
            return;
        }

        auto* peer = negotiator.peer();
        if (!peer)
        {
            completion.reject(core::Error{core::ErrorCode::kInternalError, "No transport identity"});
            return;
        }

        const PeerId remoteId = InviteCode::toIdentity(config.identityPrefix(), hostCode);
        core::Log::infof(kTag, "Connecting to host '{}'", remoteId);

        auto connection = peer->connect(remoteId, transport::ConnectOptions{config.reliable()});
        state->hostCode          = std::move(hostCode);
        state->pendingConnection = connection;
        state->pendingConnect    = completion;
        state->connectTimer      = timers.schedule(config.connectTimeout(), [this] { onConnectTimeout(); });

        WeakConnection weak = connection;
        connection->setHandlers(transport::ConnectionHandlers{
            .onOpen = [this, weak]
            {
                if (auto c = weak.lock())
                    onHostOpen(c);
            },
            .onData = [this, weak](const protocol::Envelope& envelope)
            {
                if (auto c = weak.lock())
                    dispatcher.dispatch(envelope, c->remoteId());
            },
            .onClose = [this, weak]
            {
                if (auto c = weak.lock())
                    onHostClose(c);
            },
            .onError = [this, weak](const transport::TransportError& error)
            {
                if (auto c = weak.lock())
                    onHostError(c, error);
            },
        });
    }

    // ------------------------------------------------------------------ //
    //  Client connect path                                               //
    // ------------------------------------------------------------------ //

    /// @brief Clears the pending attempt and returns its completion.
    Completion<void> takePendingConnect(ClientState& state)
    {
        if (state.connectTimer != runtime::kInvalidTimer)
        {
            timers.cancel(state.connectTimer);
            state.connectTimer = runtime::kInvalidTimer;
        }
        state.pendingConnection.reset();
        return std::exchange(state.pendingConnect, Completion<void>{});
    }

    void onHostOpen(const ConnectionPtr& connection)
    {
        auto* state = client();
        if (!state || state->pendingConnection != connection)
        {
            return;
        }

        auto completion = takePendingConnect(*state);
        state->hostConnection = connection;
        state->hostId         = connection->remoteId();
        core::Log::infof(kTag, "Connected to host '{}'", state->hostId);
        completion.resolve();
    }

    void onConnectTimeout()
    {
        auto* state = client();
        if (!state)
        {
            return;
        }
        state->connectTimer = runtime::kInvalidTimer;
        if (!state->pendingConnection)
        {
            return;
        }

        auto connection = state->pendingConnection;
        auto completion = takePendingConnect(*state);
        detachAndClose(connection);

        const auto waited = std::chrono::duration_cast<core::Millis>(config.connectTimeout()).count();
        core::Log::warnf(kTag, "Host '{}' did not answer within {} ms", connection->remoteId(), waited);
        completion.reject(core::Error{core::ErrorCode::kTimeout,
            std::format("Connection to '{}' timed out after {} ms", connection->remoteId(), waited)});
    }

    void onHostError(const ConnectionPtr& connection, const transport::TransportError& error)
    {
        auto* state = client();
        if (!state)
        {
            return;
        }

        if (state->pendingConnection == connection)
        {
            auto completion = takePendingConnect(*state);
            detachAndClose(connection);
            core::Log::errorf(kTag, "Connecting to '{}' failed: {}", connection->remoteId(), error.message);
            completion.reject(toError(error));
            return;
        }
        if (state->hostConnection == connection)
        {
            core::Log::errorf(kTag, "Host connection '{}': {} ({})",
                              connection->remoteId(), error.message, transport::toString(error.kind));
            connection->close();
        }
    }

    void onHostClose(const ConnectionPtr& connection)
    {
        auto* state = client();
        if (!state)
        {
            return;
        }

        if (state->pendingConnection == connection)
        {
            auto completion = takePendingConnect(*state);
            connection->clearHandlers();
            completion.reject(core::Error{core::ErrorCode::kPeerUnreachable,
                std::format("'{}' closed before the connection opened", connection->remoteId())});
            return;
        }
        if (state->hostConnection != connection)
        {
            return;
        }

        connection->clearHandlers();
        state->hostConnection.reset();
        const auto hostId = std::exchange(state->hostId, PeerId{});
        core::Log::warnf(kTag, "Host '{}' disconnected", hostId);
        events.publish(LifecycleEvent{LifecycleKind::kHostDisconnect, {}});
    }

    // ------------------------------------------------------------------ //
    //  Host accept path                                                  //
    // ------------------------------------------------------------------ //

    void onInboundOffer(ConnectionPtr connection)
    {
        auto* state = host();
        if (!state)
        {
            detachAndClose(connection);
            return;
        }

        core::Log::debugf(kTag, "Connection offer from '{}'", connection->remoteId());

        WeakConnection weak = connection;
        connection->setHandlers(transport::ConnectionHandlers{
            .onOpen = [this, weak]
            {
                if (auto c = weak.lock())
                    onInboundOpen(c);
            },
            .onData = [this, weak](const protocol::Envelope& envelope)
            {
                if (auto c = weak.lock())
                    dispatcher.dispatch(envelope, c->remoteId());
            },
            .onClose = [this, weak]
            {
                if (auto c = weak.lock())
                    onInboundClose(c);
            },
            .onError = [weak](const transport::TransportError& error)
            {
                auto c = weak.lock();
                if (!c)
                    return;
                core::Log::errorf(kTag, "Connection '{}': {} ({})",
                                  c->remoteId(), error.message, transport::toString(error.kind));
                c->close();
            },
        });
        state->pending.push_back(std::move(connection));
    }

    void onInboundOpen(const ConnectionPtr& connection)
    {
        auto* state = host();
        if (!state)
        {
            return;
        }
        std::erase(state->pending, connection);

        const PeerId id = connection->remoteId();
        if (auto displaced = state->registry.insert(id, connection))
        {
            core::Log::warnf(kTag, "'{}' reconnected; dropping its previous connection", id);
            detachAndClose(displaced);
            events.publish(LifecycleEvent{LifecycleKind::kLeave, id});
        }

        core::Log::infof(kTag, "'{}' joined ({} connected)", id, state->registry.size());
        events.publish(LifecycleEvent{LifecycleKind::kJoin, id});
    }

    void onInboundClose(const ConnectionPtr& connection)
    {
        auto* state = host();
        if (!state)
        {
            return;
        }
        connection->clearHandlers();
        std::erase(state->pending, connection);

        const PeerId id = connection->remoteId();
        if (state->registry.erase(id, connection.get()))
        {
            core::Log::infof(kTag, "'{}' left ({} connected)", id, state->registry.size());
            events.publish(LifecycleEvent{LifecycleKind::kLeave, id});
        }
    }

    // ------------------------------------------------------------------ //
    //  Transmission                                                      //
    // ------------------------------------------------------------------ //

    core::Expected<void> checkSend(Role required, const protocol::Envelope& envelope, std::string_view op) const
    {
        if (phase != SessionPhase::kActive)
        {
            core::Log::warnf(kTag, "{} ignored: session is {}", op, toString(phase));
            return core::makeError(core::ErrorCode::kInvalidState,
                                   std::format("{} requires an active session", op));
        }
        if (role != required)
        {
            core::Log::warnf(kTag, "{} ignored: not available to a {}", op, toString(*role));
            return core::makeError(core::ErrorCode::kInvalidState,
                                   std::format("{} is {}-only", op, toString(required)));
        }
        if (envelope.type.empty())
        {
            core::Log::warnf(kTag, "{} ignored: envelope has no type", op);
            return core::makeError(core::ErrorCode::kInvalidArgument, "Envelope type is empty");
        }
        if (!envelope.isValid())
        {
            core::Log::warnf(kTag, "{} ignored: envelope '{:.32}' exceeds the frame limits (type {} B, payload {} B)",
                             op, envelope.type, envelope.type.size(), envelope.payload.size());
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("Envelope type must be at most {} bytes and payload at most {} bytes",
                            core::kMaxMessageTypeLength, core::kMaxPayloadSize));
        }
        return {};
    }

    core::Expected<void> sendToHost(const protocol::Envelope& envelope)
    {
        RDV_TRY_VOID(checkSend(Role::kClient, envelope, "sendToHost"));

        const auto* state = client();
        if (!state->hostConnection || !state->hostConnection->isOpen())
        {
            core::Log::warnf(kTag, "sendToHost('{}') ignored: no host connection", envelope.type);
            return core::makeError(core::ErrorCode::kNotFound, "Not connected to a host");
        }
        return state->hostConnection->send(envelope);
    }

    core::Expected<void> sendToPeer(const PeerId& peer, const protocol::Envelope& envelope)
    {
        RDV_TRY_VOID(checkSend(Role::kHost, envelope, "sendToPeer"));

        auto connection = host()->registry.find(peer);
        if (!connection)
        {
            core::Log::warnf(kTag, "sendToPeer('{}') ignored: '{}' is not connected", envelope.type, peer);
            return core::makeError(core::ErrorCode::kNotFound,
                                   std::format("Peer '{}' is not connected", peer));
        }
        return connection->send(envelope);
    }

    core::u32 broadcast(const protocol::Envelope& envelope, std::span<const PeerId> exclude)
    {
        if (!checkSend(Role::kHost, envelope, "broadcast"))
        {
            return 0;
        }

        core::u32 delivered = 0;
        for (const auto& id : host()->registry.ids())
        {
            if (std::ranges::find(exclude, id) != exclude.end())
            {
                continue;
            }
            // A send may close connections synchronously on some transports.
            auto* state = host();
            auto connection = state ? state->registry.find(id) : nullptr;
            if (!connection)
            {
                continue;
            }
            if (auto sent = connection->send(envelope); !sent)
            {
                core::Log::warnf(kTag, "broadcast('{}') to '{}' failed: {}",
                                 envelope.type, id, sent.error().message());
                continue;
            }
            ++delivered;
        }
        return delivered;
    }

    // ------------------------------------------------------------------ //
    //  Teardown                                                          //
    // ------------------------------------------------------------------ //

    void disconnect()
    {
        if (phase == SessionPhase::kClosed)
        {
            return;
        }

        core::Log::infof(kTag, "Disconnecting ({})", toString(phase));

        if (phase == SessionPhase::kOpening)
        {
            negotiator.abort();
        }

        Completion<void> abandoned;
        if (auto* state = host())
        {
            for (auto& connection : std::exchange(state->pending, {}))
            {
                detachAndClose(connection);
            }
            for (auto& connection : state->registry.takeAll())
            {
                detachAndClose(connection);
            }
        }
        else if (auto* state = client())
        {
            auto pending = state->pendingConnection;
            abandoned = takePendingConnect(*state);
            detachAndClose(pending);
            detachAndClose(std::exchange(state->hostConnection, nullptr));
        }

        roleState.emplace<std::monostate>();
        negotiator.release();
        dispatcher.clearAllHandlers();
        events.clear();
        role.reset();
        displayCode.clear();
        phase = SessionPhase::kClosed;

        abandoned.reject(core::Error{core::ErrorCode::kCancelled, "Session disconnected"});
    }

    NetworkInfo info() const
    {
        NetworkInfo out;
        out.initialized = phase == SessionPhase::kActive;
        out.phase       = phase;
        out.role        = role;
        out.localId     = negotiator.localId();
        if (host())
        {
            out.displayCode    = displayCode;
            out.connectedPeers = connectedPeers();
            out.peerCount      = out.connectedPeers.size();
        }
        else if (const auto* state = client())
        {
            out.displayCode = state->hostCode;
            out.hostId      = state->hostId;
            out.peerCount   = state->hostConnection ? 1 : 0;
        }
        return out;
    }

    std::vector<PeerId> connectedPeers() const
    {
        const auto* state = host();
        if (!state)
        {
            return {};
        }
        auto ids = state->registry.ids();
        std::ranges::sort(ids);
        return ids;
    }
};

// ========================================================================== //
//  Session                                                                   //
// ========================================================================== //

Session::Session(transport::ITransport& transport,
                 runtime::TimerQueue& timers,
                 SessionConfig config,
                 IInviteCodeSource* codes)
    : impl_{std::make_unique<Impl>(transport, timers, std::move(config), codes)}
{}

Session::~Session()
{
    if (impl_)
    {
        impl_->disconnect();
    }
}

Session::Session(Session&&) noexcept = default;

Session& Session::operator=(Session&& other) noexcept
{
    if (this != &other)
    {
        if (impl_)
        {
            impl_->disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

void Session::initNetwork(std::string code, Role role, InitCallback done)
{
    impl_->initNetwork(std::move(code), role, std::move(done));
}

void Session::connectToHost(std::string hostCode, ConnectCallback done)
{
    impl_->connectToHost(std::move(hostCode), std::move(done));
}

core::Expected<void> Session::sendToHost(std::string type, Payload payload)
{
    return impl_->sendToHost(protocol::Envelope{std::move(type), std::move(payload)});
}

core::Expected<void> Session::sendToHost(const protocol::Envelope& envelope)
{
    return impl_->sendToHost(envelope);
}

core::Expected<void> Session::sendToPeer(const PeerId& peer, std::string type, Payload payload)
{
    return impl_->sendToPeer(peer, protocol::Envelope{std::move(type), std::move(payload)});
}

core::Expected<void> Session::sendToPeer(const PeerId& peer, const protocol::Envelope& envelope)
{
    return impl_->sendToPeer(peer, envelope);
}

core::u32 Session::broadcast(std::string type, Payload payload, std::span<const PeerId> exclude)
{
    return impl_->broadcast(protocol::Envelope{std::move(type), std::move(payload)}, exclude);
}

core::u32 Session::broadcast(const protocol::Envelope& envelope, std::span<const PeerId> exclude)
{
    return impl_->broadcast(envelope, exclude);
}

void Session::disconnect()
{
    impl_->disconnect();
}

MessageDispatcher& Session::dispatcher() noexcept           { return impl_->dispatcher; }
LifecycleEventStream& Session::events() noexcept            { return impl_->events; }
NetworkInfo Session::info() const                           { return impl_->info(); }
SessionPhase Session::phase() const noexcept                { return impl_->phase; }
std::optional<Role> Session::role() const noexcept          { return impl_->role; }
bool Session::isInitialized() const noexcept                { return impl_->phase == SessionPhase::kActive; }
std::vector<PeerId> Session::connectedPeers() const         { return impl_->connectedPeers(); }
const PeerId& Session::localId() const noexcept             { return impl_->negotiator.localId(); }
const SessionConfig& Session::config() const noexcept       { return impl_->config; }
runtime::TimerQueue& Session::timers() noexcept             { return impl_->timers; }

LifecycleEventStream::SubscriptionId Session::onConnectionChange(LifecycleEventStream::Callback callback,
                                                                 const void* owner)
{
    return impl_->events.subscribe(std::move(callback), owner);
}

bool Session::onConnectionChange(ILifecycleListener& listener)
{
    return impl_->events.addListener(listener);
}

bool Session::isConnected() const noexcept
{
    if (impl_->phase != SessionPhase::kActive)
    {
        return false;
    }
    if (const auto* state = impl_->client())
    {
        return state->hostConnection && state->hostConnection->isOpen();
    }
    return impl_->host() != nullptr;
}

} // namespace rdv::net::session
