// /////////////////////////////////////////////////////////////////////////////
/// @file Session.hpp
/// @brief Host-authoritative peer-to-peer session.
///
/// A Session ties together the identity negotiator, the connection
/// lifecycle (host accept path, client connect path), message dispatch
/// and the transmission primitives. It is an explicit value owned by the
/// application: nothing here is process-global.
///
/// Everything runs on the thread that pumps the transport and advances
/// the TimerQueue. Results of asynchronous operations are delivered
/// through callbacks on that same thread.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/session/InviteCode.hpp>
#include <rdv/net/session/LifecycleEvents.hpp>
#include <rdv/net/session/MessageDispatcher.hpp>
#include <rdv/net/session/Role.hpp>
#include <rdv/net/session/SessionConfig.hpp>
#include <rdv/net/transport/ITransport.hpp>
#include <rdv/runtime/TimerQueue.hpp>
#include <rdv/core/Expected.hpp>
#include <rdv/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @struct NetworkInfo
/// @brief Snapshot for status displays.
// /////////////////////////////////////////////////////////////////////////////
struct NetworkInfo
{
    bool                 initialized{false};
    SessionPhase         phase{SessionPhase::kIdle};
    std::optional<Role>  role;
    /// @brief Host: the granted invite code. Client: the code it joined.
    std::string          displayCode;
    PeerId               localId;
    PeerId               hostId;
    std::vector<PeerId>  connectedPeers;
    core::usize          peerCount{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Session
/// @brief One local endpoint of a host/client session.
///
/// Lifecycle: kIdle → initNetwork → kOpening → kActive → disconnect →
/// kClosed. The role is fixed while the session is active. Every
/// transmission primitive is a logged no-op returning an error outside
/// kActive or from the wrong role.
///
/// Do not call disconnect() or destroy the Session from inside one of its
/// own lifecycle or message callbacks.
// /////////////////////////////////////////////////////////////////////////////
class Session final : public core::NonCopyable<Session>
{
public:
    /// @brief Host: the granted invite code. Client: the granted identity.
    using InitCallback    = std::function<void(core::Expected<std::string>)>;
    using ConnectCallback = std::function<void(core::Expected<void>)>;

    /// @param codes Code generator for collision retries; a random one is
    ///              created when null. Must outlive the session.
    Session(transport::ITransport& transport,
            runtime::TimerQueue& timers,
            SessionConfig config = SessionConfig::Builder{}.build(),
            IInviteCodeSource* codes = nullptr);
    ~Session();

    Session(Session&&) noexcept;
    Session& operator=(Session&&) noexcept;

    // --------------------------------------------------------------------- //
    //  Establishment                                                         //
    // --------------------------------------------------------------------- //

    /// @brief Acquires the local identity for @p role.
    ///
    /// A host registers @p code (regenerating it on collision) and receives
    /// the code it finally got. A client ignores @p code and receives its
    /// anonymous identity. Calling it again while active logs a warning
    /// and resolves with @p code.
    void initNetwork(std::string code, Role role, InitCallback done);

    /// @brief Client only: opens the connection to the host behind
    ///        @p hostCode. Fails with kTimeout when it has not opened
    ///        within the configured connect timeout.
    void connectToHost(std::string hostCode, ConnectCallback done);

    // --------------------------------------------------------------------- //
    //  Transmission                                                          //
    // --------------------------------------------------------------------- //

    core::Expected<void> sendToHost(std::string type, Payload payload);
    core::Expected<void> sendToHost(const protocol::Envelope& envelope);

    core::Expected<void> sendToPeer(const PeerId& peer, std::string type, Payload payload);
    core::Expected<void> sendToPeer(const PeerId& peer, const protocol::Envelope& envelope);

    /// @brief Host only: sends to every registered peer not in @p exclude.
    ///        Each send is independent; failures are logged.
    /// @return Number of peers the envelope was handed to.
    core::u32 broadcast(std::string type, Payload payload, std::span<const PeerId> exclude = {});
    core::u32 broadcast(const protocol::Envelope& envelope, std::span<const PeerId> exclude = {});

    // --------------------------------------------------------------------- //
    //  Teardown                                                              //
    // --------------------------------------------------------------------- //

    /// @brief Closes every connection, destroys the identity, clears
    ///        handlers and subscribers. Publishes no lifecycle events.
    ///        A pending connectToHost is rejected with kCancelled, a pending
    ///        initNetwork likewise. Idempotent.
    void disconnect();

    // --------------------------------------------------------------------- //
    //  Observation                                                           //
    // --------------------------------------------------------------------- //

    [[nodiscard]] MessageDispatcher& dispatcher() noexcept;
    [[nodiscard]] LifecycleEventStream& events() noexcept;

    /// @brief Shorthand for events().subscribe(@p callback, @p owner).
    ///        Registering again with the same @p owner (or the same plain
    ///        function) is a no-op returning the existing id.
    LifecycleEventStream::SubscriptionId onConnectionChange(LifecycleEventStream::Callback callback,
                                                            const void* owner = nullptr);

    /// @brief Shorthand for events().addListener(@p listener).
    /// @return @c false if @p listener was already registered.
    bool onConnectionChange(ILifecycleListener& listener);

    [[nodiscard]] NetworkInfo info() const;
    [[nodiscard]] SessionPhase phase() const noexcept;
    [[nodiscard]] std::optional<Role> role() const noexcept;
    [[nodiscard]] bool isInitialized() const noexcept;

    /// @brief Host: active. Client: the host connection is open.
    [[nodiscard]] bool isConnected() const noexcept;

    /// @brief Host: registered remotes, sorted. Client: always empty.
    [[nodiscard]] std::vector<PeerId> connectedPeers() const;

    [[nodiscard]] const PeerId& localId() const noexcept;
    [[nodiscard]] const SessionConfig& config() const noexcept;
    [[nodiscard]] runtime::TimerQueue& timers() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rdv::net::session
