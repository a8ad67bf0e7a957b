// /////////////////////////////////////////////////////////////////////////////
/// @file IdentityNegotiator.hpp
/// @brief Acquires the local transport identity, retrying on collision.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/session/Completion.hpp>
#include <rdv/net/session/InviteCode.hpp>
#include <rdv/net/session/Role.hpp>
#include <rdv/net/session/SessionConfig.hpp>
#include <rdv/net/transport/ITransport.hpp>
#include <rdv/runtime/TimerQueue.hpp>
#include <rdv/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @enum NegotiatorState
// /////////////////////////////////////////////////////////////////////////////
enum class NegotiatorState : core::u8
{
    kIdle,
    kAttempting,    ///< One peer is registering.
    kCollided,      ///< Registration refused; the peer has been destroyed.
    kRetrying,      ///< Waiting for the settle delay before the next attempt.
    kReady,
    kFailed,
    kAborted
};

[[nodiscard]] std::string_view toString(NegotiatorState state) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class IdentityNegotiator
/// @brief Owns the single live IPeer of a session.
///
/// A host registers @c prefix+code. When the rendezvous server reports the
/// identity as taken, the peer is destroyed, the settle delay runs on the
/// TimerQueue and a fresh code is tried. The slot holds at most one peer
/// at any time, so a failed identity is always gone before the next one
/// is requested.
///
/// A client registers an anonymous identity and never retries.
// /////////////////////////////////////////////////////////////////////////////
class IdentityNegotiator final : public core::NonCopyable<IdentityNegotiator>
{
public:
    /// @brief Receives the invite code of the granted identity (host) or the
    ///        granted identity itself (client).
    using ResultCallback     = Completion<std::string>::Callback;
    using ConnectionCallback = std::function<void(std::shared_ptr<transport::IConnection>)>;
    using ErrorCallback      = std::function<void(const transport::TransportError&)>;

    IdentityNegotiator(transport::ITransport& transport,
                       runtime::TimerQueue& timers,
                       const SessionConfig& config,
                       IInviteCodeSource& codes);
    ~IdentityNegotiator();

    /// @brief Starts negotiating. Rejects immediately with kInvalidState
    ///        while an attempt is in flight or an identity is held.
    void acquire(std::string code, Role role, ResultCallback done);

    /// @brief Stops an in-flight negotiation; the pending result is rejected
    ///        with kCancelled. No-op otherwise.
    void abort();

    /// @brief Aborts, destroys the held identity and returns to kIdle.
    void release();

    /// @brief Inbound connection offers for the held identity.
    void setConnectionHandler(ConnectionCallback handler);

    /// @brief Identity-level errors reported after kReady.
    void setErrorHandler(ErrorCallback handler);

    [[nodiscard]] NegotiatorState state() const noexcept { return state_; }
    [[nodiscard]] core::u32 attempts() const noexcept { return attempts_; }
    [[nodiscard]] bool inProgress() const noexcept;

    /// @brief The held peer, or nullptr.
    [[nodiscard]] transport::IPeer* peer() noexcept { return peer_.get(); }

    /// @brief Granted identity; empty unless kReady.
    [[nodiscard]] const PeerId& localId() const noexcept { return localId_; }

    /// @brief Code of the current (or last) attempt.
    [[nodiscard]] const std::string& currentCode() const noexcept { return code_; }

private:
    void attempt();
    void onPeerOpen(const PeerId& id);
    void onPeerError(const transport::TransportError& error);
    void collide(const transport::TransportError& error);
    void retry();
    void fail(core::Error error);
    void destroyPeer();
    void cancelSettleTimer();

    transport::ITransport&            transport_;
    runtime::TimerQueue&              timers_;
    const SessionConfig&              config_;
    IInviteCodeSource&                codes_;

    NegotiatorState                   state_{NegotiatorState::kIdle};
    Role                              role_{Role::kHost};
    std::string                       code_;
    PeerId                            localId_;
    core::u32                         attempts_{0};
    runtime::TimerId                  settleTimer_{runtime::kInvalidTimer};
    std::unique_ptr<transport::IPeer> peer_;
    Completion<std::string>           pending_;
    ConnectionCallback                onConnection_;
    ErrorCallback                     onError_;
};

} // namespace rdv::net::session
