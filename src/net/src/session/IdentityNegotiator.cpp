// /////////////////////////////////////////////////////////////////////////////
/// @file IdentityNegotiator.cpp
/// @brief IdentityNegotiator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/IdentityNegotiator.hpp>
#include <rdv/net/session/ErrorClassification.hpp>
#include <rdv/core/Assert.hpp>
#include <rdv/core/Log.hpp>

#include <format>
#include <optional>
#include <utility>

namespace rdv::net::session {

namespace {

constexpr std::string_view kTag = "identity";

} // namespace

std::string_view toString(NegotiatorState state) noexcept
{
    switch (state)
    {
        case NegotiatorState::kIdle:       return "idle";
        case NegotiatorState::kAttempting: return "attempting";
        case NegotiatorState::kCollided:   return "collided";
        case NegotiatorState::kRetrying:   return "retrying";
        case NegotiatorState::kReady:      return "ready";
        case NegotiatorState::kFailed:     return "failed";
        case NegotiatorState::kAborted:    return "aborted";
    }
    return "unknown";
}

IdentityNegotiator::IdentityNegotiator(transport::ITransport& transport,
                                       runtime::TimerQueue& timers,
                                       const SessionConfig& config,
                                       IInviteCodeSource& codes)
    : transport_{transport}
    , timers_{timers}
    , config_{config}
    , codes_{codes}
{}

IdentityNegotiator::~IdentityNegotiator()
{
    cancelSettleTimer();
    destroyPeer();
}

bool IdentityNegotiator::inProgress() const noexcept
{
    return state_ == NegotiatorState::kAttempting
        || state_ == NegotiatorState::kCollided
        || state_ == NegotiatorState::kRetrying;
}

void IdentityNegotiator::acquire(std::string code, Role role, ResultCallback done)
{
    Completion<std::string> completion{std::move(done)};

    if (inProgress() || state_ == NegotiatorState::kReady)
    {
        completion.reject(core::Error{core::ErrorCode::kInvalidState,
            std::format("Identity negotiation already {}", toString(state_))});
        return;
    }

    role_     = role;
    code_     = std::move(code);
    attempts_ = 0;
    localId_.clear();
    pending_  = std::move(completion);

    attempt();
}

void IdentityNegotiator::abort()
{
    if (!inProgress())
    {
        return;
    }

    core::Log::infof(kTag, "Negotiation aborted after {} attempt(s)", attempts_);
    cancelSettleTimer();
    destroyPeer();
    state_ = NegotiatorState::kAborted;

    auto pending = pending_;
    pending.reject(core::Error{core::ErrorCode::kCancelled, "Identity negotiation aborted"});
}

void IdentityNegotiator::release()
{
    abort();
    cancelSettleTimer();
    destroyPeer();
    localId_.clear();
    state_ = NegotiatorState::kIdle;
}

void IdentityNegotiator::setConnectionHandler(ConnectionCallback handler)
{
    onConnection_ = std::move(handler);
}

void IdentityNegotiator::setErrorHandler(ErrorCallback handler)
{
    onError_ = std::move(handler);
}

// ========================================================================== //
//  Transitions                                                               //
// ========================================================================== //

void IdentityNegotiator::attempt()
{
    RDV_ASSERT(!peer_);

    state_ = NegotiatorState::kAttempting;
    ++attempts_;

    std::optional<PeerId> requested;
    if (role_ == Role::kHost)
    {
        requested = InviteCode::toIdentity(config_.identityPrefix(), code_);
        core::Log::infof(kTag, "Attempt {}: registering '{}'", attempts_, *requested);
    }
    else
    {
        core::Log::infof(kTag, "Attempt {}: registering anonymous identity", attempts_);
    }

    peer_ = transport_.createPeer(config_.peerOptions(std::move(requested)));
    RDV_VERIFY(peer_ != nullptr);
    peer_->setHandlers(transport::PeerHandlers{
        .onOpen = [this](const PeerId& id) { onPeerOpen(id); },
        .onError = [this](const transport::TransportError& error) { onPeerError(error); },
        .onConnection = [this](std::shared_ptr<transport::IConnection> connection)
        {
            if (onConnection_)
            {
                auto handler = onConnection_;
                handler(std::move(connection));
            }
            else
            {
                connection->close();
            }
        },
    });
    if (role_ == Role::kHost)
    {
        peer_->listen(true);
    }
}

void IdentityNegotiator::onPeerOpen(const PeerId& id)
{
    if (state_ != NegotiatorState::kAttempting)
    {
        return;
    }

    state_   = NegotiatorState::kReady;
    localId_ = id;

    std::string result = id;
    if (role_ == Role::kHost)
    {
        code_  = InviteCode::fromIdentity(config_.identityPrefix(), id);
        result = code_;
    }
    core::Log::infof(kTag, "Identity '{}' ready after {} attempt(s)", id, attempts_);

    auto pending = pending_;
    pending.resolve(std::move(result));
}

void IdentityNegotiator::onPeerError(const transport::TransportError& error)
{
    if (state_ == NegotiatorState::kReady)
    {
        if (onError_)
        {
            auto handler = onError_;
            handler(error);
        }
        else
        {
            core::Log::errorf(kTag, "Identity '{}': {} ({})",
                              localId_, error.message, transport::toString(error.kind));
        }
        return;
    }
    if (state_ != NegotiatorState::kAttempting)
    {
        return;
    }

    if (role_ == Role::kHost && error.kind == transport::TransportErrorKind::kUnavailableId)
    {
        collide(error);
        return;
    }

    core::Log::errorf(kTag, "Registration failed: {} ({})",
                      error.message, transport::toString(error.kind));
    fail(toError(error));
}

void IdentityNegotiator::collide(const transport::TransportError& error)
{
    core::Log::warnf(kTag, "Code {} is taken: {}", code_, error.message);

    state_ = NegotiatorState::kCollided;
    destroyPeer();

    const auto cap = config_.maxIdentityAttempts();
    if (cap != 0 && attempts_ >= cap)
    {
        fail(core::Error{core::ErrorCode::kIdentifierTaken,
            std::format("No free identity after {} attempts", attempts_)});
        return;
    }

    state_ = NegotiatorState::kRetrying;
    settleTimer_ = timers_.schedule(config_.collisionSettleDelay(), [this]
    {
        settleTimer_ = runtime::kInvalidTimer;
        retry();
    });
}

void IdentityNegotiator::retry()
{
    if (state_ != NegotiatorState::kRetrying)
    {
        return;
    }

    code_ = codes_.next(config_.inviteCodeLength());
    core::Log::infof(kTag, "Retrying with code {}", code_);
    attempt();
}

void IdentityNegotiator::fail(core::Error error)
{
    cancelSettleTimer();
    destroyPeer();
    state_ = NegotiatorState::kFailed;

    auto pending = pending_;
    pending.reject(std::move(error));
}

void IdentityNegotiator::destroyPeer()
{
    if (!peer_)
    {
        return;
    }
    auto peer = std::move(peer_);
    peer->setHandlers({});
    peer->destroy();
}

void IdentityNegotiator::cancelSettleTimer()
{
    if (settleTimer_ != runtime::kInvalidTimer)
    {
        timers_.cancel(settleTimer_);
        settleTimer_ = runtime::kInvalidTimer;
    }
}

} // namespace rdv::net::session
