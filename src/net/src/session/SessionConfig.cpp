// /////////////////////////////////////////////////////////////////////////////
/// @file SessionConfig.cpp
/// @brief SessionConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/SessionConfig.hpp>

namespace rdv::net::session {

namespace {

const transport::IceServer kGoogleStun0{"stun:stun.l.google.com:19302", {}, {}};
const transport::IceServer kGoogleStun1{"stun:stun1.l.google.com:19302", {}, {}};
const transport::IceServer kPublicTurn{"turn:numb.viagenie.ca", "webrtc@live.com", "muazkh"};

} // namespace

SessionConfig::Builder SessionConfig::Builder::localDevelopment()
{
    Builder builder;
    builder.signaling(transport::SignalingEndpoint{"localhost", core::kLocalSignalingPort, "/", false})
           .addIceServer(kGoogleStun0)
           .addIceServer(kPublicTurn);
    return builder;
}

SessionConfig::Builder SessionConfig::Builder::publicCloud()
{
    Builder builder;
    builder.signaling(transport::SignalingEndpoint{{}, 0, "/", true})
           .addIceServer(kGoogleStun0)
           .addIceServer(kGoogleStun1)
           .addIceServer(kPublicTurn);
    return builder;
}

SessionConfig::Builder& SessionConfig::Builder::identityPrefix(std::string prefix)
{
    identityPrefix_ = std::move(prefix);
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::inviteCodeLength(core::u32 digits) noexcept
{
    inviteCodeLength_ = digits;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::connectTimeout(core::Duration timeout) noexcept
{
    connectTimeout_ = timeout;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::collisionSettleDelay(core::Duration delay) noexcept
{
    collisionSettleDelay_ = delay;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::maxIdentityAttempts(core::u32 attempts) noexcept
{
    maxIdentityAttempts_ = attempts;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::reliable(bool enabled) noexcept
{
    reliable_ = enabled;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::signaling(transport::SignalingEndpoint endpoint)
{
    signaling_ = std::move(endpoint);
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::addIceServer(transport::IceServer server)
{
    iceServers_.push_back(std::move(server));
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::clearIceServers() noexcept
{
    iceServers_.clear();
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::lifecycleBufferCapacity(core::u32 capacity) noexcept
{
    lifecycleBufferCapacity_ = capacity;
    return *this;
}

SessionConfig SessionConfig::Builder::build() const
{
    SessionConfig cfg;
    cfg.identityPrefix_          = identityPrefix_;
    cfg.inviteCodeLength_        = inviteCodeLength_;
    cfg.connectTimeout_          = connectTimeout_;
    cfg.collisionSettleDelay_    = collisionSettleDelay_;
    cfg.maxIdentityAttempts_     = maxIdentityAttempts_;
    cfg.reliable_                = reliable_;
    cfg.signaling_               = signaling_;
    cfg.iceServers_              = iceServers_;
    cfg.lifecycleBufferCapacity_ = lifecycleBufferCapacity_;
    return cfg;
}

transport::PeerOptions SessionConfig::peerOptions(std::optional<PeerId> requestedId) const
{
    transport::PeerOptions options;
    options.requestedId = std::move(requestedId);
    options.signaling   = signaling_;
    options.iceServers  = iceServers_;
    return options;
}

} // namespace rdv::net::session
