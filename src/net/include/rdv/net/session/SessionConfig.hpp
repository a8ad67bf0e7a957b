// /////////////////////////////////////////////////////////////////////////////
/// @file SessionConfig.hpp
/// @brief Session configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the identity prefix, timeouts, retry cap and the
/// connectivity-assist endpoints passed through to the transport.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rdv/net/transport/ITransport.hpp>
#include <rdv/core/Constants.hpp>
#include <rdv/core/Types.hpp>

#include <string>
#include <vector>

namespace rdv::net::session {

/// @brief Immutable session configuration.
class SessionConfig
{
public:
    /// @brief Fluent builder for SessionConfig.
    class Builder
    {
    public:
        /// @brief Local rendezvous server on localhost:9000 over plain HTTP,
        ///        with one public STUN server and a TURN fallback.
        [[nodiscard]] static Builder localDevelopment();

        /// @brief Transport's default cloud rendezvous over TLS, with two
        ///        public STUN servers and a TURN fallback.
        [[nodiscard]] static Builder publicCloud();

        Builder& identityPrefix(std::string prefix);
        Builder& inviteCodeLength(core::u32 digits) noexcept;
        Builder& connectTimeout(core::Duration timeout) noexcept;
        Builder& collisionSettleDelay(core::Duration delay) noexcept;
        /// @brief 0 retries forever.
        Builder& maxIdentityAttempts(core::u32 attempts) noexcept;
        Builder& reliable(bool enabled) noexcept;
        Builder& signaling(transport::SignalingEndpoint endpoint);
        Builder& addIceServer(transport::IceServer server);
        Builder& clearIceServers() noexcept;
        /// @brief 0 disables the drainable lifecycle buffer.
        Builder& lifecycleBufferCapacity(core::u32 capacity) noexcept;

        [[nodiscard]] SessionConfig build() const;

    private:
        std::string                         identityPrefix_{core::kDefaultIdentityPrefix};
        core::u32                           inviteCodeLength_{core::kInviteCodeLength};
        core::Duration                      connectTimeout_{core::kConnectTimeout};
        core::Duration                      collisionSettleDelay_{core::kCollisionSettleDelay};
        core::u32                           maxIdentityAttempts_{core::kMaxIdentityAttempts};
        bool                                reliable_{true};
        transport::SignalingEndpoint        signaling_{};
        std::vector<transport::IceServer>   iceServers_{};
        core::u32                           lifecycleBufferCapacity_{core::kLifecycleBufferCapacity};
    };

    SessionConfig() = default;

    [[nodiscard]] const std::string&    identityPrefix()          const noexcept { return identityPrefix_; }
    [[nodiscard]] core::u32             inviteCodeLength()        const noexcept { return inviteCodeLength_; }
    [[nodiscard]] core::Duration        connectTimeout()          const noexcept { return connectTimeout_; }
    [[nodiscard]] core::Duration        collisionSettleDelay()    const noexcept { return collisionSettleDelay_; }
    [[nodiscard]] core::u32             maxIdentityAttempts()     const noexcept { return maxIdentityAttempts_; }
    [[nodiscard]] bool                  reliable()                const noexcept { return reliable_; }
    [[nodiscard]] core::u32             lifecycleBufferCapacity() const noexcept { return lifecycleBufferCapacity_; }
    [[nodiscard]] const transport::SignalingEndpoint&       signaling()  const noexcept { return signaling_; }
    [[nodiscard]] const std::vector<transport::IceServer>&  iceServers() const noexcept { return iceServers_; }

    /// @brief Transport options for registering @p requestedId (nullopt
    ///        for an anonymous identity).
    [[nodiscard]] transport::PeerOptions peerOptions(std::optional<PeerId> requestedId) const;

private:
    std::string                         identityPrefix_{core::kDefaultIdentityPrefix};
    core::u32                           inviteCodeLength_{core::kInviteCodeLength};
    core::Duration                      connectTimeout_{core::kConnectTimeout};
    core::Duration                      collisionSettleDelay_{core::kCollisionSettleDelay};
    core::u32                           maxIdentityAttempts_{core::kMaxIdentityAttempts};
    bool                                reliable_{true};
    transport::SignalingEndpoint        signaling_{};
    std::vector<transport::IceServer>   iceServers_{};
    core::u32                           lifecycleBufferCapacity_{core::kLifecycleBufferCapacity};
};

} // namespace rdv::net::session
