// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.hpp
/// @brief In-process transport: rendezvous registry plus deferred event
///        queue, with fault injection for tests.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/transport/ITransport.hpp>
#include <rdv/core/NonCopyable.hpp>

#include <memory>
#include <string>

namespace rdv::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackNetwork
/// @brief Every peer created from one LoopbackNetwork can reach every other
///        one by identity.
///
/// Nothing happens synchronously: identity registration, connection
/// handshakes, data and close notifications are queued and delivered by
/// @ref pump, in order. Every envelope travels through EnvelopeCodec, so
/// what the far end receives is what a byte transport would have carried.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackNetwork final : public ITransport,
                              public core::NonCopyable<LoopbackNetwork>
{
public:
    struct Options
    {
        /// @brief Report kPeerUnavailable when connecting to an unknown id.
        ///        When false the attempt stays pending forever.
        bool        reportUnknownPeers{true};
        /// @brief Prefix of identities handed to anonymous peers.
        std::string anonymousPrefix{"anon-"};
    };

    LoopbackNetwork();
    explicit LoopbackNetwork(Options options);
    ~LoopbackNetwork() override;

    [[nodiscard]] std::unique_ptr<IPeer> createPeer(const PeerOptions& options) override;
    [[nodiscard]] const char* name() const noexcept override;

    /// @brief Delivers queued events, including those queued while
    ///        delivering, until the queue is empty.
    /// @return Number of events delivered.
    core::u32 pump();

    [[nodiscard]] bool idle() const noexcept;

    // --------------------------------------------------------------------- //
    //  Fault injection                                                       //
    // --------------------------------------------------------------------- //

    /// @brief The next @p count identity registrations fail with @p kind.
    void failNextPeers(core::u32 count, TransportErrorKind kind);

    /// @brief While unavailable, registrations and connects fail with kNetwork.
    void setAvailable(bool available) noexcept;

    void setReportUnknownPeers(bool enabled) noexcept;

    /// @brief Simulates link loss: every connection of @p id reports
    ///        kDisconnected on its local end, then both ends close.
    void sever(const PeerId& id);

    // --------------------------------------------------------------------- //
    //  Accounting                                                            //
    // --------------------------------------------------------------------- //

    [[nodiscard]] bool isRegistered(const PeerId& id) const;
    [[nodiscard]] core::u32 peersCreated() const noexcept;
    [[nodiscard]] core::u32 peersDestroyed() const noexcept;
    [[nodiscard]] core::u32 livePeerCount() const noexcept;
    /// @brief Highest number of simultaneously live peers ever observed.
    [[nodiscard]] core::u32 maxConcurrentPeers() const noexcept;
    [[nodiscard]] core::u64 framesDelivered() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rdv::net::transport
