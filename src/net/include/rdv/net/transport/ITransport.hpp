// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract point-to-point transport the session layer runs on
///        (Strategy pattern).
///
/// The transport owns NAT traversal, relaying, encryption and framing.
/// It reports everything through callbacks invoked on the owning event
/// loop; none of these calls block.
///
/// Concrete implementations:
///   - @c LoopbackNetwork: in-process rendezvous used by tests and demos.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/Expected.hpp>
#include <rdv/core/Types.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdv::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @enum TransportErrorKind
/// @brief Failure classes a transport reports.
// /////////////////////////////////////////////////////////////////////////////
enum class TransportErrorKind : core::u8
{
    kUnavailableId,     ///< Requested identity is registered by someone else.
    kNetwork,           ///< Signaling / rendezvous server unreachable.
    kPeerUnavailable,   ///< Remote identity not found.
    kServerError,       ///< Generic infrastructure fault.
    kDisconnected,      ///< Link lost after establishment.
    kOther
};

[[nodiscard]] std::string_view toString(TransportErrorKind kind) noexcept;

struct TransportError
{
    TransportErrorKind kind{TransportErrorKind::kOther};
    std::string        message;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct IceServer
/// @brief Address-discovery (STUN) or relay (TURN) endpoint.
// /////////////////////////////////////////////////////////////////////////////
struct IceServer
{
    std::string urls;
    std::string username;
    std::string credential;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct SignalingEndpoint
/// @brief Rendezvous server location. An empty host selects the
///        transport's default (cloud) server.
// /////////////////////////////////////////////////////////////////////////////
struct SignalingEndpoint
{
    std::string host;
    core::u16   port{0};
    std::string path{"/"};
    bool        secure{true};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PeerOptions
/// @brief Parameters for creating a transport identity. Everything except
///        @c requestedId is passed through uninterpreted.
// /////////////////////////////////////////////////////////////////////////////
struct PeerOptions
{
    /// @brief Identity to register; @c std::nullopt asks for an anonymous one.
    std::optional<PeerId>  requestedId;
    SignalingEndpoint      signaling;
    std::vector<IceServer> iceServers;
};

struct ConnectOptions
{
    bool reliable{true};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct ConnectionHandlers
/// @brief Per-connection event callbacks.
// /////////////////////////////////////////////////////////////////////////////
struct ConnectionHandlers
{
    std::function<void()>                            onOpen;
    std::function<void(const protocol::Envelope&)>   onData;
    std::function<void()>                            onClose;
    std::function<void(const TransportError&)>       onError;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IConnection
/// @brief One reliable, ordered channel to a remote identity.
// /////////////////////////////////////////////////////////////////////////////
class IConnection
{
public:
    virtual ~IConnection() = default;

    /// @brief Identity of the far end.
    [[nodiscard]] virtual const PeerId& remoteId() const noexcept = 0;

    /// @brief Whether the open handshake completed and close has not happened.
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// @brief Queues @p envelope for delivery; the transport serialises it.
    [[nodiscard]] virtual core::Expected<void> send(const protocol::Envelope& envelope) = 0;

    /// @brief Closes the channel. Idempotent.
    virtual void close() = 0;

    /// @brief Installs the event callbacks, replacing any previous set.
    virtual void setHandlers(ConnectionHandlers handlers) = 0;

    /// @brief Removes every callback; pending events are then discarded.
    virtual void clearHandlers() = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PeerHandlers
/// @brief Identity-level event callbacks.
// /////////////////////////////////////////////////////////////////////////////
struct PeerHandlers
{
    /// @brief The identity is registered; carries the granted id.
    std::function<void(const PeerId&)>                     onOpen;
    std::function<void(const TransportError&)>             onError;
    /// @brief An inbound connection offer (only while listening).
    std::function<void(std::shared_ptr<IConnection>)>      onConnection;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IPeer
/// @brief A transport identity: registered with the rendezvous server,
///        able to accept and open connections.
// /////////////////////////////////////////////////////////////////////////////
class IPeer
{
public:
    virtual ~IPeer() = default;

    /// @brief Granted identity; empty until onOpen fired.
    [[nodiscard]] virtual const PeerId& id() const noexcept = 0;

    virtual void setHandlers(PeerHandlers handlers) = 0;

    /// @brief Enables or disables delivery of inbound connection offers.
    virtual void listen(bool enabled) = 0;

    /// @brief Opens an outbound connection to @p remoteId.
    /// @return The connection handle; it reports open / error / close later.
    [[nodiscard]] virtual std::shared_ptr<IConnection> connect(
        const PeerId& remoteId, const ConnectOptions& options) = 0;

    /// @brief Unregisters the identity and closes every connection. Idempotent.
    virtual void destroy() = 0;

    [[nodiscard]] virtual bool isDestroyed() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Factory for transport identities.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Starts registering a new identity. The result is reported
    ///        through the peer's onOpen / onError handlers.
    /// @return Never null.
    [[nodiscard]] virtual std::unique_ptr<IPeer> createPeer(const PeerOptions& options) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace rdv::net::transport
