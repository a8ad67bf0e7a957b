// /////////////////////////////////////////////////////////////////////////////
/// @file ErrorClassification.hpp
/// @brief Maps transport failures onto the session error taxonomy.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/transport/ITransport.hpp>
#include <rdv/core/Error.hpp>

namespace rdv::net::session {

/// @brief kUnavailableId → kIdentifierTaken, kNetwork → kTransportUnavailable,
///        kPeerUnavailable / kDisconnected → kPeerUnreachable, anything
///        else → kServerError.
[[nodiscard]] core::ErrorCode classify(transport::TransportErrorKind kind) noexcept;

/// @brief Builds the Error a caller receives for @p error.
[[nodiscard]] core::Error toError(const transport::TransportError& error);

} // namespace rdv::net::session
