// /////////////////////////////////////////////////////////////////////////////
/// @file ErrorClassification.cpp
/// @brief Transport → session error mapping.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/ErrorClassification.hpp>

#include <format>

namespace rdv::net::session {

core::ErrorCode classify(transport::TransportErrorKind kind) noexcept
{
    using transport::TransportErrorKind;

    switch (kind)
    {
        case TransportErrorKind::kUnavailableId:   return core::ErrorCode::kIdentifierTaken;
        case TransportErrorKind::kNetwork:         return core::ErrorCode::kTransportUnavailable;
        case TransportErrorKind::kPeerUnavailable: return core::ErrorCode::kPeerUnreachable;
        case TransportErrorKind::kDisconnected:    return core::ErrorCode::kPeerUnreachable;
        case TransportErrorKind::kServerError:     return core::ErrorCode::kServerError;
        case TransportErrorKind::kOther:           return core::ErrorCode::kServerError;
    }
    return core::ErrorCode::kServerError;
}

core::Error toError(const transport::TransportError& error)
{
    return core::Error{classify(error.kind),
                       std::format("{}: {}", transport::toString(error.kind), error.message)};
}

} // namespace rdv::net::session
