// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.hpp
/// @brief The {type, payload} wrapper carried by every application message.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/core/Constants.hpp>
#include <rdv/core/Types.hpp>

#include <string>
#include <vector>

namespace rdv::net {

/// @brief Transport-level identifier of a peer (e.g. "rdv-123456").
using PeerId = std::string;

/// @brief Opaque message body; only the application interprets it.
using Payload = std::vector<core::byte>;

} // namespace rdv::net

namespace rdv::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @struct Envelope
/// @brief Dispatch tag plus opaque payload.
///
/// @c type selects the handler on the receiving side. The session layer
/// never looks inside @c payload.
// /////////////////////////////////////////////////////////////////////////////
struct Envelope
{
    std::string type;
    Payload     payload;

    /// @brief Whether the type tag and payload fit a frame the receiver
    ///        accepts: a 1..255 byte tag and a payload of at most 16 MiB.
    [[nodiscard]] bool isValid() const noexcept
    {
        return !type.empty()
            && type.size() <= core::kMaxMessageTypeLength
            && payload.size() <= core::kMaxPayloadSize;
    }
};

} // namespace rdv::net::protocol
