// /////////////////////////////////////////////////////////////////////////////
/// @file EnvelopeCodec.hpp
/// @brief Wire framing of an Envelope for byte-oriented transports.
///
/// Frame layout (big-endian):
///   u16 typeLength | type bytes | u32 payloadLength | payload bytes
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/Expected.hpp>

#include <span>

namespace rdv::net::protocol {

class EnvelopeCodec final
{
public:
    EnvelopeCodec() = delete;

    /// @brief Serialises @p envelope into a single frame. Callers check
    ///        Envelope::isValid() first; decode() rejects anything else.
    [[nodiscard]] static Payload encode(const Envelope& envelope);

    /// @brief Parses one complete frame.
    /// @return The envelope, or @c kCorruptedData on truncation, trailing
    ///         bytes, an empty or oversize type tag, or an oversize payload.
    [[nodiscard]] static core::Expected<Envelope> decode(std::span<const core::byte> frame);
};

} // namespace rdv::net::protocol
