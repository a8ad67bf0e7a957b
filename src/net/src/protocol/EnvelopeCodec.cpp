// /////////////////////////////////////////////////////////////////////////////
/// @file EnvelopeCodec.cpp
/// @brief EnvelopeCodec implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/protocol/EnvelopeCodec.hpp>
#include <rdv/net/protocol/PayloadCodec.hpp>
#include <rdv/core/Constants.hpp>

namespace rdv::net::protocol {

Payload EnvelopeCodec::encode(const Envelope& envelope)
{
    PayloadWriter writer;
    writer.writeU16(static_cast<core::u16>(envelope.type.size()));
    writer.writeRaw(std::as_bytes(std::span{envelope.type.data(), envelope.type.size()}));
    writer.writeU32(static_cast<core::u32>(envelope.payload.size()));
    writer.writeRaw(envelope.payload);
    return writer.take();
}

core::Expected<Envelope> EnvelopeCodec::decode(std::span<const core::byte> frame)
{
    PayloadReader reader{frame};

    const auto typeLength = RDV_TRY(reader.readU16());
    if (typeLength == 0 || typeLength > core::kMaxMessageTypeLength)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Invalid envelope type length");
    }

    const auto typeBytes = RDV_TRY(reader.readRaw(typeLength));

    const auto payloadLength = RDV_TRY(reader.readU32());
    if (payloadLength > core::kMaxPayloadSize)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Envelope payload too large");
    }

    Envelope envelope;
    envelope.type.reserve(typeBytes.size());
    for (auto b : typeBytes)
    {
        envelope.type.push_back(static_cast<char>(b));
    }
    envelope.payload = RDV_TRY(reader.readRaw(payloadLength));

    if (!reader.atEnd())
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Trailing bytes after envelope");
    }
    return envelope;
}

} // namespace rdv::net::protocol
