// /////////////////////////////////////////////////////////////////////////////
/// @file Message.hpp
/// @brief Typed application messages layered over Envelope.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/net/protocol/PayloadCodec.hpp>
#include <rdv/core/Expected.hpp>

#include <concepts>
#include <format>
#include <span>
#include <string>
#include <string_view>

namespace rdv::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @concept Message
/// @brief A struct that names its dispatch tag and knows its payload format.
///
/// @code
/// struct Chat {
///     static constexpr std::string_view kType = "chat";
///     std::string text;
///     void encode(PayloadWriter& w) const { w.writeString(text); }
///     static core::Expected<Chat> decode(PayloadReader& r);
/// };
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
template <typename T>
concept Message = requires(const T& msg, PayloadWriter& writer, PayloadReader& reader) {
    { T::kType } -> std::convertible_to<std::string_view>;
    { msg.encode(writer) };
    { T::decode(reader) } -> std::same_as<core::Expected<T>>;
};

/// @brief Wraps @p msg into an envelope tagged with @c T::kType.
template <Message T>
[[nodiscard]] Envelope makeEnvelope(const T& msg)
{
    PayloadWriter writer;
    msg.encode(writer);
    return Envelope{std::string{T::kType}, writer.take()};
}

/// @brief Decodes a @p T from @p payload, rejecting trailing bytes.
template <Message T>
[[nodiscard]] core::Expected<T> decodeMessage(std::span<const core::byte> payload)
{
    PayloadReader reader{payload};
    auto msg = T::decode(reader);
    if (msg && !reader.atEnd())
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               std::format("Trailing bytes in '{}' payload", T::kType));
    }
    return msg;
}

} // namespace rdv::net::protocol
