// /////////////////////////////////////////////////////////////////////////////
/// @file PayloadCodec.hpp
/// @brief Byte-aligned big-endian writer/reader for message payloads.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/Expected.hpp>
#include <rdv/core/Types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace rdv::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class PayloadWriter
/// @brief Appends fixed-width integers, strings and byte blocks to a
///        growing buffer.
///
/// Multi-byte values are written big-endian. Strings and byte blocks are
/// prefixed with a u32 length.
// /////////////////////////////////////////////////////////////////////////////
class PayloadWriter final
{
public:
    PayloadWriter() = default;

    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);
    void writeI32(core::i32 value);
    void writeF32(core::f32 value);
    void writeBool(bool value);

    /// @brief Writes a u32 length followed by the UTF-8 bytes.
    void writeString(std::string_view value);

    /// @brief Writes a u32 length followed by @p bytes.
    void writeBytes(std::span<const core::byte> bytes);

    /// @brief Appends @p bytes verbatim (no length prefix).
    void writeRaw(std::span<const core::byte> bytes);

    [[nodiscard]] core::usize size() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::span<const core::byte> data() const noexcept { return buffer_; }

    /// @brief Moves the encoded bytes out; the writer is left empty.
    [[nodiscard]] Payload take() noexcept;

private:
    Payload buffer_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PayloadReader
/// @brief Bounds-checked cursor over an encoded payload.
///
/// Every read fails with @c kCorruptedData instead of running past the end
/// of the buffer. The reader does not own the bytes it reads.
// /////////////////////////////////////////////////////////////////////////////
class PayloadReader final
{
public:
    explicit PayloadReader(std::span<const core::byte> data) noexcept;

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::i32> readI32();
    [[nodiscard]] core::Expected<core::f32> readF32();
    [[nodiscard]] core::Expected<bool>      readBool();

    [[nodiscard]] core::Expected<std::string> readString();
    [[nodiscard]] core::Expected<Payload>     readBytes();

    /// @brief Reads exactly @p count bytes with no length prefix.
    [[nodiscard]] core::Expected<Payload> readRaw(core::usize count);

    [[nodiscard]] core::usize remaining() const noexcept;
    [[nodiscard]] bool atEnd() const noexcept { return remaining() == 0; }

private:
    [[nodiscard]] core::Expected<core::u64> readBigEndian(core::usize width);

    std::span<const core::byte> data_;
    core::usize                 cursor_{0};
};

} // namespace rdv::net::protocol
