// /////////////////////////////////////////////////////////////////////////////
/// @file PayloadCodec.cpp
/// @brief PayloadWriter / PayloadReader implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/protocol/PayloadCodec.hpp>
#include <rdv/core/Assert.hpp>

#include <bit>

namespace rdv::net::protocol {

namespace {

void appendBigEndian(Payload& out, core::u64 value, core::usize width)
{
    for (core::usize i = 0; i < width; ++i)
    {
        const auto shift = static_cast<unsigned>((width - 1 - i) * 8);
        out.push_back(static_cast<core::byte>((value >> shift) & 0xFFu));
    }
}

} // namespace

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void PayloadWriter::writeU8(core::u8 value)   { appendBigEndian(buffer_, value, 1); }
void PayloadWriter::writeU16(core::u16 value) { appendBigEndian(buffer_, value, 2); }
void PayloadWriter::writeU32(core::u32 value) { appendBigEndian(buffer_, value, 4); }
void PayloadWriter::writeU64(core::u64 value) { appendBigEndian(buffer_, value, 8); }

void PayloadWriter::writeI32(core::i32 value)
{
    writeU32(static_cast<core::u32>(value));
}

void PayloadWriter::writeF32(core::f32 value)
{
    writeU32(std::bit_cast<core::u32>(value));
}

void PayloadWriter::writeBool(bool value)
{
    writeU8(value ? 1u : 0u);
}

void PayloadWriter::writeString(std::string_view value)
{
    writeU32(static_cast<core::u32>(value.size()));
    for (char c : value)
    {
        buffer_.push_back(static_cast<core::byte>(c));
    }
}

void PayloadWriter::writeBytes(std::span<const core::byte> bytes)
{
    writeU32(static_cast<core::u32>(bytes.size()));
    writeRaw(bytes);
}

void PayloadWriter::writeRaw(std::span<const core::byte> bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

Payload PayloadWriter::take() noexcept
{
    Payload out = std::move(buffer_);
    buffer_.clear();
    return out;
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

PayloadReader::PayloadReader(std::span<const core::byte> data) noexcept
    : data_{data}
{}

core::usize PayloadReader::remaining() const noexcept
{
    return data_.size() - cursor_;
}

core::Expected<core::u64> PayloadReader::readBigEndian(core::usize width)
{
    RDV_ASSERT(width > 0 && width <= 8);

    if (remaining() < width)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Payload underflow");
    }

    core::u64 value = 0;
    for (core::usize i = 0; i < width; ++i)
    {
        value = (value << 8) | static_cast<core::u8>(data_[cursor_++]);
    }
    return value;
}

core::Expected<core::u8> PayloadReader::readU8()
{
    return readBigEndian(1).transform([](core::u64 v) { return static_cast<core::u8>(v); });
}

core::Expected<core::u16> PayloadReader::readU16()
{
    return readBigEndian(2).transform([](core::u64 v) { return static_cast<core::u16>(v); });
}

core::Expected<core::u32> PayloadReader::readU32()
{
    return readBigEndian(4).transform([](core::u64 v) { return static_cast<core::u32>(v); });
}

core::Expected<core::u64> PayloadReader::readU64()
{
    return readBigEndian(8);
}

core::Expected<core::i32> PayloadReader::readI32()
{
    return readU32().transform([](core::u32 v) { return static_cast<core::i32>(v); });
}

core::Expected<core::f32> PayloadReader::readF32()
{
    return readU32().transform([](core::u32 v) { return std::bit_cast<core::f32>(v); });
}

core::Expected<bool> PayloadReader::readBool()
{
    const auto raw = RDV_TRY(readU8());
    if (raw > 1)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Invalid boolean byte");
    }
    return raw == 1;
}

core::Expected<std::string> PayloadReader::readString()
{
    const auto length = RDV_TRY(readU32());
    if (length > remaining())
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "String length exceeds payload");
    }

    std::string out;
    out.reserve(length);
    for (core::u32 i = 0; i < length; ++i)
    {
        out.push_back(static_cast<char>(data_[cursor_++]));
    }
    return out;
}

core::Expected<Payload> PayloadReader::readBytes()
{
    const auto length = RDV_TRY(readU32());
    return readRaw(length);
}

core::Expected<Payload> PayloadReader::readRaw(core::usize count)
{
    if (count > remaining())
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Byte block exceeds payload");
    }

    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    Payload out{first, first + static_cast<std::ptrdiff_t>(count)};
    cursor_ += count;
    return out;
}

} // namespace rdv::net::protocol
