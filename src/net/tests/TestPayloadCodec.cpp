/**
 * @file TestPayloadCodec.cpp
 * @brief Unit tests for PayloadWriter / PayloadReader.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/net/protocol/PayloadCodec.hpp>

using namespace rdv;
using namespace rdv::net::protocol;

TEST_CASE("PayloadWriter encodes integers big-endian", "[protocol][payload]")
{
    PayloadWriter writer;
    writer.writeU16(0x0102);
    writer.writeU32(0x03040506);

    const auto data = writer.data();
    REQUIRE(data.size() == 6);
    REQUIRE(data[0] == core::byte{0x01});
    REQUIRE(data[1] == core::byte{0x02});
    REQUIRE(data[2] == core::byte{0x03});
    REQUIRE(data[5] == core::byte{0x06});
}

TEST_CASE("PayloadReader reads back mixed fields", "[protocol][payload]")
{
    PayloadWriter writer;
    writer.writeU8(7);
    writer.writeU64(0xDEADBEEFCAFEBABEull);
    writer.writeI32(-42);
    writer.writeF32(1.5f);
    writer.writeBool(true);
    writer.writeString("rdv-123456");

    const auto payload = writer.take();
    PayloadReader reader{payload};

    REQUIRE(reader.readU8().value() == 7);
    REQUIRE(reader.readU64().value() == 0xDEADBEEFCAFEBABEull);
    REQUIRE(reader.readI32().value() == -42);
    REQUIRE(reader.readF32().value() == 1.5f);
    REQUIRE(reader.readBool().value());
    REQUIRE(reader.readString().value() == "rdv-123456");
    REQUIRE(reader.atEnd());
}

TEST_CASE("PayloadReader rejects reads past the end", "[protocol][payload]")
{
    PayloadWriter writer;
    writer.writeU16(9);
    const auto payload = writer.take();

    PayloadReader reader{payload};
    auto value = reader.readU32();
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("PayloadReader rejects a string longer than the payload", "[protocol][payload]")
{
    PayloadWriter writer;
    writer.writeU32(100);
    writer.writeU8('x');
    const auto payload = writer.take();

    PayloadReader reader{payload};
    REQUIRE(reader.readString().error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("PayloadReader rejects a non-boolean byte", "[protocol][payload]")
{
    PayloadWriter writer;
    writer.writeU8(2);
    const auto payload = writer.take();

    PayloadReader reader{payload};
    REQUIRE_FALSE(reader.readBool().has_value());
}
