/**
 * @file TestEnvelopeCodec.cpp
 * @brief Unit tests for the envelope wire frame.
 */

#include <catch2/catch_test_macros.hpp>

#include <rdv/net/protocol/EnvelopeCodec.hpp>
#include <rdv/net/protocol/PayloadCodec.hpp>

#include "SessionHarness.hpp"

#include <string>

using namespace rdv;
using namespace rdv::net::protocol;

TEST_CASE("EnvelopeCodec frame layout", "[protocol][envelope]")
{
    const Envelope envelope{"chat", test::bytesOf("hi")};
    const auto frame = EnvelopeCodec::encode(envelope);

    // u16 type length | "chat" | u32 payload length | "hi"
    REQUIRE(frame.size() == 2 + 4 + 4 + 2);
    REQUIRE(frame[1] == core::byte{4});
    REQUIRE(frame[9] == core::byte{2});

    auto decoded = EnvelopeCodec::decode(frame);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->type == "chat");
    REQUIRE(test::textOf(decoded->payload) == "hi");
}

TEST_CASE("EnvelopeCodec keeps an empty payload", "[protocol][envelope]")
{
    auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(Envelope{"start_game", {}}));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->payload.empty());
}

TEST_CASE("EnvelopeCodec rejects an untyped envelope", "[protocol][envelope]")
{
    const auto frame = EnvelopeCodec::encode(Envelope{"", test::bytesOf("x")});
    auto decoded = EnvelopeCodec::decode(frame);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("EnvelopeCodec rejects an oversize type tag", "[protocol][envelope]")
{
    const auto frame = EnvelopeCodec::encode(Envelope{std::string(256, 't'), {}});
    REQUIRE_FALSE(EnvelopeCodec::decode(frame).has_value());
}

TEST_CASE("Envelope validity matches what decode accepts", "[protocol][envelope]")
{
    REQUIRE(Envelope{"t", {}}.isValid());
    REQUIRE(Envelope{std::string(255, 't'), {}}.isValid());
    REQUIRE_FALSE(Envelope{"", {}}.isValid());
    REQUIRE_FALSE(Envelope{std::string(256, 't'), {}}.isValid());

    const Envelope longest{std::string(255, 't'), test::bytesOf("x")};
    REQUIRE(EnvelopeCodec::decode(EnvelopeCodec::encode(longest)).has_value());
}

TEST_CASE("EnvelopeCodec rejects truncated and padded frames", "[protocol][envelope]")
{
    auto frame = EnvelopeCodec::encode(Envelope{"pong", test::bytesOf("12345678")});

    auto truncated = frame;
    truncated.pop_back();
    REQUIRE_FALSE(EnvelopeCodec::decode(truncated).has_value());

    auto padded = frame;
    padded.push_back(core::byte{0});
    REQUIRE_FALSE(EnvelopeCodec::decode(padded).has_value());
}
