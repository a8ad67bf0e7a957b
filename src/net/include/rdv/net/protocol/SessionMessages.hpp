// /////////////////////////////////////////////////////////////////////////////
/// @file SessionMessages.hpp
/// @brief Messages the session layer itself exchanges (latency pings).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Message.hpp>

#include <variant>

namespace rdv::net::protocol {

/// @brief Latency ping; answered with a Pong carrying the same id.
struct Ping
{
    static constexpr std::string_view kType = "ping";

    core::u64 pingId{0};

    void encode(PayloadWriter& writer) const { writer.writeU64(pingId); }

    static core::Expected<Ping> decode(PayloadReader& reader)
    {
        const auto id = RDV_TRY(reader.readU64());
        return Ping{id};
    }
};

struct Pong
{
    static constexpr std::string_view kType = "pong";

    core::u64 pingId{0};
    core::u64 serverTimeMs{0};

    void encode(PayloadWriter& writer) const
    {
        writer.writeU64(pingId);
        writer.writeU64(serverTimeMs);
    }

    static core::Expected<Pong> decode(PayloadReader& reader)
    {
        const auto id = RDV_TRY(reader.readU64());
        const auto time = RDV_TRY(reader.readU64());
        return Pong{id, time};
    }
};

using SessionMessage = std::variant<Ping, Pong>;

} // namespace rdv::net::protocol
