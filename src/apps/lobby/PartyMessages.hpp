// /////////////////////////////////////////////////////////////////////////////
/// @file PartyMessages.hpp
/// @brief Lobby protocol exchanged by the demo's host and clients.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Message.hpp>
#include <rdv/net/session/MessageRouter.hpp>

#include <string>
#include <variant>
#include <vector>

namespace rdv::apps::lobby {

using net::protocol::PayloadReader;
using net::protocol::PayloadWriter;

/// @brief Client → host, sent once the connection opened.
struct JoinRequest
{
    static constexpr std::string_view kType = "join_request";

    std::string name;

    void encode(PayloadWriter& writer) const { writer.writeString(name); }

    static core::Expected<JoinRequest> decode(PayloadReader& reader)
    {
        auto name = RDV_TRY(reader.readString());
        return JoinRequest{std::move(name)};
    }
};

/// @brief Host → everyone: the current member list, host first.
struct PartyUpdate
{
    static constexpr std::string_view kType = "party_update";

    std::vector<std::string> members;

    void encode(PayloadWriter& writer) const
    {
        writer.writeU32(static_cast<core::u32>(members.size()));
        for (const auto& member : members)
            writer.writeString(member);
    }

    static core::Expected<PartyUpdate> decode(PayloadReader& reader)
    {
        const auto count = RDV_TRY(reader.readU32());
        PartyUpdate update;
        for (core::u32 i = 0; i < count; ++i)
        {
            auto member = RDV_TRY(reader.readString());
            update.members.push_back(std::move(member));
        }
        return update;
    }
};

struct Chat
{
    static constexpr std::string_view kType = "chat";

    std::string author;
    std::string text;

    void encode(PayloadWriter& writer) const
    {
        writer.writeString(author);
        writer.writeString(text);
    }

    static core::Expected<Chat> decode(PayloadReader& reader)
    {
        auto author = RDV_TRY(reader.readString());
        auto text = RDV_TRY(reader.readString());
        return Chat{std::move(author), std::move(text)};
    }
};

using PartyMessage = std::variant<JoinRequest, PartyUpdate, Chat>;
using PartyRouter  = net::session::MessageRouter<PartyMessage>;

} // namespace rdv::apps::lobby
