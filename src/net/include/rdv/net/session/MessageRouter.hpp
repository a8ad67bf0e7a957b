// /////////////////////////////////////////////////////////////////////////////
/// @file MessageRouter.hpp
/// @brief Typed dispatch over a closed set of message kinds.
///
/// Each application names its protocol as a @c std::variant of Message
/// structs. The router binds handlers for those structs into a
/// MessageDispatcher, so decoding happens once and the handler receives
/// the concrete type.
///
/// @code
/// using PartyMessage = std::variant<JoinRequest, Chat>;
/// MessageRouter<PartyMessage> router{session.dispatcher()};
/// router.on<Chat>([](const Chat& chat, const PeerId& from) { ... });
/// session.sendToHost(MessageRouter<PartyMessage>::encode(Chat{"hi"}));
/// @endcode
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/session/MessageDispatcher.hpp>
#include <rdv/net/protocol/Message.hpp>
#include <rdv/core/Expected.hpp>
#include <rdv/core/Log.hpp>

#include <format>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

namespace rdv::net::session {

template <typename Variant>
class MessageRouter;

// /////////////////////////////////////////////////////////////////////////////
/// @class MessageRouter
/// @brief Binds typed handlers for every alternative of @c std::variant<Ts...>.
///
/// Keeps the dispatcher's contract: one handler per tag, the latest
/// registration wins. Payloads that fail to decode are logged and
/// dropped. The router holds no state of its own beyond the dispatcher
/// reference, which must outlive it.
// /////////////////////////////////////////////////////////////////////////////
template <protocol::Message... Ts>
class MessageRouter<std::variant<Ts...>>
{
public:
    using Variant = std::variant<Ts...>;

    template <typename T>
    using Handler = std::function<void(const T&, const PeerId&)>;

    using AnyHandler = std::function<void(const Variant&, const PeerId&)>;

    template <typename T>
    static constexpr bool kIsAlternative = (std::is_same_v<T, Ts> || ...);

    explicit MessageRouter(MessageDispatcher& dispatcher) : dispatcher_{dispatcher} {}

    /// @brief Installs @p handler for @c T::kType.
    template <typename T>
        requires kIsAlternative<T>
    void on(Handler<T> handler)
    {
        dispatcher_.registerHandler(std::string{T::kType},
            [handler = std::move(handler)](std::span<const core::byte> payload, const PeerId& from)
            {
                auto msg = protocol::decodeMessage<T>(payload);
                if (!msg)
                {
                    core::Log::warnf("dispatch", "Malformed '{}' from '{}': {}",
                                     T::kType, from, msg.error().message());
                    return;
                }
                handler(*msg, from);
            });
    }

    /// @brief Removes the handler for @c T::kType.
    template <typename T>
        requires kIsAlternative<T>
    bool off()
    {
        return dispatcher_.unregisterHandler(T::kType);
    }

    /// @brief Installs @p handler for every alternative, replacing any
    ///        per-type handler.
    void onAny(AnyHandler handler)
    {
        (on<Ts>([handler](const Ts& msg, const PeerId& from) { handler(Variant{msg}, from); }), ...);
    }

    /// @brief Removes the handlers of every alternative.
    void offAll()
    {
        (off<Ts>(), ...);
    }

    [[nodiscard]] static protocol::Envelope encode(const Variant& message)
    {
        return std::visit([](const auto& msg) { return protocol::makeEnvelope(msg); }, message);
    }

    /// @brief Decodes @p envelope into the alternative its tag names.
    /// @return kNotFound for a tag outside the set, kCorruptedData for a
    ///         bad payload.
    [[nodiscard]] static core::Expected<Variant> decode(const protocol::Envelope& envelope)
    {
        std::optional<core::Expected<Variant>> result;
        ((envelope.type == Ts::kType && !result
              ? static_cast<void>(result.emplace(decodeAs<Ts>(envelope.payload)))
              : static_cast<void>(0)), ...);
        if (!result)
        {
            return core::makeError(core::ErrorCode::kNotFound,
                                   std::format("Unknown message type '{}'", envelope.type));
        }
        return std::move(*result);
    }

private:
    template <typename T>
    static core::Expected<Variant> decodeAs(std::span<const core::byte> payload)
    {
        auto msg = protocol::decodeMessage<T>(payload);
        if (!msg)
        {
            return std::unexpected(std::move(msg.error()));
        }
        return Variant{std::in_place_type<T>, std::move(*msg)};
    }

    MessageDispatcher& dispatcher_;
};

} // namespace rdv::net::session
