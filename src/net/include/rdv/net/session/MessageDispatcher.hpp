// /////////////////////////////////////////////////////////////////////////////
/// @file MessageDispatcher.hpp
/// @brief Demultiplexes inbound envelopes by type tag.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/NonCopyable.hpp>
#include <rdv/core/Types.hpp>

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rdv::net::session {

enum class DispatchResult : core::u8
{
    kHandled,
    kNoHandler,
    kMalformed      ///< Envelope without a type tag.
};

// /////////////////////////////////////////////////////////////////////////////
/// @class MessageDispatcher
/// @brief One handler per type tag; registering again replaces it.
///
/// Pure demultiplexing on the caller's thread: no queuing, no
/// backpressure. A handler may register, unregister or clear handlers
/// (itself included) while it runs.
// /////////////////////////////////////////////////////////////////////////////
class MessageDispatcher final : public core::NonCopyable<MessageDispatcher>
{
public:
    using Handler = std::function<void(std::span<const core::byte> payload, const PeerId& from)>;

    MessageDispatcher() = default;

    /// @brief Installs @p handler for @p type, replacing any previous one.
    void registerHandler(std::string type, Handler handler);

    /// @return @c true if a handler was removed.
    bool unregisterHandler(std::string_view type);

    void clearAllHandlers() noexcept;

    [[nodiscard]] bool hasHandler(std::string_view type) const;
    [[nodiscard]] core::usize handlerCount() const noexcept { return handlers_.size(); }

    /// @brief Invokes the handler registered for @c envelope.type.
    DispatchResult dispatch(const protocol::Envelope& envelope, const PeerId& from) const;

private:
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace rdv::net::session
