// /////////////////////////////////////////////////////////////////////////////
/// @file MessageDispatcher.cpp
/// @brief MessageDispatcher implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/MessageDispatcher.hpp>
#include <rdv/core/Log.hpp>

#include <utility>

namespace rdv::net::session {

void MessageDispatcher::registerHandler(std::string type, Handler handler)
{
    if (type.empty() || !handler)
    {
        core::Log::warn("dispatch", "Ignoring handler registration without type or callback");
        return;
    }
    handlers_.insert_or_assign(std::move(type), std::move(handler));
}

bool MessageDispatcher::unregisterHandler(std::string_view type)
{
    auto it = handlers_.find(std::string{type});
    if (it == handlers_.end())
    {
        return false;
    }
    handlers_.erase(it);
    return true;
}

void MessageDispatcher::clearAllHandlers() noexcept
{
    handlers_.clear();
}

bool MessageDispatcher::hasHandler(std::string_view type) const
{
    return handlers_.contains(std::string{type});
}

DispatchResult MessageDispatcher::dispatch(const protocol::Envelope& envelope, const PeerId& from) const
{
    if (!envelope.isValid())
    {
        core::Log::warnf("dispatch", "Dropping envelope with an invalid type from '{}'", from);
        return DispatchResult::kMalformed;
    }

    auto it = handlers_.find(envelope.type);
    if (it == handlers_.end())
    {
        core::Log::debugf("dispatch", "No handler for '{}' from '{}'", envelope.type, from);
        return DispatchResult::kNoHandler;
    }

    auto handler = it->second;
    handler(envelope.payload, from);
    return DispatchResult::kHandled;
}

} // namespace rdv::net::session
