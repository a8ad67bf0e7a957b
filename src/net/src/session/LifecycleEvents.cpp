// /////////////////////////////////////////////////////////////////////////////
/// @file LifecycleEvents.cpp
/// @brief LifecycleEventStream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/session/LifecycleEvents.hpp>
#include <rdv/core/Log.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace rdv::net::session {

std::string_view toString(LifecycleKind kind) noexcept
{
    switch (kind)
    {
        case LifecycleKind::kJoin:           return "join";
        case LifecycleKind::kLeave:          return "leave";
        case LifecycleKind::kHostDisconnect: return "host_disconnect";
    }
    return "unknown";
}

LifecycleEventStream::LifecycleEventStream(core::u32 bufferCapacity)
    : capacity_{bufferCapacity}
{}

bool LifecycleEventStream::addListener(ILifecycleListener& listener)
{
    const bool present = std::ranges::any_of(subscribers_,
        [&listener](const Subscriber& s) { return s.listener == &listener; });
    if (present)
    {
        return false;
    }
    subscribers_.push_back(Subscriber{nextId_++, &listener, {}, nullptr, nullptr});
    return true;
}

bool LifecycleEventStream::removeListener(ILifecycleListener& listener)
{
    return std::erase_if(subscribers_,
        [&listener](const Subscriber& s) { return s.listener == &listener; }) > 0;
}

LifecycleEventStream::SubscriptionId LifecycleEventStream::subscribe(Callback callback, const void* owner)
{
    if (!callback)
    {
        return kInvalidSubscription;
    }

    const auto* target = callback.target<FreeFunction>();
    const FreeFunction function = target ? *target : nullptr;

    auto it = std::ranges::find_if(subscribers_, [owner, function](const Subscriber& s)
    {
        return (owner && s.owner == owner) || (function && s.function == function);
    });
    if (it != subscribers_.end())
    {
        core::Log::debugf("session", "Lifecycle callback already registered as #{}", it->id);
        return it->id;
    }

    const auto id = nextId_++;
    subscribers_.push_back(Subscriber{id, nullptr, std::move(callback), owner, function});
    return id;
}

bool LifecycleEventStream::unsubscribe(SubscriptionId id)
{
    return std::erase_if(subscribers_,
        [id](const Subscriber& s) { return s.id == id && s.listener == nullptr; }) > 0;
}

void LifecycleEventStream::publish(const LifecycleEvent& event)
{
    core::Log::debugf("session", "Lifecycle {} '{}'", toString(event.kind), event.peer);

    if (capacity_ > 0)
    {
        if (buffer_.size() >= capacity_)
        {
            core::Log::warnf("session", "Lifecycle buffer full ({}), dropping oldest event", capacity_);
            buffer_.pop_front();
        }
        buffer_.push_back(event);
    }

    const auto snapshot = subscribers_;
    for (const auto& subscriber : snapshot)
    {
        if (subscriber.listener)
        {
            subscriber.listener->onLifecycleEvent(event);
        }
        else
        {
            subscriber.callback(event);
        }
    }
}

std::vector<LifecycleEvent> LifecycleEventStream::drain()
{
    std::vector<LifecycleEvent> out{std::make_move_iterator(buffer_.begin()),
                                    std::make_move_iterator(buffer_.end())};
    buffer_.clear();
    return out;
}

void LifecycleEventStream::clear()
{
    subscribers_.clear();
    buffer_.clear();
}

} // namespace rdv::net::session
