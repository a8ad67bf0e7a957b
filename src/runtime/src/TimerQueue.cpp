// /////////////////////////////////////////////////////////////////////////////
/// @file TimerQueue.cpp
/// @brief TimerQueue implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/runtime/TimerQueue.hpp>

#include <algorithm>

namespace rdv::runtime {

TimerQueue::TimerQueue(core::TimePoint start)
    : now_{start}
{}

TimerQueue::~TimerQueue() = default;

TimerId TimerQueue::schedule(core::Duration delay, Callback callback)
{
    const TimerId id = nextId_++;
    const core::TimePoint deadline = now_ + std::max(delay, core::Duration::zero());
    timers_.emplace(Key{deadline, id}, std::move(callback));
    index_.emplace(id, deadline);
    return id;
}

bool TimerQueue::cancel(TimerId id)
{
    auto it = index_.find(id);
    if (it == index_.end())
    {
        return false;
    }
    timers_.erase(Key{it->second, id});
    index_.erase(it);
    return true;
}

bool TimerQueue::isPending(TimerId id) const noexcept
{
    return index_.contains(id);
}

core::u32 TimerQueue::advanceTo(core::TimePoint target)
{
    core::u32 fired = 0;

    while (!timers_.empty())
    {
        auto first = timers_.begin();
        if (first->first.first > target)
        {
            break;
        }

        now_ = std::max(now_, first->first.first);
        Callback callback = std::move(first->second);
        index_.erase(first->first.second);
        timers_.erase(first);

        if (callback)
        {
            callback();
        }
        ++fired;
    }

    now_ = std::max(now_, target);
    return fired;
}

core::u32 TimerQueue::advanceBy(core::Duration delta)
{
    return advanceTo(now_ + delta);
}

void TimerQueue::clear()
{
    timers_.clear();
    index_.clear();
}

} // namespace rdv::runtime
