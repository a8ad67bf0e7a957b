/**
 * @file TimerQueue.hpp
 * @brief One-shot timers on a manually advanced clock.
 *
 * The session layer never sleeps: connect timeouts and collision settle
 * delays are entries in a TimerQueue that the owning event loop advances
 * once per frame.  Tests advance it directly, so a 30 second timeout
 * costs nothing to exercise.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_RUNTIME_TIMER_QUEUE_HPP
    #define RDV_RUNTIME_TIMER_QUEUE_HPP

    #include <rdv/core/NonCopyable.hpp>
    #include <rdv/core/Types.hpp>

    #include <functional>
    #include <map>
    #include <unordered_map>
    #include <utility>

namespace rdv::runtime {

/** @brief Opaque handle returned by TimerQueue::schedule. 0 is never issued. */
using TimerId = core::u64;

inline constexpr TimerId kInvalidTimer = 0;

/**
 * @brief Deadline-ordered one-shot timer queue.
 *
 * Timers with equal deadlines fire in scheduling order.  A callback may
 * schedule or cancel timers; a zero-delay timer scheduled from a callback
 * fires within the same advance.
 */
class TimerQueue final : public core::NonCopyable<TimerQueue>
{
public:
    using Callback = std::function<void()>;

    explicit TimerQueue(core::TimePoint start = core::Clock::now());
    ~TimerQueue();

    /**
     * @brief Arms a timer firing @p delay after now().
     * @return Handle usable with cancel().
     */
    TimerId schedule(core::Duration delay, Callback callback);

    /**
     * @brief Disarms a pending timer.
     * @return @c false if the timer already fired or was cancelled.
     */
    bool cancel(TimerId id);

    /** @brief Whether @p id is still armed. */
    [[nodiscard]] bool isPending(TimerId id) const noexcept;

    /**
     * @brief Moves the clock forward to @p target, firing every due timer.
     * @return Number of callbacks invoked.
     */
    core::u32 advanceTo(core::TimePoint target);

    /** @brief Shorthand for advanceTo(now() + @p delta). */
    core::u32 advanceBy(core::Duration delta);

    [[nodiscard]] core::TimePoint now() const noexcept { return now_; }
    [[nodiscard]] core::usize pendingCount() const noexcept { return index_.size(); }

    /** @brief Drops every pending timer without firing it. */
    void clear();

private:
    using Key = std::pair<core::TimePoint, TimerId>;

    core::TimePoint                               now_;
    TimerId                                       nextId_{1};
    std::map<Key, Callback>                       timers_;
    std::unordered_map<TimerId, core::TimePoint>  index_;
};

} // namespace rdv::runtime

#endif // RDV_RUNTIME_TIMER_QUEUE_HPP
