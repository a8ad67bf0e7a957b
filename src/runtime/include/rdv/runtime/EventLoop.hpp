/**
 * @file EventLoop.hpp
 * @brief Single-threaded frame loop driving timers and transport pumps.
 *
 * Every frame drains the registered pumps (transport event queues),
 * advances the TimerQueue to the frame time, drains the pumps again and
 * then runs the per-frame update.  Events already queued are therefore
 * handled before a timer due in the same frame.  All session callbacks
 * execute on the thread calling run()/runOnce(), one at a time.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_RUNTIME_EVENT_LOOP_HPP
    #define RDV_RUNTIME_EVENT_LOOP_HPP

#include <rdv/runtime/TimerQueue.hpp>
#include <rdv/core/Types.hpp>

#include <functional>
#include <vector>

namespace rdv::runtime {

/** @brief Callbacks the event loop invokes each frame. */
struct LoopCallbacks
{
    /** @brief Called once per frame after timers and pumps, with the frame time. */
    std::function<void(core::TimePoint now)> update;

    /** @brief Called once per frame after update (metrics, stop checks, etc.). */
    std::function<void()> postFrame;
};

/** @brief Frame loop over a TimerQueue and a set of event pumps. */
class EventLoop
{
public:
    /// @brief Drains pending events and returns how many were delivered.
    using Pump = std::function<core::u32()>;

    /// @param timers        Queue advanced every frame.
    /// @param frameInterval Target frame period for run() and runFor().
    explicit EventLoop(TimerQueue& timers, core::Duration frameInterval = core::Millis{16});
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /** @brief Registers an event pump drained every frame. */
    void addPump(Pump pump);

    /**
     * @brief Runs one frame at time @p now.
     * @return Number of timer callbacks and pumped events handled.
     */
    core::u32 runOnce(core::TimePoint now, const LoopCallbacks& callbacks = {});

    /**
     * @brief Run in real time until requestStop() is called.
     * @param callbacks Per-frame callbacks.
     */
    void run(const LoopCallbacks& callbacks);

    /**
     * @brief Simulates @p span of loop time without sleeping, one frame
     *        interval at a time.
     */
    void runFor(core::Duration span, const LoopCallbacks& callbacks = {});

    /** @brief Request graceful loop termination. */
    void requestStop() noexcept;

    /** @brief Whether run() is currently executing. */
    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Frames executed since construction. */
    [[nodiscard]] core::u64 frameCount() const noexcept;

    [[nodiscard]] TimerQueue& timers() noexcept { return timers_; }

private:
    core::u32 drainPumps();

    TimerQueue&        timers_;
    core::Duration     frameInterval_;
    std::vector<Pump>  pumps_;
    bool               running_{false};
    bool               stopRequested_{false};
    core::u64          frameCount_{0};
};

} // namespace rdv::runtime

#endif // RDV_RUNTIME_EVENT_LOOP_HPP
