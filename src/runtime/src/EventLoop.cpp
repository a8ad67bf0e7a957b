// /////////////////////////////////////////////////////////////////////////////
/// @file EventLoop.cpp
/// @brief EventLoop implementation: pumps, timers, then update.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/runtime/EventLoop.hpp>
#include <rdv/core/Assert.hpp>
#include <rdv/core/Log.hpp>

#include <algorithm>
#include <thread>

namespace rdv::runtime {

namespace {

// Upper bound on pump rounds per frame; a pump that keeps producing
// events (e.g. two peers ping-ponging with zero delay) must not starve
// the rest of the frame.
constexpr core::u32 kMaxPumpRounds = 64;

} // namespace

EventLoop::EventLoop(TimerQueue& timers, core::Duration frameInterval)
    : timers_{timers}
    , frameInterval_{frameInterval}
{
    RDV_ASSERT(frameInterval_ > core::Duration::zero());
}

EventLoop::~EventLoop() = default;

void EventLoop::addPump(Pump pump)
{
    pumps_.push_back(std::move(pump));
}

core::u32 EventLoop::drainPumps()
{
    core::u32 total = 0;
    for (core::u32 round = 0; round < kMaxPumpRounds; ++round)
    {
        core::u32 delivered = 0;
        for (auto& pump : pumps_)
        {
            delivered += pump();
        }
        total += delivered;
        if (delivered == 0)
        {
            break;
        }
    }
    return total;
}

core::u32 EventLoop::runOnce(core::TimePoint now, const LoopCallbacks& callbacks)
{
    core::u32 handled = drainPumps();
    handled += timers_.advanceTo(now);
    handled += drainPumps();

    if (callbacks.update)
    {
        callbacks.update(timers_.now());
    }

    if (callbacks.postFrame)
    {
        callbacks.postFrame();
    }

    ++frameCount_;
    return handled;
}

void EventLoop::run(const LoopCallbacks& callbacks)
{
    running_ = true;
    stopRequested_ = false;

    while (!stopRequested_)
    {
        const auto frameStart = core::Clock::now();
        runOnce(frameStart, callbacks);

        const auto elapsed = core::Clock::now() - frameStart;
        if (elapsed < frameInterval_)
        {
            std::this_thread::sleep_for(frameInterval_ - elapsed);
        }
    }

    running_ = false;
    core::Log::info("loop", "EventLoop: stopped");
}

void EventLoop::runFor(core::Duration span, const LoopCallbacks& callbacks)
{
    stopRequested_ = false;
    const core::TimePoint end = timers_.now() + span;

    while (!stopRequested_ && timers_.now() < end)
    {
        const core::TimePoint next = std::min(timers_.now() + frameInterval_, end);
        runOnce(next, callbacks);
    }
}

void EventLoop::requestStop() noexcept
{
    stopRequested_ = true;
}

bool EventLoop::isRunning() const noexcept
{
    return running_;
}

core::u64 EventLoop::frameCount() const noexcept
{
    return frameCount_;
}

} // namespace rdv::runtime
