/**
 * @file SessionHarness.hpp
 * @brief Shared fixtures for the session tests: capturing logger,
 *        scripted invite codes and a loopback network with a timer queue.
 */

#pragma once

#include <rdv/net/session/Session.hpp>
#include <rdv/net/transport/LoopbackTransport.hpp>
#include <rdv/runtime/TimerQueue.hpp>
#include <rdv/core/Log.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rdv::test {

class CapturingLogger final : public core::ILogger
{
public:
    struct Entry
    {
        core::LogLevel level;
        std::string    tag;
        std::string    message;
    };

    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back(Entry{level, std::string{tag}, std::string{message}});
    }

    [[nodiscard]] std::size_t count(core::LogLevel level) const
    {
        std::size_t n = 0;
        for (const auto& e : entries)
            n += (e.level == level) ? 1 : 0;
        return n;
    }

    [[nodiscard]] bool contains(core::LogLevel level, std::string_view needle) const
    {
        for (const auto& e : entries)
        {
            if (e.level == level && e.message.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    std::vector<Entry> entries;
};

/// Installs a CapturingLogger at debug level for the scope's lifetime.
class ScopedLogCapture
{
public:
    ScopedLogCapture()
        : previous_{core::Log::minLevel()}
    {
        core::Log::setLogger(&logger);
        core::Log::setMinLevel(core::LogLevel::kDebug);
    }

    ~ScopedLogCapture()
    {
        core::Log::setLogger(nullptr);
        core::Log::setMinLevel(previous_);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    CapturingLogger logger;

private:
    core::LogLevel previous_;
};

/// Hands out a fixed list of codes, then repeats the last one.
class ScriptedCodes final : public net::session::IInviteCodeSource
{
public:
    explicit ScriptedCodes(std::vector<std::string> codes) : codes_{std::move(codes)} {}

    std::string next(core::u32 /*length*/) override
    {
        ++calls;
        if (index_ < codes_.size())
            return codes_[index_++];
        return codes_.empty() ? std::string{"999999"} : codes_.back();
    }

    core::u32 calls{0};

private:
    std::vector<std::string> codes_;
    std::size_t              index_{0};
};

/// Loopback network, manual clock and a default configuration.
struct Harness
{
    Harness() = default;

    explicit Harness(net::session::SessionConfig cfg) : config{std::move(cfg)} {}

    /// Delivers every queued transport event.
    void pump() { network.pump(); }

    /// Moves the clock forward, delivering transport events on both sides.
    void advance(core::Duration delta)
    {
        network.pump();
        timers.advanceBy(delta);
        network.pump();
    }

    net::session::Session makeSession()
    {
        return net::session::Session{network, timers, config, &codes};
    }

    /// Opens @p session as host with @p code; returns the granted code.
    std::optional<std::string> openHost(net::session::Session& session, std::string code = "123456")
    {
        std::optional<std::string> granted;
        session.initNetwork(std::move(code), net::session::Role::kHost,
            [&granted](core::Expected<std::string> result)
            {
                if (result)
                    granted = *result;
            });
        pump();
        return granted;
    }

    /// Opens @p session as client and connects it to @p hostCode.
    bool joinHost(net::session::Session& session, const std::string& hostCode)
    {
        bool identity = false;
        session.initNetwork({}, net::session::Role::kClient,
            [&identity](core::Expected<std::string> result) { identity = result.has_value(); });
        pump();
        if (!identity)
            return false;

        bool connected = false;
        session.connectToHost(hostCode,
            [&connected](core::Expected<void> result) { connected = result.has_value(); });
        pump();
        return connected;
    }

    net::transport::LoopbackNetwork network;
    runtime::TimerQueue             timers;
    ScriptedCodes                   codes{{"987654", "555555", "444444"}};
    net::session::SessionConfig     config{net::session::SessionConfig::Builder{}.build()};
};

/// Serialises @p text into a payload.
inline net::Payload bytesOf(std::string_view text)
{
    net::Payload out;
    for (char c : text)
        out.push_back(static_cast<core::byte>(c));
    return out;
}

inline std::string textOf(std::span<const core::byte> payload)
{
    std::string out;
    for (auto b : payload)
        out.push_back(static_cast<char>(b));
    return out;
}

} // namespace rdv::test
