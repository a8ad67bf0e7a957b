// /////////////////////////////////////////////////////////////////////////////
/// @file LatencyMonitor.hpp
/// @brief Round-trip latency measurement over ping / pong messages.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/SessionMessages.hpp>
#include <rdv/net/session/MessageRouter.hpp>
#include <rdv/net/session/Session.hpp>
#include <rdv/core/Constants.hpp>
#include <rdv/core/NonCopyable.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rdv::net::quality {

enum class QualityLevel : core::u8
{
    kGood,      ///< Below 100 ms.
    kMedium,    ///< Below 200 ms.
    kPoor,      ///< Below 500 ms.
    kCritical
};

[[nodiscard]] std::string_view toString(QualityLevel level) noexcept;

[[nodiscard]] QualityLevel qualityLevel(core::i64 latencyMs) noexcept;

/// @brief "45ms", or "?ms" when no sample exists (latency <= 0).
[[nodiscard]] std::string formatLatency(core::i64 latencyMs);

// /////////////////////////////////////////////////////////////////////////////
/// @class LatencyMonitor
/// @brief Pings the host (client) or every connected peer (host) once per
///        interval and records the round-trip time of matching pongs.
///
/// Answers incoming pings on both sides. Time is read from the session's
/// TimerQueue. Latencies are 0 until the first pong arrives.
///
/// Session::disconnect() clears every handler, so call attach() again
/// after re-initializing. The Session must outlive the monitor.
// /////////////////////////////////////////////////////////////////////////////
class LatencyMonitor final : public core::NonCopyable<LatencyMonitor>
{
public:
    explicit LatencyMonitor(session::Session& session,
                            core::Duration pingInterval = core::kPingInterval);
    ~LatencyMonitor();

    /// @brief Registers the ping / pong handlers and the leave subscription.
    void attach();
    void detach();

    /// @brief Sends the next round of pings when the interval has elapsed.
    /// @return Number of pings sent.
    core::u32 tick(core::TimePoint now);

    [[nodiscard]] core::i64 peerLatency(const PeerId& peer) const;
    [[nodiscard]] core::i64 localLatency() const noexcept { return localLatency_; }
    [[nodiscard]] std::map<PeerId, core::i64> allPeerLatencies() const;

    void clearPeer(const PeerId& peer);
    void reset();

private:
    using Router = session::MessageRouter<protocol::SessionMessage>;

    struct PeerSample
    {
        core::i64       latencyMs{0};
        core::u64       pingId{0};
        core::TimePoint sentAt{};
    };

    void onPing(const protocol::Ping& ping, const PeerId& from);
    void onPong(const protocol::Pong& pong, const PeerId& from);

    session::Session&                          session_;
    Router                                     router_;
    core::Duration                             interval_;
    session::LifecycleEventStream::SubscriptionId subscription_{session::LifecycleEventStream::kInvalidSubscription};

    std::map<PeerId, PeerSample>               peers_;
    core::i64                                  localLatency_{0};
    core::u64                                  localPingId_{0};
    core::TimePoint                            localSentAt_{};
    core::u64                                  nextPingId_{0};
    std::optional<core::TimePoint>             lastRound_;
};

} // namespace rdv::net::quality
