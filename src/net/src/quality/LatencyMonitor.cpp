// /////////////////////////////////////////////////////////////////////////////
/// @file LatencyMonitor.cpp
/// @brief LatencyMonitor implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdv/net/quality/LatencyMonitor.hpp>
#include <rdv/core/Log.hpp>

#include <format>

namespace rdv::net::quality {

std::string_view toString(QualityLevel level) noexcept
{
    switch (level)
    {
        case QualityLevel::kGood:     return "good";
        case QualityLevel::kMedium:   return "medium";
        case QualityLevel::kPoor:     return "poor";
        case QualityLevel::kCritical: return "critical";
    }
    return "unknown";
}

QualityLevel qualityLevel(core::i64 latencyMs) noexcept
{
    if (latencyMs < core::kLatencyGoodMs)   return QualityLevel::kGood;
    if (latencyMs < core::kLatencyMediumMs) return QualityLevel::kMedium;
    if (latencyMs < core::kLatencyPoorMs)   return QualityLevel::kPoor;
    return QualityLevel::kCritical;
}

std::string formatLatency(core::i64 latencyMs)
{
    if (latencyMs <= 0)
    {
        return "?ms";
    }
    return std::format("{}ms", latencyMs);
}

LatencyMonitor::LatencyMonitor(session::Session& session, core::Duration pingInterval)
    : session_{session}
    , router_{session.dispatcher()}
    , interval_{pingInterval}
{}

LatencyMonitor::~LatencyMonitor()
{
    detach();
}

void LatencyMonitor::attach()
{
    router_.on<protocol::Ping>([this](const protocol::Ping& ping, const PeerId& from) { onPing(ping, from); });
    router_.on<protocol::Pong>([this](const protocol::Pong& pong, const PeerId& from) { onPong(pong, from); });

    session_.events().unsubscribe(subscription_);
    subscription_ = session_.events().subscribe([this](const session::LifecycleEvent& event)
    {
        if (event.kind == session::LifecycleKind::kLeave)
        {
            clearPeer(event.peer);
        }
        else if (event.kind == session::LifecycleKind::kHostDisconnect)
        {
            localLatency_ = 0;
            localPingId_  = 0;
        }
    });
}

void LatencyMonitor::detach()
{
    router_.offAll();
    session_.events().unsubscribe(subscription_);
    subscription_ = session::LifecycleEventStream::kInvalidSubscription;
}

core::u32 LatencyMonitor::tick(core::TimePoint now)
{
    if (!session_.isInitialized())
    {
        return 0;
    }
    if (lastRound_ && now - *lastRound_ < interval_)
    {
        return 0;
    }
    lastRound_ = now;

    core::u32 sent = 0;
    if (session_.role() == session::Role::kHost)
    {
        for (const auto& id : session_.connectedPeers())
        {
            auto& sample  = peers_[id];
            sample.pingId = ++nextPingId_;
            sample.sentAt = now;
            if (session_.sendToPeer(id, Router::encode(protocol::Ping{sample.pingId})))
            {
                ++sent;
            }
        }
    }
    else if (session_.isConnected())
    {
        localPingId_ = ++nextPingId_;
        localSentAt_ = now;
        if (session_.sendToHost(Router::encode(protocol::Ping{localPingId_})))
        {
            ++sent;
        }
    }
    return sent;
}

void LatencyMonitor::onPing(const protocol::Ping& ping, const PeerId& from)
{
    const protocol::Pong pong{ping.pingId,
                              static_cast<core::u64>(core::toMillis(session_.timers().now().time_since_epoch()))};

    const auto sent = (session_.role() == session::Role::kHost)
        ? session_.sendToPeer(from, Router::encode(pong))
        : session_.sendToHost(Router::encode(pong));
    if (!sent)
    {
        core::Log::debugf("session", "Pong to '{}' not sent: {}", from, sent.error().message());
    }
}

void LatencyMonitor::onPong(const protocol::Pong& pong, const PeerId& from)
{
    const auto now = session_.timers().now();

    if (session_.role() == session::Role::kHost)
    {
        auto it = peers_.find(from);
        if (it != peers_.end() && it->second.pingId == pong.pingId)
        {
            it->second.latencyMs = core::toMillis(now - it->second.sentAt);
        }
        return;
    }

    if (localPingId_ != 0 && localPingId_ == pong.pingId)
    {
        localLatency_ = core::toMillis(now - localSentAt_);
    }
}

core::i64 LatencyMonitor::peerLatency(const PeerId& peer) const
{
    auto it = peers_.find(peer);
    return (it != peers_.end()) ? it->second.latencyMs : 0;
}

std::map<PeerId, core::i64> LatencyMonitor::allPeerLatencies() const
{
    std::map<PeerId, core::i64> out;
    for (const auto& [id, sample] : peers_)
    {
        out.emplace(id, sample.latencyMs);
    }
    return out;
}

void LatencyMonitor::clearPeer(const PeerId& peer)
{
    peers_.erase(peer);
}

void LatencyMonitor::reset()
{
    peers_.clear();
    localLatency_ = 0;
    localPingId_  = 0;
    localSentAt_  = {};
    lastRound_.reset();
}

} // namespace rdv::net::quality
