// /////////////////////////////////////////////////////////////////////////////
/// @file LifecycleEvents.hpp
/// @brief Ordered stream of join / leave / host-disconnect notifications.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/NonCopyable.hpp>
#include <rdv/core/Types.hpp>

#include <deque>
#include <functional>
#include <string_view>
#include <vector>

namespace rdv::net::session {

enum class LifecycleKind : core::u8
{
    kJoin,              ///< Host: a remote completed its open handshake.
    kLeave,             ///< Host: a registered remote closed.
    kHostDisconnect     ///< Client: the host connection closed.
};

[[nodiscard]] std::string_view toString(LifecycleKind kind) noexcept;

struct LifecycleEvent
{
    LifecycleKind kind{LifecycleKind::kJoin};
    /// @brief Remote identity; empty for kHostDisconnect.
    PeerId        peer;

    bool operator==(const LifecycleEvent&) const = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ILifecycleListener
/// @brief Observer registered by reference.
// /////////////////////////////////////////////////////////////////////////////
class ILifecycleListener
{
public:
    virtual ~ILifecycleListener() = default;

    virtual void onLifecycleEvent(const LifecycleEvent& event) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class LifecycleEventStream
/// @brief Pushes each event to every subscriber in registration order and
///        optionally keeps it in a bounded buffer for later draining.
///
/// Listeners are deduplicated by address, callbacks by owner token or
/// function pointer. Subscribers are invoked over a
/// snapshot, so one may unsubscribe itself (or another) while handling an
/// event; removals take effect from the next publish.
// /////////////////////////////////////////////////////////////////////////////
class LifecycleEventStream final : public core::NonCopyable<LifecycleEventStream>
{
public:
    using Callback       = std::function<void(const LifecycleEvent&)>;
    using SubscriptionId = core::u64;

    static constexpr SubscriptionId kInvalidSubscription = 0;

    /// @param bufferCapacity 0 disables the drain buffer.
    explicit LifecycleEventStream(core::u32 bufferCapacity = 0);

    /// @return @c false if @p listener is already registered.
    bool addListener(ILifecycleListener& listener);
    bool removeListener(ILifecycleListener& listener);

    /// @brief Registers @p callback once per @p owner.
    ///
    /// A second registration for the same non-null @p owner, or of the same
    /// plain function, is ignored and returns the existing id. Without an
    /// owner, lambdas cannot be told apart and every call subscribes anew.
    SubscriptionId subscribe(Callback callback, const void* owner = nullptr);
    bool unsubscribe(SubscriptionId id);

    void publish(const LifecycleEvent& event);

    /// @brief Returns and clears the buffered events, oldest first.
    [[nodiscard]] std::vector<LifecycleEvent> drain();

    /// @brief Drops every subscriber and buffered event.
    void clear();

    [[nodiscard]] core::usize subscriberCount() const noexcept { return subscribers_.size(); }
    [[nodiscard]] core::usize buffered() const noexcept { return buffer_.size(); }
    [[nodiscard]] core::u32 bufferCapacity() const noexcept { return capacity_; }

private:
    using FreeFunction = void (*)(const LifecycleEvent&);

    struct Subscriber
    {
        SubscriptionId      id{kInvalidSubscription};
        ILifecycleListener* listener{nullptr};
        Callback            callback;
        const void*         owner{nullptr};
        FreeFunction        function{nullptr};
    };

    std::vector<Subscriber>    subscribers_;
    std::deque<LifecycleEvent> buffer_;
    core::u32                  capacity_;
    SubscriptionId             nextId_{1};
};

} // namespace rdv::net::session
