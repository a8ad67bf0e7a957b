// /////////////////////////////////////////////////////////////////////////////
/// @file Completion.hpp
/// @brief One-shot result slot for asynchronous session operations.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/core/Expected.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class Completion
/// @brief Delivers exactly one result to a callback.
///
/// Copies share the same slot, so a timeout timer, a transport handler
/// and the teardown path can each hold one: whichever settles first wins
/// and every later settle attempt is a no-op returning @c false.
///
/// @tparam T Success value type (@c void for operations without a value).
// /////////////////////////////////////////////////////////////////////////////
template <typename T>
class Completion
{
public:
    using Result   = core::Expected<T>;
    using Callback = std::function<void(Result)>;

    Completion() = default;

    explicit Completion(Callback callback)
        : state_{std::make_shared<State>(std::move(callback))}
    {}

    /// @brief Settles with @p result unless already settled.
    bool complete(Result result)
    {
        if (!state_ || state_->settled)
        {
            return false;
        }
        state_->settled = true;
        // Release the callback before invoking it: it may start a new
        // operation that stores another Completion in the same slot.
        auto callback = std::move(state_->callback);
        state_->callback = nullptr;
        if (callback)
        {
            callback(std::move(result));
        }
        return true;
    }

    template <typename U = T>
        requires (!std::is_void_v<U>)
    bool resolve(U value)
    {
        return complete(Result{std::move(value)});
    }

    template <typename U = T>
        requires std::is_void_v<U>
    bool resolve()
    {
        return complete(Result{});
    }

    bool reject(core::Error error)
    {
        return complete(Result{std::unexpect, std::move(error)});
    }

    /// @brief Whether a result was delivered (or the slot is empty).
    [[nodiscard]] bool settled() const noexcept { return !state_ || state_->settled; }

    /// @brief Whether this handle refers to an operation at all.
    [[nodiscard]] explicit operator bool() const noexcept { return state_ != nullptr; }

private:
    struct State
    {
        explicit State(Callback cb) : callback{std::move(cb)} {}

        Callback callback;
        bool     settled{false};
    };

    std::shared_ptr<State> state_;
};

} // namespace rdv::net::session
