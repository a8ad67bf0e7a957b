// /////////////////////////////////////////////////////////////////////////////
/// @file Role.hpp
/// @brief Session role and lifecycle phase.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/core/Types.hpp>

#include <string_view>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @enum Role
/// @brief Host accepts many connections and owns the registry; Client
///        makes exactly one outbound connection.
// /////////////////////////////////////////////////////////////////////////////
enum class Role : core::u8
{
    kHost,
    kClient
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum SessionPhase
/// @brief Lifecycle of a Session.
///
/// kIdle → kOpening (identity negotiation) → kActive → kClosed.
/// A failed negotiation returns to kIdle; a closed session may be opened
/// again.
// /////////////////////////////////////////////////////////////////////////////
enum class SessionPhase : core::u8
{
    kIdle,
    kOpening,
    kActive,
    kClosed
};

[[nodiscard]] constexpr std::string_view toString(Role role) noexcept
{
    return role == Role::kHost ? "host" : "client";
}

[[nodiscard]] constexpr std::string_view toString(SessionPhase phase) noexcept
{
    switch (phase)
    {
        case SessionPhase::kIdle:    return "idle";
        case SessionPhase::kOpening: return "opening";
        case SessionPhase::kActive:  return "active";
        case SessionPhase::kClosed:  return "closed";
    }
    return "unknown";
}

} // namespace rdv::net::session
