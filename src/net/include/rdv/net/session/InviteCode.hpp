// /////////////////////////////////////////////////////////////////////////////
/// @file InviteCode.hpp
/// @brief Short human-shareable codes and their mapping to transport ids.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdv/net/protocol/Envelope.hpp>
#include <rdv/core/Types.hpp>

#include <random>
#include <string>
#include <string_view>

namespace rdv::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class IInviteCodeSource
/// @brief Produces candidate invite codes for the identity negotiator.
// /////////////////////////////////////////////////////////////////////////////
class IInviteCodeSource
{
public:
    virtual ~IInviteCodeSource() = default;

    /// @brief Returns a fresh code of @p length digits.
    [[nodiscard]] virtual std::string next(core::u32 length) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class RandomInviteCodeSource
/// @brief Uniform random codes without a leading zero (100000–999999 for
///        six digits).
// /////////////////////////////////////////////////////////////////////////////
class RandomInviteCodeSource final : public IInviteCodeSource
{
public:
    RandomInviteCodeSource();
    explicit RandomInviteCodeSource(core::u64 seed);

    [[nodiscard]] std::string next(core::u32 length) override;

private:
    std::mt19937_64 engine_;
};

namespace InviteCode {

/// @brief Exactly @p length ASCII digits.
[[nodiscard]] bool isValid(std::string_view code, core::u32 length) noexcept;

/// @brief Transport identity for @p code: @p prefix + @p code.
[[nodiscard]] PeerId toIdentity(std::string_view prefix, std::string_view code);

/// @brief Strips @p prefix from @p id; returns @p id unchanged when it does
///        not carry the prefix (anonymous client identities).
[[nodiscard]] std::string fromIdentity(std::string_view prefix, std::string_view id);

} // namespace InviteCode

} // namespace rdv::net::session
