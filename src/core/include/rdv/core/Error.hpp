/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes surfaced by identity negotiation, connection
 * establishment and message decoding, and a lightweight Error value type
 * carrying the code, a human-readable message, and the source location
 * where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_ERROR_HPP
    #define RDV_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace rdv::core {

/**
 * @brief Library-wide error code enumeration.
 *
 * The first block is the session taxonomy callers of initNetwork and
 * connectToHost branch on. kIdentifierTaken only escapes the identity
 * negotiator when its attempt cap is exhausted.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kIdentifierTaken,
    kTransportUnavailable,
    kPeerUnreachable,
    kServerError,
    kTimeout,

    kInvalidState,
    kInvalidArgument,
    kNotFound,
    kCancelled,

    kCorruptedData,
    kOutOfRange,
    kNotSupported,
    kInternalError,
};

/**
 * @brief Returns a stable, lowercase name for @p code (e.g. "timeout").
 */
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace rdv::core

#endif // RDV_CORE_ERROR_HPP
