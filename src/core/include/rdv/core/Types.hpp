/**
 * @file Types.hpp
 * @brief Primitive type aliases and clock types shared by every module.
 *
 * Provides fixed-width integer aliases, floating-point aliases, the byte
 * type used for payloads, and the monotonic clock the runtime schedules
 * against.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_TYPES_HPP
    #define RDV_CORE_TYPES_HPP

    #include <chrono>
    #include <cstddef>
    #include <cstdint>

namespace rdv::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;

using byte = std::byte;

/// @brief Monotonic clock used for every timer and latency measurement.
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;
using Millis    = std::chrono::milliseconds;

/**
 * @brief Converts a duration to whole milliseconds.
 */
[[nodiscard]] constexpr i64 toMillis(Duration d) noexcept
{
    return std::chrono::duration_cast<Millis>(d).count();
}

} // namespace rdv::core

#endif // RDV_CORE_TYPES_HPP
