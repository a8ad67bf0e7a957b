/**
 * @file Constants.hpp
 * @brief Library-wide compile-time defaults.
 *
 * Every value here is only a default: SessionConfig::Builder overrides
 * them per session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDV_CORE_CONSTANTS_HPP
    #define RDV_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <string_view>

namespace rdv::core {

inline constexpr std::string_view kDefaultIdentityPrefix   = "rdv-";
inline constexpr u32              kInviteCodeLength        = 6;

inline constexpr Millis           kConnectTimeout          {30'000};
inline constexpr Millis           kCollisionSettleDelay    { 2'000};
inline constexpr u32              kMaxIdentityAttempts     = 10;

inline constexpr u32              kLifecycleBufferCapacity = 64;

inline constexpr Millis           kPingInterval            { 2'000};
inline constexpr i64              kLatencyGoodMs           = 100;
inline constexpr i64              kLatencyMediumMs         = 200;
inline constexpr i64              kLatencyPoorMs           = 500;

inline constexpr usize            kMaxMessageTypeLength    = 255;
inline constexpr usize            kMaxPayloadSize          = 16 * 1024 * 1024;

inline constexpr u16              kLocalSignalingPort      = 9000;

} // namespace rdv::core

#endif // RDV_CORE_CONSTANTS_HPP
