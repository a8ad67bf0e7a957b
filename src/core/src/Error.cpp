/**
 * @file Error.cpp
 * @brief ErrorCode names used in log lines and test diagnostics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rdv/core/Error.hpp"

namespace rdv::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                 return "none";
        case ErrorCode::kIdentifierTaken:      return "identifier-taken";
        case ErrorCode::kTransportUnavailable: return "transport-unavailable";
        case ErrorCode::kPeerUnreachable:      return "peer-unreachable";
        case ErrorCode::kServerError:          return "server-error";
        case ErrorCode::kTimeout:              return "timeout";
        case ErrorCode::kInvalidState:         return "invalid-state";
        case ErrorCode::kInvalidArgument:      return "invalid-argument";
        case ErrorCode::kNotFound:             return "not-found";
        case ErrorCode::kCancelled:            return "cancelled";
        case ErrorCode::kCorruptedData:        return "corrupted-data";
        case ErrorCode::kOutOfRange:           return "out-of-range";
        case ErrorCode::kNotSupported:         return "not-supported";
        case ErrorCode::kInternalError:        return "internal-error";
    }
    return "unknown";
}

} // namespace rdv::core
