/**
 * @file error.hpp
 * @brief Error taxonomy shared by the acquisition pipeline and the orchestrator
 *
 * @details
 * Every fallible operation returns an `Error` value; results travel through
 * out-parameters. `Error::None` is success.
 *
 * # Phases
 * - **Resolution** (fatal to startup, never retried here): ScanTimeout, ScanFailed,
 *   ConnectionFailed, ServiceNotFound, CharacteristicNotFound
 * - **Steady state** (cancel the sibling activity): SubscriptionFailed,
 *   ConnectionLost, PlaybackFailed, TaskStartFailed
 * - **Unwinding** (not a failure): ContextCancelled, DeadlineExceeded
 *
 * @note Decoder anomalies are not errors: they yield a speed of zero
 */

#ifndef CSCSYNC_ERROR_HPP_
#define CSCSYNC_ERROR_HPP_

#include <cstdint>

namespace cscsync {

enum class Error : uint8_t {
    None = 0,
    ScanTimeout,             ///< No matching peripheral within the scan window
    ScanFailed,              ///< Adapter refused to start scanning
    ConnectionFailed,        ///< Connect to the matched peripheral failed
    ServiceNotFound,         ///< CSC service 0x1816 absent
    CharacteristicNotFound,  ///< CSC Measurement 0x2A5B absent
    SubscriptionFailed,      ///< Notifications could not be enabled
    ConnectionLost,          ///< Link dropped while monitoring
    ContextCancelled,        ///< Cooperative shutdown in progress
    DeadlineExceeded,        ///< Context deadline passed
    PlaybackFailed,          ///< Playback sink rejected a command
    InvalidSettings,         ///< Configuration failed validation
    TaskStartFailed          ///< Activity task could not be created
};

constexpr const char* toString(const Error error) noexcept {
    switch (error) {
        case Error::None:                   return "none";
        case Error::ScanTimeout:            return "scanning time limit reached";
        case Error::ScanFailed:             return "scan could not be started";
        case Error::ConnectionFailed:       return "connection failed";
        case Error::ServiceNotFound:        return "CSC service not found";
        case Error::CharacteristicNotFound: return "CSC measurement characteristic not found";
        case Error::SubscriptionFailed:     return "notification subscription failed";
        case Error::ConnectionLost:         return "connection lost";
        case Error::ContextCancelled:       return "context cancelled";
        case Error::DeadlineExceeded:       return "deadline exceeded";
        case Error::PlaybackFailed:         return "playback command failed";
        case Error::InvalidSettings:        return "invalid settings";
        case Error::TaskStartFailed:        return "task could not be started";
    }
    return "unknown";
}

/// True for the reasons a context reports while unwinding
constexpr bool isCancellation(const Error error) noexcept {
    return error == Error::ContextCancelled || error == Error::DeadlineExceeded;
}

}  // namespace cscsync

#endif // CSCSYNC_ERROR_HPP_
