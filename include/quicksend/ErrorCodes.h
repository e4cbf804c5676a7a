/**
 * @file ErrorCodes.h
 * @brief Error kinds and stable, user-visible error codes.
 *
 * The codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <string>

namespace QuickSend {
namespace ErrorCodes {

inline constexpr const char* NONE = "QS-OK-0000";
inline constexpr const char* DISCOVERY_TIMEOUT = "QS-DISC-1000";
inline constexpr const char* CONNECTION = "QS-CONN-2000";
inline constexpr const char* FRAMING = "QS-FRAME-3000";
inline constexpr const char* LOCAL_IO = "QS-IO-4000";

}  // namespace ErrorCodes

/**
 * @brief Failure categories surfaced to the invoking layer
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    DISCOVERY_TIMEOUT,  ///< No valid announcement within the bound
    CONNECTION,         ///< TCP/UDP connect, accept, read or write failure
    FRAMING,            ///< Malformed or truncated frame
    LOCAL_IO            ///< Source read or destination create/write failure
};

inline const char* errorKindToCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return ErrorCodes::NONE;
        case ErrorKind::DISCOVERY_TIMEOUT: return ErrorCodes::DISCOVERY_TIMEOUT;
        case ErrorKind::CONNECTION:        return ErrorCodes::CONNECTION;
        case ErrorKind::FRAMING:           return ErrorCodes::FRAMING;
        case ErrorKind::LOCAL_IO:          return ErrorCodes::LOCAL_IO;
        default:                           return ErrorCodes::NONE;
    }
}

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "None";
        case ErrorKind::DISCOVERY_TIMEOUT: return "DiscoveryTimeout";
        case ErrorKind::CONNECTION:        return "ConnectionError";
        case ErrorKind::FRAMING:           return "FramingError";
        case ErrorKind::LOCAL_IO:          return "LocalIOError";
        default:                           return "Unknown";
    }
}

/**
 * @brief Error output filled by every fallible core operation
 *
 * Operations return false and fill this in; the message says what failed
 * and where (file path, field, peer), the kind says how the caller should
 * categorize it.
 */
struct TransferError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    void set(ErrorKind k, const std::string& msg) {
        kind = k;
        message = msg;
    }

    void clear() {
        kind = ErrorKind::NONE;
        message.clear();
    }

    bool isSet() const { return kind != ErrorKind::NONE; }

    const char* code() const { return errorKindToCode(kind); }

    /**
     * @brief "[QS-FRAME-3000] FramingError: message"
     */
    std::string toString() const {
        return std::string("[") + code() + "] " + errorKindToString(kind) + ": " + message;
    }
};

}  // namespace QuickSend
