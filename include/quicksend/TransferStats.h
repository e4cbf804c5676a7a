/**
 * @file TransferStats.h
 * @brief Per-session transfer counters
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>

namespace QuickSend {

/**
 * @brief Outcome counters of one session, filled by both roles
 *
 * On failure the counters describe what was completed before the error.
 */
struct TransferStats {
    uint32_t filesCompleted = 0;   ///< Entries fully sent / written
    uint64_t bytesTransferred = 0; ///< Content bytes only, framing excluded
    double elapsedSeconds = 0.0;   ///< From connect/accept to end marker

    double bytesPerSecond() const {
        return elapsedSeconds > 0.0 ? static_cast<double>(bytesTransferred) / elapsedSeconds
                                    : 0.0;
    }
};

}  // namespace QuickSend
