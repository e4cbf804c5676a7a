/**
 * @file Commands.h
 * @brief Core entry points used by the command-line front end
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "NetworkInterfaces.h"
#include "PeerAddress.h"
#include "Settings.h"
#include "TransferStats.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace QuickSend {

/**
 * @brief Receiver invocation parameters
 */
struct ReceiverOptions {
    std::string bindAddress = "0.0.0.0";   ///< IPv4 or IPv6 literal ("::" for all IPv6)
    uint16_t port = TRANSFER_PORT;          ///< 0 = ephemeral
    bool stripPrefix = false;
    bool broadcast = true;
    std::filesystem::path outputDir = ".";
    Settings settings;

    /// Broadcast targets override (empty = interface enumeration)
    std::vector<BroadcastTarget> broadcastTargets;

    /// Called once the server is bound, with the bound port (tests use port 0)
    std::function<void(uint16_t boundPort)> onListening;
};

/**
 * @brief Run one receive session
 * @param options Bind address, port, strip flag, broadcast flag, output dir
 * @param stats Output counters
 * @param error Output error
 * @return true if a full session was received
 *
 * Binds the TCP server, starts the broadcaster if requested (falling back
 * to direct-IP mode with a warning if it cannot start), stops broadcasting
 * as soon as the connection is accepted, then receives the session.
 */
bool startReceiver(const ReceiverOptions& options, TransferStats& stats, TransferError& error);

/**
 * @brief Wait for a receiver announcement
 * @param timeoutMs Overall deadline
 * @param discoveryPort UDP port to listen on
 * @param receiver Output: announced receiver endpoint
 * @param error Output error (DISCOVERY_TIMEOUT, CONNECTION)
 */
bool resolveViaDiscovery(uint32_t timeoutMs, uint16_t discoveryPort,
                         PeerAddress& receiver, TransferError& error);

/**
 * @brief Send files, in order, to a resolved receiver
 * @param receiver Receiver endpoint
 * @param orderedPaths Local file paths, sent verbatim as entry paths
 * @param settings Timeouts and buffer size
 * @param stats Output counters
 * @param error Output error (LOCAL_IO, CONNECTION, FRAMING)
 */
bool sendFiles(const PeerAddress& receiver, const std::vector<std::string>& orderedPaths,
               const Settings& settings, TransferStats& stats, TransferError& error);

}  // namespace QuickSend
