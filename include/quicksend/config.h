/**
 * @file config.h
 * @brief Configuration constants for QuickSend
 *
 * This file contains the compile-time defaults used throughout QuickSend:
 * network ports, timing values, buffer sizes and wire protocol identifiers.
 * Most of the timing and port values can be overridden at runtime through
 * Settings (config.json); the protocol identifiers cannot.
 *
 * @note Changes to the Binary Protocol or Discovery Protocol groups break
 *       compatibility with other QuickSend builds.
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @namespace QuickSend
 * @brief QuickSend namespace containing all public APIs
 */
namespace QuickSend {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief Well-known ports shared by sender and receiver
 *
 * The values spell the tool's old name: 'S' (83) 'F' (70) -> 8370 for the
 * transfer port and one below it for discovery.
 * @{
 */

/**
 * @brief TCP port the receiver listens on for the transfer session.
 *
 * A value of 0 in Settings makes the receiver bind an ephemeral port; the
 * broadcaster then announces whatever the OS assigned.
 */
constexpr uint16_t TRANSFER_PORT = 8370;

/**
 * @brief UDP port senders listen on for discovery announcements.
 */
constexpr uint16_t DISCOVERY_PORT = 8369;

/** @} */ // end of NetworkPorts

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timing intervals and timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Interval between two discovery announcements.
 *
 * A sender in auto mode is expected to find the receiver within one interval
 * plus network latency.
 */
constexpr uint32_t BROADCAST_INTERVAL_MS = 1000;

/**
 * @brief How long a sender waits for an announcement before giving up.
 */
constexpr uint32_t DISCOVERY_TIMEOUT_MS = 10000;

/**
 * @brief Connect timeout and idle receive timeout on the transfer socket.
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;

/**
 * @brief Sleep between two non-blocking accept() attempts.
 *
 * Bounds how long TransferServer::stop() takes to be noticed by the accept loop.
 */
constexpr uint32_t ACCEPT_POLL_INTERVAL_MS = 100;

/**
 * @brief Broadcast target list refresh interval (seconds).
 *
 * Picks up interfaces that come up while the receiver waits (WiFi roam,
 * cable plugged in) without a restart.
 */
constexpr int BROADCAST_REFRESH_INTERVAL_S = 60;

/** @} */ // end of Timing

//=========================================================================
// Buffer Sizes
//=========================================================================

/** @defgroup BufferSizes Buffer Size Configuration
 * @{
 */

/**
 * @brief File content chunk size used on both sides of the transfer.
 *
 * Content is never buffered whole; it moves disk -> socket and
 * socket -> disk in chunks of this size.
 */
constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024;  // 4 MB

/**
 * @brief Bounds accepted for a configured buffer size.
 */
constexpr size_t MIN_BUFFER_SIZE = 4 * 1024;
constexpr size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;

/**
 * @brief Socket send/receive buffer requested on transfer sockets.
 */
constexpr int SOCKET_BUFFER_SIZE = 4 * 1024 * 1024;

/**
 * @brief Upper bound for a single path string (and the prefix hint).
 *
 * Path contents are not validated, but a length above this value can only be
 * garbage and is rejected as a framing error instead of being allocated.
 */
constexpr uint32_t MAX_PATH_BYTES = 1024 * 1024;

/**
 * @brief Maximum discovery datagram size.
 */
constexpr size_t MAX_ANNOUNCEMENT_SIZE = 1024;

/** @} */ // end of BufferSizes

//=========================================================================
// Binary Protocol
//=========================================================================

/** @defgroup BinaryProtocol Binary Protocol Configuration
 * @brief Constants for the TCP transfer stream
 *
 * Stream layout (all integers big-endian):
 * - "sf-" magic (3 bytes), version (1 byte)
 * - entry count (4 bytes), prefix hint length (4 bytes), prefix hint
 * - per entry: path length (4), path, content length (8), content
 * - END_OF_STREAM_MARKER in place of the next path length
 * @{
 */

/**
 * @brief Session preamble magic.
 */
constexpr std::array<uint8_t, 3> SESSION_MAGIC = {'s', 'f', '-'};

/**
 * @brief Wire protocol version carried in the preamble.
 *
 * Version 4 replaced the up-front file list of version 3 with per-entry
 * records and an explicit end marker.
 */
constexpr uint8_t PROTOCOL_VERSION = 4;

/**
 * @brief Sentinel path length meaning "no more entries".
 */
constexpr uint32_t END_OF_STREAM_MARKER = 0xFFFFFFFF;

/** @} */ // end of BinaryProtocol

//=========================================================================
// Discovery Protocol
//=========================================================================

/** @defgroup DiscoveryProtocol Discovery Protocol Configuration
 * @{
 */

/**
 * @brief Fixed bytes every announcement datagram starts with.
 *
 * Datagrams not starting with these 8 bytes are dropped before any parsing.
 */
constexpr std::array<char, 8> ANNOUNCEMENT_MAGIC = {'Q', 'S', 'N', 'D', 'v', '4', '\r', '\n'};

/**
 * @brief protocol_id value inside the announcement JSON body.
 */
constexpr const char* PROTOCOL_ID = "QUICKSEND";

/**
 * @brief IPv4 limited broadcast address, always included in the targets.
 */
constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

/**
 * @brief Loopback address used by tests and local transfers.
 */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/**
 * @brief Literal destination that makes the sender use discovery.
 */
constexpr const char* AUTO_ADDRESS = "auto";

/** @} */ // end of DiscoveryProtocol

}  // namespace QuickSend
