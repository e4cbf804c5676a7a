/**
 * @file DiscoveryAnnouncement.h
 * @brief UDP announcement datagram: magic marker + JSON body
 *
 * Datagram layout:
 *   "QSNDv4\r\n" {"protocol_id":"QUICKSEND","proto_version":4,
 *                 "ip":"192.168.1.7","tcp_port":8370,"timestamp_ms":...}
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace QuickSend {

struct DiscoveryAnnouncement {
    std::string ipAddress;      ///< Receiver IP (may be empty: use datagram source)
    uint16_t tcpPort = 0;       ///< Receiver's bound transfer port
    int64_t timestampMs = 0;    ///< Sender wall clock, informational only
};

/**
 * @brief Build the datagram payload for an announcement
 *
 * timestamp_ms is filled with the current time.
 */
std::string encodeAnnouncement(const std::string& ipAddress, uint16_t tcpPort);

/**
 * @brief Parse a received datagram
 * @param data Datagram bytes
 * @param size Datagram length
 * @param out Parsed announcement
 * @param reason Output: why the datagram was rejected
 * @return false if the datagram is not a valid QuickSend announcement
 *
 * Never throws; malformed JSON is reported through reason.
 */
bool parseAnnouncement(const char* data, size_t size,
                       DiscoveryAnnouncement& out, std::string& reason);

}  // namespace QuickSend
