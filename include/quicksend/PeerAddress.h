/**
 * @file PeerAddress.h
 * @brief Address of a receiver's transfer endpoint
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <string>

namespace QuickSend {

/**
 * @brief IP literal (IPv4 or IPv6) plus TCP port of a receiver
 *
 * Filled either from the command line (direct mode) or from a discovery
 * announcement (auto mode). The sender never resolves host names.
 */
struct PeerAddress {
    std::string ipAddress;  ///< Numeric IP, no brackets for IPv6
    uint16_t tcpPort;       ///< TCP port where the receiver accepts the session

    PeerAddress() : tcpPort(0) {}

    PeerAddress(const std::string& ip, uint16_t port)
        : ipAddress(ip), tcpPort(port) {}

    bool isIpv6() const {
        return ipAddress.find(':') != std::string::npos;
    }

    /**
     * @brief "192.168.1.7:8370" or "[fe80::1]:8370"
     */
    std::string toString() const {
        if (isIpv6()) {
            return "[" + ipAddress + "]:" + std::to_string(tcpPort);
        }
        return ipAddress + ":" + std::to_string(tcpPort);
    }

    bool operator==(const PeerAddress& other) const {
        return ipAddress == other.ipAddress && tcpPort == other.tcpPort;
    }

    bool operator!=(const PeerAddress& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Check that text is a numeric IPv4 or IPv6 address
 */
bool isIpLiteral(const std::string& text);

/**
 * @brief Check for 0.0.0.0 or ::
 */
bool isUnspecifiedAddress(const std::string& ip);

}  // namespace QuickSend
