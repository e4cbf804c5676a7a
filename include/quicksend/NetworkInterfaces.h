/**
 * @file NetworkInterfaces.h
 * @brief Local IPv4 interface enumeration for discovery broadcasts
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <string>
#include <vector>

namespace QuickSend {

/**
 * @brief One destination of the announcement broadcast
 *
 * localIp is the address announced in datagrams sent to broadcastIp. An
 * empty localIp tells listeners to use the datagram's source address.
 */
struct BroadcastTarget {
    std::string localIp;
    std::string broadcastIp;
};

/**
 * @brief Get list of subnet broadcast addresses for all interfaces
 * @return One target per up, non-loopback IPv4 interface, plus the limited
 *         broadcast (255.255.255.255) with an empty localIp
 *
 * The subnet broadcast is computed as (address & netmask) | ~netmask.
 */
std::vector<BroadcastTarget> getBroadcastTargets();

}  // namespace QuickSend
