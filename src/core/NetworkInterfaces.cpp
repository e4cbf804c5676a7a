/**
 * @file NetworkInterfaces.cpp
 * @brief getifaddrs-based broadcast target enumeration
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/NetworkInterfaces.h"
#include "quicksend/Debug.h"
#include "quicksend/config.h"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace QuickSend {

std::vector<BroadcastTarget> getBroadcastTargets() {
    std::vector<BroadcastTarget> targets;

    ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) == 0) {
        for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || !ifa->ifa_netmask) continue;
            if (ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

            const auto* addr = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
            const auto* netmask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);

            uint32_t network = addr->sin_addr.s_addr & netmask->sin_addr.s_addr;
            in_addr broadcast{};
            broadcast.s_addr = network | ~netmask->sin_addr.s_addr;

            char ipStr[INET_ADDRSTRLEN] = {};
            char bcastStr[INET_ADDRSTRLEN] = {};
            ::inet_ntop(AF_INET, &addr->sin_addr, ipStr, sizeof(ipStr));
            ::inet_ntop(AF_INET, &broadcast, bcastStr, sizeof(bcastStr));

            LOG_DEBUG("Interface " << ifa->ifa_name << ": " << ipStr
                      << " broadcast " << bcastStr);
            targets.push_back({ipStr, bcastStr});
        }
        ::freeifaddrs(ifaddr);
    } else {
        LOG_WARNING("getifaddrs() failed, using limited broadcast only");
    }

    // Always include limited broadcast for compatibility
    targets.push_back({"", BROADCAST_ADDRESS});
    return targets;
}

}  // namespace QuickSend
