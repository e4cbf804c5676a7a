/**
 * @file PeerAddress.cpp
 * @brief IP literal helpers
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/PeerAddress.h"
#include <arpa/inet.h>
#include <netinet/in.h>

namespace QuickSend {

bool isIpLiteral(const std::string& text) {
    in_addr addr4{};
    if (::inet_pton(AF_INET, text.c_str(), &addr4) == 1) {
        return true;
    }
    in6_addr addr6{};
    return ::inet_pton(AF_INET6, text.c_str(), &addr6) == 1;
}

bool isUnspecifiedAddress(const std::string& ip) {
    in_addr addr4{};
    if (::inet_pton(AF_INET, ip.c_str(), &addr4) == 1) {
        return addr4.s_addr == htonl(INADDR_ANY);
    }
    in6_addr addr6{};
    if (::inet_pton(AF_INET6, ip.c_str(), &addr6) == 1) {
        return IN6_IS_ADDR_UNSPECIFIED(&addr6);
    }
    return false;
}

}  // namespace QuickSend
