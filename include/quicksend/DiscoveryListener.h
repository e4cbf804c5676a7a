/**
 * @file DiscoveryListener.h
 * @brief Bounded wait for a receiver announcement
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "PeerAddress.h"
#include "SocketUtils.h"
#include "config.h"
#include <cstdint>

namespace QuickSend {

/**
 * @class DiscoveryListener
 * @brief Returns the first valid announcement received before a deadline
 *
 * Datagrams with a wrong marker, malformed body or foreign protocol are
 * skipped and the wait continues with the remaining time. No ranking of
 * multiple receivers: first valid one wins.
 *
 * The UDP socket is IPv4 only, since announcements travel as IPv4
 * broadcasts. The announced address itself may be an IPv4 or IPv6 literal
 * and is returned as given; only an empty or unspecified address falls
 * back to the datagram's IPv4 source.
 */
class DiscoveryListener {
public:
    /**
     * @param discoveryPort UDP port to bind (0 = ephemeral, see getPort())
     */
    explicit DiscoveryListener(uint16_t discoveryPort = DISCOVERY_PORT);

    ~DiscoveryListener() = default;

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Bind the UDP socket (SO_REUSEADDR) on all IPv4 interfaces
     * @param error Output error (CONNECTION)
     */
    bool bind(TransferError& error);

    /**
     * @brief Port actually bound (valid after bind())
     */
    uint16_t getPort() const { return m_port; }

    /**
     * @brief Block until a valid announcement arrives or timeoutMs elapses
     * @param timeoutMs Overall deadline, not per datagram
     * @param receiver Output: announced ip (or datagram source) and tcp_port
     * @param error Output error (DISCOVERY_TIMEOUT or CONNECTION)
     * @return true if an announcement was accepted
     *
     * Binds first if bind() has not been called.
     */
    bool waitForAnnouncement(uint32_t timeoutMs, PeerAddress& receiver, TransferError& error);

    /**
     * @brief Number of datagrams skipped as invalid
     */
    uint32_t getDiscardedCount() const { return m_discardedCount; }

private:
    uint16_t m_port;
    ScopedSocket m_udpSocket;
    uint32_t m_discardedCount;
};

}  // namespace QuickSend
