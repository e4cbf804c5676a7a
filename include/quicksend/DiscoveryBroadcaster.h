/**
 * @file DiscoveryBroadcaster.h
 * @brief Periodic UDP announcement of the receiver's transfer endpoint
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "NetworkInterfaces.h"
#include "SocketUtils.h"
#include "config.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace QuickSend {

/**
 * @class DiscoveryBroadcaster
 * @brief Broadcasts announcements until stopped
 *
 * A single transmitter thread sends one announcement per target every
 * interval. Targets default to every up IPv4 interface's subnet broadcast
 * address plus 255.255.255.255, refreshed every BROADCAST_REFRESH_INTERVAL_S
 * to follow interface changes. A failed send is logged and retried on the
 * next tick.
 *
 * Shares nothing with the transfer server except the stop request.
 */
class DiscoveryBroadcaster {
public:
    /**
     * @brief Constructor
     * @param tcpPort Bound transfer port to announce
     * @param discoveryPort UDP destination port of the announcements
     * @param intervalMs Delay between two announcement rounds
     */
    DiscoveryBroadcaster(uint16_t tcpPort,
                         uint16_t discoveryPort = DISCOVERY_PORT,
                         uint32_t intervalMs = BROADCAST_INTERVAL_MS);

    /**
     * @brief Destructor - ensures clean shutdown
     */
    ~DiscoveryBroadcaster();

    // Prevent copying (owns a socket and a thread)
    DiscoveryBroadcaster(const DiscoveryBroadcaster&) = delete;
    DiscoveryBroadcaster& operator=(const DiscoveryBroadcaster&) = delete;

    /**
     * @brief Replace interface enumeration with a fixed target list
     *
     * Must be called before start(). Used by tests (loopback) and for
     * networks where the computed broadcast addresses are unsuitable.
     */
    void setTargets(const std::vector<BroadcastTarget>& targets);

    /**
     * @brief Create the UDP socket and launch the transmitter thread
     * @param errorMsg Output error message
     * @return false if the socket cannot be created or configured
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Signal the transmitter thread and join it (idempotent)
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Number of datagrams successfully handed to the kernel
     */
    uint64_t getSentCount() const { return m_sentCount.load(); }

private:
    void transmitterThreadFunc();
    std::vector<BroadcastTarget> resolveTargets() const;
    void sendRound(const std::vector<BroadcastTarget>& targets);

    uint16_t m_tcpPort;
    uint16_t m_discoveryPort;
    uint32_t m_intervalMs;

    std::vector<BroadcastTarget> m_targetOverride;

    ScopedSocket m_udpSocket;
    std::thread m_transmitterThread;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::atomic<uint64_t> m_sentCount;
    std::condition_variable m_stopCv;  ///< Wakes the transmitter on stop
    std::mutex m_stopCvMutex;          ///< Protects m_stopCv waits
};

}  // namespace QuickSend
