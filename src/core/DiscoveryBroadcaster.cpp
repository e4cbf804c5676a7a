/**
 * @file DiscoveryBroadcaster.cpp
 * @brief Discovery broadcaster implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/DiscoveryBroadcaster.h"
#include "quicksend/Debug.h"
#include "quicksend/DiscoveryAnnouncement.h"
#include "quicksend/ThreadSafeLog.h"
#include <arpa/inet.h>
#include <chrono>
#include <exception>
#include <netinet/in.h>
#include <sys/socket.h>

namespace QuickSend {

//=============================================================================
// Constructor / Destructor
//=============================================================================

DiscoveryBroadcaster::DiscoveryBroadcaster(uint16_t tcpPort, uint16_t discoveryPort,
                                           uint32_t intervalMs)
    : m_tcpPort(tcpPort)
    , m_discoveryPort(discoveryPort)
    , m_intervalMs(intervalMs)
    , m_running(false)
    , m_stopRequested(false)
    , m_sentCount(0)
{
}

DiscoveryBroadcaster::~DiscoveryBroadcaster() {
    stop();
}

//=============================================================================
// Public Methods
//=============================================================================

void DiscoveryBroadcaster::setTargets(const std::vector<BroadcastTarget>& targets) {
    m_targetOverride = targets;
}

bool DiscoveryBroadcaster::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Broadcaster already running";
        return false;
    }

    ScopedSocket sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.isValid()) {
        errorMsg = "socket() failed: " + lastSocketError() + " -- cannot create UDP socket";
        return false;
    }

    // Enable SO_BROADCAST for sending broadcast announcements.
    int broadcastEnable = 1;
    if (::setsockopt(sock.fd, SOL_SOCKET, SO_BROADCAST,
                     &broadcastEnable, sizeof(broadcastEnable)) < 0) {
        errorMsg = "SO_BROADCAST failed: " + lastSocketError();
        return false;
    }

    m_udpSocket = std::move(sock);
    m_running = true;
    m_stopRequested = false;

    try {
        m_transmitterThread = std::thread(&DiscoveryBroadcaster::transmitterThreadFunc, this);
    } catch (const std::exception& e) {
        m_running = false;
        closeSocket(m_udpSocket.fd);
        errorMsg = std::string("Failed to start transmitter thread: ") + e.what();
        return false;
    }

    LOG_INFO("Broadcasting on UDP port " << m_discoveryPort
             << " every " << m_intervalMs << " ms (tcp_port " << m_tcpPort << ")");
    ThreadSafeLog::log("Broadcaster started, tcp_port=" + std::to_string(m_tcpPort));
    return true;
}

void DiscoveryBroadcaster::stop() {
    if (!m_running.load()) {
        return;
    }

    // Signal thread to stop
    {
        std::lock_guard<std::mutex> lock(m_stopCvMutex);
        m_stopRequested = true;
    }
    m_stopCv.notify_all();

    if (m_transmitterThread.joinable()) {
        m_transmitterThread.join();
    }

    closeSocket(m_udpSocket.fd);
    m_running = false;

    LOG_DEBUG("Broadcaster stopped after " << m_sentCount.load() << " datagrams");
    ThreadSafeLog::log("Broadcaster stopped");
}

//=============================================================================
// Private Helper Methods
//=============================================================================

std::vector<BroadcastTarget> DiscoveryBroadcaster::resolveTargets() const {
    if (!m_targetOverride.empty()) {
        return m_targetOverride;
    }
    return getBroadcastTargets();
}

void DiscoveryBroadcaster::sendRound(const std::vector<BroadcastTarget>& targets) {
    for (const auto& target : targets) {
        sockaddr_in broadcastAddr{};
        broadcastAddr.sin_family = AF_INET;
        broadcastAddr.sin_port   = htons(m_discoveryPort);
        if (::inet_pton(AF_INET, target.broadcastIp.c_str(), &broadcastAddr.sin_addr) != 1) {
            LOG_WARNING("Skipping invalid broadcast address " << target.broadcastIp);
            continue;
        }

        const std::string datagram = encodeAnnouncement(target.localIp, m_tcpPort);
        ssize_t sent = ::sendto(m_udpSocket.fd, datagram.data(), datagram.size(), 0,
                                reinterpret_cast<sockaddr*>(&broadcastAddr),
                                sizeof(broadcastAddr));
        if (sent < 0) {
            // Transient (no route, interface down); next tick retries
            LOG_DEBUG("sendto(" << target.broadcastIp << ") failed: " << lastSocketError());
            continue;
        }
        m_sentCount++;
    }
}

void DiscoveryBroadcaster::transmitterThreadFunc() {
    std::vector<BroadcastTarget> targets = resolveTargets();
    auto lastRefresh = std::chrono::steady_clock::now();

    while (!m_stopRequested.load()) {
        sendRound(targets);

        // Refresh broadcast target list if interval has elapsed.
        // This handles VPN connect / WiFi roam / new NIC without restart.
        const auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::seconds>(
                now - lastRefresh).count() >= BROADCAST_REFRESH_INTERVAL_S) {
            targets = resolveTargets();
            lastRefresh = now;
        }

        // Wait for the interval or stop signal.
        std::unique_lock<std::mutex> waitLock(m_stopCvMutex);
        m_stopCv.wait_for(waitLock,
                          std::chrono::milliseconds(m_intervalMs),
                          [this]() { return m_stopRequested.load(); });
    }
}

}  // namespace QuickSend
