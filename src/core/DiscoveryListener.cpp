/**
 * @file DiscoveryListener.cpp
 * @brief Discovery listener implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/DiscoveryListener.h"
#include "quicksend/Debug.h"
#include "quicksend/DiscoveryAnnouncement.h"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace QuickSend {

DiscoveryListener::DiscoveryListener(uint16_t discoveryPort)
    : m_port(discoveryPort)
    , m_discardedCount(0)
{
}

bool DiscoveryListener::bind(TransferError& error) {
    if (m_udpSocket.isValid()) {
        return true;
    }

    ScopedSocket sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.isValid()) {
        error.set(ErrorKind::CONNECTION, "socket() failed: " + lastSocketError());
        return false;
    }

    // Allow a sender to start right after another one on the same host
    int reuse = 1;
    (void)::setsockopt(sock.fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in localAddr{};
    localAddr.sin_family      = AF_INET;
    localAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    localAddr.sin_port        = htons(m_port);

    if (::bind(sock.fd, reinterpret_cast<sockaddr*>(&localAddr), sizeof(localAddr)) < 0) {
        error.set(ErrorKind::CONNECTION, "Failed to bind UDP discovery port " +
                  std::to_string(m_port) + ": " + lastSocketError());
        return false;
    }

    sockaddr_in boundAddr{};
    socklen_t boundLen = sizeof(boundAddr);
    if (::getsockname(sock.fd, reinterpret_cast<sockaddr*>(&boundAddr), &boundLen) == 0) {
        m_port = ntohs(boundAddr.sin_port);
    }

    m_udpSocket = std::move(sock);
    LOG_DEBUG("Listening for announcements on UDP port " << m_port);
    return true;
}

bool DiscoveryListener::waitForAnnouncement(uint32_t timeoutMs, PeerAddress& receiver,
                                            TransferError& error)
{
    if (!bind(error)) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeoutMs);
    char buffer[MAX_ANNOUNCEMENT_SIZE];

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        pollfd pfd{};
        pfd.fd = m_udpSocket.fd;
        pfd.events = POLLIN;

        int pollResult = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (pollResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            error.set(ErrorKind::CONNECTION, "poll() failed: " + lastSocketError());
            return false;
        }
        if (pollResult == 0) {
            break;
        }

        sockaddr_storage senderAddr{};
        socklen_t senderLen = sizeof(senderAddr);
        ssize_t bytesReceived = ::recvfrom(m_udpSocket.fd, buffer, sizeof(buffer), 0,
                                           reinterpret_cast<sockaddr*>(&senderAddr),
                                           &senderLen);
        if (bytesReceived < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            error.set(ErrorKind::CONNECTION, "recvfrom() failed: " + lastSocketError());
            return false;
        }

        const PeerAddress source = fromSockaddr(reinterpret_cast<sockaddr*>(&senderAddr));

        DiscoveryAnnouncement announcement;
        std::string reason;
        if (!parseAnnouncement(buffer, static_cast<size_t>(bytesReceived), announcement, reason)) {
            m_discardedCount++;
            LOG_DEBUG("Ignoring datagram from " << source.ipAddress << ": " << reason);
            continue;
        }

        std::string ip = announcement.ipAddress;
        if (ip.empty() || isUnspecifiedAddress(ip)) {
            ip = source.ipAddress;
        } else if (!isIpLiteral(ip)) {
            m_discardedCount++;
            LOG_DEBUG("Ignoring announcement from " << source.ipAddress
                      << ": invalid ip '" << ip << "'");
            continue;
        }

        receiver = PeerAddress(ip, announcement.tcpPort);
        LOG_INFO("Found receiver at " << receiver.toString());
        return true;
    }

    error.set(ErrorKind::DISCOVERY_TIMEOUT, "No receiver announcement within " +
              std::to_string(timeoutMs) + " ms on UDP port " + std::to_string(m_port));
    return false;
}

}  // namespace QuickSend
