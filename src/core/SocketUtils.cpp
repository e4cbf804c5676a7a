/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/SocketUtils.h"
#include "quicksend/config.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

namespace QuickSend {

std::string lastSocketError() {
    int err = errno;
    return std::string(std::strerror(err)) + " (" + std::to_string(err) + ")";
}

void closeSocket(int& fd) {
    if (fd != INVALID_SOCKET_FD) {
        ::close(fd);
        fd = INVALID_SOCKET_FD;
    }
}

//=============================================================================
// Exact-length I/O
//=============================================================================

IoStatus sendExact(int socket, const uint8_t* data, size_t size,
                   std::string& errorMsg)
{
    if (!data || size == 0) {
        return IoStatus::OK;  // Nothing to send
    }

    size_t totalSent = 0;

    while (totalSent < size) {
        ssize_t sendResult = ::send(socket, data + totalSent,
                                    size - totalSent, MSG_NOSIGNAL);

        if (sendResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "send() failed: " + lastSocketError();
            return IoStatus::FAILED;
        }

        if (sendResult == 0) {
            errorMsg = "Connection closed by peer";
            return IoStatus::FAILED;
        }

        totalSent += static_cast<size_t>(sendResult);
    }

    return IoStatus::OK;
}

IoStatus recvExact(int socket, uint8_t* buffer, size_t size,
                   size_t& received, std::string& errorMsg)
{
    received = 0;
    if (!buffer || size == 0) {
        return IoStatus::OK;  // Nothing to receive
    }

    while (received < size) {
        ssize_t recvResult = ::recv(socket, buffer + received,
                                    size - received, 0);

        if (recvResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "Receive timeout - peer not responding";
            } else {
                errorMsg = "recv() failed: " + lastSocketError();
            }
            return IoStatus::FAILED;
        }

        if (recvResult == 0) {
            errorMsg = "Connection closed by peer";
            return IoStatus::PEER_CLOSED;
        }

        received += static_cast<size_t>(recvResult);
    }

    return IoStatus::OK;
}

//=============================================================================
// Socket options
//=============================================================================

bool setSocketRecvTimeout(int socket, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void tuneSocketBuffers(int socket) {
    const int buf = static_cast<int>(SOCKET_BUFFER_SIZE);
    (void)::setsockopt(socket, SOL_SOCKET, SO_SNDBUF, &buf, sizeof(buf));
    (void)::setsockopt(socket, SOL_SOCKET, SO_RCVBUF, &buf, sizeof(buf));
}

bool setSocketNonBlocking(int socket, bool nonBlocking) {
    int flags = ::fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(socket, F_SETFL, flags) == 0;
}

//=============================================================================
// Address conversion
//=============================================================================

bool toSockaddr(const PeerAddress& address, sockaddr_storage& storage,
                socklen_t& length, std::string& errorMsg)
{
    std::memset(&storage, 0, sizeof(storage));

    if (address.isIpv6()) {
        auto* addr6 = reinterpret_cast<sockaddr_in6*>(&storage);
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(address.tcpPort);
        if (::inet_pton(AF_INET6, address.ipAddress.c_str(), &addr6->sin6_addr) != 1) {
            errorMsg = "Invalid IPv6 address: " + address.ipAddress;
            return false;
        }
        length = sizeof(sockaddr_in6);
        return true;
    }

    auto* addr4 = reinterpret_cast<sockaddr_in*>(&storage);
    addr4->sin_family = AF_INET;
    addr4->sin_port = htons(address.tcpPort);
    if (::inet_pton(AF_INET, address.ipAddress.c_str(), &addr4->sin_addr) != 1) {
        errorMsg = "Invalid IPv4 address: " + address.ipAddress;
        return false;
    }
    length = sizeof(sockaddr_in);
    return true;
}

PeerAddress fromSockaddr(const sockaddr* addr) {
    PeerAddress result;
    if (!addr) {
        return result;
    }

    if (addr->sa_family == AF_INET) {
        const auto* addr4 = reinterpret_cast<const sockaddr_in*>(addr);
        char ipStr[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &addr4->sin_addr, ipStr, sizeof(ipStr));
        result.ipAddress = ipStr;
        result.tcpPort = ntohs(addr4->sin_port);
    } else if (addr->sa_family == AF_INET6) {
        const auto* addr6 = reinterpret_cast<const sockaddr_in6*>(addr);
        char ipStr[INET6_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET6, &addr6->sin6_addr, ipStr, sizeof(ipStr));
        result.ipAddress = ipStr;
        result.tcpPort = ntohs(addr6->sin6_port);
    }
    return result;
}

//=============================================================================
// Connect
//=============================================================================

int connectWithTimeout(const PeerAddress& address, uint32_t timeoutMs,
                       std::string& errorMsg)
{
    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!toSockaddr(address, storage, length, errorMsg)) {
        return INVALID_SOCKET_FD;
    }

    ScopedSocket sock(::socket(storage.ss_family, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.isValid()) {
        errorMsg = "socket() failed: " + lastSocketError();
        return INVALID_SOCKET_FD;
    }

    tuneSocketBuffers(sock.fd);

    if (!setSocketNonBlocking(sock.fd, true)) {
        errorMsg = "Failed to set non-blocking mode: " + lastSocketError();
        return INVALID_SOCKET_FD;
    }

    int rc = ::connect(sock.fd, reinterpret_cast<sockaddr*>(&storage), length);
    if (rc < 0 && errno != EINPROGRESS) {
        errorMsg = "connect() to " + address.toString() + " failed: " + lastSocketError();
        return INVALID_SOCKET_FD;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = sock.fd;
        pfd.events = POLLOUT;

        int pollResult;
        do {
            pollResult = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
        } while (pollResult < 0 && errno == EINTR);

        if (pollResult == 0) {
            errorMsg = "Connection to " + address.toString() + " timed out";
            return INVALID_SOCKET_FD;
        }
        if (pollResult < 0) {
            errorMsg = "poll() failed: " + lastSocketError();
            return INVALID_SOCKET_FD;
        }

        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0) {
            errorMsg = "getsockopt(SO_ERROR) failed: " + lastSocketError();
            return INVALID_SOCKET_FD;
        }
        if (soError != 0) {
            errorMsg = "connect() to " + address.toString() + " failed: " +
                       std::strerror(soError);
            return INVALID_SOCKET_FD;
        }
    }

    if (!setSocketNonBlocking(sock.fd, false)) {
        errorMsg = "Failed to restore blocking mode: " + lastSocketError();
        return INVALID_SOCKET_FD;
    }

    int noDelay = 1;
    (void)::setsockopt(sock.fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));

    return sock.release();
}

}  // namespace QuickSend
