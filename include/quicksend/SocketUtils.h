/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers shared by the transfer and discovery code
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "PeerAddress.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace QuickSend {

constexpr int INVALID_SOCKET_FD = -1;

/**
 * @brief Outcome of an exact-length socket or stream operation
 */
enum class IoStatus : uint8_t {
    OK = 0,       ///< All requested bytes transferred
    PEER_CLOSED,  ///< Orderly close by the peer (recv returned 0)
    FAILED        ///< Socket error, reset or timeout
};

/**
 * @brief Close a socket descriptor and mark it invalid (no-op if already invalid)
 */
void closeSocket(int& fd);

// Simple RAII wrapper for a socket descriptor.
// Needed to avoid double-close in move operations when used as a class member.
struct ScopedSocket {
    int fd = INVALID_SOCKET_FD;

    ScopedSocket() = default;
    explicit ScopedSocket(int s) : fd(s) {}

    ~ScopedSocket() { closeSocket(fd); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : fd(other.fd) {
        other.fd = INVALID_SOCKET_FD;
    }

    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            closeSocket(fd);
            fd = other.fd;
            other.fd = INVALID_SOCKET_FD;
        }
        return *this;
    }

    bool isValid() const { return fd != INVALID_SOCKET_FD; }

    int release() {
        int s = fd;
        fd = INVALID_SOCKET_FD;
        return s;
    }
};

/**
 * @brief Send exactly N bytes over socket (handles partial sends)
 * @param socket Connected TCP socket
 * @param data Data to send
 * @param size Number of bytes to send
 * @param errorMsg Output error message
 * @return IoStatus::OK if all bytes were sent
 *
 * Loops until all bytes are sent or an error occurs. EINTR is retried.
 * SIGPIPE is suppressed with MSG_NOSIGNAL; a reset peer yields FAILED.
 */
IoStatus sendExact(int socket, const uint8_t* data, size_t size,
                   std::string& errorMsg);

/**
 * @brief Receive exactly N bytes from socket (handles partial receives)
 * @param socket Connected TCP socket
 * @param buffer Buffer to receive data
 * @param size Number of bytes to receive
 * @param received Output: bytes actually stored in buffer (< size on failure)
 * @param errorMsg Output error message
 * @return IoStatus::OK, PEER_CLOSED (orderly close) or FAILED
 */
IoStatus recvExact(int socket, uint8_t* buffer, size_t size,
                   size_t& received, std::string& errorMsg);

/**
 * @brief Set socket receive timeout (SO_RCVTIMEO)
 * @param socket Socket to configure
 * @param timeoutMs Timeout in milliseconds (0 = block forever)
 * @return true if successful
 */
bool setSocketRecvTimeout(int socket, uint32_t timeoutMs);

/**
 * @brief Request large kernel buffers on a transfer socket (best effort)
 */
void tuneSocketBuffers(int socket);

/**
 * @brief Switch a socket between blocking and non-blocking mode
 */
bool setSocketNonBlocking(int socket, bool nonBlocking);

/**
 * @brief Convert an address to a sockaddr suitable for bind/connect/sendto
 * @param address IP literal and port
 * @param storage Output storage
 * @param length Output length of the filled structure
 * @param errorMsg Output error message
 * @return false if the IP is not a valid numeric IPv4/IPv6 address
 */
bool toSockaddr(const PeerAddress& address, sockaddr_storage& storage,
                socklen_t& length, std::string& errorMsg);

/**
 * @brief Convert a sockaddr (AF_INET or AF_INET6) to a PeerAddress
 */
PeerAddress fromSockaddr(const sockaddr* addr);

/**
 * @brief Connect a new TCP socket to address, bounded by timeoutMs
 * @return Connected blocking socket, or INVALID_SOCKET_FD with errorMsg set
 */
int connectWithTimeout(const PeerAddress& address, uint32_t timeoutMs,
                       std::string& errorMsg);

/**
 * @brief errno as "strerror (errno)"
 */
std::string lastSocketError();

}  // namespace QuickSend
