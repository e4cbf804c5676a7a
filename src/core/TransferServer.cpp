/**
 * @file TransferServer.cpp
 * @brief Single-connection file transfer server
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/TransferServer.h"
#include "quicksend/Debug.h"
#include "quicksend/FileTransfer.h"
#include "quicksend/FrameProtocol.h"
#include "quicksend/PathPrefix.h"
#include "quicksend/ThreadSafeLog.h"
#include <cerrno>
#include <chrono>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <vector>

namespace QuickSend {

namespace {
    #define LogTransfer(msg) QuickSend::ThreadSafeLog::log(msg)
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

/**
 * @brief Construct transfer server
 * @param port TCP port to listen on
 * @param bindAddress Local address to bind
 */
TransferServer::TransferServer(uint16_t port, const std::string& bindAddress)
    : m_port(port)
    , m_bindAddress(bindAddress)
    , m_boundPort(0)
    , m_outputDir(".")  // Default to current directory
    , m_stripPrefix(false)
    , m_connectionTimeoutMs(CONNECTION_TIMEOUT_MS)
    , m_bufferSize(BUFFER_SIZE)
    , m_acceptCallback(nullptr)
    , m_stopRequested(false)
{
}

TransferServer::~TransferServer() {
    stop();
    closeSocket(m_listenSocket.fd);
}

//=============================================================================
// TransferServer: bind()
//=============================================================================

bool TransferServer::bind(TransferError& error) {
    if (m_listenSocket.isValid()) {
        return true;
    }

    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    std::string errorMsg;
    if (!toSockaddr(PeerAddress(m_bindAddress, m_port), addr, addrLen, errorMsg)) {
        error.set(ErrorKind::CONNECTION, "Invalid bind address: " + errorMsg);
        return false;
    }

    ScopedSocket sock(::socket(addr.ss_family, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.isValid()) {
        error.set(ErrorKind::CONNECTION, "socket() failed: " + lastSocketError());
        return false;
    }

    int reuse = 1;
    (void)::setsockopt(sock.fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(sock.fd, reinterpret_cast<sockaddr*>(&addr), addrLen) < 0) {
        error.set(ErrorKind::CONNECTION, "bind() to " + PeerAddress(m_bindAddress, m_port).toString() +
                  " failed: " + lastSocketError());
        return false;
    }

    // Only one sender is served; a backlog of 1 is enough
    if (::listen(sock.fd, 1) < 0) {
        error.set(ErrorKind::CONNECTION, "listen() failed: " + lastSocketError());
        return false;
    }

    // Non-blocking accept so stop() is noticed between polls
    if (!setSocketNonBlocking(sock.fd, true)) {
        error.set(ErrorKind::CONNECTION, "Failed to set non-blocking mode: " + lastSocketError());
        return false;
    }

    sockaddr_storage boundAddr{};
    socklen_t boundLen = sizeof(boundAddr);
    if (::getsockname(sock.fd, reinterpret_cast<sockaddr*>(&boundAddr), &boundLen) < 0) {
        error.set(ErrorKind::CONNECTION, "getsockname() failed: " + lastSocketError());
        return false;
    }
    m_boundPort = fromSockaddr(reinterpret_cast<sockaddr*>(&boundAddr)).tcpPort;

    m_listenSocket = std::move(sock);
    LogTransfer("Server listening on port " + std::to_string(m_boundPort));
    return true;
}

//=============================================================================
// TransferServer: acceptConnection()
//=============================================================================

bool TransferServer::acceptConnection(ScopedSocket& client, PeerAddress& peer,
                                      TransferError& error)
{
    while (!m_stopRequested.load()) {
        sockaddr_storage clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);

        int clientSocket = ::accept(m_listenSocket.fd,
                                    reinterpret_cast<sockaddr*>(&clientAddr),
                                    &addrLen);

        if (clientSocket < 0) {
            // EAGAIN is expected in non-blocking mode
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
                errno == ECONNABORTED) {
                std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_INTERVAL_MS));
                continue;
            }
            error.set(ErrorKind::CONNECTION, "accept() failed: " + lastSocketError());
            return false;
        }

        client = ScopedSocket(clientSocket);
        peer = fromSockaddr(reinterpret_cast<sockaddr*>(&clientAddr));
        return true;
    }

    error.set(ErrorKind::CONNECTION, "Server stopped before a sender connected");
    return false;
}

//=============================================================================
// TransferServer: serveOne()
//=============================================================================

bool TransferServer::serveOne(TransferStats& stats, TransferError& error) {
    if (!bind(error)) {
        return false;
    }

    ScopedSocket client;
    PeerAddress peer;
    if (!acceptConnection(client, peer, error)) {
        LogTransfer("Server stopped without a connection");
        return false;
    }

    // Exactly one session per invocation: refuse every later connection attempt
    closeSocket(m_listenSocket.fd);

    LOG_INFO("Connection from " << peer.toString());
    LogTransfer("Accepted connection from " + peer.toString());

    if (m_acceptCallback) {
        m_acceptCallback(peer);
    }

    // Set client socket back to blocking mode
    if (!setSocketNonBlocking(client.fd, false)) {
        error.set(ErrorKind::CONNECTION, "Failed to set blocking mode: " + lastSocketError());
        return false;
    }
    if (!setSocketRecvTimeout(client.fd, m_connectionTimeoutMs)) {
        error.set(ErrorKind::CONNECTION, "Failed to set receive timeout: " + lastSocketError());
        return false;
    }
    tuneSocketBuffers(client.fd);

    PlainSocketStream stream(client.fd);
    bool ok = receiveSession(stream, stats, error);

    LogTransfer(ok ? "Session complete: " + std::to_string(stats.filesCompleted) + " files"
                   : "Session failed: " + error.toString());
    return ok;
}

//=============================================================================
// TransferServer: receiveSession()
//=============================================================================

bool TransferServer::receiveSession(TransportStream& stream, TransferStats& stats,
                                    TransferError& error)
{
    const auto startTime = std::chrono::steady_clock::now();
    auto updateElapsed = [&]() {
        stats.elapsedSeconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - startTime).count();
    };

    FrameReader reader(stream);
    SessionHeader header;
    if (!reader.readSessionHeader(header, error)) {
        return false;
    }

    // Nothing to strip with fewer than two files
    const bool applyHint = m_stripPrefix && header.entryCount >= 2 && !header.prefixHint.empty();
    if (applyHint) {
        LOG_DEBUG("Stripping common prefix '" << header.prefixHint << "'");
    }
    LOG_INFO("Receiving " << header.entryCount << " file(s) into " << m_outputDir.string());

    FileReceiver receiver(m_outputDir);
    std::vector<uint8_t> buffer(m_bufferSize);

    while (true) {
        FileEntry entry;
        bool endOfStream = false;
        if (!reader.nextEntry(entry, endOfStream, error)) {
            updateElapsed();
            return false;
        }
        if (endOfStream) {
            break;
        }

        std::string destPath = entry.path;
        if (applyHint) {
            if (!stripPathPrefix(entry.path, header.prefixHint, destPath)) {
                error.set(ErrorKind::FRAMING, "Prefix hint '" + header.prefixHint +
                          "' is not a whole-component prefix of '" + entry.path + "'");
                updateElapsed();
                return false;
            }
            if (destPath.empty()) {
                error.set(ErrorKind::FRAMING, "Prefix hint '" + header.prefixHint +
                          "' leaves an empty path for '" + entry.path + "'");
                updateElapsed();
                return false;
            }
        }

        LOG_INFO("[" << reader.entriesRead() << "/" << header.entryCount << "] "
                 << destPath << " (" << entry.size << " bytes)");

        if (!receiver.receiveFile(reader, destPath, entry.size, buffer, error)) {
            updateElapsed();
            return false;
        }

        stats.filesCompleted++;
        stats.bytesTransferred += entry.size;
    }

    updateElapsed();
    return true;
}

}  // namespace QuickSend
