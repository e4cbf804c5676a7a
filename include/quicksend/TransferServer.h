/**
 * @file TransferServer.h
 * @brief Single-connection TCP receiver
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "PeerAddress.h"
#include "SocketUtils.h"
#include "TransferStats.h"
#include "TransportStream.h"
#include "config.h"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace QuickSend {

/**
 * @brief Called once, right after the connection has been accepted
 */
using AcceptCallback = std::function<void(const PeerAddress& peer)>;

/**
 * @class TransferServer
 * @brief Accepts exactly one sender and writes its files to disk
 *
 * Lifecycle:
 * 1. bind() - create the listening socket (port 0 = ephemeral, see getPort())
 * 2. serveOne() - wait for one connection, close the listening socket so
 *    later senders are refused, then run the receive session on it
 * 3. stop() - from another thread, aborts a pending accept
 *
 * The accept wait is a non-blocking accept polled every
 * ACCEPT_POLL_INTERVAL_MS so stop() is honoured promptly.
 *
 * Thread Safety:
 * - stop() may be called from any thread
 * - Everything else runs on the caller's thread
 */
class TransferServer {
public:
    /**
     * @brief Construct transfer server
     * @param port TCP port to listen on (0 = ephemeral)
     * @param bindAddress Local IP literal to bind ("0.0.0.0" = all IPv4)
     */
    explicit TransferServer(uint16_t port = TRANSFER_PORT,
                            const std::string& bindAddress = "0.0.0.0");

    ~TransferServer();

    // Prevent copying
    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    //=========================================================================
    // Configuration (before serveOne())
    //=========================================================================

    void setOutputDir(const std::filesystem::path& dir) { m_outputDir = dir; }
    const std::filesystem::path& getOutputDir() const { return m_outputDir; }

    /**
     * @brief Strip the sender's common path prefix hint from every entry
     */
    void setStripPrefix(bool enabled) { m_stripPrefix = enabled; }
    bool getStripPrefix() const { return m_stripPrefix; }

    void setConnectionTimeout(uint32_t timeoutMs) { m_connectionTimeoutMs = timeoutMs; }
    void setBufferSize(size_t bytes) { m_bufferSize = bytes; }

    void setAcceptCallback(AcceptCallback callback) { m_acceptCallback = std::move(callback); }

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Create, bind and listen
     * @param error Output error (CONNECTION)
     */
    bool bind(TransferError& error);

    /**
     * @brief Port actually bound (valid after bind())
     */
    uint16_t getPort() const { return m_boundPort; }

    bool isListening() const { return m_listenSocket.isValid(); }

    /**
     * @brief Accept one connection and receive its session
     * @param stats Output counters (partial on failure)
     * @param error Output error
     * @return true if the session ended with a valid end marker
     */
    bool serveOne(TransferStats& stats, TransferError& error);

    /**
     * @brief Receive a session from an already connected stream
     *
     * Reads the session header, writes each entry under the output
     * directory (prefix-stripped if enabled) and verifies the end marker.
     * The first error aborts the session; completed files stay on disk.
     *
     * The prefix hint is checked entry by entry as records arrive. A hint
     * that a later path does not share fails the session with FRAMING only
     * when that path is reached; earlier entries are already written with
     * the hint stripped.
     */
    bool receiveSession(TransportStream& stream, TransferStats& stats, TransferError& error);

    /**
     * @brief Abort a pending accept (thread-safe)
     */
    void stop() { m_stopRequested.store(true); }

private:
    bool acceptConnection(ScopedSocket& client, PeerAddress& peer, TransferError& error);

    uint16_t m_port;
    std::string m_bindAddress;
    uint16_t m_boundPort;

    std::filesystem::path m_outputDir;
    bool m_stripPrefix;
    uint32_t m_connectionTimeoutMs;
    size_t m_bufferSize;
    AcceptCallback m_acceptCallback;

    ScopedSocket m_listenSocket;
    std::atomic<bool> m_stopRequested;
};

}  // namespace QuickSend
