/**
 * @file TransferClient.h
 * @brief TCP sender: streams an ordered list of local files to a receiver
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "FileTransfer.h"
#include "PeerAddress.h"
#include "TransferStats.h"
#include "TransportStream.h"
#include "config.h"
#include <cstdint>
#include <string>
#include <vector>

namespace QuickSend {

/**
 * @class TransferClient
 * @brief Sends one session to one receiver
 *
 * Every file is checked (opened, sized) before connecting so that a missing
 * or unreadable source fails fast with LOCAL_IO and nothing is sent.
 *
 * Usage:
 * @code
 * TransferClient client({"a.txt", "sub/b.txt"});
 * TransferStats stats;
 * TransferError error;
 * if (!client.send(PeerAddress("192.168.1.7", 8370), stats, error)) {
 *     std::cerr << error.toString() << "\n";
 * }
 * @endcode
 */
class TransferClient {
public:
    explicit TransferClient(const std::vector<std::string>& filePaths);

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    void setConnectionTimeout(uint32_t timeoutMs) { m_connectionTimeoutMs = timeoutMs; }
    void setBufferSize(size_t bytes) { m_bufferSize = bytes; }
    void setProgressCallback(ProgressCallback progress) { m_progress = std::move(progress); }

    /**
     * @brief Open and size every file (no network activity)
     * @param error Output error (LOCAL_IO)
     */
    bool prepare(TransferError& error);

    /**
     * @brief Prefix hint that will be announced in the session header
     */
    const std::string& getPrefixHint() const { return m_prefixHint; }

    /**
     * @brief Total content bytes of the prepared files
     */
    uint64_t getTotalBytes() const;

    /**
     * @brief Connect to receiver and send the whole session
     * @param receiver Resolved receiver endpoint
     * @param stats Output counters (partial on failure)
     * @param error Output error
     *
     * Calls prepare() first if it has not succeeded yet.
     */
    bool send(const PeerAddress& receiver, TransferStats& stats, TransferError& error);

    /**
     * @brief Send the session over an already connected stream
     *
     * Writes the session header, every entry, the end marker, then
     * half-closes the stream.
     */
    bool sendSession(TransportStream& stream, TransferStats& stats, TransferError& error);

private:
    std::vector<FileSender> m_senders;
    std::string m_prefixHint;
    bool m_prepared;
    uint32_t m_connectionTimeoutMs;
    size_t m_bufferSize;
    ProgressCallback m_progress;
};

}  // namespace QuickSend
