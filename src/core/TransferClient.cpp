/**
 * @file TransferClient.cpp
 * @brief Transfer client implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/TransferClient.h"
#include "quicksend/Debug.h"
#include "quicksend/FrameProtocol.h"
#include "quicksend/PathPrefix.h"
#include "quicksend/SocketUtils.h"
#include "quicksend/ThreadSafeLog.h"
#include <chrono>

namespace QuickSend {

TransferClient::TransferClient(const std::vector<std::string>& filePaths)
    : m_prepared(false)
    , m_connectionTimeoutMs(CONNECTION_TIMEOUT_MS)
    , m_bufferSize(BUFFER_SIZE)
    , m_progress(nullptr)
{
    m_senders.reserve(filePaths.size());
    for (const auto& path : filePaths) {
        m_senders.emplace_back(path);
    }
}

bool TransferClient::prepare(TransferError& error) {
    std::vector<std::string> paths;
    paths.reserve(m_senders.size());

    for (auto& sender : m_senders) {
        if (!sender.initialize(error)) {
            return false;
        }
        paths.push_back(sender.getFilePath());
    }

    m_prefixHint = commonPathPrefix(paths);
    m_prepared = true;
    return true;
}

uint64_t TransferClient::getTotalBytes() const {
    uint64_t total = 0;
    for (const auto& sender : m_senders) {
        total += sender.getFileSize();
    }
    return total;
}

bool TransferClient::send(const PeerAddress& receiver, TransferStats& stats,
                          TransferError& error)
{
    if (!m_prepared && !prepare(error)) {
        return false;
    }

    LOG_INFO("Connecting to " << receiver.toString());
    std::string errorMsg;
    ScopedSocket sock(connectWithTimeout(receiver, m_connectionTimeoutMs, errorMsg));
    if (!sock.isValid()) {
        error.set(ErrorKind::CONNECTION, errorMsg);
        return false;
    }

    ThreadSafeLog::log("Connected to " + receiver.toString());

    PlainSocketStream stream(sock.fd);
    bool ok = sendSession(stream, stats, error);

    ThreadSafeLog::log(ok ? "Sent " + std::to_string(stats.filesCompleted) + " files to " +
                            receiver.toString()
                          : "Send failed: " + error.toString());
    return ok;
}

bool TransferClient::sendSession(TransportStream& stream, TransferStats& stats,
                                 TransferError& error)
{
    if (!m_prepared && !prepare(error)) {
        return false;
    }

    const auto startTime = std::chrono::steady_clock::now();
    auto updateElapsed = [&]() {
        stats.elapsedSeconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - startTime).count();
    };

    FrameWriter writer(stream);

    SessionHeader header;
    header.entryCount = static_cast<uint32_t>(m_senders.size());
    header.prefixHint = m_prefixHint;
    if (!writer.writeSessionHeader(header, error)) {
        updateElapsed();
        return false;
    }

    std::vector<uint8_t> buffer(m_bufferSize);
    const size_t count = m_senders.size();

    for (size_t i = 0; i < count; ++i) {
        FileSender& sender = m_senders[i];
        LOG_INFO("[" << (i + 1) << "/" << count << "] " << sender.getFilePath()
                 << " (" << sender.getFileSize() << " bytes)");

        if (!sender.sendFile(writer, buffer, error, m_progress)) {
            updateElapsed();
            return false;
        }

        stats.filesCompleted++;
        stats.bytesTransferred += sender.getFileSize();
    }

    if (!writer.writeEndOfStream(error)) {
        updateElapsed();
        return false;
    }

    stream.shutdown();
    updateElapsed();
    return true;
}

}  // namespace QuickSend
