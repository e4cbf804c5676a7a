/**
 * @file FrameProtocol.cpp
 * @brief Session frame writer and reader implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/FrameProtocol.h"
#include <algorithm>
#include <array>
#include <cstring>

namespace QuickSend {

namespace {
    constexpr size_t PREAMBLE_FIXED_SIZE = 3 + 1 + 4 + 4;  // magic, version, count, hintLen

    void putU32(uint8_t* out, uint32_t value) {
        out[0] = static_cast<uint8_t>(value >> 24);
        out[1] = static_cast<uint8_t>(value >> 16);
        out[2] = static_cast<uint8_t>(value >> 8);
        out[3] = static_cast<uint8_t>(value);
    }

    void putU64(uint8_t* out, uint64_t value) {
        for (int i = 7; i >= 0; --i) {
            out[7 - i] = static_cast<uint8_t>(value >> (i * 8));
        }
    }

    uint32_t getU32(const uint8_t* in) {
        return (static_cast<uint32_t>(in[0]) << 24) |
               (static_cast<uint32_t>(in[1]) << 16) |
               (static_cast<uint32_t>(in[2]) << 8) |
               static_cast<uint32_t>(in[3]);
    }

    uint64_t getU64(const uint8_t* in) {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | in[i];
        }
        return value;
    }
} // anonymous namespace

//=============================================================================
// FrameWriter
//=============================================================================

FrameWriter::FrameWriter(TransportStream& stream)
    : m_stream(stream)
    , m_headerWritten(false)
    , m_finished(false)
    , m_entryCount(0)
    , m_entriesWritten(0)
    , m_contentRemaining(0)
{
}

bool FrameWriter::send(const uint8_t* data, size_t size, TransferError& error) {
    std::string errorMsg;
    if (m_stream.sendExact(data, size, errorMsg) != IoStatus::OK) {
        error.set(ErrorKind::CONNECTION, "Send failed: " + errorMsg);
        return false;
    }
    return true;
}

bool FrameWriter::writeSessionHeader(const SessionHeader& header, TransferError& error) {
    if (m_headerWritten) {
        error.set(ErrorKind::FRAMING, "Session header already written");
        return false;
    }
    if (header.prefixHint.size() > MAX_PATH_BYTES) {
        error.set(ErrorKind::FRAMING, "Prefix hint exceeds " +
                  std::to_string(MAX_PATH_BYTES) + " bytes");
        return false;
    }

    std::array<uint8_t, PREAMBLE_FIXED_SIZE> fixed{};
    std::memcpy(fixed.data(), SESSION_MAGIC.data(), SESSION_MAGIC.size());
    fixed[3] = header.version;
    putU32(fixed.data() + 4, header.entryCount);
    putU32(fixed.data() + 8, static_cast<uint32_t>(header.prefixHint.size()));

    if (!send(fixed.data(), fixed.size(), error)) {
        return false;
    }
    if (!send(reinterpret_cast<const uint8_t*>(header.prefixHint.data()),
              header.prefixHint.size(), error)) {
        return false;
    }

    m_headerWritten = true;
    m_entryCount = header.entryCount;
    return true;
}

bool FrameWriter::writeEntryHeader(const FileEntry& entry, TransferError& error) {
    if (!m_headerWritten || m_finished) {
        error.set(ErrorKind::FRAMING, "Entry written outside of an open session");
        return false;
    }
    if (m_contentRemaining != 0) {
        error.set(ErrorKind::FRAMING, "New entry started with " +
                  std::to_string(m_contentRemaining) +
                  " content bytes of the previous entry still pending");
        return false;
    }
    if (entry.path.size() > MAX_PATH_BYTES) {
        error.set(ErrorKind::FRAMING, "Path exceeds " + std::to_string(MAX_PATH_BYTES) +
                  " bytes: " + entry.path.substr(0, 64) + "...");
        return false;
    }

    uint8_t pathLen[4];
    putU32(pathLen, static_cast<uint32_t>(entry.path.size()));
    uint8_t contentLen[8];
    putU64(contentLen, entry.size);

    if (!send(pathLen, sizeof(pathLen), error) ||
        !send(reinterpret_cast<const uint8_t*>(entry.path.data()), entry.path.size(), error) ||
        !send(contentLen, sizeof(contentLen), error)) {
        return false;
    }

    m_contentRemaining = entry.size;
    m_entriesWritten++;
    return true;
}

bool FrameWriter::writeContent(const uint8_t* data, size_t size, TransferError& error) {
    if (size > m_contentRemaining) {
        error.set(ErrorKind::FRAMING, "Content exceeds declared length by " +
                  std::to_string(size - m_contentRemaining) + " bytes");
        return false;
    }
    if (!send(data, size, error)) {
        return false;
    }
    m_contentRemaining -= size;
    return true;
}

bool FrameWriter::writeEndOfStream(TransferError& error) {
    if (!m_headerWritten || m_finished) {
        error.set(ErrorKind::FRAMING, "End marker written outside of an open session");
        return false;
    }
    if (m_contentRemaining != 0) {
        error.set(ErrorKind::FRAMING, "End marker with " +
                  std::to_string(m_contentRemaining) + " content bytes still pending");
        return false;
    }
    if (m_entriesWritten != m_entryCount) {
        error.set(ErrorKind::FRAMING, "Announced " + std::to_string(m_entryCount) +
                  " entries but wrote " + std::to_string(m_entriesWritten));
        return false;
    }

    uint8_t marker[4];
    putU32(marker, END_OF_STREAM_MARKER);
    if (!send(marker, sizeof(marker), error)) {
        return false;
    }

    m_finished = true;
    return true;
}

//=============================================================================
// FrameReader
//=============================================================================

FrameReader::FrameReader(TransportStream& stream)
    : m_stream(stream)
    , m_headerRead(false)
    , m_finished(false)
    , m_entriesRead(0)
    , m_contentRemaining(0)
{
}

bool FrameReader::recvField(uint8_t* buffer, size_t size, bool atRecordBoundary,
                            const char* fieldName, TransferError& error)
{
    std::string errorMsg;
    size_t received = 0;
    IoStatus status = m_stream.recvExact(buffer, size, received, errorMsg);

    switch (status) {
        case IoStatus::OK:
            return true;
        case IoStatus::PEER_CLOSED:
            if (atRecordBoundary && received == 0) {
                error.set(ErrorKind::CONNECTION,
                          "Connection closed before end-of-stream marker");
            } else {
                error.set(ErrorKind::FRAMING,
                          std::string("Truncated frame: connection closed inside ") +
                          fieldName + " (" + std::to_string(received) + " of " +
                          std::to_string(size) + " bytes)");
            }
            return false;
        case IoStatus::FAILED:
        default:
            error.set(ErrorKind::CONNECTION,
                      std::string("Receive failed reading ") + fieldName + ": " + errorMsg);
            return false;
    }
}

bool FrameReader::readSessionHeader(SessionHeader& header, TransferError& error) {
    if (m_headerRead) {
        error.set(ErrorKind::FRAMING, "Session header already read");
        return false;
    }

    std::array<uint8_t, PREAMBLE_FIXED_SIZE> fixed{};

    // Magic first so a foreign protocol is reported as such, not as truncation
    if (!recvField(fixed.data(), SESSION_MAGIC.size(), true, "session magic", error)) {
        return false;
    }
    if (std::memcmp(fixed.data(), SESSION_MAGIC.data(), SESSION_MAGIC.size()) != 0) {
        error.set(ErrorKind::FRAMING, "Bad session magic");
        return false;
    }

    if (!recvField(fixed.data() + 3, PREAMBLE_FIXED_SIZE - 3, false,
                   "session header", error)) {
        return false;
    }

    uint8_t version = fixed[3];
    if (version != PROTOCOL_VERSION) {
        error.set(ErrorKind::FRAMING, "Unsupported protocol version " +
                  std::to_string(version) + " (expected " +
                  std::to_string(PROTOCOL_VERSION) + ")");
        return false;
    }

    uint32_t entryCount = getU32(fixed.data() + 4);
    uint32_t hintLen = getU32(fixed.data() + 8);
    if (hintLen > MAX_PATH_BYTES) {
        error.set(ErrorKind::FRAMING, "Prefix hint length " + std::to_string(hintLen) +
                  " exceeds " + std::to_string(MAX_PATH_BYTES));
        return false;
    }

    std::string hint(hintLen, '\0');
    if (hintLen > 0 &&
        !recvField(reinterpret_cast<uint8_t*>(&hint[0]), hintLen, false, "prefix hint", error)) {
        return false;
    }

    m_header.version = version;
    m_header.entryCount = entryCount;
    m_header.prefixHint = std::move(hint);
    m_headerRead = true;

    header = m_header;
    return true;
}

bool FrameReader::nextEntry(FileEntry& entry, bool& endOfStream, TransferError& error) {
    endOfStream = false;

    if (!m_headerRead || m_finished) {
        error.set(ErrorKind::FRAMING, "Entry read outside of an open session");
        return false;
    }
    if (m_contentRemaining != 0) {
        error.set(ErrorKind::FRAMING, "Previous entry has " +
                  std::to_string(m_contentRemaining) + " unread content bytes");
        return false;
    }

    uint8_t lenBuf[8];
    if (!recvField(lenBuf, 4, true, "path length", error)) {
        return false;
    }
    uint32_t pathLen = getU32(lenBuf);

    if (pathLen == END_OF_STREAM_MARKER) {
        if (m_entriesRead != m_header.entryCount) {
            error.set(ErrorKind::FRAMING, "End marker after " +
                      std::to_string(m_entriesRead) + " entries, " +
                      std::to_string(m_header.entryCount) + " announced");
            return false;
        }
        m_finished = true;
        endOfStream = true;
        return true;
    }

    // Refuse the record before any of it is handed to the caller
    if (m_entriesRead >= m_header.entryCount) {
        error.set(ErrorKind::FRAMING, "More entries than announced (" +
                  std::to_string(m_header.entryCount) + ")");
        return false;
    }

    if (pathLen > MAX_PATH_BYTES) {
        error.set(ErrorKind::FRAMING, "Path length " + std::to_string(pathLen) +
                  " exceeds " + std::to_string(MAX_PATH_BYTES));
        return false;
    }

    std::string path(pathLen, '\0');
    if (pathLen > 0 &&
        !recvField(reinterpret_cast<uint8_t*>(&path[0]), pathLen, false, "path", error)) {
        return false;
    }

    if (!recvField(lenBuf, 8, false, "content length", error)) {
        return false;
    }

    entry.path = std::move(path);
    entry.size = getU64(lenBuf);
    m_contentRemaining = entry.size;
    m_entriesRead++;
    return true;
}

bool FrameReader::readContent(uint8_t* buffer, size_t capacity, size_t& bytesRead,
                              TransferError& error)
{
    bytesRead = 0;
    size_t toRead = static_cast<size_t>(
        std::min<uint64_t>(capacity, m_contentRemaining));
    if (toRead == 0) {
        return true;
    }

    if (!recvField(buffer, toRead, false, "content", error)) {
        return false;
    }

    bytesRead = toRead;
    m_contentRemaining -= toRead;
    return true;
}

}  // namespace QuickSend
