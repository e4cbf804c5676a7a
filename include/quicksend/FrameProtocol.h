/**
 * @file FrameProtocol.h
 * @brief Wire codec for a transfer session: session header, file entries, end marker
 *
 * Session layout (all integers unsigned, network byte order):
 *
 *   preamble := "sf-" version:u8 entryCount:u32 hintLen:u32 hint[hintLen]
 *   entry    := pathLen:u32 path[pathLen] contentLen:u64 content[contentLen]
 *   end      := 0xFFFFFFFF   (in the pathLen position)
 *
 * The codec only talks to a TransportStream; it never opens files or sockets.
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "TransportStream.h"
#include "config.h"
#include <cstdint>
#include <string>

namespace QuickSend {

/**
 * @brief One (path, size) record; content follows on the stream
 */
struct FileEntry {
    std::string path;   ///< Opaque path string, exactly as the sender gave it
    uint64_t size = 0;  ///< Content length in bytes
};

/**
 * @brief Preamble sent once per session
 */
struct SessionHeader {
    uint8_t version = PROTOCOL_VERSION;
    uint32_t entryCount = 0;   ///< Number of entries before the end marker
    std::string prefixHint;    ///< Common path prefix computed by the sender (may be empty)
};

/**
 * @brief Encodes a session onto a stream
 *
 * Call order: writeSessionHeader, then per entry writeEntryHeader followed by
 * writeContent until the declared size is reached, then writeEndOfStream.
 * Any out-of-order call fails with FRAMING without touching the stream.
 */
class FrameWriter {
public:
    explicit FrameWriter(TransportStream& stream);

    bool writeSessionHeader(const SessionHeader& header, TransferError& error);
    bool writeEntryHeader(const FileEntry& entry, TransferError& error);

    /**
     * @brief Write a chunk of the current entry's content
     *
     * Fails with FRAMING if the chunk would exceed the declared size.
     */
    bool writeContent(const uint8_t* data, size_t size, TransferError& error);

    /**
     * @brief Write the end marker
     *
     * Fails with FRAMING if the current entry is incomplete or if the number
     * of entries written differs from the announced count.
     */
    bool writeEndOfStream(TransferError& error);

    uint32_t entriesWritten() const { return m_entriesWritten; }
    uint64_t contentRemaining() const { return m_contentRemaining; }

private:
    bool send(const uint8_t* data, size_t size, TransferError& error);

    TransportStream& m_stream;
    bool m_headerWritten;
    bool m_finished;
    uint32_t m_entryCount;
    uint32_t m_entriesWritten;
    uint64_t m_contentRemaining;
};

/**
 * @brief Decodes a session from a stream, pull-based
 *
 * Error mapping:
 * - orderly close before any byte of the next record -> CONNECTION
 * - orderly close inside a field -> FRAMING (truncated frame)
 * - transport failure or timeout -> CONNECTION
 * - bad magic, unsupported version, oversized path/hint, entry count
 *   mismatch at the end marker -> FRAMING
 */
class FrameReader {
public:
    explicit FrameReader(TransportStream& stream);

    bool readSessionHeader(SessionHeader& header, TransferError& error);

    /**
     * @brief Read the next entry header or the end marker
     * @param entry Output entry (valid only if endOfStream is false)
     * @param endOfStream Output: true when the end marker was read
     * @param error Output error
     * @return false on any error
     *
     * The previous entry's content must have been consumed completely.
     */
    bool nextEntry(FileEntry& entry, bool& endOfStream, TransferError& error);

    /**
     * @brief Read up to capacity bytes of the current entry's content
     * @param buffer Destination buffer
     * @param capacity Buffer size
     * @param bytesRead Output: bytes stored (0 once the content is exhausted)
     * @param error Output error
     * @return false on any error
     */
    bool readContent(uint8_t* buffer, size_t capacity, size_t& bytesRead,
                     TransferError& error);

    uint64_t remainingContent() const { return m_contentRemaining; }
    uint32_t entriesRead() const { return m_entriesRead; }
    const SessionHeader& sessionHeader() const { return m_header; }

private:
    bool recvField(uint8_t* buffer, size_t size, bool atRecordBoundary,
                   const char* fieldName, TransferError& error);

    TransportStream& m_stream;
    SessionHeader m_header;
    bool m_headerRead;
    bool m_finished;
    uint32_t m_entriesRead;
    uint64_t m_contentRemaining;
};

}  // namespace QuickSend
