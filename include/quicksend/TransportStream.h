/**
 * @file TransportStream.h
 * @brief Minimal transport abstraction for sockets and in-memory buffers
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "SocketUtils.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace QuickSend {

/**
 * @brief Minimal stream interface used by the frame protocol.
 *
 * The frame protocol requires exact-length reads and writes for both
 * fixed-size fields (lengths, counts) and streaming content chunks. This
 * interface abstracts the underlying transport (TCP socket or memory buffer)
 * while keeping the hot path simple.
 *
 * recvExact reports how many bytes were stored before a failure so that the
 * frame reader can tell a close on a record boundary from a truncated field.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual IoStatus sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual IoStatus recvExact(uint8_t* buffer, size_t size, size_t& received,
                               std::string& errorMsg) = 0;

    /// Signal end of outgoing data (half-close)
    virtual void shutdown() {}
};

class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socket) : m_socket(socket) {}

    IoStatus sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    IoStatus recvExact(uint8_t* buffer, size_t size, size_t& received,
                       std::string& errorMsg) override;
    void shutdown() override;

private:
    int m_socket;
};

/**
 * @brief Stream over an in-memory byte buffer
 *
 * Writes append to the buffer, reads consume from the front. Reading past
 * the end behaves like an orderly peer close. Used to encode and decode
 * frames without a socket.
 */
class MemoryStream final : public TransportStream {
public:
    MemoryStream() = default;
    explicit MemoryStream(std::vector<uint8_t> data) : m_data(std::move(data)) {}

    IoStatus sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    IoStatus recvExact(uint8_t* buffer, size_t size, size_t& received,
                       std::string& errorMsg) override;

    const std::vector<uint8_t>& data() const { return m_data; }
    size_t readPosition() const { return m_readPos; }
    size_t remaining() const { return m_data.size() - m_readPos; }

    /**
     * @brief Make reads fail (FAILED, not PEER_CLOSED) once offset is reached
     */
    void setReadFailureAt(size_t offset) { m_readFailureAt = offset; }

    /**
     * @brief Make writes fail once the buffer would grow past limit bytes
     */
    void setWriteLimit(size_t limit) { m_writeLimit = limit; }

private:
    std::vector<uint8_t> m_data;
    size_t m_readPos = 0;
    size_t m_readFailureAt = SIZE_MAX;
    size_t m_writeLimit = SIZE_MAX;
};

}  // namespace QuickSend
