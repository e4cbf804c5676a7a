/**
 * @file TransportStream.cpp
 * @brief Socket and memory stream implementations
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/TransportStream.h"
#include <algorithm>
#include <cstring>
#include <sys/socket.h>

namespace QuickSend {

//=============================================================================
// PlainSocketStream
//=============================================================================

IoStatus PlainSocketStream::sendExact(const uint8_t* data, size_t size,
                                      std::string& errorMsg) {
    return QuickSend::sendExact(m_socket, data, size, errorMsg);
}

IoStatus PlainSocketStream::recvExact(uint8_t* buffer, size_t size, size_t& received,
                                      std::string& errorMsg) {
    return QuickSend::recvExact(m_socket, buffer, size, received, errorMsg);
}

void PlainSocketStream::shutdown() {
    (void)::shutdown(m_socket, SHUT_WR);
}

//=============================================================================
// MemoryStream
//=============================================================================

IoStatus MemoryStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!data || size == 0) {
        return IoStatus::OK;
    }

    if (m_writeLimit != SIZE_MAX && m_data.size() + size > m_writeLimit) {
        size_t room = m_writeLimit > m_data.size() ? m_writeLimit - m_data.size() : 0;
        m_data.insert(m_data.end(), data, data + room);
        errorMsg = "Write limit reached";
        return IoStatus::FAILED;
    }

    m_data.insert(m_data.end(), data, data + size);
    return IoStatus::OK;
}

IoStatus MemoryStream::recvExact(uint8_t* buffer, size_t size, size_t& received,
                                 std::string& errorMsg) {
    received = 0;
    if (!buffer || size == 0) {
        return IoStatus::OK;
    }

    size_t available = remaining();
    bool failing = false;
    if (m_readFailureAt != SIZE_MAX) {
        size_t untilFailure = m_readFailureAt > m_readPos ? m_readFailureAt - m_readPos : 0;
        if (untilFailure < size && untilFailure <= available) {
            available = untilFailure;
            failing = true;
        }
    }

    size_t count = std::min(size, available);
    if (count > 0) {
        std::memcpy(buffer, m_data.data() + m_readPos, count);
        m_readPos += count;
        received = count;
    }

    if (count == size) {
        return IoStatus::OK;
    }

    if (failing) {
        errorMsg = "Injected read failure";
        return IoStatus::FAILED;
    }

    errorMsg = "Connection closed by peer";
    return IoStatus::PEER_CLOSED;
}

}  // namespace QuickSend
