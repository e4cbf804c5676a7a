/**
 * @file DiscoveryAnnouncement.cpp
 * @brief Announcement datagram encoding and parsing
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/DiscoveryAnnouncement.h"
#include "quicksend/config.h"
#include <chrono>
#include <cstring>
#include <nlohmann/json.hpp>

// Use nlohmann::json for convenience
using json = nlohmann::json;

namespace QuickSend {

std::string encodeAnnouncement(const std::string& ipAddress, uint16_t tcpPort) {
    json body;
    body["protocol_id"]   = PROTOCOL_ID;
    body["proto_version"] = PROTOCOL_VERSION;
    body["ip"]            = ipAddress;
    body["tcp_port"]      = tcpPort;
    body["timestamp_ms"]  = static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    std::string datagram(ANNOUNCEMENT_MAGIC.data(), ANNOUNCEMENT_MAGIC.size());
    datagram += body.dump();
    return datagram;
}

bool parseAnnouncement(const char* data, size_t size,
                       DiscoveryAnnouncement& out, std::string& reason)
{
    if (!data || size < ANNOUNCEMENT_MAGIC.size() ||
        std::memcmp(data, ANNOUNCEMENT_MAGIC.data(), ANNOUNCEMENT_MAGIC.size()) != 0) {
        reason = "magic marker mismatch";
        return false;
    }

    const char* bodyBegin = data + ANNOUNCEMENT_MAGIC.size();
    const char* bodyEnd = data + size;

    json body = json::parse(bodyBegin, bodyEnd, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        reason = "malformed JSON body";
        return false;
    }

    // Validate protocol_id
    auto protocolId = body.find("protocol_id");
    if (protocolId == body.end() || !protocolId->is_string() ||
        protocolId->get<std::string>() != PROTOCOL_ID) {
        reason = "foreign protocol_id";
        return false;
    }

    auto version = body.find("proto_version");
    if (version != body.end() &&
        (!version->is_number_unsigned() || version->get<uint64_t>() != PROTOCOL_VERSION)) {
        reason = "unsupported proto_version";
        return false;
    }

    auto port = body.find("tcp_port");
    if (port == body.end() || !port->is_number_unsigned()) {
        reason = "missing tcp_port";
        return false;
    }
    uint64_t portValue = port->get<uint64_t>();
    if (portValue == 0 || portValue > 65535) {
        reason = "tcp_port out of range";
        return false;
    }

    DiscoveryAnnouncement result;
    result.tcpPort = static_cast<uint16_t>(portValue);

    auto ip = body.find("ip");
    if (ip != body.end() && ip->is_string()) {
        result.ipAddress = ip->get<std::string>();
    }

    auto timestamp = body.find("timestamp_ms");
    if (timestamp != body.end() && timestamp->is_number_integer()) {
        result.timestampMs = timestamp->get<int64_t>();
    }

    out = result;
    return true;
}

}  // namespace QuickSend
