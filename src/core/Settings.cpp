/**
 * @file Settings.cpp
 * @brief Settings loading and config path resolution
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/Settings.h"
#include "quicksend/Debug.h"
#include <cstdlib>
#include <fstream>
#include <limits>

namespace QuickSend {

namespace {
    /**
     * @brief Read an unsigned integer key within [minValue, maxValue]
     *
     * Leaves target untouched when the key is absent or rejected.
     */
    template <typename T>
    void readUnsigned(const nlohmann::json& j, const char* key, uint64_t minValue,
                      uint64_t maxValue, T& target, std::vector<std::string>& warnings)
    {
        auto it = j.find(key);
        if (it == j.end()) {
            return;
        }
        if (!it->is_number_unsigned()) {
            warnings.push_back(std::string(key) + ": expected a non-negative integer");
            return;
        }
        uint64_t value = it->get<uint64_t>();
        if (value < minValue || value > maxValue) {
            warnings.push_back(std::string(key) + ": " + std::to_string(value) +
                               " outside [" + std::to_string(minValue) + ", " +
                               std::to_string(maxValue) + "]");
            return;
        }
        target = static_cast<T>(value);
    }

    std::string envValue(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }
} // anonymous namespace

nlohmann::json Settings::toJson() const {
    nlohmann::json out;
    out["transfer_port"] = transferPort;
    out["discovery_port"] = discoveryPort;
    out["broadcast_interval_ms"] = broadcastIntervalMs;
    out["discovery_timeout_ms"] = discoveryTimeoutMs;
    out["connection_timeout_ms"] = connectionTimeoutMs;
    out["buffer_size"] = bufferSize;
    out["log_file"] = logFile;
    return out;
}

Settings Settings::fromJson(const nlohmann::json& j, std::vector<std::string>& warnings) {
    Settings settings;
    if (!j.is_object()) {
        warnings.push_back("config root is not a JSON object");
        return settings;
    }

    const uint64_t maxU32 = std::numeric_limits<uint32_t>::max();

    readUnsigned(j, "transfer_port", 0, 65535, settings.transferPort, warnings);
    readUnsigned(j, "discovery_port", 1, 65535, settings.discoveryPort, warnings);
    readUnsigned(j, "broadcast_interval_ms", 1, maxU32, settings.broadcastIntervalMs, warnings);
    readUnsigned(j, "discovery_timeout_ms", 1, maxU32, settings.discoveryTimeoutMs, warnings);
    readUnsigned(j, "connection_timeout_ms", 1, maxU32, settings.connectionTimeoutMs, warnings);
    readUnsigned(j, "buffer_size", MIN_BUFFER_SIZE, MAX_BUFFER_SIZE, settings.bufferSize, warnings);

    if (j.contains("log_file")) {
        if (j["log_file"].is_string()) {
            settings.logFile = j["log_file"].get<std::string>();
        } else {
            warnings.push_back("log_file: expected a string");
        }
    }

    return settings;
}

bool Settings::loadFromFile(const std::filesystem::path& path, Settings& out,
                            std::vector<std::string>& warnings)
{
    out = Settings();

    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return false;
    }

    std::ifstream file(path);
    if (!file) {
        warnings.push_back("cannot open " + path.string());
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        warnings.push_back(path.string() + ": malformed JSON, using defaults");
        return true;
    }

    out = fromJson(j, warnings);
    return true;
}

std::filesystem::path resolveConfigPath(const std::filesystem::path& explicitPath) {
    if (!explicitPath.empty()) {
        return explicitPath;
    }

    const std::string fromEnv = envValue("QUICKSEND_CONFIG");
    if (!fromEnv.empty()) {
        return fromEnv;
    }

    const std::string xdg = envValue("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "quicksend" / "config.json";
    }

    const std::string home = envValue("HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / ".config" / "quicksend" / "config.json";
    }

    return {};
}

Settings loadSettings(const std::filesystem::path& explicitPath) {
    const std::filesystem::path path = resolveConfigPath(explicitPath);

    Settings settings;
    std::vector<std::string> warnings;
    const bool found = Settings::loadFromFile(path, settings, warnings);

    if (!found && !explicitPath.empty()) {
        LOG_WARNING("Config file not found: " << explicitPath.string() << ", using defaults");
    } else if (found) {
        LOG_DEBUG("Loaded settings from " << path.string());
    }
    for (const auto& warning : warnings) {
        LOG_WARNING("Config: " << warning);
    }

    return settings;
}

}  // namespace QuickSend
