/**
 * @file Settings.h
 * @brief Runtime settings: compile-time defaults overridden by config.json
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace QuickSend {

/**
 * @brief Tunables shared by both roles
 *
 * JSON keys:
 *   transfer_port, discovery_port, broadcast_interval_ms,
 *   discovery_timeout_ms, connection_timeout_ms, buffer_size, log_file
 *
 * Unknown keys are ignored. A value of the wrong type or out of range is
 * reported as a warning and the default is kept.
 */
struct Settings {
    uint16_t transferPort = TRANSFER_PORT;
    uint16_t discoveryPort = DISCOVERY_PORT;
    uint32_t broadcastIntervalMs = BROADCAST_INTERVAL_MS;
    uint32_t discoveryTimeoutMs = DISCOVERY_TIMEOUT_MS;
    uint32_t connectionTimeoutMs = CONNECTION_TIMEOUT_MS;
    size_t bufferSize = BUFFER_SIZE;
    std::string logFile;   ///< Trace log path, empty = no trace log

    nlohmann::json toJson() const;

    /**
     * @brief Build settings from a parsed config object
     * @param j Parsed JSON (non-objects yield defaults plus a warning)
     * @param warnings Output: one line per rejected value
     */
    static Settings fromJson(const nlohmann::json& j, std::vector<std::string>& warnings);

    /**
     * @brief Read and parse a config file
     * @param path File to read
     * @param out Output settings (defaults on any failure)
     * @param warnings Output: parse errors and rejected values
     * @return false if the file does not exist or cannot be read
     */
    static bool loadFromFile(const std::filesystem::path& path, Settings& out,
                             std::vector<std::string>& warnings);
};

/**
 * @brief Config file location
 * @param explicitPath Value of -c/--config (empty if not given)
 * @return explicitPath, else $QUICKSEND_CONFIG, else
 *         $XDG_CONFIG_HOME/quicksend/config.json, else
 *         $HOME/.config/quicksend/config.json, else empty
 */
std::filesystem::path resolveConfigPath(const std::filesystem::path& explicitPath);

/**
 * @brief Resolve, load and log: the one-call entry point for the CLI
 *
 * Missing file -> defaults silently (warning if the path was explicit).
 * Warnings are written with LOG_WARNING.
 */
Settings loadSettings(const std::filesystem::path& explicitPath);

}  // namespace QuickSend
