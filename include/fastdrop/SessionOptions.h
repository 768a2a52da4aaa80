/**
 * @file SessionOptions.h
 * @brief Runtime configuration of a FastDrop session
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "TransferSession.h"
#include "config.h"

#include <cstdint>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @brief Per-process session settings
 *
 * Defaults come from config.h. fromEnvironment() applies FASTDROP_*
 * overrides on top of them.
 */
struct SessionOptions {
    std::string displayName;                              ///< Advertised name (defaults to the host name)
    std::string downloadDir = ".";                        ///< Receiver destination directory
    std::string bindAddress = "0.0.0.0";                  ///< Listener bind address (sender)
    std::vector<std::string> advertisedAddresses;         ///< Ticket hosts; empty = reachable interfaces
    uint32_t scanDurationMs = DEFAULT_SCAN_DURATION_MS;
    bool stopScanOnFirstPeer = false;                     ///< End the scan at the first sighting
    uint32_t connectTimeoutMs = CONNECTION_TIMEOUT_MS;    ///< Dial and handshake bound
    uint32_t acceptTimeoutMs = 0;                         ///< Sender wait for a receiver; 0 = until cancelled
    uint32_t idleTimeoutMs = IDLE_TIMEOUT_MS;
    size_t parallelStreams = MAX_PARALLEL_STREAMS;
    bool computeChecksums = true;                         ///< SHA-256 every file in the manifest
    uint64_t maxIncomingBytes = DEFAULT_MAX_INCOMING_SIZE_BYTES;
    uint32_t progressIntervalMs = PROGRESS_THROTTLE_MS;
    std::string identityDir;                              ///< Persist the identity here; empty = ephemeral
    std::string logFile;                                  ///< ThreadSafeLog target; empty = disabled

    SessionOptions();

    /**
     * @brief Defaults with FASTDROP_* environment overrides applied
     *
     * Recognized: FASTDROP_DOWNLOAD_DIR, FASTDROP_BIND_ADDRESS,
     * FASTDROP_DISPLAY_NAME, FASTDROP_SCAN_MS, FASTDROP_CONNECT_TIMEOUT_MS,
     * FASTDROP_IDENTITY_DIR, FASTDROP_LOG_FILE. Invalid numbers are ignored
     * with a warning.
     */
    static SessionOptions fromEnvironment();

    /// Apply FASTDROP_* overrides to this instance
    void applyEnvironment();

    /// Engine settings derived from these options
    TransferOptions transferOptions() const;
};

/**
 * @brief Parse a base-10 unsigned value
 * @return false for empty input, junk or overflow past maxValue
 */
bool parseUnsigned(const std::string& text, uint64_t maxValue, uint64_t& out);

}  // namespace FastDrop
