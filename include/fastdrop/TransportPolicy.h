/**
 * @file TransportPolicy.h
 * @brief Transport selection from the shape of a file set
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "SessionTicket.h"

#include <cstdint>
#include <string>

namespace FastDrop {

/**
 * @class TransportPolicy
 * @brief Pure, deterministic Quic/Tcp decision
 *
 * Many files or a small payload favour Quic (parallel streams, cheap setup);
 * a few large files favour a single Tcp stream.
 */
class TransportPolicy {
public:
    /**
     * @brief Choose the transport for a session
     * @return Quic if fileCount > 5 or totalBytes < 100000000, otherwise Tcp
     */
    static TransportProtocol choose(uint64_t fileCount, uint64_t totalBytes);

    /**
     * @brief Human-readable reason for a decision (for logs and the CLI)
     */
    static std::string explain(uint64_t fileCount, uint64_t totalBytes);
};

/**
 * @brief Format a byte count ("34.00 B", "1.50 MB"); binary units, two decimals
 */
std::string formatBytes(uint64_t bytes);

/**
 * @brief Percentage of transferred over total; 0 when total is 0
 */
double calculateProgress(uint64_t transferred, uint64_t total);

}  // namespace FastDrop
