/**
 * @file TransportPolicy.cpp
 * @brief Transport selection and size formatting
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransportPolicy.h"
#include "fastdrop/config.h"

#include <iomanip>
#include <sstream>

namespace FastDrop {

TransportProtocol TransportPolicy::choose(uint64_t fileCount, uint64_t totalBytes) {
    if (fileCount > POLICY_MAX_TCP_FILE_COUNT || totalBytes < POLICY_MIN_TCP_TOTAL_BYTES) {
        return TransportProtocol::Quic;
    }
    return TransportProtocol::Tcp;
}

std::string TransportPolicy::explain(uint64_t fileCount, uint64_t totalBytes) {
    std::ostringstream oss;
    oss << fileCount << " file(s), " << formatBytes(totalBytes) << " -> "
        << transportProtocolName(choose(fileCount, totalBytes));
    if (fileCount > POLICY_MAX_TCP_FILE_COUNT) {
        oss << " (more than " << POLICY_MAX_TCP_FILE_COUNT << " files)";
    } else if (totalBytes < POLICY_MIN_TCP_TOTAL_BYTES) {
        oss << " (small payload)";
    } else {
        oss << " (few large files)";
    }
    return oss.str();
}

std::string formatBytes(uint64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t kUnitCount = sizeof(kUnits) / sizeof(kUnits[0]);

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < kUnitCount - 1) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << kUnits[unit];
    return oss.str();
}

double calculateProgress(uint64_t transferred, uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return (static_cast<double>(transferred) / static_cast<double>(total)) * 100.0;
}

}  // namespace FastDrop
