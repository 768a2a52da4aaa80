/**
 * @file SessionOptions.cpp
 * @brief Session configuration defaults and environment overrides
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/SessionOptions.h"
#include "fastdrop/Debug.h"

#include <unistd.h>

#include <cstdlib>
#include <limits>

namespace FastDrop {

namespace {

std::string defaultDisplayName() {
    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return hostname;
    }
    return SERVICE_NAME;
}

bool readEnv(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return false;
    }
    out = value;
    return true;
}

void readEnvMs(const char* name, uint32_t& target) {
    std::string text;
    if (!readEnv(name, text)) {
        return;
    }
    uint64_t value = 0;
    if (!parseUnsigned(text, std::numeric_limits<uint32_t>::max(), value)) {
        LOG_WARNING("Ignoring " << name << "=\"" << text << "\": not a valid millisecond value");
        return;
    }
    target = static_cast<uint32_t>(value);
}

}  // namespace

bool parseUnsigned(const std::string& text, uint64_t maxValue, uint64_t& out) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (maxValue - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

SessionOptions::SessionOptions()
    : displayName(defaultDisplayName())
{
}

SessionOptions SessionOptions::fromEnvironment() {
    SessionOptions options;
    options.applyEnvironment();
    return options;
}

void SessionOptions::applyEnvironment() {
    readEnv("FASTDROP_DOWNLOAD_DIR", downloadDir);
    readEnv("FASTDROP_BIND_ADDRESS", bindAddress);
    readEnv("FASTDROP_DISPLAY_NAME", displayName);
    readEnv("FASTDROP_IDENTITY_DIR", identityDir);
    readEnv("FASTDROP_LOG_FILE", logFile);
    readEnvMs("FASTDROP_SCAN_MS", scanDurationMs);
    readEnvMs("FASTDROP_CONNECT_TIMEOUT_MS", connectTimeoutMs);
}

TransferOptions SessionOptions::transferOptions() const {
    TransferOptions options;
    options.downloadDir = downloadDir;
    options.maxIncomingBytes = maxIncomingBytes;
    options.parallelStreams = parallelStreams;
    options.idleTimeoutMs = idleTimeoutMs;
    options.progressIntervalMs = progressIntervalMs;
    return options;
}

}  // namespace FastDrop
