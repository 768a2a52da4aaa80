/**
 * @file FileManifest.h
 * @brief Ordered list of files offered in one session
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "SessionError.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @brief One file of the manifest
 */
struct FileManifestEntry {
    std::string path;     ///< '/'-separated relative path (usually just the file name)
    uint64_t size = 0;    ///< Exact number of bytes that will be streamed
    std::string sha256;   ///< Lowercase hex digest, empty if not computed

    bool hasChecksum() const { return !sha256.empty(); }

    bool operator==(const FileManifestEntry& other) const {
        return path == other.path && size == other.size && sha256 == other.sha256;
    }
};

/**
 * @class FileManifest
 * @brief Manifest exchanged before streaming starts
 *
 * Fixed for the lifetime of one session. The nonce ties the manifest to the
 * ticket the receiver read over the discovery channel.
 */
class FileManifest {
public:
    FileManifest() = default;
    FileManifest(std::vector<FileManifestEntry> entries, uint64_t nonce);

    /**
     * @brief Build a manifest from local files (sender side)
     * @param filePaths Files to send; each must be a readable regular file
     * @param computeChecksums Hash every file with SHA-256
     * @param nonce Session nonce
     * @param out Receives the manifest
     * @param error FileAccess if a file is missing or unreadable, ManifestInvalid
     *        if the set is empty or two files share a name
     */
    static bool buildFromFiles(const std::vector<std::string>& filePaths,
                               bool computeChecksums,
                               uint64_t nonce,
                               FileManifest& out,
                               SessionError& error);

    /**
     * @brief Validate a received manifest (receiver side)
     *
     * Non-empty, bounded entry count, safe unique relative paths, sizes that
     * add up without overflow and fit maxTotalBytes, well-formed checksums.
     */
    bool validate(uint64_t maxTotalBytes, SessionError& error) const;

    /// Serialize to the MANIFEST frame payload
    std::string toJson() const;

    /**
     * @brief Parse a MANIFEST frame payload
     * @return false with ManifestInvalid on malformed JSON or missing fields
     */
    static bool fromJson(const std::string& text, FileManifest& out, SessionError& error);

    const std::vector<FileManifestEntry>& entries() const { return m_entries; }
    size_t fileCount() const { return m_entries.size(); }
    uint64_t totalBytes() const;
    uint64_t nonce() const { return m_nonce; }

private:
    std::vector<FileManifestEntry> m_entries;
    uint64_t m_nonce = 0;
};

void to_json(nlohmann::json& j, const FileManifestEntry& entry);
void from_json(const nlohmann::json& j, FileManifestEntry& entry);

}  // namespace FastDrop
