/**
 * @file FileManifest.cpp
 * @brief Manifest construction, validation and JSON encoding
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/FileManifest.h"
#include "fastdrop/Debug.h"
#include "fastdrop/HashUtils.h"
#include "fastdrop/PathSanitizer.h"
#include "fastdrop/config.h"

#include <filesystem>
#include <limits>
#include <set>

namespace FastDrop {

using json = nlohmann::json;

//=============================================================================
// JSON mapping
//=============================================================================

void to_json(json& j, const FileManifestEntry& entry) {
    j = json{{"path", entry.path}, {"size", entry.size}};
    if (entry.hasChecksum()) {
        j["sha256"] = entry.sha256;
    }
}

void from_json(const json& j, FileManifestEntry& entry) {
    j.at("path").get_to(entry.path);
    j.at("size").get_to(entry.size);
    entry.sha256 = j.value("sha256", std::string());
}

//=============================================================================
// Construction
//=============================================================================

FileManifest::FileManifest(std::vector<FileManifestEntry> entries, uint64_t nonce)
    : m_entries(std::move(entries))
    , m_nonce(nonce)
{
}

uint64_t FileManifest::totalBytes() const {
    uint64_t total = 0;
    for (const auto& e : m_entries) {
        total += e.size;
    }
    return total;
}

bool FileManifest::buildFromFiles(const std::vector<std::string>& filePaths,
                                  bool computeChecksums,
                                  uint64_t nonce,
                                  FileManifest& out,
                                  SessionError& error) {
    if (filePaths.empty()) {
        error.set(ErrorKind::ManifestInvalid, "No files to send");
        return false;
    }

    std::vector<FileManifestEntry> entries;
    std::set<std::string> names;
    entries.reserve(filePaths.size());

    for (const std::string& filePath : filePaths) {
        std::error_code ec;
        const std::filesystem::path p(filePath);
        if (!std::filesystem::is_regular_file(p, ec)) {
            error.set(ErrorKind::FileAccess, "Not a regular file: " + filePath);
            return false;
        }

        FileManifestEntry entry;
        entry.size = static_cast<uint64_t>(std::filesystem::file_size(p, ec));
        if (ec) {
            error.set(ErrorKind::FileAccess, "Cannot stat " + filePath + ": " + ec.message());
            return false;
        }

        entry.path = sanitizeOutgoingName(p.filename().string());
        if (entry.path.empty()) {
            error.set(ErrorKind::ManifestInvalid, "Unusable file name: " + filePath);
            return false;
        }
        if (!names.insert(entry.path).second) {
            error.set(ErrorKind::ManifestInvalid, "Two files are named '" + entry.path + "'");
            return false;
        }

        if (computeChecksums) {
            Sha256Digest digest{};
            std::string hashError;
            if (!HashUtils::computeFileHash(filePath, digest, hashError)) {
                error.set(ErrorKind::FileAccess, hashError);
                return false;
            }
            entry.sha256 = HashUtils::toHex(digest);
        }

        LOG_DEBUG("[FileManifest] " << entry.path << " " << entry.size << " bytes");
        entries.push_back(std::move(entry));
    }

    out = FileManifest(std::move(entries), nonce);
    return true;
}

//=============================================================================
// Validation
//=============================================================================

bool FileManifest::validate(uint64_t maxTotalBytes, SessionError& error) const {
    auto invalid = [&error](const std::string& why) {
        error.set(ErrorKind::ManifestInvalid, why);
        return false;
    };

    if (m_entries.empty()) {
        return invalid("Manifest lists no files");
    }
    if (m_entries.size() > MAX_MANIFEST_ENTRIES) {
        return invalid("Manifest lists " + std::to_string(m_entries.size()) + " files (limit " +
                       std::to_string(MAX_MANIFEST_ENTRIES) + ")");
    }

    std::set<std::string> seen;
    uint64_t total = 0;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        const FileManifestEntry& e = m_entries[i];

        std::vector<std::string> components;
        std::string why;
        if (!splitSafeRelativePath(e.path, components, why)) {
            return invalid("Entry " + std::to_string(i) + ": " + why);
        }
        if (!seen.insert(e.path).second) {
            return invalid("Duplicate path '" + e.path + "'");
        }
        if (e.hasChecksum() && !HashUtils::isHexDigest(e.sha256)) {
            return invalid("Entry " + std::to_string(i) + ": malformed sha256");
        }
        if (e.size > std::numeric_limits<uint64_t>::max() - total) {
            return invalid("Declared sizes overflow");
        }
        total += e.size;
    }

    if (total > maxTotalBytes) {
        return invalid("Session size " + std::to_string(total) + " bytes exceeds limit of " +
                       std::to_string(maxTotalBytes) + " bytes");
    }

    // A path may not also be a directory of another path ("a" and "a/b")
    for (const std::string& path : seen) {
        auto it = seen.lower_bound(path + "/");
        if (it != seen.end() && it->compare(0, path.size() + 1, path + "/") == 0) {
            return invalid("Path '" + path + "' is both a file and a directory");
        }
    }

    return true;
}

//=============================================================================
// JSON
//=============================================================================

std::string FileManifest::toJson() const {
    json j;
    j["version"] = PROTOCOL_VERSION;
    j["nonce"] = m_nonce;
    j["files"] = m_entries;
    j["total_size"] = totalBytes();
    // Non-UTF-8 file names are sent with replacement characters
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool FileManifest::fromJson(const std::string& text, FileManifest& out, SessionError& error) {
    try {
        const json j = json::parse(text);
        if (!j.is_object() || !j.contains("files") || !j.at("files").is_array()) {
            error.set(ErrorKind::ManifestInvalid, "Manifest has no file list");
            return false;
        }
        if (j.value("version", 0) != PROTOCOL_VERSION) {
            error.set(ErrorKind::ManifestInvalid, "Unsupported manifest version");
            return false;
        }

        FileManifest parsed(j.at("files").get<std::vector<FileManifestEntry>>(),
                            j.at("nonce").get<uint64_t>());

        if (j.at("total_size").get<uint64_t>() != parsed.totalBytes()) {
            error.set(ErrorKind::ManifestInvalid, "Declared total does not match entry sizes");
            return false;
        }

        out = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        error.set(ErrorKind::ManifestInvalid, std::string("Malformed manifest: ") + e.what());
        return false;
    }
}

}  // namespace FastDrop
