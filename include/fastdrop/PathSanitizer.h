/**
 * @file PathSanitizer.h
 * @brief Validation of manifest paths before they touch the file system
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @brief Check a single path component received from a peer.
 *
 * Rejects empty components, "." and "..", control characters, path
 * separators, NUL bytes and components longer than MAX_PATH_COMPONENT_BYTES.
 */
bool isSafePathComponent(const std::string& component, std::string& errorMsg);

/**
 * @brief Split and validate a '/'-separated relative manifest path.
 * @param relativePath Path as declared in the manifest
 * @param components Receives the validated components
 * @param errorMsg Reason on failure
 * @return false for absolute paths, traversal, empty components or bad characters
 */
bool splitSafeRelativePath(const std::string& relativePath,
                           std::vector<std::string>& components,
                           std::string& errorMsg);

/**
 * @brief Resolve a validated manifest path under a destination directory.
 * @return false if the path is unsafe; out is untouched in that case
 */
bool resolveUnderDirectory(const std::filesystem::path& directory,
                           const std::string& relativePath,
                           std::filesystem::path& out,
                           std::string& errorMsg);

/**
 * @brief Replace characters a sender should not put in a manifest name.
 *
 * Used when building a manifest from local file names: separators and
 * control characters become '_'. Returns an empty string if nothing usable
 * remains.
 */
std::string sanitizeOutgoingName(const std::string& name);

}  // namespace FastDrop
