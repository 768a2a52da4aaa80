/**
 * @file AtomicFile.h
 * @brief Helpers for receive-side file writes (write ".part", then rename).
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <string>

namespace FastDrop {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute the ".part" path next to finalPath.
 *
 * A file keeps its ".part" name until it is fully received and verified,
 * so an interrupted or failed transfer is never mistaken for a complete one.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Rename tempPath to finalPath.
 *
 * Requirements:
 * - tempPath must exist as a file.
 * - finalPath must not already exist (callers choose a unique final name).
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg);

/**
 * @brief Pick a destination that collides with neither a final nor a ".part" file.
 *
 * "report.pdf" becomes "report (1).pdf", "report (2).pdf", ...
 *
 * @param ownTempPath The caller's own ".part" file; it does not reserve a name
 */
std::filesystem::path generateUniquePath(const std::filesystem::path& desired,
                                         const std::filesystem::path& ownTempPath = {});

}  // namespace FastDrop
