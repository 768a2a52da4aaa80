/**
 * @file AtomicFile.cpp
 * @brief Receive-side file helpers implementation.
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/AtomicFile.h"
#include "fastdrop/config.h"

namespace FastDrop {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += PARTIAL_FILE_SUFFIX;
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist: " + tempPath.string();
        return false;
    }

    if (std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists: " + finalPath.string();
        return false;
    }

    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

std::filesystem::path generateUniquePath(const std::filesystem::path& desired,
                                         const std::filesystem::path& ownTempPath)
{
    auto taken = [&ownTempPath](const std::filesystem::path& p) {
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) {
            return true;
        }
        const std::filesystem::path temp = computeAtomicFilePaths(p).tempPath;
        return temp != ownTempPath && std::filesystem::exists(temp, ec);
    };

    if (!taken(desired)) {
        return desired;
    }

    const std::filesystem::path parent = desired.parent_path();
    const std::string stem = desired.stem().string();
    const std::string ext = desired.extension().string();

    for (int counter = 1;; ++counter) {
        std::filesystem::path candidate =
            parent / (stem + " (" + std::to_string(counter) + ")" + ext);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

}  // namespace FastDrop
