/**
 * @file PathSanitizer.cpp
 * @brief Manifest path validation
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/PathSanitizer.h"
#include "fastdrop/config.h"

namespace FastDrop {
namespace {

static bool isControlChar(unsigned char ch) {
    return ch < 32 || ch == 127;
}

static void trimTrailingDotsAndSpaces(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '.')) {
        s.pop_back();
    }
}

}  // namespace

bool isSafePathComponent(const std::string& component, std::string& errorMsg) {
    if (component.empty()) {
        errorMsg = "empty path component";
        return false;
    }
    if (component == "." || component == "..") {
        errorMsg = "path traversal component '" + component + "'";
        return false;
    }
    if (component.size() > MAX_PATH_COMPONENT_BYTES) {
        errorMsg = "path component longer than " + std::to_string(MAX_PATH_COMPONENT_BYTES) + " bytes";
        return false;
    }
    for (unsigned char ch : component) {
        if (isControlChar(ch)) {
            errorMsg = "control character in path component";
            return false;
        }
        if (ch == '/' || ch == '\\') {
            errorMsg = "separator inside path component";
            return false;
        }
    }
    return true;
}

bool splitSafeRelativePath(const std::string& relativePath,
                           std::vector<std::string>& components,
                           std::string& errorMsg)
{
    components.clear();

    if (relativePath.empty()) {
        errorMsg = "empty path";
        return false;
    }
    if (relativePath.size() > MAX_RELATIVE_PATH_BYTES) {
        errorMsg = "path longer than " + std::to_string(MAX_RELATIVE_PATH_BYTES) + " bytes";
        return false;
    }
    if (relativePath.front() == '/' || relativePath.find('\\') != std::string::npos) {
        errorMsg = "absolute or non-portable path '" + relativePath + "'";
        return false;
    }
    // Drive letters ("C:...") are absolute on some receivers
    if (relativePath.size() >= 2 && relativePath[1] == ':') {
        errorMsg = "drive-qualified path '" + relativePath + "'";
        return false;
    }

    size_t start = 0;
    while (start <= relativePath.size()) {
        const size_t slash = relativePath.find('/', start);
        const size_t end = (slash == std::string::npos) ? relativePath.size() : slash;
        std::string component = relativePath.substr(start, end - start);

        std::string why;
        if (!isSafePathComponent(component, why)) {
            errorMsg = "unsafe path '" + relativePath + "': " + why;
            components.clear();
            return false;
        }
        components.push_back(std::move(component));

        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

bool resolveUnderDirectory(const std::filesystem::path& directory,
                           const std::string& relativePath,
                           std::filesystem::path& out,
                           std::string& errorMsg)
{
    std::vector<std::string> components;
    if (!splitSafeRelativePath(relativePath, components, errorMsg)) {
        return false;
    }

    std::filesystem::path resolved = directory;
    for (const std::string& c : components) {
        resolved /= c;
    }
    out = resolved;
    return true;
}

std::string sanitizeOutgoingName(const std::string& name) {
    std::string out = name;
    for (char& ch : out) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (isControlChar(uch) || ch == '/' || ch == '\\') {
            ch = '_';
        }
    }

    trimTrailingDotsAndSpaces(out);

    if (out.empty() || out == "." || out == "..") {
        return {};
    }
    if (out.size() > MAX_PATH_COMPONENT_BYTES) {
        // Keep the extension when shortening
        const size_t dot = out.find_last_of('.');
        std::string ext = (dot != std::string::npos && out.size() - dot <= 16) ? out.substr(dot) : "";
        out = out.substr(0, MAX_PATH_COMPONENT_BYTES - ext.size()) + ext;
    }
    return out;
}

}  // namespace FastDrop
