/**
 * @file RadioAdapter.cpp
 * @brief Exclusive role ownership of a radio adapter
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/RadioAdapter.h"

namespace FastDrop {

const char* radioRoleName(RadioRole role) {
    switch (role) {
        case RadioRole::None:        return "idle";
        case RadioRole::Advertising: return "advertising";
        case RadioRole::Scanning:    return "scanning";
    }
    return "unknown";
}

bool RadioAdapter::acquire(RadioRole role, SessionError& error) {
    std::lock_guard<std::mutex> lock(m_roleMutex);
    if (m_role != RadioRole::None) {
        error.set(ErrorKind::RadioUnavailable,
                  std::string("Radio adapter is busy ") + radioRoleName(m_role));
        return false;
    }
    m_role = role;
    return true;
}

void RadioAdapter::release(RadioRole role) {
    std::lock_guard<std::mutex> lock(m_roleMutex);
    if (m_role == role) {
        m_role = RadioRole::None;
    }
}

RadioRole RadioAdapter::activeRole() const {
    std::lock_guard<std::mutex> lock(m_roleMutex);
    return m_role;
}

}  // namespace FastDrop
