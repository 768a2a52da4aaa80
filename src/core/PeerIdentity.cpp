/**
 * @file PeerIdentity.cpp
 * @brief Fingerprint parsing and formatting
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/PeerIdentity.h"

#include <openssl/crypto.h>

#include <cctype>

namespace FastDrop {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

std::string PeerIdentity::normalizeSha256Hex(const std::string& input) {
    std::string out;
    out.reserve(HASH_SIZE * 2);

    for (unsigned char uc : input) {
        if (uc == ':' || std::isspace(uc)) {
            continue;
        }
        if (!std::isxdigit(uc)) {
            return {};
        }
        out.push_back(static_cast<char>(std::toupper(uc)));
    }

    if (out.size() != HASH_SIZE * 2) {
        return {};
    }
    return out;
}

bool PeerIdentity::fromFingerprint(const std::string& fingerprint, PeerIdentity& out) {
    out = PeerIdentity();

    const std::string norm = normalizeSha256Hex(fingerprint);
    if (norm.empty()) {
        return false;
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        out.m_bytes[i] = static_cast<uint8_t>(
            (hexValue(norm[i * 2]) << 4) | hexValue(norm[i * 2 + 1]));
    }
    out.m_valid = true;
    return true;
}

PeerIdentity PeerIdentity::fromBytes(const Bytes& bytes) {
    PeerIdentity id;
    id.m_bytes = bytes;
    id.m_valid = true;
    return id;
}

std::string PeerIdentity::toString() const {
    if (!m_valid) {
        return {};
    }

    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t b : m_bytes) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

std::string PeerIdentity::toDisplayString() const {
    const std::string norm = toString();
    if (norm.empty()) {
        return {};
    }

    std::string out;
    out.reserve(norm.size() + HASH_SIZE - 1);
    for (size_t i = 0; i < norm.size(); i += 2) {
        out.push_back(norm[i]);
        out.push_back(norm[i + 1]);
        if (i + 2 < norm.size()) {
            out.push_back(':');
        }
    }
    return out;
}

std::string PeerIdentity::shortId() const {
    return toString().substr(0, 8);
}

bool PeerIdentity::operator==(const PeerIdentity& other) const {
    if (!m_valid || !other.m_valid) {
        return false;
    }
    return CRYPTO_memcmp(m_bytes.data(), other.m_bytes.data(), HASH_SIZE) == 0;
}

}  // namespace FastDrop
