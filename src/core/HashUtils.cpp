/**
 * @file HashUtils.cpp
 * @brief SHA-256 hash computation utilities using OpenSSL EVP API
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/HashUtils.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <fstream>
#include <vector>

namespace FastDrop {

//=============================================================================
// Static Methods
//=============================================================================

bool HashUtils::computeFileHash(const std::string& filePath,
                                Sha256Digest& digest,
                                std::string& errorMsg)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        errorMsg = "Failed to open file: " + filePath;
        return false;
    }

    IncrementalHash hash;
    std::vector<uint8_t> buffer(BUFFER_SIZE);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytesRead = file.gcount();

        if (bytesRead > 0 && !hash.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            errorMsg = "Failed to update SHA256 hash";
            return false;
        }
    }

    if (file.bad()) {
        errorMsg = "Error reading file: " + filePath;
        return false;
    }

    if (!hash.finalize(digest)) {
        errorMsg = "Failed to finalize SHA256 hash";
        return false;
    }
    return true;
}

Sha256Digest HashUtils::computeBufferHash(const uint8_t* data, size_t size)
{
    Sha256Digest digest{};
    IncrementalHash hash;
    if (data && size > 0) {
        hash.update(data, size);
    }
    hash.finalize(digest);
    return digest;
}

std::string HashUtils::toHex(const Sha256Digest& digest)
{
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t b : digest) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

bool HashUtils::fromHex(const std::string& hexString, Sha256Digest& digest)
{
    if (hexString.size() != HASH_SIZE * 2) {
        return false;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        const int hi = nibble(hexString[i * 2]);
        const int lo = nibble(hexString[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        digest[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

bool HashUtils::isHexDigest(const std::string& hexString)
{
    Sha256Digest scratch{};
    return fromHex(hexString, scratch);
}

bool HashUtils::digestsEqual(const Sha256Digest& a, const Sha256Digest& b)
{
    return CRYPTO_memcmp(a.data(), b.data(), HASH_SIZE) == 0;
}

//=============================================================================
// IncrementalHash Class (using EVP API)
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(EVP_MD_CTX_new())
    , m_finalized(false)
{
    reset();
}

HashUtils::IncrementalHash::~IncrementalHash()
{
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_finalized(other.m_finalized)
{
    other.m_ctx = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }
        m_ctx = other.m_ctx;
        m_finalized = other.m_finalized;
        other.m_ctx = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size) {
    if (!m_ctx || m_finalized) {
        return false;
    }
    if (!data || size == 0) {
        return true;
    }
    return EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(m_ctx), data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(Sha256Digest& digest) {
    if (!m_ctx || m_finalized) {
        return false;
    }

    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(m_ctx), digest.data(), &hashLen) != 1) {
        return false;
    }
    m_finalized = true;
    return hashLen == HASH_SIZE;
}

bool HashUtils::IncrementalHash::reset() {
    if (!m_ctx) {
        return false;
    }
    m_finalized = false;
    return EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(m_ctx), EVP_sha256(), nullptr) == 1;
}

}  // namespace FastDrop
