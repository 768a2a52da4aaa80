/**
 * @file UuidGenerator.h
 * @brief Random identifier generation (prefixed ids, nonces)
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace FastDrop {

/**
 * @class UuidGenerator
 * @brief CSPRNG-backed identifier generator
 *
 * All identifiers come from OpenSSL's RAND_bytes, which is thread-safe.
 */
class UuidGenerator {
public:
    /**
     * @brief Generate a short prefixed id (e.g. "sess_1a2b-3c4d-5e6f-7a8b")
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 8> bytes{};
        if (!fillRandom(bytes.data(), bytes.size())) {
            return {};
        }

        std::ostringstream oss;
        oss << prefix << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 2 || i == 4 || i == 6) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return oss.str();
    }

    /**
     * @brief Generate a random 64-bit value
     * @param out Receives the value
     * @return false if the CSPRNG failed
     */
    static bool randomU64(uint64_t& out) {
        std::array<uint8_t, 8> bytes{};
        if (!fillRandom(bytes.data(), bytes.size())) {
            return false;
        }
        out = 0;
        for (uint8_t b : bytes) {
            out = (out << 8) | b;
        }
        return true;
    }

private:
    static bool fillRandom(uint8_t* out, size_t len) {
        return RAND_bytes(out, static_cast<int>(len)) == 1;
    }
};

}  // namespace FastDrop
