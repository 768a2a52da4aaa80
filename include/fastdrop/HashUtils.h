/**
 * @file HashUtils.h
 * @brief SHA-256 hash computation utilities
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"

#include <array>
#include <cstdint>
#include <string>

namespace FastDrop {

/// 32-byte SHA-256 digest
using Sha256Digest = std::array<uint8_t, HASH_SIZE>;

/**
 * @class HashUtils
 * @brief SHA-256 hashing utilities for manifest checksums
 *
 * Thread Safety:
 * - All static methods are thread-safe (no shared state)
 * - Uses the OpenSSL EVP digest API
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of a file
     * @param filePath Path to the file to hash
     * @param digest Output digest
     * @param errorMsg Output error message if computation fails
     * @return true if successful, false otherwise
     *
     * Reads the file in BUFFER_SIZE chunks.
     */
    static bool computeFileHash(const std::string& filePath,
                                Sha256Digest& digest,
                                std::string& errorMsg);

    /**
     * @brief Compute SHA-256 hash of a memory buffer
     */
    static Sha256Digest computeBufferHash(const uint8_t* data, size_t size);

    /**
     * @brief Convert a digest to lowercase hex (64 characters)
     */
    static std::string toHex(const Sha256Digest& digest);

    /**
     * @brief Parse 64 hex characters (either case) into a digest
     * @return false if the string is not exactly 64 hex characters
     */
    static bool fromHex(const std::string& hexString, Sha256Digest& digest);

    /**
     * @brief Whether a string is a well-formed SHA-256 hex digest
     */
    static bool isHexDigest(const std::string& hexString);

    /**
     * @brief Compare two digests in constant time
     */
    static bool digestsEqual(const Sha256Digest& a, const Sha256Digest& b);

    /**
     * @brief Incremental SHA-256 for streamed data
     *
     * Used while a file is read or received chunk by chunk.
     */
    class IncrementalHash {
    public:
        IncrementalHash();
        ~IncrementalHash();

        // Context cannot be copied
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        // Moving transfers ownership of the EVP_MD_CTX
        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        /**
         * @brief Add data to the hash computation
         * @return false if the context is unusable or already finalized
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the digest
         *
         * After finalize(), update() fails until reset().
         */
        bool finalize(Sha256Digest& digest);

        /**
         * @brief Reset the context to start a new hash
         */
        bool reset();

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

}  // namespace FastDrop
