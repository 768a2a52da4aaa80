/**
 * @file hash_test.cpp
 * @brief Unit tests for SHA-256 hashing functionality
 *
 * Tests HashUtils for buffer and file hashing, incremental hashing
 * and hex conversion.
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/HashUtils.h"
#include "fastdrop/config.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <cctype>
#include <string>

using namespace FastDrop;
using FastDropTest::TempDirTest;
using FastDropTest::writeFile;

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Test fixture for HashUtils tests
 */
class HashUtilsTest : public TempDirTest {
protected:
    // SHA-256("Hello, World!")
    const std::string m_helloHex = "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f";
    // SHA-256("")
    const std::string m_emptyHex = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
};

//=============================================================================
// Buffer Hashing
//=============================================================================

/**
 * @test Known vector for a short buffer
 */
TEST_F(HashUtilsTest, BufferHashMatchesKnownVector) {
    const std::string text = "Hello, World!";
    const auto digest = HashUtils::computeBufferHash(
        reinterpret_cast<const uint8_t*>(text.data()), text.size());

    EXPECT_EQ(HashUtils::toHex(digest), m_helloHex);
}

TEST_F(HashUtilsTest, EmptyBufferHash) {
    const auto digest = HashUtils::computeBufferHash(nullptr, 0);
    EXPECT_EQ(HashUtils::toHex(digest), m_emptyHex);
}

//=============================================================================
// File Hashing
//=============================================================================

TEST_F(HashUtilsTest, FileHashMatchesBufferHash) {
    const auto path = m_root / "large.bin";
    const std::string content = FastDropTest::patternContent(3 * BUFFER_SIZE + 17);
    writeFile(path, content);

    Sha256Digest fileDigest{};
    std::string errorMsg;
    ASSERT_TRUE(HashUtils::computeFileHash(path.string(), fileDigest, errorMsg)) << errorMsg;

    const auto bufferDigest = HashUtils::computeBufferHash(
        reinterpret_cast<const uint8_t*>(content.data()), content.size());
    EXPECT_TRUE(HashUtils::digestsEqual(fileDigest, bufferDigest));
}

TEST_F(HashUtilsTest, EmptyFileHash) {
    const auto path = m_root / "empty.txt";
    writeFile(path, "");

    Sha256Digest digest{};
    std::string errorMsg;
    ASSERT_TRUE(HashUtils::computeFileHash(path.string(), digest, errorMsg)) << errorMsg;
    EXPECT_EQ(HashUtils::toHex(digest), m_emptyHex);
}

TEST_F(HashUtilsTest, MissingFileFails) {
    Sha256Digest digest{};
    std::string errorMsg;
    EXPECT_FALSE(HashUtils::computeFileHash((m_root / "missing").string(), digest, errorMsg));
    EXPECT_FALSE(errorMsg.empty());
}

//=============================================================================
// Incremental Hashing
//=============================================================================

/**
 * @test Feeding a buffer in uneven pieces gives the one-shot digest
 */
TEST_F(HashUtilsTest, IncrementalMatchesOneShot) {
    const std::string text = "Hello, World!";

    HashUtils::IncrementalHash hash;
    ASSERT_TRUE(hash.update(reinterpret_cast<const uint8_t*>(text.data()), 5));
    ASSERT_TRUE(hash.update(reinterpret_cast<const uint8_t*>(text.data()) + 5, text.size() - 5));

    Sha256Digest digest{};
    ASSERT_TRUE(hash.finalize(digest));
    EXPECT_EQ(HashUtils::toHex(digest), m_helloHex);

    // Finalized context must be reset before reuse
    EXPECT_FALSE(hash.update(reinterpret_cast<const uint8_t*>(text.data()), 1));
    ASSERT_TRUE(hash.reset());
    ASSERT_TRUE(hash.finalize(digest));
    EXPECT_EQ(HashUtils::toHex(digest), m_emptyHex);
}

TEST_F(HashUtilsTest, MovedHashKeepsState) {
    const std::string text = "Hello, World!";

    HashUtils::IncrementalHash first;
    ASSERT_TRUE(first.update(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    HashUtils::IncrementalHash second(std::move(first));

    Sha256Digest digest{};
    ASSERT_TRUE(second.finalize(digest));
    EXPECT_EQ(HashUtils::toHex(digest), m_helloHex);
}

//=============================================================================
// Hex Conversion
//=============================================================================

TEST_F(HashUtilsTest, HexRoundTripAcceptsUppercase) {
    Sha256Digest digest{};
    ASSERT_TRUE(HashUtils::fromHex(m_helloHex, digest));
    EXPECT_EQ(HashUtils::toHex(digest), m_helloHex);

    std::string upper = m_helloHex;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    Sha256Digest upperDigest{};
    ASSERT_TRUE(HashUtils::fromHex(upper, upperDigest));
    EXPECT_TRUE(HashUtils::digestsEqual(digest, upperDigest));
}

TEST_F(HashUtilsTest, IsHexDigestRejectsBadInput) {
    EXPECT_TRUE(HashUtils::isHexDigest(m_emptyHex));
    EXPECT_FALSE(HashUtils::isHexDigest(""));
    EXPECT_FALSE(HashUtils::isHexDigest(m_emptyHex.substr(1)));
    EXPECT_FALSE(HashUtils::isHexDigest(m_emptyHex + "0"));
    EXPECT_FALSE(HashUtils::isHexDigest(std::string(63, 'a') + "g"));
}
