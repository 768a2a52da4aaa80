/**
 * @file path_sanitizer_test.cpp
 * @brief Tests for manifest path validation and outgoing name cleanup
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/PathSanitizer.h"
#include "fastdrop/config.h"

#include <gtest/gtest.h>

using namespace FastDrop;

TEST(PathSanitizerTest, AcceptsPlainAndNestedRelativePaths) {
    std::vector<std::string> components;
    std::string err;

    ASSERT_TRUE(splitSafeRelativePath("test.txt", components, err)) << err;
    EXPECT_EQ(components, std::vector<std::string>{"test.txt"});

    ASSERT_TRUE(splitSafeRelativePath("photos/2026/beach.jpg", components, err)) << err;
    EXPECT_EQ(components.size(), 3u);
    EXPECT_EQ(components[2], "beach.jpg");
}

TEST(PathSanitizerTest, RejectsTraversalAndAbsolutePaths) {
    const char* unsafe[] = {
        "",
        "/etc/passwd",
        "../secret",
        "a/../../b",
        "./a",
        "a//b",
        "a/",
        "dir\\file.txt",
        "C:evil.txt",
    };

    for (const char* path : unsafe) {
        std::vector<std::string> components;
        std::string err;
        EXPECT_FALSE(splitSafeRelativePath(path, components, err)) << path;
        EXPECT_FALSE(err.empty()) << path;
        EXPECT_TRUE(components.empty()) << path;
    }
}

TEST(PathSanitizerTest, RejectsControlCharactersAndOversizedComponents) {
    std::string err;
    EXPECT_FALSE(isSafePathComponent(std::string("bad\nname"), err));
    EXPECT_FALSE(isSafePathComponent(std::string("del\x7f"), err));
    EXPECT_FALSE(isSafePathComponent(std::string(MAX_PATH_COMPONENT_BYTES + 1, 'a'), err));
    EXPECT_TRUE(isSafePathComponent(std::string(MAX_PATH_COMPONENT_BYTES, 'a'), err));
}

TEST(PathSanitizerTest, ResolveStaysUnderDirectory) {
    std::filesystem::path out;
    std::string err;

    ASSERT_TRUE(resolveUnderDirectory("/downloads", "a/b.txt", out, err)) << err;
    EXPECT_EQ(out, std::filesystem::path("/downloads/a/b.txt"));

    EXPECT_FALSE(resolveUnderDirectory("/downloads", "../b.txt", out, err));
}

TEST(PathSanitizerTest, SanitizeOutgoingName) {
    EXPECT_EQ(sanitizeOutgoingName("report.pdf"), "report.pdf");
    EXPECT_EQ(sanitizeOutgoingName("a\tb"), "a_b");
    EXPECT_EQ(sanitizeOutgoingName("trailing. . "), "trailing");
    EXPECT_EQ(sanitizeOutgoingName(".."), "");

    const std::string longName = std::string(300, 'x') + ".txt";
    const std::string cleaned = sanitizeOutgoingName(longName);
    EXPECT_EQ(cleaned.size(), MAX_PATH_COMPONENT_BYTES);
    EXPECT_EQ(cleaned.substr(cleaned.size() - 4), ".txt");
}
