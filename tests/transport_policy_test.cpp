/**
 * @file transport_policy_test.cpp
 * @brief Unit tests for the Quic/Tcp selection rule and display helpers
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransportPolicy.h"

#include <gtest/gtest.h>

using namespace FastDrop;

TEST(TransportPolicyTest, DocumentedExamples) {
    EXPECT_EQ(TransportPolicy::choose(1, 34), TransportProtocol::Quic);
    EXPECT_EQ(TransportPolicy::choose(6, 500000000ULL), TransportProtocol::Quic);
    EXPECT_EQ(TransportPolicy::choose(2, 200000000ULL), TransportProtocol::Tcp);
}

TEST(TransportPolicyTest, ThresholdsAreStrict) {
    // Exactly 100000000 bytes is not "small"
    EXPECT_EQ(TransportPolicy::choose(5, 100000000ULL), TransportProtocol::Tcp);
    EXPECT_EQ(TransportPolicy::choose(5, 99999999ULL), TransportProtocol::Quic);
    // Exactly 5 files is not "many"
    EXPECT_EQ(TransportPolicy::choose(6, 100000000ULL), TransportProtocol::Quic);
}

TEST(TransportPolicyTest, RuleHoldsAcrossGrid) {
    const uint64_t counts[] = {0, 1, 4, 5, 6, 7, 100, 10000};
    const uint64_t sizes[] = {0, 1, 99999999ULL, 100000000ULL, 100000001ULL, 1ULL << 40};

    for (uint64_t count : counts) {
        for (uint64_t size : sizes) {
            const bool quic = count > 5 || size < 100000000ULL;
            EXPECT_EQ(TransportPolicy::choose(count, size),
                      quic ? TransportProtocol::Quic : TransportProtocol::Tcp)
                << count << " files, " << size << " bytes";
        }
    }
}

TEST(TransportPolicyTest, ExplainNamesTheChoice) {
    EXPECT_NE(TransportPolicy::explain(1, 34).find("Quic"), std::string::npos);
    EXPECT_NE(TransportPolicy::explain(2, 200000000ULL).find("Tcp"), std::string::npos);
}

TEST(FormatBytesTest, UsesBinaryUnitsWithTwoDecimals) {
    EXPECT_EQ(formatBytes(34), "34.00 B");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(1024ULL * 1024ULL), "1.00 MB");
    EXPECT_EQ(formatBytes(3ULL * 1024ULL * 1024ULL * 1024ULL), "3.00 GB");
}

TEST(CalculateProgressTest, HandlesEmptyTotal) {
    EXPECT_DOUBLE_EQ(calculateProgress(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(calculateProgress(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(calculateProgress(200, 200), 100.0);
}
