/**
 * @file ticket_codec_test.cpp
 * @brief Unit tests for session ticket encoding and decoding
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TicketCodec.h"
#include "fastdrop/config.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace FastDrop;

//=============================================================================
// Test Fixtures
//=============================================================================

class TicketCodecTest : public ::testing::Test {
protected:
    SessionTicket m_ticket;

    void SetUp() override {
        PeerIdentity::Bytes bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(0xA0 + i);
        }
        m_ticket.protocol = TransportProtocol::Quic;
        m_ticket.senderIdentity = PeerIdentity::fromBytes(bytes);
        m_ticket.endpoints = {Endpoint("192.168.1.20", 40001)};
        m_ticket.nonce = 0x0102030405060708ULL;
    }

    std::vector<uint8_t> encoded() {
        std::vector<uint8_t> out;
        SessionError error;
        EXPECT_TRUE(TicketCodec::encode(m_ticket, out, error)) << error.toString();
        return out;
    }
};

//=============================================================================
// Round Trip
//=============================================================================

/**
 * @test A single IPv4 endpoint ticket survives encode/decode unchanged
 */
TEST_F(TicketCodecTest, RoundTripSingleEndpoint) {
    const auto bytes = encoded();

    SessionTicket decoded;
    SessionError error;
    ASSERT_TRUE(TicketCodec::decode(bytes, decoded, error)) << error.toString();
    EXPECT_EQ(decoded, m_ticket);
}

TEST_F(TicketCodecTest, RoundTripMixedFamiliesAndTcp) {
    m_ticket.protocol = TransportProtocol::Tcp;
    m_ticket.endpoints = {
        Endpoint("10.0.0.5", 1),
        Endpoint("fe80::1", 65535),
        Endpoint("::1", 443),
    };
    m_ticket.nonce = 0;

    SessionTicket decoded;
    SessionError error;
    ASSERT_TRUE(TicketCodec::decode(encoded(), decoded, error)) << error.toString();
    EXPECT_EQ(decoded, m_ticket);
    EXPECT_EQ(decoded.endpoints[1].host, "fe80::1");
}

/**
 * @test Layout: version, protocol tag, body length, then the identity bytes
 */
TEST_F(TicketCodecTest, EncodedLayoutIsVersionedAndLengthPrefixed) {
    const auto bytes = encoded();

    // 4 prefix + 32 identity + 8 nonce + 1 count + (1 + 4 + 2) endpoint
    ASSERT_EQ(bytes.size(), 52u);
    EXPECT_EQ(bytes[0], TICKET_VERSION);
    EXPECT_EQ(bytes[1], static_cast<uint8_t>(TransportProtocol::Quic));
    EXPECT_EQ((bytes[2] << 8) | bytes[3], 48);
    EXPECT_EQ(bytes[4], 0xA0);
    EXPECT_EQ(bytes[36], 0x01);  // nonce, big-endian
}

//=============================================================================
// Encode Errors
//=============================================================================

TEST_F(TicketCodecTest, TooManyEndpointsIsTicketTooLarge) {
    m_ticket.endpoints.clear();
    for (int i = 0; i < 25; ++i) {
        m_ticket.endpoints.emplace_back("2001:db8::" + std::to_string(i + 1), 5000);
    }

    std::vector<uint8_t> out;
    SessionError error;
    EXPECT_FALSE(TicketCodec::encode(m_ticket, out, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketTooLarge);
}

TEST_F(TicketCodecTest, LargestTicketThatFitsIsAccepted) {
    m_ticket.endpoints.clear();
    for (int i = 0; i < 24; ++i) {
        m_ticket.endpoints.emplace_back("2001:db8::" + std::to_string(i + 1), 5000);
    }

    const auto bytes = encoded();
    EXPECT_LE(bytes.size(), MAX_TICKET_SIZE);
}

TEST_F(TicketCodecTest, HostNameIsRejected) {
    m_ticket.endpoints = {Endpoint("sender.local", 4000)};

    std::vector<uint8_t> out;
    SessionError error;
    EXPECT_FALSE(TicketCodec::encode(m_ticket, out, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}

TEST_F(TicketCodecTest, MissingIdentityOrEndpointsIsRejected) {
    SessionTicket noIdentity = m_ticket;
    noIdentity.senderIdentity = PeerIdentity();

    std::vector<uint8_t> out;
    SessionError error;
    EXPECT_FALSE(TicketCodec::encode(noIdentity, out, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);

    SessionTicket noEndpoints = m_ticket;
    noEndpoints.endpoints.clear();
    SessionError error2;
    EXPECT_FALSE(TicketCodec::encode(noEndpoints, out, error2));
    EXPECT_EQ(error2.kind, ErrorKind::TicketMalformed);
}

//=============================================================================
// Decode Errors
//=============================================================================

TEST_F(TicketCodecTest, EveryTruncationIsMalformed) {
    const auto bytes = encoded();

    for (size_t len = 0; len < bytes.size(); ++len) {
        std::vector<uint8_t> cut(bytes.begin(), bytes.begin() + static_cast<long>(len));
        SessionTicket decoded;
        SessionError error;
        EXPECT_FALSE(TicketCodec::decode(cut, decoded, error)) << "length " << len;
        EXPECT_EQ(error.kind, ErrorKind::TicketMalformed) << "length " << len;
    }
}

TEST_F(TicketCodecTest, UnknownVersionIsMalformed) {
    auto bytes = encoded();
    bytes[0] = TICKET_VERSION + 1;

    SessionTicket decoded;
    SessionError error;
    EXPECT_FALSE(TicketCodec::decode(bytes, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}

TEST_F(TicketCodecTest, UnknownProtocolTagIsMalformed) {
    for (uint8_t tag : {uint8_t(0), uint8_t(3), uint8_t(0xFF)}) {
        auto bytes = encoded();
        bytes[1] = tag;

        SessionTicket decoded;
        SessionError error;
        EXPECT_FALSE(TicketCodec::decode(bytes, decoded, error)) << "tag " << int(tag);
        EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
    }
}

TEST_F(TicketCodecTest, TrailingBytesAreMalformed) {
    auto bytes = encoded();
    bytes.push_back(0x00);

    SessionTicket decoded;
    SessionError error;
    EXPECT_FALSE(TicketCodec::decode(bytes, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}

TEST_F(TicketCodecTest, UnknownAddressFamilyIsMalformed) {
    auto bytes = encoded();
    bytes[45] = 5;  // family byte of the first endpoint

    SessionTicket decoded;
    SessionError error;
    EXPECT_FALSE(TicketCodec::decode(bytes, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}

TEST_F(TicketCodecTest, ZeroEndpointsIsMalformed) {
    // Header + identity + nonce + count 0, body length 41
    std::vector<uint8_t> bytes = {TICKET_VERSION, 0x01, 0x00, 41};
    bytes.resize(4 + 41, 0xEE);
    bytes.back() = 0;

    SessionTicket decoded;
    SessionError error;
    EXPECT_FALSE(TicketCodec::decode(bytes, decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}

//=============================================================================
// Service Tags
//=============================================================================

TEST(ServiceTagTest, TagsMapBothWays) {
    TransportProtocol out = TransportProtocol::Tcp;
    ASSERT_TRUE(protocolForServiceTag(serviceTagFor(TransportProtocol::Quic), out));
    EXPECT_EQ(out, TransportProtocol::Quic);
    ASSERT_TRUE(protocolForServiceTag(serviceTagFor(TransportProtocol::Tcp), out));
    EXPECT_EQ(out, TransportProtocol::Tcp);

    EXPECT_FALSE(protocolForServiceTag("00000000-0000-0000-0000-000000000000", out));
    EXPECT_STREQ(serviceTagFor(TransportProtocol::Quic), QUIC_SERVICE_UUID);
}
