/**
 * @file scanner_test.cpp
 * @brief Tests for advertising and scanning over the loopback radio
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/AdvertRecord.h"
#include "fastdrop/Advertiser.h"
#include "fastdrop/LoopbackRadio.h"
#include "fastdrop/Scanner.h"
#include "fastdrop/SessionTicket.h"
#include "fastdrop/config.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace FastDrop;

namespace {

const std::string kQuicTag = serviceTagFor(TransportProtocol::Quic);
const std::string kTcpTag = serviceTagFor(TransportProtocol::Tcp);

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

//=============================================================================
// AdvertRecord
//=============================================================================

TEST(AdvertRecordTest, EncodesTagAndName) {
    AdvertRecord record;
    record.serviceTag = kQuicTag;
    record.displayName = "Office desktop";

    AdvertRecord decoded;
    std::string err;
    ASSERT_TRUE(decodeAdvertRecord(encodeAdvertRecord(record), decoded, err)) << err;
    EXPECT_EQ(decoded.serviceTag, kQuicTag);
    EXPECT_EQ(decoded.displayName, "Office desktop");
}

TEST(AdvertRecordTest, LongNamesAreTruncated) {
    AdvertRecord record;
    record.serviceTag = kTcpTag;
    record.displayName = std::string(200, 'n');

    const std::vector<uint8_t> bytes = encodeAdvertRecord(record);
    EXPECT_LE(bytes.size(), MAX_ADVERT_RECORD_BYTES);

    AdvertRecord decoded;
    std::string err;
    ASSERT_TRUE(decodeAdvertRecord(bytes, decoded, err)) << err;
    EXPECT_EQ(decoded.displayName.size(), MAX_ADVERT_NAME_BYTES);
}

TEST(AdvertRecordTest, RejectsForeignRecords) {
    const std::vector<std::string> bad = {
        "",
        "garbage",
        R"({"fastdrop":2,"service":"x","name":"n"})",
        R"({"fastdrop":1,"name":"n"})",
        R"({"fastdrop":1,"service":"","name":"n"})",
        R"({"fastdrop":1,"service":5,"name":"n"})",
    };
    for (const std::string& text : bad) {
        AdvertRecord out;
        std::string err;
        EXPECT_FALSE(decodeAdvertRecord(bytesOf(text), out, err)) << text;
    }
}

//=============================================================================
// Advertiser / Scanner
//=============================================================================

class LoopbackScanTest : public ::testing::Test {
protected:
    std::shared_ptr<LoopbackAir> m_air = std::make_shared<LoopbackAir>();
    LoopbackRadio m_senderRadio{m_air, "sender-radio", -40};
    LoopbackRadio m_receiverRadio{m_air, "receiver-radio"};
};

/**
 * @test One advertiser heard many times is yielded exactly once
 */
TEST_F(LoopbackScanTest, DiscoversAdvertiserOnce) {
    Advertiser advertiser(m_senderRadio);
    SessionError error;
    auto handle = advertiser.advertise(kQuicTag, "Laptop", {1, 2, 3}, error);
    ASSERT_TRUE(handle) << error.toString();
    EXPECT_TRUE(m_senderRadio.isAdvertising());

    Scanner scanner(m_receiverRadio);
    auto scan = scanner.scan({kQuicTag}, 1500, error);
    ASSERT_TRUE(scan) << error.toString();

    DiscoveredPeer peer;
    ASSERT_TRUE(scan->next(peer));
    EXPECT_EQ(peer.radioAddress, "sender-radio");
    EXPECT_EQ(peer.displayName, "Laptop");
    EXPECT_EQ(peer.serviceTag, kQuicTag);
    ASSERT_TRUE(peer.rssi.has_value());
    EXPECT_EQ(*peer.rssi, -40);

    // Repeated advertisements within the window are deduplicated
    DiscoveredPeer another;
    EXPECT_FALSE(scan->next(another));
    EXPECT_TRUE(scan->isFinished());
    EXPECT_EQ(scan->peers().size(), 1u);

    // Finished sequences stay finished
    EXPECT_FALSE(scan->next(another));
}

TEST_F(LoopbackScanTest, ScanEndsAtDeadlineWithoutPeers) {
    Scanner scanner(m_receiverRadio);
    SessionError error;

    const auto start = std::chrono::steady_clock::now();
    auto scan = scanner.scan({kQuicTag}, 300, error);
    ASSERT_TRUE(scan);

    DiscoveredPeer peer;
    EXPECT_FALSE(scan->next(peer));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(scan->wasCancelled());
    EXPECT_FALSE(m_receiverRadio.isScanning());
}

TEST_F(LoopbackScanTest, IgnoresOtherServiceTags) {
    Advertiser advertiser(m_senderRadio);
    SessionError error;
    auto handle = advertiser.advertise(kTcpTag, "Tower", {9}, error);
    ASSERT_TRUE(handle);

    Scanner scanner(m_receiverRadio);
    auto scan = scanner.scan({kQuicTag}, 700, error);
    ASSERT_TRUE(scan);

    DiscoveredPeer peer;
    EXPECT_FALSE(scan->next(peer));
    EXPECT_TRUE(scan->peers().empty());
}

TEST_F(LoopbackScanTest, MalformedAdvertisementsAreSkipped) {
    Scanner scanner(m_receiverRadio);
    SessionError error;
    auto scan = scanner.scan({kQuicTag, kTcpTag}, 1000, error);
    ASSERT_TRUE(scan);

    m_air->inject("noise-1", bytesOf("\x01\x02 not a record"));

    AdvertRecord record;
    record.serviceTag = kTcpTag;
    record.displayName = "Injected";
    m_air->inject("good-1", encodeAdvertRecord(record), -70);

    DiscoveredPeer peer;
    ASSERT_TRUE(scan->next(peer));
    EXPECT_EQ(peer.radioAddress, "good-1");
    EXPECT_EQ(scan->skippedAdvertisements(), 1u);
}

TEST_F(LoopbackScanTest, CancelUnblocksNext) {
    Scanner scanner(m_receiverRadio);
    SessionError error;
    auto scan = scanner.scan({kQuicTag}, 60000, error);
    ASSERT_TRUE(scan);

    std::thread canceller([&scan]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        scan->cancel();
    });

    DiscoveredPeer peer;
    EXPECT_FALSE(scan->next(peer));
    canceller.join();
    EXPECT_TRUE(scan->wasCancelled());
}

TEST_F(LoopbackScanTest, ReadsPublishedTicket) {
    Advertiser advertiser(m_senderRadio);
    SessionError error;
    const std::vector<uint8_t> ticket(100, 0x5A);
    auto handle = advertiser.advertise(kQuicTag, "Phone", ticket, error);
    ASSERT_TRUE(handle);

    Scanner scanner(m_receiverRadio);
    auto scan = scanner.scan({kQuicTag}, 2000, error);
    ASSERT_TRUE(scan);

    DiscoveredPeer peer;
    ASSERT_TRUE(scan->next(peer));
    scan->cancel();

    // The window is closed; the radio is re-enabled for the read
    std::vector<uint8_t> read;
    ASSERT_TRUE(scan->readTicket(peer, read, error)) << error.toString();
    EXPECT_EQ(read, ticket);

    DiscoveredPeer stranger("nobody", "Nobody", kQuicTag);
    SessionError notFound;
    EXPECT_FALSE(scan->readTicket(stranger, read, notFound));
    EXPECT_EQ(notFound.kind, ErrorKind::PeerNotFound);

    // Once the advertiser stops, its ticket is gone
    handle->stop();
    SessionError gone;
    EXPECT_FALSE(scan->readTicket(peer, read, gone));
    EXPECT_EQ(gone.kind, ErrorKind::RadioUnavailable);
}

TEST_F(LoopbackScanTest, OversizedTicketIsRejectedBeforeAdvertising) {
    Advertiser advertiser(m_senderRadio);
    SessionError error;
    auto handle = advertiser.advertise(kQuicTag, "Big", std::vector<uint8_t>(MAX_TICKET_SIZE + 1, 1), error);
    EXPECT_FALSE(handle);
    EXPECT_EQ(error.kind, ErrorKind::TicketTooLarge);
    EXPECT_FALSE(m_senderRadio.isAdvertising());
    EXPECT_EQ(m_senderRadio.activeRole(), RadioRole::None);
}

TEST_F(LoopbackScanTest, UnavailableRadioFails) {
    m_air->setAvailable(false);

    Advertiser advertiser(m_senderRadio);
    SessionError advertError;
    EXPECT_FALSE(advertiser.advertise(kQuicTag, "Off", {1}, advertError));
    EXPECT_EQ(advertError.kind, ErrorKind::RadioUnavailable);
    EXPECT_EQ(m_senderRadio.activeRole(), RadioRole::None);

    Scanner scanner(m_receiverRadio);
    SessionError scanError;
    EXPECT_FALSE(scanner.scan({kQuicTag}, 100, scanError));
    EXPECT_EQ(scanError.kind, ErrorKind::RadioUnavailable);
    EXPECT_EQ(m_receiverRadio.activeRole(), RadioRole::None);
}

/**
 * @test One adapter cannot advertise and scan at the same time
 */
TEST_F(LoopbackScanTest, AdvertisingAndScanningAreExclusive) {
    Advertiser advertiser(m_senderRadio);
    SessionError error;
    auto handle = advertiser.advertise(kQuicTag, "Busy", {1}, error);
    ASSERT_TRUE(handle);
    EXPECT_TRUE(m_senderRadio.isPowered());

    Scanner scanner(m_senderRadio);
    SessionError busy;
    EXPECT_FALSE(scanner.scan({kQuicTag}, 100, busy));
    EXPECT_EQ(busy.kind, ErrorKind::RadioUnavailable);

    handle->stop();
    EXPECT_FALSE(handle->isActive());
    EXPECT_FALSE(m_senderRadio.isPowered());
    handle->stop();

    SessionError again;
    auto scan = scanner.scan({kQuicTag}, 100, again);
    EXPECT_TRUE(scan) << again.toString();
}
