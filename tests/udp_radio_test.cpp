/**
 * @file udp_radio_test.cpp
 * @brief Tests for the UDP beacon radio on the loopback interface
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/Advertiser.h"
#include "fastdrop/Scanner.h"
#include "fastdrop/SessionTicket.h"
#include "fastdrop/UdpRadio.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace FastDrop;

namespace {

UdpRadioOptions loopbackOptions() {
    UdpRadioOptions options;
    options.beaconPort = 41917;
    options.targets = {"127.0.0.1"};
    options.blobBindAddress = "127.0.0.1";
    return options;
}

}  // namespace

TEST(UdpRadioTest, BroadcastAddressesIncludeLimitedBroadcast) {
    const std::vector<std::string> addresses = UdpRadio::getBroadcastAddresses();
    ASSERT_FALSE(addresses.empty());
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), "255.255.255.255"), addresses.end());
}

TEST(UdpRadioTest, ScannerHearsBeaconAndReadsBlob) {
    UdpRadio senderRadio(loopbackOptions());
    UdpRadio receiverRadio(loopbackOptions());
    ASSERT_NE(senderRadio.localAddress(), receiverRadio.localAddress());

    const std::string tag = serviceTagFor(TransportProtocol::Quic);
    const std::vector<uint8_t> ticket = {0x46, 0x44, 0x54, 0x4B, 1, 2, 3, 4};

    // Scan first so the beacon port is bound before the first beacon goes out
    Scanner scanner(receiverRadio);
    SessionError error;
    auto scan = scanner.scan({tag}, 3000, error);
    ASSERT_TRUE(scan) << error.toString();

    Advertiser advertiser(senderRadio);
    auto handle = advertiser.advertise(tag, "udp-sender", ticket, error);
    ASSERT_TRUE(handle) << error.toString();
    EXPECT_NE(senderRadio.blobPort(), 0);

    DiscoveredPeer peer;
    ASSERT_TRUE(scan->next(peer));
    EXPECT_EQ(peer.radioAddress, senderRadio.localAddress());
    EXPECT_EQ(peer.displayName, "udp-sender");

    std::vector<uint8_t> read;
    ASSERT_TRUE(scan->readTicket(peer, read, error)) << error.toString();
    EXPECT_EQ(read, ticket);

    handle->stop();
    EXPECT_EQ(senderRadio.blobPort(), 0);
}

TEST(UdpRadioTest, UnknownAddressCannotBeRead) {
    UdpRadio radio(loopbackOptions());
    std::string err;
    ASSERT_TRUE(radio.powerOn(err)) << err;

    std::vector<uint8_t> blob;
    EXPECT_FALSE(radio.readBlob("udp_nobody", blob, err));
    EXPECT_FALSE(err.empty());
    radio.powerOff();
}
