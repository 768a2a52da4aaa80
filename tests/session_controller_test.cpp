/**
 * @file session_controller_test.cpp
 * @brief Whole-session tests: advertise, scan, connect and transfer over the loopback radio
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/Advertiser.h"
#include "fastdrop/HashUtils.h"
#include "fastdrop/LoopbackRadio.h"
#include "fastdrop/SessionController.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>

using namespace FastDrop;
using FastDropTest::TempDirTest;
using FastDropTest::makeIdentity;
using FastDropTest::readFile;
using FastDropTest::writeFile;

namespace fs = std::filesystem;

class SessionControllerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        m_src = makeDir("outbox");
        m_dest = makeDir("inbox");

        m_senderOptions.displayName = "Sender";
        m_senderOptions.bindAddress = "127.0.0.1";
        m_senderOptions.advertisedAddresses = {"127.0.0.1"};
        m_senderOptions.acceptTimeoutMs = 15000;

        m_receiverOptions.displayName = "Receiver";
        m_receiverOptions.downloadDir = m_dest.string();
        m_receiverOptions.scanDurationMs = 5000;
        m_receiverOptions.stopScanOnFirstPeer = true;
        m_receiverOptions.connectTimeoutMs = 5000;
    }

    std::shared_ptr<LoopbackAir> m_air = std::make_shared<LoopbackAir>();
    LoopbackRadio m_senderRadio{m_air, "radio-sender"};
    LoopbackRadio m_receiverRadio{m_air, "radio-receiver"};
    fs::path m_src;
    fs::path m_dest;
    SessionOptions m_senderOptions;
    SessionOptions m_receiverOptions;
};

/**
 * @test A single small file goes over the multiplexed transport and arrives intact
 */
TEST_F(SessionControllerTest, SendsOneFileEndToEnd) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    const std::string content = FastDropTest::kSampleText;
    ASSERT_EQ(content.size(), 34u);
    writeFile(m_src / "test.txt", content);

    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);

    std::vector<SessionPhase> senderPhases;
    sender.setPhaseCallback([&senderPhases](SessionPhase phase) { senderPhases.push_back(phase); });

    std::vector<std::string> discoveredNames;
    receiver.setPeerDiscoveredCallback(
        [&discoveredNames](const DiscoveredPeer& peer) { discoveredNames.push_back(peer.displayName); });

    SessionError senderError;
    bool senderOk = false;
    std::thread senderThread([&]() {
        senderOk = sender.runSender({(m_src / "test.txt").string()}, senderError);
    });

    SessionError receiverError;
    const bool receiverOk = receiver.runReceiver(receiverError);
    senderThread.join();

    ASSERT_TRUE(receiverOk) << receiverError.toString();
    ASSERT_TRUE(senderOk) << senderError.toString();
    EXPECT_EQ(sender.phase(), SessionPhase::Complete);
    EXPECT_EQ(receiver.phase(), SessionPhase::Complete);

    EXPECT_EQ(receiver.lastTicket().protocol, TransportProtocol::Quic);
    EXPECT_EQ(receiver.lastTicket().senderIdentity, sender.identity());
    EXPECT_EQ(receiver.lastTicket(), sender.lastTicket());
    EXPECT_EQ(receiver.lastManifest().totalBytes(), 34u);

    ASSERT_EQ(receiver.lastManifest().fileCount(), 1u);
    EXPECT_EQ(receiver.lastManifest().entries()[0].path, "test.txt");
    EXPECT_EQ(receiver.lastManifest().entries()[0].size, 34u);
    EXPECT_FALSE(receiver.lastManifest().entries()[0].sha256.empty());

    ASSERT_EQ(receiver.receivedFiles().size(), 1u);
    EXPECT_EQ(receiver.receivedFiles()[0].path, m_dest / "test.txt");
    EXPECT_EQ(readFile(m_dest / "test.txt"), content);
    EXPECT_EQ(discoveredNames, std::vector<std::string>{"Sender"});

    const std::vector<SessionPhase> expected = {
        SessionPhase::Preparing, SessionPhase::Advertising,
        SessionPhase::Transferring, SessionPhase::Complete};
    EXPECT_EQ(senderPhases, expected);

    // The advertisement is withdrawn once the receiver connected
    EXPECT_FALSE(m_senderRadio.isAdvertising());
    EXPECT_EQ(m_senderRadio.activeRole(), RadioRole::None);
    EXPECT_EQ(m_receiverRadio.activeRole(), RadioRole::None);
}

/**
 * @test One file of 100,000,000 bytes picks Tcp and arrives with a matching digest
 */
TEST_F(SessionControllerTest, SendsLargeFileOverTcp) {
    const uint64_t size = 100000000ULL;
    const std::string block = FastDropTest::patternContent(1000000, 3);
    {
        std::ofstream out(m_src / "large.bin", std::ios::binary);
        for (uint64_t written = 0; written < size; written += block.size()) {
            out.write(block.data(), static_cast<std::streamsize>(block.size()));
        }
    }
    ASSERT_EQ(fs::file_size(m_src / "large.bin"), size);

    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);

    SessionError senderError;
    bool senderOk = false;
    std::thread senderThread([&]() {
        senderOk = sender.runSender({(m_src / "large.bin").string()}, senderError);
    });

    SessionError receiverError;
    const bool receiverOk = receiver.runReceiver(receiverError);
    senderThread.join();

    ASSERT_TRUE(receiverOk) << receiverError.toString();
    ASSERT_TRUE(senderOk) << senderError.toString();
    EXPECT_EQ(receiver.lastTicket().protocol, TransportProtocol::Tcp);
    EXPECT_EQ(receiver.lastManifest().totalBytes(), size);

    ASSERT_EQ(receiver.receivedFiles().size(), 1u);
    EXPECT_EQ(receiver.receivedFiles()[0].path, m_dest / "large.bin");
    ASSERT_EQ(fs::file_size(m_dest / "large.bin"), size);

    Sha256Digest sent{};
    Sha256Digest got{};
    std::string hashError;
    ASSERT_TRUE(HashUtils::computeFileHash((m_src / "large.bin").string(), sent, hashError)) << hashError;
    ASSERT_TRUE(HashUtils::computeFileHash((m_dest / "large.bin").string(), got, hashError)) << hashError;
    EXPECT_TRUE(HashUtils::digestsEqual(sent, got));
    EXPECT_EQ(HashUtils::toHex(got), receiver.lastManifest().entries()[0].sha256);
}

TEST_F(SessionControllerTest, ReceiverChoosesAmongSenders) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    writeFile(m_src / "pick.txt", "picked");

    LoopbackRadio decoyRadio(m_air, "radio-decoy");
    Advertiser decoy(decoyRadio);
    SessionError decoyError;
    auto decoyHandle = decoy.advertise(serviceTagFor(TransportProtocol::Tcp), "Decoy", {1, 2, 3}, decoyError);
    ASSERT_TRUE(decoyHandle) << decoyError.toString();

    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);
    m_receiverOptions.stopScanOnFirstPeer = false;
    m_receiverOptions.scanDurationMs = 1500;
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);

    size_t offered = 0;
    receiver.setPeerSelector([&offered](const std::vector<DiscoveredPeer>& peers) {
        offered = peers.size();
        for (size_t i = 0; i < peers.size(); ++i) {
            if (peers[i].displayName == "Sender") {
                return static_cast<int>(i);
            }
        }
        return -1;
    });

    SessionError senderError;
    std::thread senderThread([&]() {
        sender.runSender({(m_src / "pick.txt").string()}, senderError);
    });

    SessionError receiverError;
    EXPECT_TRUE(receiver.runReceiver(receiverError)) << receiverError.toString();
    senderThread.join();

    EXPECT_EQ(offered, 2u);
    EXPECT_EQ(readFile(m_dest / "pick.txt"), "picked");
}

TEST_F(SessionControllerTest, ReceiverWithoutSendersFindsNoPeer) {
    m_receiverOptions.scanDurationMs = 300;
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);

    SessionError error;
    EXPECT_FALSE(receiver.runReceiver(error));
    EXPECT_EQ(error.kind, ErrorKind::PeerNotFound);
    EXPECT_EQ(receiver.phase(), SessionPhase::Failed);
}

TEST_F(SessionControllerTest, DeclinedSelectionFindsNoPeer) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    writeFile(m_src / "a.txt", "a");
    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);

    m_receiverOptions.stopScanOnFirstPeer = false;
    m_receiverOptions.scanDurationMs = 800;
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);
    receiver.setPeerSelector([](const std::vector<DiscoveredPeer>&) { return -1; });

    std::thread senderThread([&]() {
        SessionError senderError;
        sender.runSender({(m_src / "a.txt").string()}, senderError);
    });

    SessionError error;
    EXPECT_FALSE(receiver.runReceiver(error));
    EXPECT_EQ(error.kind, ErrorKind::PeerNotFound);

    sender.cancel();
    senderThread.join();
    EXPECT_EQ(sender.phase(), SessionPhase::Failed);
}

TEST_F(SessionControllerTest, RadioOffFailsBothRoles) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    m_air->setAvailable(false);
    writeFile(m_src / "a.txt", "a");

    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);
    SessionError senderError;
    EXPECT_FALSE(sender.runSender({(m_src / "a.txt").string()}, senderError));
    EXPECT_EQ(senderError.kind, ErrorKind::RadioUnavailable);

    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);
    SessionError receiverError;
    EXPECT_FALSE(receiver.runReceiver(receiverError));
    EXPECT_EQ(receiverError.kind, ErrorKind::RadioUnavailable);
}

TEST_F(SessionControllerTest, MissingFileFailsBeforeAdvertising) {
    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);

    std::vector<SessionPhase> phases;
    sender.setPhaseCallback([&phases](SessionPhase phase) { phases.push_back(phase); });

    SessionError error;
    EXPECT_FALSE(sender.runSender({(m_src / "missing.txt").string()}, error));
    EXPECT_EQ(error.kind, ErrorKind::FileAccess);
    EXPECT_EQ(phases, (std::vector<SessionPhase>{SessionPhase::Preparing, SessionPhase::Failed}));
    EXPECT_FALSE(m_senderRadio.isAdvertising());
}

TEST_F(SessionControllerTest, CancelWhileAdvertising) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    writeFile(m_src / "a.txt", "a");
    m_senderOptions.acceptTimeoutMs = 0;
    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);

    std::mutex mutex;
    std::condition_variable cv;
    bool advertising = false;
    sender.setPhaseCallback([&](SessionPhase phase) {
        if (phase == SessionPhase::Advertising) {
            std::lock_guard<std::mutex> lock(mutex);
            advertising = true;
            cv.notify_all();
        }
    });

    SessionError error;
    std::thread senderThread([&]() {
        sender.runSender({(m_src / "a.txt").string()}, error);
    });

    bool reached = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        reached = cv.wait_for(lock, std::chrono::seconds(10), [&advertising]() { return advertising; });
    }
    EXPECT_TRUE(reached);
    sender.cancel();
    senderThread.join();

    EXPECT_EQ(error.kind, ErrorKind::Cancelled);
    EXPECT_EQ(sender.phase(), SessionPhase::Failed);
    EXPECT_FALSE(m_senderRadio.isAdvertising());
    EXPECT_EQ(m_senderRadio.activeRole(), RadioRole::None);
}

/**
 * @test A cancel issued before a run starts stops that run, and only that run
 */
TEST_F(SessionControllerTest, CancelBeforeRunIsNotLost) {
    m_receiverOptions.scanDurationMs = 200;
    SessionController receiver(makeIdentity("receiver"), m_receiverRadio, m_receiverOptions);

    receiver.cancel();
    SessionError cancelled;
    EXPECT_FALSE(receiver.runReceiver(cancelled));
    EXPECT_EQ(cancelled.kind, ErrorKind::Cancelled);
    EXPECT_EQ(m_receiverRadio.activeRole(), RadioRole::None);

    // The request was consumed; the next run scans normally
    SessionError next;
    EXPECT_FALSE(receiver.runReceiver(next));
    EXPECT_EQ(next.kind, ErrorKind::PeerNotFound);

    writeFile(m_src / "a.txt", "a");
    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);
    sender.cancel();
    SessionError senderError;
    EXPECT_FALSE(sender.runSender({(m_src / "a.txt").string()}, senderError));
    EXPECT_EQ(senderError.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(m_senderRadio.isAdvertising());
}

TEST_F(SessionControllerTest, ForeignAdvertisedAddressIsRejected) {
    if (!quicTransportAvailable()) {
        GTEST_SKIP() << "Small sends pick Quic; linked OpenSSL has no QUIC server support";
    }
    writeFile(m_src / "a.txt", "a");
    m_senderOptions.advertisedAddresses = {"printer.local"};
    SessionController sender(makeIdentity("sender"), m_senderRadio, m_senderOptions);

    SessionError error;
    EXPECT_FALSE(sender.runSender({(m_src / "a.txt").string()}, error));
    EXPECT_EQ(error.kind, ErrorKind::TicketMalformed);
}
