/**
 * @file transfer_session_test.cpp
 * @brief End-to-end transfer engine tests over real loopback connections
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/HashUtils.h"
#include "fastdrop/TransferSession.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <thread>

using namespace FastDrop;
using FastDropTest::ConnectedPair;
using FastDropTest::TempDirTest;
using FastDropTest::connectPair;
using FastDropTest::patternContent;
using FastDropTest::readFile;
using FastDropTest::writeFile;

namespace fs = std::filesystem;

namespace {

struct TransferOutcome {
    bool senderOk = false;
    bool receiverOk = false;
    SessionError senderError;
    SessionError receiverError;
    TransferState senderState = TransferState::AwaitingConnection;
    TransferState receiverState = TransferState::AwaitingConnection;
    std::vector<TransferState> receiverStates;
    std::vector<ReceivedFile> received;
    size_t progressEvents = 0;
    uint64_t receivedBytes = 0;
};

TransferOutcome runTransfer(ConnectedPair& pair,
                            const FileManifest& manifest,
                            const std::vector<std::string>& sources,
                            const TransferOptions& receiverOptions,
                            uint64_t receiverNonce) {
    TransferOutcome outcome;

    TransferSession sender(TransferOptions{});
    TransferSession receiver(
        receiverOptions,
        [&outcome](TransferState state) { outcome.receiverStates.push_back(state); },
        [&outcome](const TransferProgress&) { ++outcome.progressEvents; });

    std::thread senderThread([&]() {
        outcome.senderOk = sender.runSender(*pair.sender, manifest, sources, outcome.senderError);
    });
    outcome.receiverOk = receiver.runReceiver(*pair.receiver, receiverNonce, outcome.receiverError);
    senderThread.join();

    outcome.senderState = sender.state();
    outcome.receiverState = receiver.state();
    outcome.received = receiver.receivedFiles();
    outcome.receivedBytes = receiver.bytesTransferred();
    return outcome;
}

}  // namespace

class TransferSessionTest : public TempDirTest,
                            public ::testing::WithParamInterface<TransportProtocol> {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        if (FastDropTest::transportUnavailable(GetParam())) {
            GTEST_SKIP() << "Linked OpenSSL has no QUIC server support";
        }
        m_src = makeDir("src");
        m_dest = makeDir("dest");
        m_options.downloadDir = m_dest.string();
    }

    FileManifest buildManifest(const std::vector<std::string>& sources, uint64_t nonce) {
        FileManifest manifest;
        SessionError error;
        EXPECT_TRUE(FileManifest::buildFromFiles(sources, true, nonce, manifest, error)) << error.toString();
        return manifest;
    }

    fs::path m_src;
    fs::path m_dest;
    TransferOptions m_options;
};

TEST_P(TransferSessionTest, TransfersEveryFileIntact) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    const std::vector<std::pair<std::string, size_t>> files = {
        {"test.txt", 0},
        {"empty.bin", 0},
        {"medium.bin", 200000},
        {"large.bin", 3 * CHUNK_SIZE + 17},
        {"tiny.dat", 1},
        {"notes.md", 4096},
        {"extra.log", 70000},
    };

    std::vector<std::string> sources;
    for (size_t i = 0; i < files.size(); ++i) {
        const fs::path path = m_src / files[i].first;
        writeFile(path, i == 0 ? FastDropTest::kSampleText
                               : patternContent(files[i].second, static_cast<uint32_t>(i)));
        sources.push_back(path.string());
    }

    const FileManifest manifest = buildManifest(sources, pair.ticket.nonce);
    const TransferOutcome outcome = runTransfer(pair, manifest, sources, m_options, pair.ticket.nonce);

    ASSERT_TRUE(outcome.receiverOk) << outcome.receiverError.toString();
    ASSERT_TRUE(outcome.senderOk) << outcome.senderError.toString();
    EXPECT_EQ(outcome.senderState, TransferState::Complete);
    EXPECT_EQ(outcome.receiverState, TransferState::Complete);
    EXPECT_EQ(outcome.received.size(), files.size());
    EXPECT_EQ(outcome.receivedBytes, manifest.totalBytes());
    EXPECT_GT(outcome.progressEvents, 0u);

    for (const auto& file : files) {
        EXPECT_TRUE(fs::exists(m_dest / file.first)) << file.first;
        EXPECT_EQ(readFile(m_dest / file.first), readFile(m_src / file.first)) << file.first;
        EXPECT_FALSE(fs::exists(m_dest / (file.first + PARTIAL_FILE_SUFFIX))) << file.first;
    }

    // Files land under their manifest names
    for (const ReceivedFile& file : outcome.received) {
        EXPECT_EQ(file.path, m_dest / file.manifestPath) << file.manifestPath;
    }

    // States are only ever entered in forward order
    const std::vector<TransferState> expected = {
        TransferState::ManifestExchange, TransferState::Streaming,
        TransferState::Finalizing, TransferState::Complete};
    EXPECT_EQ(outcome.receiverStates, expected);
}

TEST_P(TransferSessionTest, ExistingFilesAreNotOverwritten) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "photo.jpg", "new content");
    writeFile(m_dest / "photo.jpg", "old content");
    const std::vector<std::string> sources = {(m_src / "photo.jpg").string()};

    const TransferOutcome outcome =
        runTransfer(pair, buildManifest(sources, pair.ticket.nonce), sources, m_options, pair.ticket.nonce);

    ASSERT_TRUE(outcome.receiverOk) << outcome.receiverError.toString();
    EXPECT_EQ(readFile(m_dest / "photo.jpg"), "old content");
    EXPECT_EQ(readFile(m_dest / "photo (1).jpg"), "new content");
    ASSERT_EQ(outcome.received.size(), 1u);
    EXPECT_EQ(outcome.received[0].path, m_dest / "photo (1).jpg");
}

/**
 * @test A file that shrank after the manifest was built fails and stays ".part"
 */
TEST_P(TransferSessionTest, ShortFileIsTruncatedTransfer) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "short.bin", patternContent(1000, 3));
    const std::vector<std::string> sources = {(m_src / "short.bin").string()};

    FileManifestEntry entry;
    entry.path = "short.bin";
    entry.size = 1001;
    const FileManifest manifest({entry}, pair.ticket.nonce);

    const TransferOutcome outcome = runTransfer(pair, manifest, sources, m_options, pair.ticket.nonce);

    EXPECT_FALSE(outcome.senderOk);
    EXPECT_FALSE(outcome.receiverOk);
    EXPECT_EQ(outcome.senderError.kind, ErrorKind::TruncatedTransfer);
    EXPECT_EQ(outcome.receiverError.kind, ErrorKind::TruncatedTransfer);
    EXPECT_EQ(outcome.receiverState, TransferState::Failed);
    EXPECT_FALSE(fs::exists(m_dest / "short.bin"));
    if (GetParam() == TransportProtocol::Tcp) {
        EXPECT_TRUE(fs::exists(m_dest / "short.bin.part"));
    }
}

TEST_P(TransferSessionTest, WrongDigestIsChecksumMismatch) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "doc.txt", "actual bytes");
    const std::vector<std::string> sources = {(m_src / "doc.txt").string()};

    FileManifestEntry entry;
    entry.path = "doc.txt";
    entry.size = 12;
    entry.sha256 = std::string(64, '0');
    const FileManifest manifest({entry}, pair.ticket.nonce);

    const TransferOutcome outcome = runTransfer(pair, manifest, sources, m_options, pair.ticket.nonce);

    EXPECT_FALSE(outcome.receiverOk);
    EXPECT_EQ(outcome.receiverError.kind, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(outcome.senderOk);
    EXPECT_EQ(outcome.senderError.kind, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(fs::exists(m_dest / "doc.txt"));
    EXPECT_TRUE(fs::exists(m_dest / "doc.txt.part"));
}

TEST_P(TransferSessionTest, UnsafeManifestPathIsRejected) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "evil.txt", "x");
    const std::vector<std::string> sources = {(m_src / "evil.txt").string()};

    FileManifestEntry entry;
    entry.path = "../evil.txt";
    entry.size = 1;
    const FileManifest manifest({entry}, pair.ticket.nonce);

    const TransferOutcome outcome = runTransfer(pair, manifest, sources, m_options, pair.ticket.nonce);

    EXPECT_FALSE(outcome.receiverOk);
    EXPECT_EQ(outcome.receiverError.kind, ErrorKind::ManifestInvalid);
    EXPECT_FALSE(fs::exists(m_root / "evil.txt"));
}

TEST_P(TransferSessionTest, IncomingSizeLimitIsEnforced) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "big.bin", patternContent(5000, 1));
    const std::vector<std::string> sources = {(m_src / "big.bin").string()};
    m_options.maxIncomingBytes = 4999;

    const TransferOutcome outcome =
        runTransfer(pair, buildManifest(sources, pair.ticket.nonce), sources, m_options, pair.ticket.nonce);

    EXPECT_FALSE(outcome.receiverOk);
    EXPECT_EQ(outcome.receiverError.kind, ErrorKind::ManifestInvalid);
    EXPECT_FALSE(outcome.senderOk);
}

/**
 * @test A receiver that does not know the ticket nonce is refused by the sender
 */
TEST_P(TransferSessionTest, HelloWithWrongNonceIsRejected) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    writeFile(m_src / "a.txt", "abc");
    const std::vector<std::string> sources = {(m_src / "a.txt").string()};

    const TransferOutcome outcome = runTransfer(pair, buildManifest(sources, pair.ticket.nonce), sources,
                                                m_options, pair.ticket.nonce + 1);

    EXPECT_FALSE(outcome.senderOk);
    EXPECT_EQ(outcome.senderError.kind, ErrorKind::IdentityMismatch);
    EXPECT_FALSE(outcome.receiverOk);
    EXPECT_FALSE(fs::exists(m_dest / "a.txt"));
}

TEST_P(TransferSessionTest, CancelStopsReceiver) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    TransferOptions options = m_options;
    TransferSession receiver(options);

    std::thread canceller([&receiver]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        receiver.cancel();
    });

    // No sender is running, so the receiver blocks waiting for the manifest
    SessionError error;
    EXPECT_FALSE(receiver.runReceiver(*pair.receiver, pair.ticket.nonce, error));
    canceller.join();

    EXPECT_EQ(error.kind, ErrorKind::Cancelled);
    EXPECT_EQ(receiver.state(), TransferState::Failed);
}

TEST_P(TransferSessionTest, LostConnectionIsReported) {
    ConnectedPair pair;
    ASSERT_TRUE(connectPair(GetParam(), pair));

    TransferSession receiver(m_options);
    std::thread dropper([&pair]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pair.sender->close();
    });

    SessionError error;
    EXPECT_FALSE(receiver.runReceiver(*pair.receiver, pair.ticket.nonce, error));
    dropper.join();
    EXPECT_EQ(error.kind, ErrorKind::ConnectionLost);
}

INSTANTIATE_TEST_SUITE_P(BothTransports, TransferSessionTest,
                         ::testing::Values(TransportProtocol::Tcp, TransportProtocol::Quic),
                         [](const ::testing::TestParamInfo<TransportProtocol>& info) {
                             return std::string(transportProtocolName(info.param));
                         });

//=============================================================================
// ThrottledProgress
//=============================================================================

TEST(ThrottledProgressTest, DropsUpdatesInsideInterval) {
    size_t calls = 0;
    ThrottledProgress progress([&calls](const TransferProgress&) { ++calls; }, 60000);

    TransferProgress p;
    progress(p);
    progress(p);
    progress(p);
    EXPECT_EQ(calls, 1u);

    progress(p, true);
    EXPECT_EQ(calls, 2u);
}
