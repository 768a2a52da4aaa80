/**
 * @file frame_test.cpp
 * @brief Tests for engine frame headers and control payloads
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransferFrame.h"
#include "fastdrop/TransportStream.h"

#include <gtest/gtest.h>

#include <deque>

using namespace FastDrop;

namespace {

/// In-memory stream: everything sent becomes readable
class BufferStream : public TransportStream {
public:
    bool sendExact(const uint8_t* data, size_t size, std::string&) override {
        m_data.insert(m_data.end(), data, data + size);
        return true;
    }
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        if (m_data.size() < size) {
            errorMsg = "end of buffer";
            return false;
        }
        for (size_t i = 0; i < size; ++i) {
            buffer[i] = m_data.front();
            m_data.pop_front();
        }
        return true;
    }
    bool finish(std::string&) override { return true; }
    bool hasPendingInput() override { return !m_data.empty(); }
    bool timedOut() const override { return false; }
    uint32_t streamId() const override { return 0; }

    std::deque<uint8_t> m_data;
};

}  // namespace

TEST(FrameHeaderTest, WireLayoutIsBigEndian) {
    uint8_t buffer[FRAME_HEADER_SIZE];
    FrameHeader(FrameType::FILE_DATA, 0x01020304).serializeToBuffer(buffer);

    EXPECT_EQ(buffer[0], 'F');
    EXPECT_EQ(buffer[1], 'D');
    EXPECT_EQ(buffer[2], 'R');
    EXPECT_EQ(buffer[3], 'P');
    EXPECT_EQ(buffer[4], PROTOCOL_VERSION);
    EXPECT_EQ(buffer[5], 0x05);
    EXPECT_EQ(buffer[8], 0x01);
    EXPECT_EQ(buffer[11], 0x04);
}

TEST(FrameHeaderTest, ValidatesMagicTypeAndLength) {
    FrameHeader header(FrameType::MANIFEST_ACK, 0);
    EXPECT_TRUE(header.isValid());

    header.payloadLength = 1;
    EXPECT_FALSE(header.isValid());

    FrameHeader data(FrameType::FILE_DATA, CHUNK_SIZE);
    EXPECT_TRUE(data.isValid());
    data.payloadLength = CHUNK_SIZE + 1;
    EXPECT_FALSE(data.isValid());

    FrameHeader unknown(FrameType::ABORT, 0);
    unknown.frameType = 0x0A;
    EXPECT_FALSE(unknown.isValid());

    FrameHeader badMagic(FrameType::HELLO, 8);
    badMagic.magic = 0xDEADBEEF;
    EXPECT_FALSE(badMagic.isValid());
}

TEST(FramePayloadTest, FileMarkerRequiresExactLength) {
    FileMarker marker;
    marker.index = 3;
    marker.length = 0x0000000100000000ULL;

    FileMarker decoded;
    ASSERT_TRUE(FileMarker::decode(marker.encode(), decoded));
    EXPECT_EQ(decoded.index, 3u);
    EXPECT_EQ(decoded.length, 0x0000000100000000ULL);

    std::vector<uint8_t> shortPayload = marker.encode();
    shortPayload.pop_back();
    EXPECT_FALSE(FileMarker::decode(shortPayload, decoded));
}

TEST(FramePayloadTest, AbortCarriesErrorKind) {
    const SessionError sent(ErrorKind::ChecksumMismatch, "digest differs for a.txt");
    const SessionError received = decodeAbort(encodeAbort(sent));

    EXPECT_EQ(received.kind, ErrorKind::ChecksumMismatch);
    EXPECT_NE(received.message.find("digest differs for a.txt"), std::string::npos);

    const std::string junk = "{{{";
    EXPECT_EQ(decodeAbort(std::vector<uint8_t>(junk.begin(), junk.end())).kind,
              ErrorKind::ProtocolError);
}

TEST(FramePayloadTest, HelloNonce) {
    uint64_t nonce = 0;
    ASSERT_TRUE(decodeHello(encodeHello(0x1122334455667788ULL), nonce));
    EXPECT_EQ(nonce, 0x1122334455667788ULL);
    EXPECT_FALSE(decodeHello({1, 2, 3}, nonce));
}

TEST(FrameStreamTest, ReadsFramesInOrder) {
    BufferStream stream;
    std::string err;

    ASSERT_TRUE(writeFrame(stream, FrameType::HELLO, encodeHello(9), err));
    ASSERT_TRUE(writeFrame(stream, FrameType::MANIFEST_ACK, nullptr, 0, err));
    const std::vector<uint8_t> big(CHUNK_SIZE, 0xAB);
    ASSERT_TRUE(writeFrame(stream, FrameType::FILE_DATA, big, err));

    Frame frame;
    ASSERT_EQ(readFrame(stream, frame, err), FrameReadResult::Ok);
    EXPECT_EQ(frame.type, FrameType::HELLO);
    ASSERT_EQ(readFrame(stream, frame, err), FrameReadResult::Ok);
    EXPECT_EQ(frame.type, FrameType::MANIFEST_ACK);
    EXPECT_TRUE(frame.payload.empty());
    ASSERT_EQ(readFrame(stream, frame, err), FrameReadResult::Ok);
    EXPECT_EQ(frame.payload, big);

    EXPECT_EQ(readFrame(stream, frame, err), FrameReadResult::IoError);
}

TEST(FrameStreamTest, RejectsGarbageHeader) {
    BufferStream stream;
    for (size_t i = 0; i < FRAME_HEADER_SIZE; ++i) {
        stream.m_data.push_back(0x42);
    }

    Frame frame;
    std::string err;
    EXPECT_EQ(readFrame(stream, frame, err), FrameReadResult::Malformed);
    EXPECT_FALSE(err.empty());
}
