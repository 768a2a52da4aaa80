/**
 * @file TransferFrame.h
 * @brief Binary framing of the transfer protocol
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "SessionError.h"
#include "config.h"

#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace FastDrop {

class TransportStream;

/**
 * @brief Frame types of the FastDrop transfer protocol
 */
enum class FrameType : uint8_t {
    HELLO = 0x01,              ///< Receiver proves it read the ticket (nonce)
    MANIFEST = 0x02,           ///< Sender offers the manifest (JSON)
    MANIFEST_ACK = 0x03,       ///< Receiver accepted the manifest
    FILE_BEGIN = 0x04,         ///< Start of one file: index + declared length
    FILE_DATA = 0x05,          ///< Up to CHUNK_SIZE bytes of file content
    FILE_END = 0x06,           ///< End of one file: index + bytes actually sent
    TRANSFER_DONE = 0x07,      ///< Sender finished every entry
    TRANSFER_DONE_ACK = 0x08,  ///< Receiver verified every entry
    ABORT = 0x09               ///< Either side gives up (JSON reason)
};

const char* frameTypeName(FrameType type);

/**
 * @brief Fixed 12-byte frame header
 *
 * Header Layout:
 * - Offset 0-3:  Magic number FRAME_MAGIC ("FDRP")
 * - Offset 4:    Protocol version
 * - Offset 5:    Frame type
 * - Offset 6-7:  Reserved (zero)
 * - Offset 8-11: Payload length
 *
 * All integer fields use network byte order (Big-Endian).
 */
#pragma pack(push, 1)
struct FrameHeader {
    uint32_t magic;
    uint8_t version;
    uint8_t frameType;
    uint16_t reserved;
    uint32_t payloadLength;

    FrameHeader() {
        std::memset(this, 0, sizeof(FrameHeader));
    }

    FrameHeader(FrameType type, uint32_t length)
        : magic(FRAME_MAGIC)
        , version(PROTOCOL_VERSION)
        , frameType(static_cast<uint8_t>(type))
        , reserved(0)
        , payloadLength(length) {}

    void serializeToBuffer(uint8_t* buffer) const {
        FrameHeader networkHeader = *this;
        networkHeader.magic = htonl(magic);
        networkHeader.reserved = htons(reserved);
        networkHeader.payloadLength = htonl(payloadLength);
        std::memcpy(buffer, &networkHeader, sizeof(FrameHeader));
    }

    void deserializeFromBuffer(const uint8_t* buffer) {
        std::memcpy(this, buffer, sizeof(FrameHeader));
        magic = ntohl(magic);
        reserved = ntohs(reserved);
        payloadLength = ntohl(payloadLength);
    }

    /**
     * @brief Magic, version, known type and a payload within the type's limit
     */
    bool isValid() const;

    FrameType getFrameType() const { return static_cast<FrameType>(frameType); }
};
#pragma pack(pop)

static_assert(sizeof(FrameHeader) == FRAME_HEADER_SIZE,
              "FrameHeader wire layout must be exactly FRAME_HEADER_SIZE bytes");

/**
 * @brief Largest payload accepted for a frame type
 */
size_t maxPayloadFor(FrameType type);

/**
 * @brief One decoded frame
 */
struct Frame {
    FrameType type = FrameType::ABORT;
    std::vector<uint8_t> payload;
};

/**
 * @brief FILE_BEGIN / FILE_END payload: entry index and a length
 */
struct FileMarker {
    uint32_t index = 0;
    uint64_t length = 0;

    std::vector<uint8_t> encode() const;
    static bool decode(const std::vector<uint8_t>& payload, FileMarker& out);
};

/**
 * @brief ABORT payload builder / parser
 */
std::vector<uint8_t> encodeAbort(const SessionError& error);
SessionError decodeAbort(const std::vector<uint8_t>& payload);

/// HELLO payload: the ticket nonce
std::vector<uint8_t> encodeHello(uint64_t nonce);
bool decodeHello(const std::vector<uint8_t>& payload, uint64_t& nonce);

/**
 * @brief Write one frame (header + payload) to a stream
 */
bool writeFrame(TransportStream& stream, FrameType type,
                const uint8_t* payload, size_t size, std::string& errorMsg);

inline bool writeFrame(TransportStream& stream, FrameType type,
                       const std::vector<uint8_t>& payload, std::string& errorMsg) {
    return writeFrame(stream, type, payload.data(), payload.size(), errorMsg);
}

/**
 * @brief Result of readFrame()
 */
enum class FrameReadResult {
    Ok,
    IoError,   ///< Stream failed (see stream.timedOut())
    Malformed  ///< Bad magic, version, type or oversized payload
};

/**
 * @brief Read one frame; payload limited by maxPayloadFor(type)
 */
FrameReadResult readFrame(TransportStream& stream, Frame& out, std::string& errorMsg);

}  // namespace FastDrop
