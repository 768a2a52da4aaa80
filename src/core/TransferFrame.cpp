/**
 * @file TransferFrame.cpp
 * @brief Frame encoding and decoding
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransferFrame.h"
#include "fastdrop/TransportStream.h"

#include <nlohmann/json.hpp>

namespace FastDrop {

using json = nlohmann::json;

const char* frameTypeName(FrameType type) {
    switch (type) {
        case FrameType::HELLO:             return "HELLO";
        case FrameType::MANIFEST:          return "MANIFEST";
        case FrameType::MANIFEST_ACK:      return "MANIFEST_ACK";
        case FrameType::FILE_BEGIN:        return "FILE_BEGIN";
        case FrameType::FILE_DATA:         return "FILE_DATA";
        case FrameType::FILE_END:          return "FILE_END";
        case FrameType::TRANSFER_DONE:     return "TRANSFER_DONE";
        case FrameType::TRANSFER_DONE_ACK: return "TRANSFER_DONE_ACK";
        case FrameType::ABORT:             return "ABORT";
    }
    return "UNKNOWN";
}

size_t maxPayloadFor(FrameType type) {
    switch (type) {
        case FrameType::MANIFEST:
            return MAX_MANIFEST_BYTES;
        case FrameType::FILE_DATA:
            return CHUNK_SIZE;
        case FrameType::MANIFEST_ACK:
        case FrameType::TRANSFER_DONE:
        case FrameType::TRANSFER_DONE_ACK:
            return 0;
        default:
            return MAX_CONTROL_PAYLOAD_BYTES;
    }
}

bool FrameHeader::isValid() const {
    if (magic != FRAME_MAGIC || version != PROTOCOL_VERSION) {
        return false;
    }
    if (frameType < static_cast<uint8_t>(FrameType::HELLO) ||
        frameType > static_cast<uint8_t>(FrameType::ABORT)) {
        return false;
    }
    return payloadLength <= maxPayloadFor(getFrameType());
}

//=============================================================================
// Payloads
//=============================================================================

std::vector<uint8_t> FileMarker::encode() const {
    std::vector<uint8_t> out(12);
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(index >> (24 - 8 * i));
    }
    for (int i = 0; i < 8; ++i) {
        out[4 + i] = static_cast<uint8_t>(length >> (56 - 8 * i));
    }
    return out;
}

bool FileMarker::decode(const std::vector<uint8_t>& payload, FileMarker& out) {
    if (payload.size() != 12) {
        return false;
    }
    out.index = 0;
    for (int i = 0; i < 4; ++i) {
        out.index = (out.index << 8) | payload[i];
    }
    out.length = 0;
    for (int i = 0; i < 8; ++i) {
        out.length = (out.length << 8) | payload[4 + i];
    }
    return true;
}

std::vector<uint8_t> encodeAbort(const SessionError& error) {
    json j;
    j["kind"] = errorKindName(error.kind);
    j["code"] = error.code();
    std::string message = error.message;
    if (message.size() > MAX_CONTROL_PAYLOAD_BYTES / 2) {
        message.resize(MAX_CONTROL_PAYLOAD_BYTES / 2);
    }
    j["message"] = message;
    // Replace invalid UTF-8 rather than throwing
    const std::string text = j.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<uint8_t>(text.begin(), text.end());
}

SessionError decodeAbort(const std::vector<uint8_t>& payload) {
    try {
        const json j = json::parse(payload.begin(), payload.end());
        SessionError error(errorKindFromName(j.value("kind", std::string())),
                           "peer aborted: " + j.value("message", std::string()));
        return error;
    } catch (const json::exception&) {
        return SessionError(ErrorKind::ProtocolError, "peer aborted with a malformed reason");
    }
}

std::vector<uint8_t> encodeHello(uint64_t nonce) {
    std::vector<uint8_t> out(8);
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(nonce >> (56 - 8 * i));
    }
    return out;
}

bool decodeHello(const std::vector<uint8_t>& payload, uint64_t& nonce) {
    if (payload.size() != 8) {
        return false;
    }
    nonce = 0;
    for (uint8_t b : payload) {
        nonce = (nonce << 8) | b;
    }
    return true;
}

//=============================================================================
// Stream I/O
//=============================================================================

bool writeFrame(TransportStream& stream, FrameType type,
                const uint8_t* payload, size_t size, std::string& errorMsg) {
    uint8_t header[FRAME_HEADER_SIZE];
    FrameHeader(type, static_cast<uint32_t>(size)).serializeToBuffer(header);

    if (size == 0) {
        return stream.sendExact(header, FRAME_HEADER_SIZE, errorMsg);
    }

    // One write per frame keeps small frames in one TLS record
    if (size <= MAX_CONTROL_PAYLOAD_BYTES) {
        uint8_t buffer[FRAME_HEADER_SIZE + MAX_CONTROL_PAYLOAD_BYTES];
        std::memcpy(buffer, header, FRAME_HEADER_SIZE);
        std::memcpy(buffer + FRAME_HEADER_SIZE, payload, size);
        return stream.sendExact(buffer, FRAME_HEADER_SIZE + size, errorMsg);
    }

    return stream.sendExact(header, FRAME_HEADER_SIZE, errorMsg) &&
           stream.sendExact(payload, size, errorMsg);
}

FrameReadResult readFrame(TransportStream& stream, Frame& out, std::string& errorMsg) {
    uint8_t buffer[FRAME_HEADER_SIZE];
    if (!stream.recvExact(buffer, FRAME_HEADER_SIZE, errorMsg)) {
        return FrameReadResult::IoError;
    }

    FrameHeader header;
    header.deserializeFromBuffer(buffer);
    if (!header.isValid()) {
        errorMsg = "Malformed frame header (type " + std::to_string(header.frameType) +
                   ", length " + std::to_string(header.payloadLength) + ")";
        return FrameReadResult::Malformed;
    }

    out.type = header.getFrameType();
    out.payload.resize(header.payloadLength);
    if (header.payloadLength > 0 &&
        !stream.recvExact(out.payload.data(), header.payloadLength, errorMsg)) {
        return FrameReadResult::IoError;
    }
    return FrameReadResult::Ok;
}

}  // namespace FastDrop
