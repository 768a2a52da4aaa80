/**
 * @file TicketCodec.cpp
 * @brief Ticket serialization
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TicketCodec.h"
#include "fastdrop/config.h"

#include <arpa/inet.h>

#include <cstring>

namespace FastDrop {

//=============================================================================
// Protocol helpers
//=============================================================================

const char* transportProtocolName(TransportProtocol protocol) {
    switch (protocol) {
        case TransportProtocol::Quic: return "Quic";
        case TransportProtocol::Tcp:  return "Tcp";
    }
    return "Unknown";
}

const char* serviceTagFor(TransportProtocol protocol) {
    return protocol == TransportProtocol::Tcp ? TCP_SERVICE_UUID : QUIC_SERVICE_UUID;
}

bool protocolForServiceTag(const std::string& serviceTag, TransportProtocol& out) {
    if (serviceTag == QUIC_SERVICE_UUID) {
        out = TransportProtocol::Quic;
        return true;
    }
    if (serviceTag == TCP_SERVICE_UUID) {
        out = TransportProtocol::Tcp;
        return true;
    }
    return false;
}

namespace {

constexpr uint8_t FAMILY_IPV4 = 4;
constexpr uint8_t FAMILY_IPV6 = 6;

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void putU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(v >> shift));
    }
}

/**
 * @brief Bounds-checked big-endian reader over the ticket bytes
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : m_data(data), m_size(size) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = m_data[m_pos++];
        return true;
    }

    bool u16(uint16_t& v) {
        if (remaining() < 2) return false;
        v = static_cast<uint16_t>((m_data[m_pos] << 8) | m_data[m_pos + 1]);
        m_pos += 2;
        return true;
    }

    bool u64(uint64_t& v) {
        if (remaining() < 8) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | m_data[m_pos++];
        }
        return true;
    }

    bool bytes(uint8_t* out, size_t n) {
        if (remaining() < n) return false;
        std::memcpy(out, m_data + m_pos, n);
        m_pos += n;
        return true;
    }

    size_t remaining() const { return m_size - m_pos; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos = 0;
};

}  // namespace

//=============================================================================
// Encode
//=============================================================================

bool TicketCodec::encode(const SessionTicket& ticket,
                         std::vector<uint8_t>& out,
                         SessionError& error) {
    out.clear();

    if (!ticket.senderIdentity.isValid()) {
        error.set(ErrorKind::TicketMalformed, "Ticket has no sender identity");
        return false;
    }
    if (ticket.endpoints.empty()) {
        error.set(ErrorKind::TicketMalformed, "Ticket has no endpoints");
        return false;
    }
    if (ticket.endpoints.size() > 255) {
        error.set(ErrorKind::TicketTooLarge,
                  "Ticket lists " + std::to_string(ticket.endpoints.size()) + " endpoints");
        return false;
    }

    std::vector<uint8_t> body;
    body.reserve(MAX_TICKET_SIZE);
    body.insert(body.end(), ticket.senderIdentity.bytes().begin(), ticket.senderIdentity.bytes().end());
    putU64(body, ticket.nonce);
    body.push_back(static_cast<uint8_t>(ticket.endpoints.size()));

    for (const Endpoint& ep : ticket.endpoints) {
        uint8_t addr[16];
        if (inet_pton(AF_INET, ep.host.c_str(), addr) == 1) {
            body.push_back(FAMILY_IPV4);
            body.insert(body.end(), addr, addr + 4);
        } else if (inet_pton(AF_INET6, ep.host.c_str(), addr) == 1) {
            body.push_back(FAMILY_IPV6);
            body.insert(body.end(), addr, addr + 16);
        } else {
            error.set(ErrorKind::TicketMalformed, "Endpoint host is not an IP literal: " + ep.host);
            return false;
        }
        putU16(body, ep.port);
    }

    const size_t total = TICKET_PREFIX_SIZE + body.size();
    if (total > MAX_TICKET_SIZE) {
        error.set(ErrorKind::TicketTooLarge,
                  "Encoded ticket is " + std::to_string(total) + " bytes (limit " +
                  std::to_string(MAX_TICKET_SIZE) + ")");
        return false;
    }

    out.reserve(total);
    out.push_back(TICKET_VERSION);
    out.push_back(static_cast<uint8_t>(ticket.protocol));
    putU16(out, static_cast<uint16_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return true;
}

//=============================================================================
// Decode
//=============================================================================

bool TicketCodec::decode(const std::vector<uint8_t>& bytes,
                         SessionTicket& out,
                         SessionError& error) {
    auto malformed = [&error](const std::string& why) {
        error.set(ErrorKind::TicketMalformed, why);
        return false;
    };

    if (bytes.size() > MAX_TICKET_SIZE) {
        return malformed("Ticket is " + std::to_string(bytes.size()) + " bytes");
    }

    Reader reader(bytes.data(), bytes.size());

    uint8_t version = 0;
    uint8_t tag = 0;
    uint16_t bodyLength = 0;
    if (!reader.u8(version) || !reader.u8(tag) || !reader.u16(bodyLength)) {
        return malformed("Truncated ticket header");
    }
    if (version != TICKET_VERSION) {
        return malformed("Unknown ticket version " + std::to_string(version));
    }
    if (tag != static_cast<uint8_t>(TransportProtocol::Quic) &&
        tag != static_cast<uint8_t>(TransportProtocol::Tcp)) {
        return malformed("Unknown protocol tag " + std::to_string(tag));
    }
    if (reader.remaining() < bodyLength) {
        return malformed("Truncated ticket body");
    }
    if (reader.remaining() > bodyLength) {
        return malformed("Trailing bytes after ticket body");
    }

    SessionTicket ticket;
    ticket.protocol = static_cast<TransportProtocol>(tag);

    PeerIdentity::Bytes identity{};
    uint8_t endpointCount = 0;
    if (!reader.bytes(identity.data(), identity.size()) ||
        !reader.u64(ticket.nonce) ||
        !reader.u8(endpointCount)) {
        return malformed("Truncated ticket body");
    }
    ticket.senderIdentity = PeerIdentity::fromBytes(identity);

    if (endpointCount == 0) {
        return malformed("Ticket has no endpoints");
    }

    for (uint8_t i = 0; i < endpointCount; ++i) {
        uint8_t family = 0;
        if (!reader.u8(family)) {
            return malformed("Truncated endpoint");
        }

        uint8_t addr[16];
        char text[INET6_ADDRSTRLEN] = {};
        if (family == FAMILY_IPV4) {
            if (!reader.bytes(addr, 4)) {
                return malformed("Truncated endpoint");
            }
            inet_ntop(AF_INET, addr, text, sizeof(text));
        } else if (family == FAMILY_IPV6) {
            if (!reader.bytes(addr, 16)) {
                return malformed("Truncated endpoint");
            }
            inet_ntop(AF_INET6, addr, text, sizeof(text));
        } else {
            return malformed("Unknown address family " + std::to_string(family));
        }

        uint16_t port = 0;
        if (!reader.u16(port)) {
            return malformed("Truncated endpoint");
        }
        ticket.endpoints.emplace_back(text, port);
    }

    if (reader.remaining() != 0) {
        return malformed("Trailing bytes after endpoints");
    }

    out = std::move(ticket);
    return true;
}

}  // namespace FastDrop
