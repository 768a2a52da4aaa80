/**
 * @file SessionTicket.h
 * @brief Connection ticket exchanged over the discovery channel
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "Endpoint.h"
#include "PeerIdentity.h"

#include <cstdint>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @brief Stream transport chosen for a session
 *
 * Values are the ticket wire tags.
 */
enum class TransportProtocol : uint8_t {
    Quic = 0x01,  ///< Multiplexed streams, one per file
    Tcp = 0x02    ///< Single ordered stream with per-file length framing
};

const char* transportProtocolName(TransportProtocol protocol);

/// Service tag a sender advertises for its chosen transport
const char* serviceTagFor(TransportProtocol protocol);

/// Reverse of serviceTagFor(); false for foreign tags
bool protocolForServiceTag(const std::string& serviceTag, TransportProtocol& out);

/**
 * @brief Everything a receiver needs to dial and verify a sender
 *
 * Built once by the sender after its listener is bound; never mutated.
 */
struct SessionTicket {
    TransportProtocol protocol = TransportProtocol::Quic;
    PeerIdentity senderIdentity;
    std::vector<Endpoint> endpoints;
    uint64_t nonce = 0;  ///< Random per session, echoed by the receiver in HELLO

    bool operator==(const SessionTicket& other) const {
        return protocol == other.protocol &&
               senderIdentity == other.senderIdentity &&
               endpoints == other.endpoints &&
               nonce == other.nonce;
    }
    bool operator!=(const SessionTicket& other) const { return !(*this == other); }
};

}  // namespace FastDrop
