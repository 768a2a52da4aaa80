/**
 * @file TicketCodec.h
 * @brief Versioned, length-prefixed binary encoding of SessionTicket
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "SessionError.h"
#include "SessionTicket.h"

#include <cstdint>
#include <vector>

namespace FastDrop {

/**
 * @class TicketCodec
 * @brief Encodes tickets into at most MAX_TICKET_SIZE bytes
 *
 * Layout (big-endian):
 * - Offset 0: version (TICKET_VERSION)
 * - Offset 1: protocol tag (TransportProtocol)
 * - Offset 2-3: body length
 * - Body: identity (32 bytes), nonce (8 bytes), endpoint count (1 byte),
 *   then per endpoint: family (4 or 6), address (4 or 16 bytes), port (2 bytes)
 *
 * decode(encode(t)) == t for every ticket encode() accepts.
 */
class TicketCodec {
public:
    /**
     * @brief Serialize a ticket
     * @return false with TicketTooLarge if the result would exceed
     *         MAX_TICKET_SIZE, or TicketMalformed if the ticket itself is
     *         invalid (no endpoints, no identity, non-numeric host)
     */
    static bool encode(const SessionTicket& ticket,
                       std::vector<uint8_t>& out,
                       SessionError& error);

    /**
     * @brief Parse a ticket
     * @return false with TicketMalformed for truncated input, an unknown
     *         version, an unknown protocol tag or inconsistent lengths
     */
    static bool decode(const std::vector<uint8_t>& bytes,
                       SessionTicket& out,
                       SessionError& error);
};

}  // namespace FastDrop
