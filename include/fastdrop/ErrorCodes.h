/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace FastDrop {
namespace ErrorCodes {

// Discovery
inline constexpr const char* RADIO_UNAVAILABLE = "FD-RADIO-1000";
inline constexpr const char* PEER_NOT_FOUND = "FD-RADIO-1001";

// Ticket codec
inline constexpr const char* TICKET_TOO_LARGE = "FD-TICKET-1100";
inline constexpr const char* TICKET_MALFORMED = "FD-TICKET-1101";

// Transport
inline constexpr const char* CONNECT_FAILED = "FD-NET-1200";
inline constexpr const char* TIMEOUT = "FD-NET-1201";
inline constexpr const char* CONNECTION_LOST = "FD-NET-1202";
inline constexpr const char* IDENTITY_MISMATCH = "FD-NET-1300";

// Transfer protocol
inline constexpr const char* MANIFEST_INVALID = "FD-XFER-1400";
inline constexpr const char* TRUNCATED_TRANSFER = "FD-XFER-1401";
inline constexpr const char* CHECKSUM_MISMATCH = "FD-XFER-1402";
inline constexpr const char* PROTOCOL_ERROR = "FD-XFER-1403";
inline constexpr const char* FILE_ACCESS = "FD-XFER-1500";

// Session
inline constexpr const char* CANCELLED = "FD-SESS-1600";
inline constexpr const char* INTERNAL_ERROR = "FD-SESS-1900";

}  // namespace ErrorCodes
}  // namespace FastDrop
