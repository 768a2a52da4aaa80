/**
 * @file SessionError.h
 * @brief Error taxonomy shared by every FastDrop component
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <string>

namespace FastDrop {

/**
 * @brief Kind of failure that ends (or prevents) a session
 */
enum class ErrorKind {
    None,
    RadioUnavailable,   ///< Radio adapter cannot be enabled or is busy
    TicketTooLarge,     ///< Encoded ticket exceeds MAX_TICKET_SIZE
    TicketMalformed,    ///< Ticket bytes cannot be decoded
    ConnectFailed,      ///< Bind, dial or handshake failed (see NetworkErrorKind)
    Timeout,            ///< No progress within the bounded timeout
    IdentityMismatch,   ///< Handshake identity differs from the ticket
    ManifestInvalid,    ///< Manifest failed to parse or validate
    TruncatedTransfer,  ///< Streamed length differs from declared length
    ConnectionLost,     ///< I/O failure on an established connection
    ChecksumMismatch,   ///< Received content does not match the manifest digest
    ProtocolError,      ///< Peer sent an unexpected or malformed frame
    FileAccess,         ///< Local file could not be read or written
    PeerNotFound,       ///< Scan ended without a selected peer
    Cancelled           ///< Caller cancelled the session
};

/**
 * @brief Inner network error carried by ConnectFailed
 */
enum class NetworkErrorKind {
    None,
    BindFailed,
    Refused,
    Unreachable,
    HandshakeFailed,
    Other
};

/**
 * @brief Terminal error surfaced by a session
 *
 * Functions that can fail take a SessionError& and return false (or a null
 * pointer); the first failure recorded wins.
 */
struct SessionError {
    ErrorKind kind = ErrorKind::None;
    NetworkErrorKind network = NetworkErrorKind::None;
    std::string message;

    SessionError() = default;
    SessionError(ErrorKind k, std::string msg,
                 NetworkErrorKind net = NetworkErrorKind::None)
        : kind(k), network(net), message(std::move(msg)) {}

    bool isSet() const { return kind != ErrorKind::None; }

    /// Record an error unless one is already recorded
    void set(ErrorKind k, const std::string& msg,
             NetworkErrorKind net = NetworkErrorKind::None) {
        if (isSet()) {
            return;
        }
        kind = k;
        network = net;
        message = msg;
    }

    void clear() {
        kind = ErrorKind::None;
        network = NetworkErrorKind::None;
        message.clear();
    }

    /// Stable user-visible code (e.g. "FD-NET-1300")
    const char* code() const;

    /// "[FD-XFER-1401] TruncatedTransfer: ..." for display and logs
    std::string toString() const;
};

/**
 * @brief Name of an error kind ("TruncatedTransfer")
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Parse an error kind name; unknown names map to ProtocolError
 */
ErrorKind errorKindFromName(const std::string& name);

/**
 * @brief Name of a network error kind ("Refused")
 */
const char* networkErrorKindName(NetworkErrorKind kind);

/**
 * @brief Whether a failure of this kind must be reported as an unsafe transfer
 *
 * Identity and integrity failures are never downgraded to warnings.
 */
bool isIntegrityFailure(ErrorKind kind);

}  // namespace FastDrop
