/**
 * @file SessionError.cpp
 * @brief Error taxonomy names and codes
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/SessionError.h"
#include "fastdrop/ErrorCodes.h"

namespace FastDrop {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::RadioUnavailable:  return "RadioUnavailable";
        case ErrorKind::TicketTooLarge:    return "TicketTooLarge";
        case ErrorKind::TicketMalformed:   return "TicketMalformed";
        case ErrorKind::ConnectFailed:     return "ConnectFailed";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::IdentityMismatch:  return "IdentityMismatch";
        case ErrorKind::ManifestInvalid:   return "ManifestInvalid";
        case ErrorKind::TruncatedTransfer: return "TruncatedTransfer";
        case ErrorKind::ConnectionLost:    return "ConnectionLost";
        case ErrorKind::ChecksumMismatch:  return "ChecksumMismatch";
        case ErrorKind::ProtocolError:     return "ProtocolError";
        case ErrorKind::FileAccess:        return "FileAccess";
        case ErrorKind::PeerNotFound:      return "PeerNotFound";
        case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

ErrorKind errorKindFromName(const std::string& name) {
    static const ErrorKind kAll[] = {
        ErrorKind::RadioUnavailable, ErrorKind::TicketTooLarge,
        ErrorKind::TicketMalformed, ErrorKind::ConnectFailed,
        ErrorKind::Timeout, ErrorKind::IdentityMismatch,
        ErrorKind::ManifestInvalid, ErrorKind::TruncatedTransfer,
        ErrorKind::ConnectionLost, ErrorKind::ChecksumMismatch,
        ErrorKind::ProtocolError, ErrorKind::FileAccess,
        ErrorKind::PeerNotFound, ErrorKind::Cancelled
    };
    for (ErrorKind kind : kAll) {
        if (name == errorKindName(kind)) {
            return kind;
        }
    }
    return ErrorKind::ProtocolError;
}

const char* networkErrorKindName(NetworkErrorKind kind) {
    switch (kind) {
        case NetworkErrorKind::None:            return "None";
        case NetworkErrorKind::BindFailed:      return "BindFailed";
        case NetworkErrorKind::Refused:         return "Refused";
        case NetworkErrorKind::Unreachable:     return "Unreachable";
        case NetworkErrorKind::HandshakeFailed: return "HandshakeFailed";
        case NetworkErrorKind::Other:           return "Other";
    }
    return "Other";
}

bool isIntegrityFailure(ErrorKind kind) {
    return kind == ErrorKind::IdentityMismatch ||
           kind == ErrorKind::ChecksumMismatch ||
           kind == ErrorKind::TruncatedTransfer;
}

const char* SessionError::code() const {
    switch (kind) {
        case ErrorKind::None:              return "";
        case ErrorKind::RadioUnavailable:  return ErrorCodes::RADIO_UNAVAILABLE;
        case ErrorKind::TicketTooLarge:    return ErrorCodes::TICKET_TOO_LARGE;
        case ErrorKind::TicketMalformed:   return ErrorCodes::TICKET_MALFORMED;
        case ErrorKind::ConnectFailed:     return ErrorCodes::CONNECT_FAILED;
        case ErrorKind::Timeout:           return ErrorCodes::TIMEOUT;
        case ErrorKind::IdentityMismatch:  return ErrorCodes::IDENTITY_MISMATCH;
        case ErrorKind::ManifestInvalid:   return ErrorCodes::MANIFEST_INVALID;
        case ErrorKind::TruncatedTransfer: return ErrorCodes::TRUNCATED_TRANSFER;
        case ErrorKind::ConnectionLost:    return ErrorCodes::CONNECTION_LOST;
        case ErrorKind::ChecksumMismatch:  return ErrorCodes::CHECKSUM_MISMATCH;
        case ErrorKind::ProtocolError:     return ErrorCodes::PROTOCOL_ERROR;
        case ErrorKind::FileAccess:        return ErrorCodes::FILE_ACCESS;
        case ErrorKind::PeerNotFound:      return ErrorCodes::PEER_NOT_FOUND;
        case ErrorKind::Cancelled:         return ErrorCodes::CANCELLED;
    }
    return ErrorCodes::INTERNAL_ERROR;
}

std::string SessionError::toString() const {
    if (!isSet()) {
        return "no error";
    }

    std::string out = "[";
    out += code();
    out += "] ";
    out += errorKindName(kind);
    if (kind == ErrorKind::ConnectFailed && network != NetworkErrorKind::None) {
        out += "(";
        out += networkErrorKindName(network);
        out += ")";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

}  // namespace FastDrop
