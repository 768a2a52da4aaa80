/**
 * @file TransportDialer.cpp
 * @brief Outgoing connection with sender identity verification
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransportDialer.h"
#include "fastdrop/Debug.h"
#include "fastdrop/QuicConnection.h"
#include "fastdrop/SocketUtils.h"
#include "fastdrop/TcpConnection.h"
#include "fastdrop/TlsSocket.h"

#include <chrono>

namespace FastDrop {

TransportDialer::TransportDialer(std::shared_ptr<const LocalIdentity> identity)
    : m_identity(std::move(identity))
    , m_cancelled(false)
    , m_activeFd(INVALID_SOCKET_FD)
{
}

std::unique_ptr<Connection> TransportDialer::dial(const SessionTicket& ticket, uint32_t timeoutMs,
                                                  SessionError& error) {
    if (ticket.endpoints.empty()) {
        error.set(ErrorKind::TicketMalformed, "Ticket carries no endpoints");
        return nullptr;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    SessionError lastError;

    for (const Endpoint& endpoint : ticket.endpoints) {
        if (m_cancelled.load()) {
            error.set(ErrorKind::Cancelled, "Dial cancelled");
            return nullptr;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            lastError = SessionError(ErrorKind::Timeout,
                                     "Could not reach the sender within " + std::to_string(timeoutMs) + " ms");
            break;
        }

        LOG_DEBUG("Dialing " << endpoint << " (" << transportProtocolName(ticket.protocol) << ")");

        SessionError attemptError;
        std::unique_ptr<Connection> connection =
            (ticket.protocol == TransportProtocol::Quic)
                ? quicConnect(m_identity, endpoint, static_cast<uint32_t>(remaining), m_cancelled, attemptError)
                : dialTcp(endpoint, static_cast<uint32_t>(remaining), attemptError);
        if (!connection) {
            if (attemptError.kind == ErrorKind::Cancelled || m_cancelled.load()) {
                error.set(ErrorKind::Cancelled, "Dial cancelled");
                return nullptr;
            }
            LOG_DEBUG("Endpoint " << endpoint << " failed: " << attemptError.message);
            lastError = attemptError;
            continue;
        }

        // Never proceed with a peer other than the one the ticket names
        const PeerIdentity& peer = connection->peerIdentity();
        if (peer != ticket.senderIdentity) {
            LOG_ERROR("Identity mismatch at " << endpoint << ": expected " << ticket.senderIdentity.shortId()
                      << ", got " << peer.shortId());
            error.set(ErrorKind::IdentityMismatch,
                      "Peer at " + endpoint.toString() + " presented identity " + peer.toDisplayString() +
                      ", ticket expects " + ticket.senderIdentity.toDisplayString());
            connection->close();
            return nullptr;
        }

        LOG_INFO("Connected to " << endpoint << " over " << transportProtocolName(ticket.protocol)
                 << " (sender " << peer.shortId() << ")");
        return connection;
    }

    if (!lastError.isSet()) {
        lastError = SessionError(ErrorKind::ConnectFailed, "No endpoint reachable", NetworkErrorKind::Unreachable);
    }
    error.set(lastError.kind, lastError.message, lastError.network);
    return nullptr;
}

std::unique_ptr<Connection> TransportDialer::dialTcp(const Endpoint& endpoint, uint32_t timeoutMs,
                                                     SessionError& error) {
    SocketHandle sock;
    if (!connectWithTimeout(endpoint, timeoutMs, &m_cancelled, sock, error)) {
        return nullptr;
    }

    // Handshake shares the remaining connect time
    setSocketTimeouts(sock.get(), timeoutMs, timeoutMs);
    tuneSocketBuffers(sock.get());

    m_activeFd.store(sock.get());
    auto tls = std::make_unique<TlsSocket>(std::move(sock), TlsRole::CLIENT, m_identity);
    std::string tlsError;
    const bool handshakeOk = tls->handshake(tlsError);
    m_activeFd.store(INVALID_SOCKET_FD);

    if (m_cancelled.load()) {
        error.set(ErrorKind::Cancelled, "Dial cancelled");
        return nullptr;
    }
    if (!handshakeOk) {
        if (tls->handshakeTimedOut()) {
            error.set(ErrorKind::Timeout, "TLS handshake with " + endpoint.toString() + " timed out");
        } else {
            error.set(ErrorKind::ConnectFailed, tlsError, NetworkErrorKind::HandshakeFailed);
        }
        return nullptr;
    }

    PeerIdentity peer;
    if (!tls->getPeerIdentity(peer, tlsError)) {
        error.set(ErrorKind::ConnectFailed, tlsError, NetworkErrorKind::HandshakeFailed);
        return nullptr;
    }

    setSocketTimeouts(tls->fd(), 0, 0);
    return std::make_unique<TcpConnection>(std::move(tls), peer);
}

void TransportDialer::cancel() {
    m_cancelled.store(true);
    const int fd = m_activeFd.load();
    if (fd != INVALID_SOCKET_FD) {
        shutdownSocket(fd);
    }
}

}  // namespace FastDrop
