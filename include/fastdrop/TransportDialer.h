/**
 * @file TransportDialer.h
 * @brief Receiver side of the connection: dial the ticket endpoints
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "LocalIdentity.h"
#include "SessionError.h"
#include "SessionTicket.h"
#include "TransportStream.h"

#include <atomic>
#include <memory>

namespace FastDrop {

/**
 * @brief Connects to a sender and authenticates it against the ticket
 *
 * Quic tickets are dialed over QUIC (UDP), Tcp tickets over TLS on TCP.
 * Endpoints are tried in ticket order within one overall deadline. The
 * certificate identity of the answering peer must equal
 * ticket.senderIdentity; otherwise the connection is dropped with
 * IdentityMismatch and no further endpoint is tried.
 */
class TransportDialer {
public:
    explicit TransportDialer(std::shared_ptr<const LocalIdentity> identity);

    TransportDialer(const TransportDialer&) = delete;
    TransportDialer& operator=(const TransportDialer&) = delete;

    /**
     * @brief Dial the sender described by ticket
     *
     * @param timeoutMs Overall bound for connect and handshake
     * @return Connection, or nullptr with ConnectFailed(kind), Timeout,
     *         IdentityMismatch or Cancelled
     */
    std::unique_ptr<Connection> dial(const SessionTicket& ticket, uint32_t timeoutMs, SessionError& error);

    /**
     * @brief Abort dial() from another thread
     */
    void cancel();

private:
    /// TCP connect plus TLS handshake to one endpoint
    std::unique_ptr<Connection> dialTcp(const Endpoint& endpoint, uint32_t timeoutMs, SessionError& error);

    std::shared_ptr<const LocalIdentity> m_identity;
    std::atomic<bool> m_cancelled;
    std::atomic<int> m_activeFd;
};

}  // namespace FastDrop
