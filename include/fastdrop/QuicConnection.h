/**
 * @file QuicConnection.h
 * @brief QUIC transport (RFC 9000 over UDP) on the OpenSSL QUIC stack
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "Endpoint.h"
#include "LocalIdentity.h"
#include "SessionError.h"
#include "SocketUtils.h"
#include "TransportStream.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace FastDrop {

/**
 * @brief Whether the linked OpenSSL provides the QUIC client and server APIs
 *
 * The server side (listener objects) needs OpenSSL 3.5. Against an older
 * OpenSSL every Quic bind or dial fails with ConnectFailed.
 */
bool quicTransportAvailable();

/**
 * @brief Sender side of a QUIC session
 *
 * Serves QUIC on an already bound UDP socket and hands out the first
 * dialer that completes the handshake with a client certificate. Later
 * dialers are refused by the accepted connection.
 *
 * Usage:
 *   QuicServer server(identity);
 *   server.listen(std::move(udpSocket), errorMsg);
 *   auto connection = server.acceptOne(0, cancelFlag, error);
 */
class QuicServer {
public:
    explicit QuicServer(std::shared_ptr<const LocalIdentity> identity);
    ~QuicServer();

    QuicServer(const QuicServer&) = delete;
    QuicServer& operator=(const QuicServer&) = delete;

    /**
     * @brief Take ownership of a bound UDP socket and start listening on it
     */
    bool listen(SocketHandle socket, std::string& errorMsg);

    /**
     * @brief Wait for one dialer and complete the QUIC handshake
     *
     * Dialers that fail the handshake are dropped and waiting continues.
     * The socket moves into the returned connection.
     *
     * @param timeoutMs 0 waits until cancelled is set
     * @return Connection, or nullptr with Timeout, Cancelled or ConnectFailed
     */
    std::unique_ptr<Connection> acceptOne(uint32_t timeoutMs, const std::atomic<bool>& cancelled,
                                          SessionError& error);

private:
    struct State;

    std::shared_ptr<const LocalIdentity> m_identity;
    std::unique_ptr<State> m_state;
};

/**
 * @brief Dial one QUIC endpoint and complete the handshake
 *
 * The caller checks peerIdentity() against the identity it expects.
 *
 * @return Connection, or nullptr with Timeout, Cancelled or
 *         ConnectFailed(HandshakeFailed / Other)
 */
std::unique_ptr<Connection> quicConnect(std::shared_ptr<const LocalIdentity> identity,
                                        const Endpoint& endpoint,
                                        uint32_t timeoutMs,
                                        const std::atomic<bool>& cancelled,
                                        SessionError& error);

}  // namespace FastDrop
