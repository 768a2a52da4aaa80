/**
 * @file TransportListener.h
 * @brief Sender side of the connection: bind an ephemeral port, accept one peer
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "LocalIdentity.h"
#include "QuicConnection.h"
#include "SessionError.h"
#include "SocketUtils.h"
#include "TransportStream.h"

#include <atomic>
#include <memory>
#include <vector>

namespace FastDrop {

/**
 * @brief Accepts exactly one authenticated connection for one session
 *
 * Usage:
 *   TransportListener listener(identity);
 *   listener.bind(TransportProtocol::Tcp, "0.0.0.0", error);
 *   // advertise listener.reachableEndpoints() in the ticket
 *   auto connection = listener.acceptOne(0, error);
 *
 * The listener never authenticates the dialer by certificate: the receiver
 * proves it read the ticket by echoing its nonce in the first frame.
 */
class TransportListener {
public:
    explicit TransportListener(std::shared_ptr<const LocalIdentity> identity);
    ~TransportListener();

    TransportListener(const TransportListener&) = delete;
    TransportListener& operator=(const TransportListener&) = delete;

    /**
     * @brief Bind an ephemeral port on bindAddress and start listening
     *
     * Tcp binds a TCP socket; Quic binds a UDP socket served by QuicServer.
     * Failure is ConnectFailed(BindFailed).
     */
    bool bind(TransportProtocol protocol, const std::string& bindAddress, SessionError& error);

    /// Bound address and OS-assigned port
    Endpoint localEndpoint() const { return m_localEndpoint; }

    /**
     * @brief Addresses a receiver can dial
     *
     * A wildcard bind expands to every non-loopback IPv4 interface address
     * (loopback if there is none).
     */
    std::vector<Endpoint> reachableEndpoints() const;

    /**
     * @brief Wait for one dialer and complete the TLS or QUIC handshake
     *
     * Dialers that fail the handshake are dropped and waiting continues.
     * The listening socket is closed once a connection is accepted.
     *
     * @param timeoutMs 0 waits until cancel()
     * @return Connection, or nullptr with Timeout, Cancelled or ConnectFailed
     */
    std::unique_ptr<Connection> acceptOne(uint32_t timeoutMs, SessionError& error);

    /**
     * @brief Abort acceptOne() from another thread
     */
    void cancel();

private:
    std::shared_ptr<const LocalIdentity> m_identity;
    SocketHandle m_listenSocket;
    std::unique_ptr<QuicServer> m_quic;
    Endpoint m_localEndpoint;
    std::atomic<bool> m_cancelled;
    std::atomic<int> m_handshakeFd;
};

}  // namespace FastDrop
