/**
 * @file TcpConnection.h
 * @brief Single-stream TLS/TCP connection (Tcp transport)
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "TlsSocket.h"
#include "TransportStream.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace FastDrop {

/**
 * @brief Connection carrying exactly one ordered stream
 *
 * Files travel back to back on the single stream, delimited by
 * FILE_BEGIN/FILE_END frames. openStream() and acceptStream() both hand out
 * that stream once.
 */
class TcpConnection : public Connection {
public:
    TcpConnection(std::unique_ptr<TlsSocket> tls, PeerIdentity peer);
    ~TcpConnection() override;

    TransportProtocol protocol() const override { return TransportProtocol::Tcp; }
    bool supportsMultiplexing() const override { return false; }

    std::shared_ptr<TransportStream> openStream(std::string& errorMsg) override;
    std::shared_ptr<TransportStream> acceptStream(uint32_t timeoutMs, std::string& errorMsg) override;

    const PeerIdentity& peerIdentity() const override { return m_peer; }
    Endpoint peerAddress() const override { return m_peerAddress; }

    bool isClosed() const override { return m_closed.load(); }
    void setIdleTimeout(uint32_t timeoutMs) override;
    void close() override;
    void closeGracefully(uint32_t lingerMs) override;

private:
    std::shared_ptr<TransportStream> takeStream(std::string& errorMsg);

    std::shared_ptr<TlsSocket> m_tls;
    PeerIdentity m_peer;
    Endpoint m_peerAddress;
    std::mutex m_mutex;
    bool m_streamTaken;
    std::atomic<bool> m_closed;
};

}  // namespace FastDrop
