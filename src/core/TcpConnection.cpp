/**
 * @file TcpConnection.cpp
 * @brief Single-stream TLS/TCP connection
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TcpConnection.h"
#include "fastdrop/Debug.h"
#include "fastdrop/SocketUtils.h"

namespace FastDrop {

namespace {

class TcpStream : public TransportStream {
public:
    explicit TcpStream(std::shared_ptr<TlsSocket> tls) : m_tls(std::move(tls)) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override {
        return m_tls->sendExact(data, size, errorMsg);
    }

    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        return m_tls->recvExact(buffer, size, errorMsg);
    }

    // TLS has no half-close short of close_notify; frames delimit the data
    bool finish(std::string&) override { return true; }

    bool hasPendingInput() override { return m_tls->hasPendingInput(); }
    bool timedOut() const override { return m_tls->lastIoTimedOut(); }
    uint32_t streamId() const override { return 0; }

private:
    std::shared_ptr<TlsSocket> m_tls;
};

}  // namespace

TcpConnection::TcpConnection(std::unique_ptr<TlsSocket> tls, PeerIdentity peer)
    : m_tls(std::move(tls))
    , m_peer(peer)
    , m_streamTaken(false)
    , m_closed(false)
{
    m_peerAddress = m_tls->peerEndpoint();
    setNoDelay(m_tls->fd());
}

TcpConnection::~TcpConnection() {
    close();
}

std::shared_ptr<TransportStream> TcpConnection::takeStream(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed.load()) {
        errorMsg = "Connection closed";
        return nullptr;
    }
    if (m_streamTaken) {
        errorMsg = "Tcp connection carries a single stream";
        return nullptr;
    }
    m_streamTaken = true;
    return std::make_shared<TcpStream>(m_tls);
}

std::shared_ptr<TransportStream> TcpConnection::openStream(std::string& errorMsg) {
    return takeStream(errorMsg);
}

std::shared_ptr<TransportStream> TcpConnection::acceptStream(uint32_t, std::string& errorMsg) {
    return takeStream(errorMsg);
}

void TcpConnection::setIdleTimeout(uint32_t timeoutMs) {
    if (!setSocketTimeouts(m_tls->fd(), timeoutMs, timeoutMs)) {
        LOG_WARNING("Failed to set idle timeout on Tcp connection");
    }
}

void TcpConnection::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    m_tls->interrupt();
}

void TcpConnection::closeGracefully(uint32_t lingerMs) {
    if (m_closed.exchange(true)) {
        return;
    }
    m_tls->shutdown();
    lingerUntilPeerCloses(m_tls->fd(), lingerMs);
}

}  // namespace FastDrop
