/**
 * @file TransportListener.cpp
 * @brief Ephemeral-port listener for one incoming session
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransportListener.h"
#include "fastdrop/Debug.h"
#include "fastdrop/TcpConnection.h"
#include "fastdrop/TlsSocket.h"
#include "fastdrop/config.h"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>

namespace FastDrop {

namespace {
    /// Pending dialers queued by the kernel; only one is ever served
    constexpr int LISTEN_BACKLOG = 8;

    bool isWildcardHost(const std::string& host) {
        return host == "0.0.0.0" || host == "::";
    }
}

TransportListener::TransportListener(std::shared_ptr<const LocalIdentity> identity)
    : m_identity(std::move(identity))
    , m_cancelled(false)
    , m_handshakeFd(INVALID_SOCKET_FD)
{
}

TransportListener::~TransportListener() {
    cancel();
}

//=============================================================================
// TransportListener: bind()
//=============================================================================

bool TransportListener::bind(TransportProtocol protocol, const std::string& bindAddress, SessionError& error) {
    std::string host;
    if (!canonicalizeHost(bindAddress, host)) {
        error.set(ErrorKind::ConnectFailed, "Bind address is not a numeric IP: " + bindAddress,
                  NetworkErrorKind::BindFailed);
        return false;
    }

    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!endpointToSockaddr(Endpoint(host, 0), addr, addrLen)) {
        error.set(ErrorKind::ConnectFailed, "Unsupported bind address: " + host,
                  NetworkErrorKind::BindFailed);
        return false;
    }

    const bool datagram = (protocol == TransportProtocol::Quic);
    SocketHandle sock(::socket(addr.ss_family, (datagram ? SOCK_DGRAM : SOCK_STREAM) | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        error.set(ErrorKind::ConnectFailed, "socket() failed: " + socketErrorString(errno),
                  NetworkErrorKind::BindFailed);
        return false;
    }

    // Port 0: the OS assigns a free ephemeral port
    if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        error.set(ErrorKind::ConnectFailed,
                  "bind(" + host + ", port=0) failed: " + socketErrorString(errno),
                  NetworkErrorKind::BindFailed);
        return false;
    }

    if (!datagram && ::listen(sock.get(), LISTEN_BACKLOG) != 0) {
        error.set(ErrorKind::ConnectFailed, "listen() failed: " + socketErrorString(errno),
                  NetworkErrorKind::BindFailed);
        return false;
    }

    // Read back the OS-assigned port
    sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) != 0) {
        error.set(ErrorKind::ConnectFailed, "getsockname() failed: " + socketErrorString(errno),
                  NetworkErrorKind::BindFailed);
        return false;
    }

    if (!setNonBlocking(sock.get(), true)) {
        error.set(ErrorKind::ConnectFailed, "Failed to set non-blocking mode",
                  NetworkErrorKind::BindFailed);
        return false;
    }

    if (datagram) {
        tuneSocketBuffers(sock.get());
        auto quic = std::make_unique<QuicServer>(m_identity);
        std::string quicError;
        if (!quic->listen(std::move(sock), quicError)) {
            error.set(ErrorKind::ConnectFailed, quicError, NetworkErrorKind::BindFailed);
            return false;
        }
        m_quic = std::move(quic);
    } else {
        m_listenSocket = std::move(sock);
    }
    m_localEndpoint = sockaddrToEndpoint(bound);
    LOG_INFO("Listening for " << transportProtocolName(protocol) << " on " << m_localEndpoint);
    return true;
}

std::vector<Endpoint> TransportListener::reachableEndpoints() const {
    std::vector<Endpoint> endpoints;
    if (!isWildcardHost(m_localEndpoint.host)) {
        endpoints.push_back(m_localEndpoint);
        return endpoints;
    }

    for (const std::string& address : localInterfaceAddresses()) {
        endpoints.emplace_back(address, m_localEndpoint.port);
    }
    if (endpoints.empty()) {
        endpoints.emplace_back("127.0.0.1", m_localEndpoint.port);
    }
    return endpoints;
}

//=============================================================================
// TransportListener: acceptOne()
//=============================================================================

std::unique_ptr<Connection> TransportListener::acceptOne(uint32_t timeoutMs, SessionError& error) {
    if (m_quic) {
        std::unique_ptr<Connection> connection = m_quic->acceptOne(timeoutMs, m_cancelled, error);
        if (connection) {
            m_quic.reset();
        }
        return connection;
    }
    if (!m_listenSocket.valid()) {
        error.set(ErrorKind::ConnectFailed, "Listener is not bound", NetworkErrorKind::Other);
        return nullptr;
    }

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        if (m_cancelled.load()) {
            error.set(ErrorKind::Cancelled, "Accept cancelled");
            return nullptr;
        }

        int waitMs = static_cast<int>(STOP_POLL_INTERVAL_MS);
        if (timeoutMs > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed >= timeoutMs) {
                error.set(ErrorKind::Timeout,
                          "No receiver connected within " + std::to_string(timeoutMs) + " ms");
                return nullptr;
            }
            waitMs = static_cast<int>(std::min<int64_t>(waitMs, timeoutMs - elapsed));
        }

        pollfd pfd{};
        pfd.fd = m_listenSocket.get();
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0 && errno != EINTR) {
            error.set(ErrorKind::ConnectFailed, "poll failed: " + socketErrorString(errno),
                      NetworkErrorKind::Other);
            return nullptr;
        }
        if (ready <= 0) {
            continue;
        }

        sockaddr_storage peerAddr{};
        socklen_t peerLen = sizeof(peerAddr);
        SocketHandle client(::accept4(m_listenSocket.get(), reinterpret_cast<sockaddr*>(&peerAddr),
                                      &peerLen, SOCK_CLOEXEC));
        if (!client.valid()) {
            // EAGAIN: dialer went away between poll() and accept()
            continue;
        }

        const Endpoint peer = sockaddrToEndpoint(peerAddr);
        LOG_DEBUG("Incoming connection from " << peer);

        // Bound the handshake so a silent dialer cannot hold the session
        if (!setSocketTimeouts(client.get(), CONNECTION_TIMEOUT_MS, CONNECTION_TIMEOUT_MS)) {
            continue;
        }
        tuneSocketBuffers(client.get());

        m_handshakeFd.store(client.get());
        auto tls = std::make_unique<TlsSocket>(std::move(client), TlsRole::SERVER, m_identity);
        std::string tlsError;
        const bool handshakeOk = tls->handshake(tlsError);
        m_handshakeFd.store(INVALID_SOCKET_FD);

        if (m_cancelled.load()) {
            error.set(ErrorKind::Cancelled, "Accept cancelled");
            return nullptr;
        }
        if (!handshakeOk) {
            LOG_WARNING("Dropped connection from " << peer << ": " << tlsError);
            continue;
        }

        PeerIdentity peerIdentity;
        if (!tls->getPeerIdentity(peerIdentity, tlsError)) {
            LOG_WARNING("Dropped connection from " << peer << ": " << tlsError);
            continue;
        }

        setSocketTimeouts(tls->fd(), 0, 0);

        auto connection = std::make_unique<TcpConnection>(std::move(tls), peerIdentity);
        LOG_INFO("Accepted Tcp connection from " << peer
                 << " (peer " << peerIdentity.shortId() << ")");
        m_listenSocket.reset();
        return connection;
    }
}

void TransportListener::cancel() {
    m_cancelled.store(true);
    const int fd = m_handshakeFd.load();
    if (fd != INVALID_SOCKET_FD) {
        shutdownSocket(fd);
    }
}

}  // namespace FastDrop
