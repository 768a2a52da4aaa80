/**
 * @file TlsSocket.cpp
 * @brief TLS 1.3 wrapper for transfer connections
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TlsSocket.h"
#include "fastdrop/Debug.h"
#include "fastdrop/config.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <mutex>

namespace FastDrop {

//=============================================================================
// OpenSSL Initialization (Static)
//=============================================================================

namespace {
    std::once_flag g_openSslOnce;

    bool isTimeoutErrno(int err) {
        return err == EAGAIN || err == EWOULDBLOCK;
    }
}

void initOpenSsl() {
    std::call_once(g_openSslOnce, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        // SSL_write on a socket closed by the peer must fail, not kill the process
        std::signal(SIGPIPE, SIG_IGN);
    });
}

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(SocketHandle socket, TlsRole role, std::shared_ptr<const LocalIdentity> identity)
    : m_socket(std::move(socket))
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_role(role)
    , m_identity(std::move(identity))
    , m_connected(false)
    , m_timedOut(false)
    , m_interrupted(false)
{
    initOpenSsl();
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

bool TlsSocket::createContext(std::string& errorMsg) {
    const SSL_METHOD* method = (m_role == TlsRole::SERVER) ? TLS_server_method()
                                                           : TLS_client_method();

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return false;
    }

    // TLS 1.3 only (no legacy protocol negotiation).
    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION) != 1 ||
        SSL_CTX_set_max_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to pin TLS version: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_ciphersuites(m_ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return false;
    }

    if (SSL_CTX_set1_groups_list(m_ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return false;
    }

    SSL_CTX_set_options(m_ctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_TICKET);
    // No post-handshake session tickets: nothing but application data after the handshake
    SSL_CTX_set_num_tickets(m_ctx, 0);

    // Allow non-blocking writes to be retried after the caller advances its buffer
    SSL_CTX_set_mode(m_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (!configureVerification(errorMsg)) {
        return false;
    }

    if (!m_identity) {
        errorMsg = "No local identity";
        return false;
    }
    return m_identity->applyTo(m_ctx, errorMsg);
}

bool TlsSocket::configureVerification(std::string& errorMsg) {
    (void)errorMsg;

    // Require a certificate from the peer but accept self-signed ones at the
    // OpenSSL layer. Identity is enforced by fingerprint comparison.
    int mode = SSL_VERIFY_PEER;
    if (m_role == TlsRole::SERVER) {
        mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    SSL_CTX_set_verify(m_ctx, mode, tlsVerifyCallback);
    SSL_CTX_set_verify_depth(m_ctx, 0);

    return true;
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    if (SSL_set_fd(m_ssl, m_socket.get()) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    return true;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    m_timedOut = false;

    if (!m_socket.valid()) {
        errorMsg = "Invalid socket";
        return false;
    }
    if (!createContext(errorMsg) || !createSsl(errorMsg)) {
        return false;
    }

    ERR_clear_error();
    const int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        int err = 0;
        const std::string details = describeFailure(result, err);
        errorMsg = "TLS handshake failed (" + getErrorDescription(err) + "): " + details;
        return false;
    }

    // Peer must present a certificate (its identity)
    X509* peerCert = SSL_get1_peer_certificate(m_ssl);
    if (!peerCert) {
        errorMsg = "TLS handshake succeeded but peer did not present a certificate";
        return false;
    }
    X509_free(peerCert);

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }
    if (!data || size == 0) {
        return true;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);
        ERR_clear_error();
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));

        if (sent <= 0) {
            int err = 0;
            const std::string details = describeFailure(sent, err);
            errorMsg = "TLS send failed (" + getErrorDescription(err) + "): " + details;
            return false;
        }

        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

bool TlsSocket::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }
    if (!buffer || size == 0) {
        return true;
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        ERR_clear_error();
        const int received = SSL_read(m_ssl, buffer + totalReceived,
                                      static_cast<int>(std::min<size_t>(size - totalReceived, INT32_MAX)));

        if (received <= 0) {
            int err = 0;
            const std::string details = describeFailure(received, err);
            if (err == SSL_ERROR_ZERO_RETURN) {
                errorMsg = "Connection closed by peer";
                return false;
            }
            errorMsg = "TLS recv failed (" + getErrorDescription(err) + "): " + details;
            return false;
        }

        totalReceived += static_cast<size_t>(received);
    }

    return true;
}

TlsIoResult TlsSocket::readSome(uint8_t* buffer, size_t size, size_t& got, std::string& errorMsg) {
    got = 0;
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return TlsIoResult::Error;
    }

    ERR_clear_error();
    const int received = SSL_read(m_ssl, buffer, static_cast<int>(std::min<size_t>(size, INT32_MAX)));
    if (received > 0) {
        got = static_cast<size_t>(received);
        return TlsIoResult::Ok;
    }

    const int err = SSL_get_error(m_ssl, received);
    switch (err) {
        case SSL_ERROR_WANT_READ:
            return TlsIoResult::WantRead;
        case SSL_ERROR_WANT_WRITE:
            return TlsIoResult::WantWrite;
        case SSL_ERROR_ZERO_RETURN:
            return TlsIoResult::Closed;
        default: {
            int ignored = 0;
            errorMsg = "TLS read failed (" + getErrorDescription(err) + "): " +
                       describeFailure(received, ignored);
            return TlsIoResult::Error;
        }
    }
}

TlsIoResult TlsSocket::writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg) {
    written = 0;
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return TlsIoResult::Error;
    }
    if (size == 0) {
        return TlsIoResult::Ok;
    }

    ERR_clear_error();
    const int sent = SSL_write(m_ssl, data, static_cast<int>(std::min(size, TLS_MAX_PACKET_SIZE)));
    if (sent > 0) {
        written = static_cast<size_t>(sent);
        return TlsIoResult::Ok;
    }

    const int err = SSL_get_error(m_ssl, sent);
    switch (err) {
        case SSL_ERROR_WANT_READ:
            return TlsIoResult::WantRead;
        case SSL_ERROR_WANT_WRITE:
            return TlsIoResult::WantWrite;
        case SSL_ERROR_ZERO_RETURN:
            return TlsIoResult::Closed;
        default: {
            int ignored = 0;
            errorMsg = "TLS write failed (" + getErrorDescription(err) + "): " +
                       describeFailure(sent, ignored);
            return TlsIoResult::Error;
        }
    }
}

size_t TlsSocket::pendingBytes() const {
    if (!m_ssl) {
        return 0;
    }
    const int pending = SSL_pending(m_ssl);
    return pending > 0 ? static_cast<size_t>(pending) : 0;
}

bool TlsSocket::hasPendingInput() const {
    if (pendingBytes() > 0) {
        return true;
    }
    if (!m_socket.valid()) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = m_socket.get();
    pfd.events = POLLIN;
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        if (!m_interrupted.load()) {
            SSL_shutdown(m_ssl);
        }
        m_connected = false;
    }
}

void TlsSocket::interrupt() {
    m_interrupted.store(true);
    shutdownSocket(m_socket.get());
}

bool TlsSocket::setNonBlocking(bool nonBlocking) {
    return FastDrop::setNonBlocking(m_socket.get(), nonBlocking);
}

//=============================================================================
// TlsSocket: Certificate Information
//=============================================================================

bool TlsSocket::getPeerIdentity(PeerIdentity& out, std::string& errorMsg) const {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    X509* cert = SSL_get1_peer_certificate(m_ssl);
    if (!cert) {
        errorMsg = "No peer certificate";
        return false;
    }

    const bool ok = certificateIdentity(cert, out, errorMsg);
    X509_free(cert);
    return ok;
}

Endpoint TlsSocket::peerEndpoint() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(m_socket.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return Endpoint();
    }
    return sockaddrToEndpoint(addr);
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::describeFailure(int ret, int& sslError) {
    const int savedErrno = errno;
    sslError = m_ssl ? SSL_get_error(m_ssl, ret) : SSL_ERROR_SSL;

    // Blocking socket with SO_RCVTIMEO/SO_SNDTIMEO: the BIO reports a retry
    if ((sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE ||
         sslError == SSL_ERROR_SYSCALL) && isTimeoutErrno(savedErrno)) {
        m_timedOut = true;
        return "timed out";
    }

    if (m_interrupted.load()) {
        return "interrupted";
    }

    // Prefer OpenSSL's error queue when present.
    const unsigned long opensslErr = ERR_get_error();
    if (opensslErr != 0) {
        char buf[256];
        ERR_error_string_n(opensslErr, buf, sizeof(buf));
        return std::string(buf);
    }

    if (sslError == SSL_ERROR_SYSCALL) {
        if (savedErrno != 0) {
            return socketErrorString(savedErrno);
        }
        return "Socket I/O failed without an error code (peer may have closed the connection)";
    }

    return "Unknown error";
}

std::string TlsSocket::getLastError() {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

//=============================================================================
// Certificate Verification Callback
//=============================================================================

/**
 * @brief TLS certificate verification callback (self-signed allowed)
 *
 * Accepts self-signed certificates so peers can connect without a CA.
 * Rejects all other verification errors. The caller compares the peer
 * certificate fingerprint with the identity it expects.
 */
int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx) {
    if (!preverifyOk) {
        const int err = X509_STORE_CTX_get_error(ctx);
        if (err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN ||
            err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT) {
            return 1;
        }
        return 0;
    }

    return 1;
}

}  // namespace FastDrop
