/**
 * @file TlsSocket.h
 * @brief TLS 1.3 wrapper around a connected TCP socket
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "LocalIdentity.h"
#include "PeerIdentity.h"
#include "SocketUtils.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

typedef struct ssl_st SSL;
typedef struct x509_store_ctx_st X509_STORE_CTX;

namespace FastDrop {

/**
 * @brief Side of the TLS handshake
 */
enum class TlsRole {
    CLIENT,  ///< Dialer (receiver)
    SERVER   ///< Listener (sender)
};

/**
 * @brief Outcome of a non-blocking TLS read or write
 */
enum class TlsIoResult {
    Ok,         ///< Some bytes were transferred
    WantRead,   ///< Retry when the socket is readable
    WantWrite,  ///< Retry when the socket is writable
    Closed,     ///< Peer closed the TLS session
    Error       ///< Fatal error (see errorMsg)
};

/**
 * @class TlsSocket
 * @brief Owns one TCP socket and the TLS session running over it
 *
 * Both sides present the process certificate (mutual TLS). Self-signed
 * certificates are accepted by the verify callback; identity is enforced by
 * comparing getPeerIdentity() with the expected PeerIdentity.
 *
 * Blocking mode: sendExact()/recvExact() honour SO_RCVTIMEO/SO_SNDTIMEO set
 * on the socket; a timeout fails the call and sets lastIoTimedOut().
 *
 * Non-blocking mode: readSome()/writeSome() never block and report
 * WantRead/WantWrite.
 *
 * Thread Safety: a TlsSocket must be driven by one thread at a time.
 * interrupt() is the exception and may be called from any thread.
 */
class TlsSocket {
public:
    TlsSocket(SocketHandle socket, TlsRole role, std::shared_ptr<const LocalIdentity> identity);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Run the TLS handshake on the (blocking) socket
     *
     * On failure, handshakeTimedOut() tells a timeout apart from a protocol
     * failure.
     */
    bool handshake(std::string& errorMsg);

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg);

    /**
     * @brief Non-blocking read of up to size bytes
     */
    TlsIoResult readSome(uint8_t* buffer, size_t size, size_t& got, std::string& errorMsg);

    /**
     * @brief Non-blocking write of up to size bytes
     */
    TlsIoResult writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg);

    /**
     * @brief Decrypted bytes already buffered inside the TLS layer
     */
    size_t pendingBytes() const;

    /**
     * @brief Whether a read would make progress right now
     *
     * True if decrypted bytes are buffered or the socket is readable.
     */
    bool hasPendingInput() const;

    /**
     * @brief Send close_notify (if connected)
     */
    void shutdown();

    /**
     * @brief Unblock any thread blocked on this socket (thread-safe)
     */
    void interrupt();

    bool setNonBlocking(bool nonBlocking);

    bool getPeerIdentity(PeerIdentity& out, std::string& errorMsg) const;

    /// Remote endpoint of the underlying socket
    Endpoint peerEndpoint() const;

    int fd() const { return m_socket.get(); }
    bool lastIoTimedOut() const { return m_timedOut; }
    bool handshakeTimedOut() const { return m_timedOut; }

    static std::string getLastError();
    static std::string getErrorDescription(int sslErrorCode);

private:
    bool createContext(std::string& errorMsg);
    bool configureVerification(std::string& errorMsg);
    bool createSsl(std::string& errorMsg);
    std::string describeFailure(int ret, int& sslError);

    SocketHandle m_socket;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    std::shared_ptr<const LocalIdentity> m_identity;
    bool m_connected;
    bool m_timedOut;
    std::atomic<bool> m_interrupted;
};

/**
 * @brief Process-wide OpenSSL initialization (idempotent, thread-safe)
 *
 * Also ignores SIGPIPE so writes to a closed peer fail with EPIPE.
 */
void initOpenSsl();

/**
 * @brief TLS certificate verification callback (self-signed allowed)
 */
int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx);

}  // namespace FastDrop
