/**
 * @file QuicConnection.cpp
 * @brief QUIC connections and streams over the OpenSSL QUIC stack
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/QuicConnection.h"
#include "fastdrop/Debug.h"
#include "fastdrop/TlsSocket.h"
#include "fastdrop/config.h"

#include <openssl/opensslv.h>

#if OPENSSL_VERSION_NUMBER >= 0x30500000L
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/quic.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#endif

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace FastDrop {

#if OPENSSL_VERSION_NUMBER >= 0x30500000L

namespace {

using Clock = std::chrono::steady_clock;

/// Application error codes carried in CONNECTION_CLOSE
constexpr uint64_t QUIC_CLOSE_NORMAL = 0;
constexpr uint64_t QUIC_CLOSE_ABORTED = 1;
constexpr uint64_t QUIC_CLOSE_BUSY = 2;

int remainingMs(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(std::min<int64_t>(left, INT32_MAX)) : 0;
}

std::string opensslFailure(const std::string& what) {
    return what + ": " + TlsSocket::getLastError();
}

/**
 * @brief Wait until the socket or an OpenSSL timer needs attention, then process events
 */
void serviceNetwork(SSL* ssl, int fd, int capMs) {
    int waitMs = std::min(capMs, static_cast<int>(STOP_POLL_INTERVAL_MS));

    timeval tv{};
    int infinite = 1;
    if (SSL_get_event_timeout(ssl, &tv, &infinite) == 1 && !infinite) {
        const int64_t timerMs = static_cast<int64_t>(tv.tv_sec) * 1000 + (tv.tv_usec + 999) / 1000;
        waitMs = static_cast<int>(std::min<int64_t>(waitMs, timerMs));
    }

    if (waitMs > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (SSL_net_write_desired(ssl)) {
            pfd.events |= POLLOUT;
        }
        ::poll(&pfd, 1, waitMs);
    }

    SSL_handle_events(ssl);
}

int selectAlpn(SSL*, const unsigned char** out, unsigned char* outLen,
               const unsigned char* in, unsigned int inLen, void*) {
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outLen, QUIC_ALPN, sizeof(QUIC_ALPN), in, inLen) !=
        OPENSSL_NPN_NEGOTIATED) {
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

SSL_CTX* createQuicContext(bool server, const std::shared_ptr<const LocalIdentity>& identity,
                           std::string& errorMsg) {
    initOpenSsl();
    if (!identity) {
        errorMsg = "No local identity";
        return nullptr;
    }

    SSL_CTX* ctx = SSL_CTX_new(server ? OSSL_QUIC_server_method() : OSSL_QUIC_client_method());
    if (!ctx) {
        errorMsg = opensslFailure("Failed to create QUIC context");
        return nullptr;
    }

    if (SSL_CTX_set_ciphersuites(ctx, TLS13_CIPHER_SUITES) != 1 ||
        SSL_CTX_set1_groups_list(ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = opensslFailure("Failed to configure QUIC TLS parameters");
        SSL_CTX_free(ctx);
        return nullptr;
    }

    SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    // Same policy as TLS over TCP: self-signed accepted, fingerprint compared by the caller
    int mode = SSL_VERIFY_PEER;
    if (server) {
        mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        SSL_CTX_set_alpn_select_cb(ctx, selectAlpn, nullptr);
    }
    SSL_CTX_set_verify(ctx, mode, tlsVerifyCallback);
    SSL_CTX_set_verify_depth(ctx, 0);

    if (!identity->applyTo(ctx, errorMsg)) {
        SSL_CTX_free(ctx);
        return nullptr;
    }
    return ctx;
}

bool attachSocket(SSL* ssl, int fd, std::string& errorMsg) {
    BIO* bio = BIO_new_dgram(fd, BIO_NOCLOSE);
    if (!bio) {
        errorMsg = opensslFailure("Failed to create datagram BIO");
        return false;
    }
    SSL_set_bio(ssl, bio, bio);
    return true;
}

bool configureConnection(SSL* conn, std::string& errorMsg) {
    if (SSL_set_blocking_mode(conn, 0) != 1 ||
        SSL_set_default_stream_mode(conn, SSL_DEFAULT_STREAM_MODE_NONE) != 1 ||
        SSL_set_incoming_stream_policy(conn, SSL_INCOMING_STREAM_POLICY_ACCEPT, 0) != 1) {
        errorMsg = opensslFailure("Failed to configure QUIC connection");
        return false;
    }
    return true;
}

enum class HandshakeOutcome { Done, Failed, TimedOut, Cancelled };

HandshakeOutcome driveHandshake(SSL* ssl, int fd, Clock::time_point deadline,
                                const std::atomic<bool>& cancelled, std::string& errorMsg) {
    while (true) {
        ERR_clear_error();
        const int ret = SSL_do_handshake(ssl);
        if (ret == 1) {
            return HandshakeOutcome::Done;
        }

        const int err = SSL_get_error(ssl, ret);
        if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
            errorMsg = "QUIC handshake failed (" + TlsSocket::getErrorDescription(err) + "): " +
                       TlsSocket::getLastError();
            return HandshakeOutcome::Failed;
        }
        if (cancelled.load()) {
            return HandshakeOutcome::Cancelled;
        }

        const int left = remainingMs(deadline);
        if (left <= 0) {
            errorMsg = "QUIC handshake timed out";
            return HandshakeOutcome::TimedOut;
        }
        serviceNetwork(ssl, fd, left);
    }
}

bool peerCertificateIdentity(SSL* ssl, PeerIdentity& out, std::string& errorMsg) {
    X509* cert = SSL_get1_peer_certificate(ssl);
    if (!cert) {
        errorMsg = "QUIC handshake succeeded but peer did not present a certificate";
        return false;
    }
    const bool ok = certificateIdentity(cert, out, errorMsg);
    X509_free(cert);
    return ok;
}

std::string describeStreamFailure(const char* what, int sslError, int streamState) {
    switch (streamState) {
        case SSL_STREAM_STATE_RESET_REMOTE:
            return std::string("Stream reset by peer during ") + what;
        case SSL_STREAM_STATE_CONN_CLOSED:
            return std::string("Connection closed during ") + what;
        default:
            return std::string("QUIC ") + what + " failed (" + TlsSocket::getErrorDescription(sslError) +
                   "): " + TlsSocket::getLastError();
    }
}

//=============================================================================
// QuicEngine
//=============================================================================

/**
 * @brief State shared by one QUIC connection and its streams
 *
 * Owns the connection object, the listener it came from on the accepting
 * side, and the UDP socket. A pump thread services the socket and OpenSSL's
 * timers so ACKs and flow-control credit go out while the application is
 * busy; blocked stream calls wait for its notifications.
 */
class QuicEngine {
public:
    QuicEngine(SSL* conn, SSL* listener, SocketHandle socket)
        : m_conn(conn)
        , m_listener(listener)
        , m_socket(std::move(socket))
        , m_generation(0)
        , m_closed(false)
        , m_lost(false)
        , m_stopping(false)
        , m_idleTimeoutMs(0)
    {
    }

    ~QuicEngine() {
        stopPump();
        for (SSL* refused : m_refused) {
            SSL_free(refused);
        }
        SSL_free(m_conn);
        if (m_listener) {
            SSL_free(m_listener);
        }
    }

    QuicEngine(const QuicEngine&) = delete;
    QuicEngine& operator=(const QuicEngine&) = delete;

    void startPump() {
        m_pump = std::thread(&QuicEngine::run, this);
    }

    void stopPump() {
        m_stopping.store(true);
        if (m_pump.joinable()) {
            m_pump.join();
        }
    }

    SSL* conn() const { return m_conn; }
    bool isClosed() const { return m_closed.load() || m_lost.load(); }
    void setIdleTimeout(uint32_t timeoutMs) { m_idleTimeoutMs.store(timeoutMs); }

    uint64_t generation() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_generation;
    }

    /// Block until the pump reports new events, the connection closes or maxWait passes
    void waitForEvents(uint64_t seen, std::chrono::milliseconds maxWait) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, maxWait, [this, seen]() { return m_generation != seen || m_closed.load(); });
    }

    /**
     * @brief Wait for events on behalf of a stalled stream call
     *
     * Fails once the connection is closed locally, or when an idle timeout
     * is set and nothing moved since lastProgress for that long.
     */
    bool awaitProgress(uint64_t seen, Clock::time_point lastProgress, bool& timedOut, std::string& errorMsg) {
        if (m_closed.load()) {
            errorMsg = "Connection closed";
            return false;
        }

        auto slice = std::chrono::milliseconds(STOP_POLL_INTERVAL_MS);
        const uint32_t idleMs = m_idleTimeoutMs.load();
        if (idleMs > 0) {
            const auto limit = lastProgress + std::chrono::milliseconds(idleMs);
            const auto now = Clock::now();
            if (now >= limit) {
                timedOut = true;
                errorMsg = "No progress within " + std::to_string(idleMs) + " ms";
                return false;
            }
            slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(limit - now) +
                                        std::chrono::milliseconds(1));
        }

        waitForEvents(seen, slice);
        return true;
    }

    void close(uint64_t code) {
        if (m_closed.exchange(true)) {
            return;
        }

        SSL_SHUTDOWN_EX_ARGS args{};
        args.quic_error_code = code;
        ERR_clear_error();
        if (SSL_shutdown_ex(m_conn, SSL_SHUTDOWN_FLAG_RAPID, &args, sizeof(args)) < 0) {
            LOG_DEBUG(opensslFailure("QUIC close failed"));
        }
        // Put CONNECTION_CLOSE on the wire before the pump goes away
        SSL_handle_events(m_conn);
        notifyAll();
    }

    void closeGracefully(uint32_t lingerMs) {
        const auto deadline = Clock::now() + std::chrono::milliseconds(lingerMs);

        SSL_SHUTDOWN_EX_ARGS args{};
        args.quic_error_code = QUIC_CLOSE_NORMAL;
        while (!m_closed.load()) {
            const uint64_t seen = generation();
            ERR_clear_error();
            const int ret = SSL_shutdown_ex(m_conn, 0, &args, sizeof(args));
            if (ret == 1) {
                break;
            }
            if (ret < 0) {
                LOG_DEBUG(opensslFailure("QUIC shutdown failed"));
                break;
            }

            const int left = remainingMs(deadline);
            if (left <= 0) {
                LOG_DEBUG("QUIC shutdown still pending after " << lingerMs << " ms");
                break;
            }
            waitForEvents(seen, std::chrono::milliseconds(std::min<int>(left, STOP_POLL_INTERVAL_MS)));
        }

        close(QUIC_CLOSE_NORMAL);
    }

private:
    void notifyAll() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_generation;
        }
        m_cv.notify_all();
    }

    void run() {
        while (!m_stopping.load()) {
            serviceNetwork(m_conn, m_socket.get(), static_cast<int>(STOP_POLL_INTERVAL_MS));
            if (m_listener) {
                refuseLateDialers();
            }
            if (!m_lost.load()) {
                noteTermination();
            }
            notifyAll();
        }
    }

    // One receiver per session: anyone else who completes a handshake is closed at once
    void refuseLateDialers() {
        SSL* late = nullptr;
        while ((late = SSL_accept_connection(m_listener, SSL_ACCEPT_CONNECTION_NO_BLOCK)) != nullptr) {
            LOG_WARNING("Refusing another QUIC dialer: a session is already in progress");
            SSL_SHUTDOWN_EX_ARGS args{};
            args.quic_error_code = QUIC_CLOSE_BUSY;
            args.quic_reason = "session in progress";
            if (SSL_set_blocking_mode(late, 0) != 1 ||
                SSL_shutdown_ex(late, SSL_SHUTDOWN_FLAG_RAPID, &args, sizeof(args)) < 0) {
                LOG_DEBUG(opensslFailure("Failed to refuse QUIC dialer"));
            }
            m_refused.push_back(late);
        }
    }

    void noteTermination() {
        SSL_CONN_CLOSE_INFO info{};
        if (SSL_get_conn_close_info(m_conn, &info, sizeof(info)) != 1) {
            return;
        }
        m_lost.store(true);
        if (!(info.flags & SSL_CONN_CLOSE_FLAG_LOCAL)) {
            const std::string reason = info.reason ? std::string(info.reason, info.reason_len) : std::string();
            LOG_DEBUG("QUIC connection closed by peer (code " << info.error_code
                      << (reason.empty() ? "" : ": " + reason) << ")");
        }
    }

    SSL* m_conn;
    SSL* m_listener;
    SocketHandle m_socket;
    std::vector<SSL*> m_refused;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    uint64_t m_generation;

    std::atomic<bool> m_closed;
    std::atomic<bool> m_lost;
    std::atomic<bool> m_stopping;
    std::atomic<uint32_t> m_idleTimeoutMs;
    std::thread m_pump;
};

//=============================================================================
// QuicStream
//=============================================================================

class QuicStream : public TransportStream {
public:
    QuicStream(std::shared_ptr<QuicEngine> engine, SSL* stream)
        : m_engine(std::move(engine))
        , m_stream(stream)
        , m_timedOut(false)
    {
        SSL_set_mode(m_stream, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    }

    ~QuicStream() override {
        SSL_free(m_stream);
    }

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override {
        m_timedOut = false;
        if (!data || size == 0) {
            return true;
        }

        size_t total = 0;
        auto lastProgress = Clock::now();
        while (total < size) {
            const uint64_t seen = m_engine->generation();
            size_t written = 0;
            ERR_clear_error();
            if (SSL_write_ex(m_stream, data + total, size - total, &written) == 1) {
                total += written;
                lastProgress = Clock::now();
                continue;
            }

            const int err = SSL_get_error(m_stream, 0);
            if (err != SSL_ERROR_WANT_WRITE && err != SSL_ERROR_WANT_READ) {
                errorMsg = describeStreamFailure("send", err, SSL_get_stream_write_state(m_stream));
                return false;
            }
            // Send buffer full: wait for the peer to acknowledge or grant credit
            if (!m_engine->awaitProgress(seen, lastProgress, m_timedOut, errorMsg)) {
                return false;
            }
        }
        return true;
    }

    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        m_timedOut = false;
        if (!buffer || size == 0) {
            return true;
        }

        size_t total = 0;
        auto lastProgress = Clock::now();
        while (total < size) {
            const uint64_t seen = m_engine->generation();
            size_t got = 0;
            ERR_clear_error();
            if (SSL_read_ex(m_stream, buffer + total, size - total, &got) == 1) {
                total += got;
                lastProgress = Clock::now();
                continue;
            }

            const int err = SSL_get_error(m_stream, 0);
            if (err == SSL_ERROR_ZERO_RETURN) {
                errorMsg = "Stream finished by peer";
                return false;
            }
            if (err != SSL_ERROR_WANT_READ) {
                errorMsg = describeStreamFailure("recv", err, SSL_get_stream_read_state(m_stream));
                return false;
            }
            if (!m_engine->awaitProgress(seen, lastProgress, m_timedOut, errorMsg)) {
                return false;
            }
        }
        return true;
    }

    bool finish(std::string& errorMsg) override {
        ERR_clear_error();
        if (SSL_stream_conclude(m_stream, 0) != 1) {
            errorMsg = opensslFailure("Failed to finish QUIC stream");
            return false;
        }
        return true;
    }

    bool hasPendingInput() override {
        if (SSL_pending(m_stream) > 0) {
            return true;
        }
        // FIN, reset or a dead connection: a read returns at once
        const int state = SSL_get_stream_read_state(m_stream);
        return state == SSL_STREAM_STATE_FINISHED || state == SSL_STREAM_STATE_RESET_REMOTE ||
               state == SSL_STREAM_STATE_CONN_CLOSED || m_engine->isClosed();
    }

    bool timedOut() const override { return m_timedOut; }

    uint32_t streamId() const override {
        return static_cast<uint32_t>(SSL_get_stream_id(m_stream));
    }

private:
    std::shared_ptr<QuicEngine> m_engine;
    SSL* m_stream;
    bool m_timedOut;
};

//=============================================================================
// QuicConnection
//=============================================================================

/**
 * @brief Multiplexed connection: every stream is an independent QUIC stream
 */
class QuicConnection : public Connection {
public:
    QuicConnection(std::shared_ptr<QuicEngine> engine, PeerIdentity peer, Endpoint peerAddress)
        : m_engine(std::move(engine))
        , m_peer(std::move(peer))
        , m_peerAddress(std::move(peerAddress))
    {
        m_engine->startPump();
    }

    ~QuicConnection() override {
        m_engine->close(QUIC_CLOSE_ABORTED);
        m_engine->stopPump();
    }

    TransportProtocol protocol() const override { return TransportProtocol::Quic; }
    bool supportsMultiplexing() const override { return true; }

    std::shared_ptr<TransportStream> openStream(std::string& errorMsg) override {
        const auto start = Clock::now();
        bool timedOut = false;
        while (true) {
            if (m_engine->isClosed()) {
                errorMsg = "Connection closed";
                return nullptr;
            }

            const uint64_t seen = m_engine->generation();
            ERR_clear_error();
            SSL* stream = SSL_new_stream(m_engine->conn(), SSL_STREAM_FLAG_NO_BLOCK);
            if (stream) {
                return std::make_shared<QuicStream>(m_engine, stream);
            }

            // Only the peer's stream limit is worth waiting out
            if (ERR_GET_REASON(ERR_peek_last_error()) != SSL_R_STREAM_COUNT_LIMITED) {
                errorMsg = opensslFailure("Failed to open QUIC stream");
                return nullptr;
            }
            if (!m_engine->awaitProgress(seen, start, timedOut, errorMsg)) {
                errorMsg = "Peer granted no stream credit: " + errorMsg;
                return nullptr;
            }
        }
    }

    std::shared_ptr<TransportStream> acceptStream(uint32_t timeoutMs, std::string& errorMsg) override {
        const auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            const uint64_t seen = m_engine->generation();
            SSL* stream = SSL_accept_stream(m_engine->conn(), SSL_ACCEPT_STREAM_NO_BLOCK);
            if (stream) {
                return std::make_shared<QuicStream>(m_engine, stream);
            }
            if (m_engine->isClosed()) {
                errorMsg = "Connection closed";
                return nullptr;
            }

            auto slice = std::chrono::milliseconds(STOP_POLL_INTERVAL_MS);
            if (timeoutMs > 0) {
                const int left = remainingMs(deadline);
                if (left <= 0) {
                    errorMsg = "Peer opened no stream within " + std::to_string(timeoutMs) + " ms";
                    return nullptr;
                }
                slice = std::min(slice, std::chrono::milliseconds(left));
            }
            m_engine->waitForEvents(seen, slice);
        }
    }

    const PeerIdentity& peerIdentity() const override { return m_peer; }
    Endpoint peerAddress() const override { return m_peerAddress; }

    bool isClosed() const override { return m_engine->isClosed(); }
    void setIdleTimeout(uint32_t timeoutMs) override { m_engine->setIdleTimeout(timeoutMs); }

    void close() override {
        m_engine->close(QUIC_CLOSE_ABORTED);
    }

    void closeGracefully(uint32_t lingerMs) override {
        m_engine->closeGracefully(lingerMs);
    }

private:
    std::shared_ptr<QuicEngine> m_engine;
    PeerIdentity m_peer;
    Endpoint m_peerAddress;
};

}  // namespace

bool quicTransportAvailable() {
    return true;
}

//=============================================================================
// QuicServer
//=============================================================================

struct QuicServer::State {
    SSL* listener = nullptr;
    SocketHandle socket;

    ~State() {
        if (listener) {
            SSL_free(listener);
        }
    }
};

QuicServer::QuicServer(std::shared_ptr<const LocalIdentity> identity)
    : m_identity(std::move(identity))
    , m_state(std::make_unique<State>())
{
}

QuicServer::~QuicServer() = default;

bool QuicServer::listen(SocketHandle socket, std::string& errorMsg) {
    if (m_state->listener) {
        errorMsg = "QUIC server is already listening";
        return false;
    }
    if (!setNonBlocking(socket.get(), true)) {
        errorMsg = "Failed to set non-blocking mode";
        return false;
    }

    SSL_CTX* ctx = createQuicContext(true, m_identity, errorMsg);
    if (!ctx) {
        return false;
    }
    SSL* listener = SSL_new_listener(ctx, 0);
    SSL_CTX_free(ctx);  // the listener holds its own reference
    if (!listener) {
        errorMsg = opensslFailure("Failed to create QUIC listener");
        return false;
    }

    if (!attachSocket(listener, socket.get(), errorMsg)) {
        SSL_free(listener);
        return false;
    }
    ERR_clear_error();
    if (SSL_listen(listener) != 1) {
        errorMsg = opensslFailure("QUIC listen failed");
        SSL_free(listener);
        return false;
    }

    m_state->listener = listener;
    m_state->socket = std::move(socket);
    return true;
}

std::unique_ptr<Connection> QuicServer::acceptOne(uint32_t timeoutMs, const std::atomic<bool>& cancelled,
                                                  SessionError& error) {
    if (!m_state->listener) {
        error.set(ErrorKind::ConnectFailed, "QUIC server is not listening", NetworkErrorKind::Other);
        return nullptr;
    }

    const int fd = m_state->socket.get();
    const auto start = Clock::now();
    while (true) {
        if (cancelled.load()) {
            error.set(ErrorKind::Cancelled, "Accept cancelled");
            return nullptr;
        }

        int waitMs = static_cast<int>(STOP_POLL_INTERVAL_MS);
        auto handshakeDeadline = Clock::now() + std::chrono::milliseconds(CONNECTION_TIMEOUT_MS);
        if (timeoutMs > 0) {
            const auto deadline = start + std::chrono::milliseconds(timeoutMs);
            const int left = remainingMs(deadline);
            if (left <= 0) {
                error.set(ErrorKind::Timeout,
                          "No receiver connected within " + std::to_string(timeoutMs) + " ms");
                return nullptr;
            }
            waitMs = std::min(waitMs, left);
            handshakeDeadline = std::min(handshakeDeadline, deadline);
        }

        ERR_clear_error();
        SSL* conn = SSL_accept_connection(m_state->listener, SSL_ACCEPT_CONNECTION_NO_BLOCK);
        if (!conn) {
            serviceNetwork(m_state->listener, fd, waitMs);
            continue;
        }

        std::string quicError;
        HandshakeOutcome outcome = HandshakeOutcome::Failed;
        if (configureConnection(conn, quicError)) {
            outcome = driveHandshake(conn, fd, handshakeDeadline, cancelled, quicError);
        }
        if (outcome == HandshakeOutcome::Cancelled) {
            SSL_free(conn);
            error.set(ErrorKind::Cancelled, "Accept cancelled");
            return nullptr;
        }

        PeerIdentity peer;
        if (outcome != HandshakeOutcome::Done || !peerCertificateIdentity(conn, peer, quicError)) {
            LOG_WARNING("Dropped QUIC dialer: " << quicError);
            SSL_free(conn);
            continue;
        }

        // The listener and socket now live as long as the connection
        auto engine = std::make_shared<QuicEngine>(conn, m_state->listener, std::move(m_state->socket));
        m_state->listener = nullptr;
        LOG_INFO("Accepted QUIC connection (peer " << peer.shortId() << ")");
        return std::make_unique<QuicConnection>(std::move(engine), peer, Endpoint());
    }
}

//=============================================================================
// quicConnect()
//=============================================================================

std::unique_ptr<Connection> quicConnect(std::shared_ptr<const LocalIdentity> identity,
                                        const Endpoint& endpoint,
                                        uint32_t timeoutMs,
                                        const std::atomic<bool>& cancelled,
                                        SessionError& error) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);

    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!endpointToSockaddr(endpoint, addr, addrLen)) {
        error.set(ErrorKind::ConnectFailed, "Unsupported endpoint: " + endpoint.toString(),
                  NetworkErrorKind::Unreachable);
        return nullptr;
    }

    SocketHandle sock(::socket(addr.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid() || !setNonBlocking(sock.get(), true)) {
        error.set(ErrorKind::ConnectFailed, "UDP socket setup failed: " + socketErrorString(errno),
                  NetworkErrorKind::Other);
        return nullptr;
    }
    tuneSocketBuffers(sock.get());

    std::string quicError;
    SSL_CTX* ctx = createQuicContext(false, identity, quicError);
    if (!ctx) {
        error.set(ErrorKind::ConnectFailed, quicError, NetworkErrorKind::Other);
        return nullptr;
    }
    SSL* conn = SSL_new(ctx);
    SSL_CTX_free(ctx);  // the connection holds its own reference
    if (!conn) {
        error.set(ErrorKind::ConnectFailed, opensslFailure("Failed to create QUIC connection"),
                  NetworkErrorKind::Other);
        return nullptr;
    }

    BIO_ADDR* peerAddr = BIO_ADDR_new();
    bool ready = peerAddr != nullptr;
    if (ready && addr.ss_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ready = BIO_ADDR_rawmake(peerAddr, AF_INET6, &sin6->sin6_addr, sizeof(sin6->sin6_addr), sin6->sin6_port) == 1;
    } else if (ready) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&addr);
        ready = BIO_ADDR_rawmake(peerAddr, AF_INET, &sin->sin_addr, sizeof(sin->sin_addr), sin->sin_port) == 1;
    }
    ready = ready && SSL_set1_initial_peer_addr(conn, peerAddr) == 1;
    if (peerAddr) {
        BIO_ADDR_free(peerAddr);
    }

    // SSL_set_alpn_protos() returns 0 on success
    ready = ready && SSL_set_alpn_protos(conn, QUIC_ALPN, sizeof(QUIC_ALPN)) == 0 &&
            attachSocket(conn, sock.get(), quicError) && configureConnection(conn, quicError);
    if (!ready) {
        if (quicError.empty()) {
            quicError = opensslFailure("Failed to prepare QUIC connection");
        }
        SSL_free(conn);
        error.set(ErrorKind::ConnectFailed, quicError, NetworkErrorKind::Other);
        return nullptr;
    }

    const HandshakeOutcome outcome = driveHandshake(conn, sock.get(), deadline, cancelled, quicError);
    PeerIdentity peer;
    if (outcome == HandshakeOutcome::Done && !peerCertificateIdentity(conn, peer, quicError)) {
        SSL_free(conn);
        error.set(ErrorKind::ConnectFailed, quicError, NetworkErrorKind::HandshakeFailed);
        return nullptr;
    }

    switch (outcome) {
        case HandshakeOutcome::Done: {
            auto engine = std::make_shared<QuicEngine>(conn, nullptr, std::move(sock));
            return std::make_unique<QuicConnection>(std::move(engine), peer, endpoint);
        }
        case HandshakeOutcome::Cancelled:
            error.set(ErrorKind::Cancelled, "Dial cancelled");
            break;
        case HandshakeOutcome::TimedOut:
            // UDP has no refusal: an endpoint nobody answers on runs out the clock
            error.set(ErrorKind::Timeout, "QUIC handshake with " + endpoint.toString() + " timed out");
            break;
        case HandshakeOutcome::Failed:
            error.set(ErrorKind::ConnectFailed, quicError, NetworkErrorKind::HandshakeFailed);
            break;
    }
    SSL_free(conn);
    return nullptr;
}

#else  // OpenSSL older than 3.5: no QUIC server API

namespace {
    const std::string QUIC_UNAVAILABLE =
        std::string("QUIC transport requires OpenSSL 3.5 or later (built against ") + OPENSSL_VERSION_TEXT + ")";
}

bool quicTransportAvailable() {
    return false;
}

struct QuicServer::State {};

QuicServer::QuicServer(std::shared_ptr<const LocalIdentity> identity)
    : m_identity(std::move(identity))
    , m_state(std::make_unique<State>())
{
}

QuicServer::~QuicServer() = default;

bool QuicServer::listen(SocketHandle, std::string& errorMsg) {
    errorMsg = QUIC_UNAVAILABLE;
    return false;
}

std::unique_ptr<Connection> QuicServer::acceptOne(uint32_t, const std::atomic<bool>&, SessionError& error) {
    error.set(ErrorKind::ConnectFailed, QUIC_UNAVAILABLE, NetworkErrorKind::Other);
    return nullptr;
}

std::unique_ptr<Connection> quicConnect(std::shared_ptr<const LocalIdentity>, const Endpoint&, uint32_t,
                                        const std::atomic<bool>&, SessionError& error) {
    error.set(ErrorKind::ConnectFailed, QUIC_UNAVAILABLE, NetworkErrorKind::Other);
    return nullptr;
}

#endif

}  // namespace FastDrop
