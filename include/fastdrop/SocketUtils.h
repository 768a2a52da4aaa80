/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers shared by the transport and LAN radio
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "Endpoint.h"
#include "SessionError.h"

#include <sys/socket.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace FastDrop {

/// Invalid socket descriptor
constexpr int INVALID_SOCKET_FD = -1;

/**
 * @brief RAII owner of a socket descriptor
 */
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : m_fd(fd) {}
    ~SocketHandle() { reset(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept : m_fd(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd != INVALID_SOCKET_FD; }

    int release() {
        const int fd = m_fd;
        m_fd = INVALID_SOCKET_FD;
        return fd;
    }

    void reset(int fd = INVALID_SOCKET_FD);

private:
    int m_fd = INVALID_SOCKET_FD;
};

/// Last socket error as text ("Connection refused (111)")
std::string socketErrorString(int err);

bool setNonBlocking(int fd, bool nonBlocking);

/// SO_RCVTIMEO / SO_SNDTIMEO; 0 disables the timeout
bool setSocketTimeouts(int fd, uint32_t recvTimeoutMs, uint32_t sendTimeoutMs);

/// Request large kernel buffers for bulk transfer sockets
void tuneSocketBuffers(int fd);

/// Disable Nagle on control-heavy sockets
void setNoDelay(int fd);

/**
 * @brief Wake blocked readers and writers without releasing the descriptor
 *
 * Safe to call from any thread while another thread is blocked on fd.
 */
void shutdownSocket(int fd);

/**
 * @brief Half-close the write side, then discard input until the peer closes
 *
 * Closing a socket with unread input makes the kernel send RST, which can
 * destroy data the peer has not read yet (e.g. a final ABORT frame).
 */
void lingerUntilPeerCloses(int fd, uint32_t lingerMs);

/**
 * @brief Parse a numeric endpoint into a sockaddr
 * @return false if host is not an IPv4/IPv6 literal
 */
bool endpointToSockaddr(const Endpoint& endpoint, sockaddr_storage& addr, socklen_t& addrLen);

/**
 * @brief Format a sockaddr as an endpoint (canonical inet_ntop form)
 */
Endpoint sockaddrToEndpoint(const sockaddr_storage& addr);

/**
 * @brief Canonicalize an IP literal ("0:0::1" -> "::1")
 * @return false if host is not an IPv4/IPv6 literal
 */
bool canonicalizeHost(const std::string& host, std::string& out);

/**
 * @brief Map a connect()/socket errno to the inner ConnectFailed kind
 */
NetworkErrorKind classifyConnectErrno(int err);

/**
 * @brief Connect with a deadline, polling the cancel flag
 *
 * On success fd holds a connected, blocking socket.
 * On failure error is ConnectFailed (with inner kind), Timeout or Cancelled.
 */
bool connectWithTimeout(const Endpoint& endpoint,
                        uint32_t timeoutMs,
                        const std::atomic<bool>* cancelFlag,
                        SocketHandle& fd,
                        SessionError& error);

/**
 * @brief Non-loopback IPv4 addresses of local interfaces that are up
 */
std::vector<std::string> localInterfaceAddresses();

/**
 * @brief Blocking send of the whole buffer on a plain socket
 */
bool sendAll(int fd, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Blocking receive of exactly size bytes on a plain socket
 */
bool recvAll(int fd, uint8_t* data, size_t size, std::string& errorMsg);

}  // namespace FastDrop
