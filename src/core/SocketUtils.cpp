/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/SocketUtils.h"
#include "fastdrop/config.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace FastDrop {

void SocketHandle::reset(int fd) {
    if (m_fd != INVALID_SOCKET_FD) {
        ::close(m_fd);
    }
    m_fd = fd;
}

std::string socketErrorString(int err) {
    return std::string(std::strerror(err)) + " (" + std::to_string(err) + ")";
}

bool setNonBlocking(int fd, bool nonBlocking) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int wanted = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, wanted) == 0;
}

bool setSocketTimeouts(int fd, uint32_t recvTimeoutMs, uint32_t sendTimeoutMs) {
    timeval rcv{};
    rcv.tv_sec = static_cast<time_t>(recvTimeoutMs / 1000);
    rcv.tv_usec = static_cast<suseconds_t>((recvTimeoutMs % 1000) * 1000);
    timeval snd{};
    snd.tv_sec = static_cast<time_t>(sendTimeoutMs / 1000);
    snd.tv_usec = static_cast<suseconds_t>((sendTimeoutMs % 1000) * 1000);

    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv)) == 0 &&
           ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd)) == 0;
}

void tuneSocketBuffers(int fd) {
    const int buf = SOCKET_BUFFER_BYTES;
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buf, sizeof(buf));
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buf, sizeof(buf));
}

void setNoDelay(int fd) {
    const int one = 1;
    (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

void shutdownSocket(int fd) {
    if (fd != INVALID_SOCKET_FD) {
        (void)::shutdown(fd, SHUT_RDWR);
    }
}

void lingerUntilPeerCloses(int fd, uint32_t lingerMs) {
    if (fd == INVALID_SOCKET_FD) {
        return;
    }
    (void)::shutdown(fd, SHUT_WR);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(lingerMs);
    uint8_t discard[4096];
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready <= 0) {
            return;
        }

        const ssize_t got = ::recv(fd, discard, sizeof(discard), MSG_DONTWAIT);
        if (got == 0) {
            return;
        }
        if (got < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return;
        }
    }
}

bool endpointToSockaddr(const Endpoint& endpoint, sockaddr_storage& addr, socklen_t& addrLen) {
    std::memset(&addr, 0, sizeof(addr));

    sockaddr_in* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    if (::inet_pton(AF_INET, endpoint.host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(endpoint.port);
        addrLen = sizeof(sockaddr_in);
        return true;
    }

    sockaddr_in6* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (::inet_pton(AF_INET6, endpoint.host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(endpoint.port);
        addrLen = sizeof(sockaddr_in6);
        return true;
    }

    return false;
}

Endpoint sockaddrToEndpoint(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET) {
        const sockaddr_in* v4 = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
        return Endpoint(buf, ntohs(v4->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const sockaddr_in6* v6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
        return Endpoint(buf, ntohs(v6->sin6_port));
    }
    return Endpoint();
}

bool canonicalizeHost(const std::string& host, std::string& out) {
    sockaddr_storage addr{};
    socklen_t len = 0;
    if (!endpointToSockaddr(Endpoint(host, 0), addr, len)) {
        return false;
    }
    out = sockaddrToEndpoint(addr).host;
    return true;
}

NetworkErrorKind classifyConnectErrno(int err) {
    switch (err) {
        case ECONNREFUSED:
        case ECONNRESET:
            return NetworkErrorKind::Refused;
        case ENETUNREACH:
        case EHOSTUNREACH:
        case ENETDOWN:
        case EADDRNOTAVAIL:
            return NetworkErrorKind::Unreachable;
        default:
            return NetworkErrorKind::Other;
    }
}

bool connectWithTimeout(const Endpoint& endpoint,
                        uint32_t timeoutMs,
                        const std::atomic<bool>* cancelFlag,
                        SocketHandle& fd,
                        SessionError& error) {
    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!endpointToSockaddr(endpoint, addr, addrLen)) {
        error.set(ErrorKind::ConnectFailed, "Not a numeric address: " + endpoint.host,
                  NetworkErrorKind::Unreachable);
        return false;
    }

    SocketHandle sock(::socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        error.set(ErrorKind::ConnectFailed, "socket() failed: " + socketErrorString(errno),
                  NetworkErrorKind::Other);
        return false;
    }
    if (!setNonBlocking(sock.get(), true)) {
        error.set(ErrorKind::ConnectFailed, "Failed to set non-blocking mode",
                  NetworkErrorKind::Other);
        return false;
    }

    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), addrLen) != 0 &&
        errno != EINPROGRESS) {
        const int err = errno;
        error.set(ErrorKind::ConnectFailed,
                  "connect to " + endpoint.toString() + " failed: " + socketErrorString(err),
                  classifyConnectErrno(err));
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        if (cancelFlag && cancelFlag->load()) {
            error.set(ErrorKind::Cancelled, "Connect cancelled");
            return false;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            error.set(ErrorKind::Timeout,
                      "connect to " + endpoint.toString() + " timed out after " +
                      std::to_string(timeoutMs) + " ms");
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int waitMs = static_cast<int>(
            std::min<int64_t>(remaining.count(), STOP_POLL_INTERVAL_MS));

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        const int rc = ::poll(&pfd, 1, waitMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            error.set(ErrorKind::ConnectFailed, "poll failed: " + socketErrorString(errno),
                      NetworkErrorKind::Other);
            return false;
        }
        if (rc == 0) {
            continue;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
            soError = errno;
        }
        if (soError != 0) {
            error.set(ErrorKind::ConnectFailed,
                      "connect to " + endpoint.toString() + " failed: " + socketErrorString(soError),
                      classifyConnectErrno(soError));
            return false;
        }
        break;
    }

    if (!setNonBlocking(sock.get(), false)) {
        error.set(ErrorKind::ConnectFailed, "Failed to restore blocking mode",
                  NetworkErrorKind::Other);
        return false;
    }

    fd = std::move(sock);
    return true;
}

std::vector<std::string> localInterfaceAddresses() {
    std::vector<std::string> out;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        return out;
    }

    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {};
        const sockaddr_in* v4 = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (::inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf))) {
            if (std::find(out.begin(), out.end(), buf) == out.end()) {
                out.emplace_back(buf);
            }
        }
    }

    ::freeifaddrs(list);
    return out;
}

bool sendAll(int fd, const uint8_t* data, size_t size, std::string& errorMsg) {
    size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "send failed: " + socketErrorString(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool recvAll(int fd, uint8_t* data, size_t size, std::string& errorMsg) {
    size_t received = 0;
    while (received < size) {
        const ssize_t n = ::recv(fd, data + received, size - received, 0);
        if (n == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "recv failed: " + socketErrorString(errno);
            return false;
        }
        received += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace FastDrop
