/**
 * @file Endpoint.h
 * @brief Numeric network endpoint (IP literal + port)
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace FastDrop {

/**
 * @brief Reachable (address, port) pair
 *
 * host is always a numeric IPv4 or IPv6 literal in canonical inet_ntop form;
 * host names are never resolved.
 */
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    Endpoint() = default;
    Endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    bool isIpv6() const { return host.find(':') != std::string::npos; }

    /// "192.168.1.20:40001" or "[fe80::1]:40001"
    std::string toString() const {
        if (isIpv6()) {
            return "[" + host + "]:" + std::to_string(port);
        }
        return host + ":" + std::to_string(port);
    }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Endpoint& ep) {
    return os << ep.toString();
}

}  // namespace FastDrop
