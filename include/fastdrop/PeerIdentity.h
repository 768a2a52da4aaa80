/**
 * @file PeerIdentity.h
 * @brief Device identity derived from a certificate fingerprint
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace FastDrop {

/**
 * @brief Opaque, globally unique identity of a device's protocol stack
 *
 * The value is the SHA-256 fingerprint of the device's self-signed TLS
 * certificate. Canonical text form is 64 uppercase hex characters with no
 * separators; the wire form is the 32 raw digest bytes.
 *
 * An empty (default constructed) identity never equals a valid one.
 */
class PeerIdentity {
public:
    using Bytes = std::array<uint8_t, HASH_SIZE>;

    PeerIdentity() = default;

    /**
     * @brief Build from a fingerprint string
     *
     * Accepts ':' separators, whitespace and either case.
     *
     * @return false (and leaves out empty) on invalid input
     */
    static bool fromFingerprint(const std::string& fingerprint, PeerIdentity& out);

    /**
     * @brief Build from the 32 raw digest bytes
     */
    static PeerIdentity fromBytes(const Bytes& bytes);

    /**
     * @brief Normalize a SHA-256 fingerprint to canonical form.
     * @return 64 uppercase hex characters, or empty string on invalid input.
     */
    static std::string normalizeSha256Hex(const std::string& input);

    bool isValid() const { return m_valid; }

    /// Canonical 64 uppercase hex form
    std::string toString() const;

    /// "AB:CD:..." colon separated form for user display
    std::string toDisplayString() const;

    /// First eight hex characters, used in log lines
    std::string shortId() const;

    const Bytes& bytes() const { return m_bytes; }

    bool operator==(const PeerIdentity& other) const;
    bool operator!=(const PeerIdentity& other) const { return !(*this == other); }

private:
    Bytes m_bytes{};
    bool m_valid = false;
};

inline std::ostream& operator<<(std::ostream& os, const PeerIdentity& id) {
    return os << (id.isValid() ? id.shortId() : std::string("<none>"));
}

}  // namespace FastDrop
