/**
 * @file config.h
 * @brief Configuration constants for FastDrop
 *
 * This file contains the compile-time configuration constants used throughout
 * FastDrop: discovery identifiers, timing values, buffer sizes, protocol
 * identifiers, transport policy thresholds and TLS configuration.
 *
 * Runtime overrides for a subset of these values live in SessionOptions.
 *
 * @note Changes to wire-level constants affect protocol compatibility.
 *       Ensure all peers use compatible configurations.
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace FastDrop
 * @brief FastDrop namespace containing all public APIs
 */
namespace FastDrop {

//=========================================================================
// Discovery
//=========================================================================

/** @defgroup Discovery Discovery Configuration
 * @brief Service tags, advertisement record and scan timing
 * @{
 */

/// Service tag advertised by a sender that chose the Quic transport
constexpr const char* QUIC_SERVICE_UUID = "12345678-1234-5678-1234-56789ABCDEF0";

/// Characteristic exposing the ticket of a Quic sender
constexpr const char* QUIC_TICKET_CHARACTERISTIC_UUID = "ABCDEFAB-CDEF-1234-5678-1234567890AB";

/// Service tag advertised by a sender that chose the Tcp transport
constexpr const char* TCP_SERVICE_UUID = "87654321-4321-8765-4321-FEDCBA987654";

/// Characteristic exposing the ticket of a Tcp sender
constexpr const char* TCP_TICKET_CHARACTERISTIC_UUID = "BAFEDCBA-FEDC-4321-8765-BA0987654321";

/// Local name carried by every advertisement
constexpr const char* SERVICE_NAME = "Fastdrop";

/// Advertisement record format version
constexpr int ADVERT_RECORD_VERSION = 1;

/// Largest advertisement record accepted from the air
constexpr size_t MAX_ADVERT_RECORD_BYTES = 256;

/// Default scan window (15 seconds)
constexpr uint32_t DEFAULT_SCAN_DURATION_MS = 15000;

/// Interval between repeated advertisements
constexpr uint32_t ADVERTISE_INTERVAL_MS = 250;

/// Poll granularity of radio and accept loops (stop flag checks)
constexpr uint32_t STOP_POLL_INTERVAL_MS = 100;

/// UDP port used by the LAN radio for beacons
constexpr uint16_t UDP_RADIO_PORT = 41900;

/// Timeout for reading a ticket blob from an advertiser
constexpr uint32_t BLOB_READ_TIMEOUT_MS = 5000;

/** @} */ // end of Discovery

//=========================================================================
// Ticket
//=========================================================================

/** @defgroup Ticket Session Ticket Configuration
 * @{
 */

/// Largest encoded ticket the discovery channel transfers in one read
constexpr size_t MAX_TICKET_SIZE = 512;

/// Current ticket format version
constexpr uint8_t TICKET_VERSION = 1;

/// Fixed ticket prefix: version, protocol tag, body length
constexpr size_t TICKET_PREFIX_SIZE = 4;

/** @} */ // end of Ticket

//=========================================================================
// Transport Policy
//=========================================================================

/** @defgroup Policy Transport Policy Thresholds
 * @brief Quic is chosen above this file count or below this byte total
 * @{
 */

constexpr uint32_t POLICY_MAX_TCP_FILE_COUNT = 5;
constexpr uint64_t POLICY_MIN_TCP_TOTAL_BYTES = 100000000ULL;

/** @} */ // end of Policy

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @{
 */

/// Bounded connect and handshake timeout (30 seconds)
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;

/// Read timeout once a session is streaming (5 minutes without progress)
constexpr uint32_t IDLE_TIMEOUT_MS = 300000;

/// Progress callback throttle
constexpr uint32_t PROGRESS_THROTTLE_MS = 50;

/// How long a failing side waits for the peer to read its ABORT frame
constexpr uint32_t ABORT_LINGER_MS = 2000;

/** @} */ // end of Timing

//=========================================================================
// Transfer Protocol
//=========================================================================

/** @defgroup Protocol Transfer Protocol Configuration
 * @{
 */

/// Frame magic, ASCII "FDRP"
constexpr uint32_t FRAME_MAGIC = 0x46445250;

/// Transfer protocol version carried in every frame header
constexpr uint8_t PROTOCOL_VERSION = 1;

/// Size of the fixed frame header
constexpr size_t FRAME_HEADER_SIZE = 12;

/// File data chunk size (64 KB)
constexpr size_t CHUNK_SIZE = 65536;

/// Largest accepted manifest payload (4 MB)
constexpr size_t MAX_MANIFEST_BYTES = 4 * 1024 * 1024;

/// Largest accepted control payload (ABORT, HELLO, FILE_BEGIN ...)
constexpr size_t MAX_CONTROL_PAYLOAD_BYTES = 4096;

/// Largest number of files a manifest may declare
constexpr size_t MAX_MANIFEST_ENTRIES = 10000;

/// Largest path component accepted from a manifest
constexpr size_t MAX_PATH_COMPONENT_BYTES = 240;

/// Largest relative path accepted from a manifest
constexpr size_t MAX_RELATIVE_PATH_BYTES = 1024;

/// SHA-256 digest size
constexpr size_t HASH_SIZE = 32;

/// Default cap on the total size of one incoming session (10 GB)
constexpr uint64_t DEFAULT_MAX_INCOMING_SIZE_BYTES = 10ULL * 1024ULL * 1024ULL * 1024ULL;

/// File buffer size used for hashing and streaming reads
constexpr size_t BUFFER_SIZE = 262144;  // 256 KB

/// Files streamed concurrently over a multiplexed connection
constexpr size_t MAX_PARALLEL_STREAMS = 4;

/// Suffix of files still being received
constexpr const char* PARTIAL_FILE_SUFFIX = ".part";

/** @} */ // end of Protocol

//=========================================================================
// QUIC Transport
//=========================================================================

/** @defgroup Quic QUIC Transport Configuration
 * @{
 */

/// ALPN protocol id offered and required on QUIC connections (wire format)
constexpr unsigned char QUIC_ALPN[] = {10, 'f', 'a', 's', 't', 'd', 'r', 'o', 'p', '/', '1'};

/** @} */ // end of Quic

//=========================================================================
// TLS/SSL Configuration
//=========================================================================

/** @defgroup TLS TLS/SSL Configuration
 * @brief TLS 1.3 secures every transport; peer identity is the
 *        certificate fingerprint.
 * @{
 */

/// TLS 1.3 cipher suites
constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:"
    "TLS_CHACHA20_POLY1305_SHA256:"
    "TLS_AES_128_GCM_SHA256";

/// Key exchange groups
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

/// Maximum TLS record size
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/// Socket buffer size requested for transfer sockets
constexpr int SOCKET_BUFFER_BYTES = 4 * 1024 * 1024;

/// Identity certificate validity
constexpr int CERT_VALIDITY_DAYS = 365;

/// Organization field of identity certificates
constexpr const char* CERT_ORGANIZATION = "FastDrop";

/// Persisted identity file names (inside the identity directory)
constexpr const char* CERT_FILENAME = "fastdrop_cert.pem";
constexpr const char* KEY_FILENAME = "fastdrop_key.pem";

/** @} */ // end of TLS

}  // namespace FastDrop
