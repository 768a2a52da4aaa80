/**
 * @file TransportStream.h
 * @brief Abstract connection and stream interfaces used by the transfer engine
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "Endpoint.h"
#include "PeerIdentity.h"
#include "SessionTicket.h"

#include <cstdint>
#include <memory>
#include <string>

namespace FastDrop {

/**
 * @brief Ordered, reliable byte stream inside a Connection
 *
 * A stream is used by one thread at a time.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;

    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Half-close: no more data will be sent on this stream
     */
    virtual bool finish(std::string& errorMsg) = 0;

    /**
     * @brief Whether a recvExact() would make progress without blocking
     */
    virtual bool hasPendingInput() = 0;

    /// Last failed I/O was a timeout rather than a broken connection
    virtual bool timedOut() const = 0;

    virtual uint32_t streamId() const = 0;
};

/**
 * @brief Authenticated, encrypted connection between sender and receiver
 *
 * Tcp connections carry exactly one stream. Multiplexed connections open
 * any number of independent streams; the dialer opens the control stream.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual TransportProtocol protocol() const = 0;
    virtual bool supportsMultiplexing() const = 0;

    /**
     * @brief Open a new outgoing stream (nullptr on failure)
     */
    virtual std::shared_ptr<TransportStream> openStream(std::string& errorMsg) = 0;

    /**
     * @brief Wait for a stream opened by the peer
     *
     * @param timeoutMs 0 waits until the connection closes
     * @return Stream, or nullptr on timeout, close or failure (errorMsg set)
     */
    virtual std::shared_ptr<TransportStream> acceptStream(uint32_t timeoutMs, std::string& errorMsg) = 0;

    virtual const PeerIdentity& peerIdentity() const = 0;
    virtual Endpoint peerAddress() const = 0;

    /// Closed locally or lost; no further stream will arrive
    virtual bool isClosed() const = 0;

    /// Maximum time a blocked read waits for data (0 = no limit)
    virtual void setIdleTimeout(uint32_t timeoutMs) = 0;

    /**
     * @brief Abort the connection; blocked calls return with an error (thread-safe)
     */
    virtual void close() = 0;

    /**
     * @brief Flush queued data, then close; waits at most lingerMs for the peer
     */
    virtual void closeGracefully(uint32_t lingerMs) = 0;
};

}  // namespace FastDrop
