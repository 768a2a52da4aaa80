/**
 * @file TransferSession.h
 * @brief Transfer protocol engine: manifest exchange, streaming, finalization
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "FileManifest.h"
#include "SessionError.h"
#include "TransferFrame.h"
#include "TransportStream.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace FastDrop {

//=============================================================================
// Session State
//=============================================================================

/**
 * @brief State of a transfer session (both roles share the shape)
 *
 * AwaitingConnection -> ManifestExchange -> Streaming -> Finalizing -> Complete,
 * with Failed reachable from every non-terminal state.
 */
enum class TransferState : uint8_t {
    AwaitingConnection,
    ManifestExchange,
    Streaming,
    Finalizing,
    Complete,
    Failed
};

const char* transferStateName(TransferState state);

inline bool isTerminalState(TransferState state) {
    return state == TransferState::Complete || state == TransferState::Failed;
}

/**
 * @brief One progress report
 */
struct TransferProgress {
    uint32_t fileIndex = 0;     ///< Manifest index of the file being moved
    uint64_t fileBytes = 0;     ///< Bytes of that file moved so far
    uint64_t fileSize = 0;      ///< Declared size of that file
    uint64_t sessionBytes = 0;  ///< Bytes moved across all files
    uint64_t sessionTotal = 0;  ///< Manifest total
};

/**
 * @brief A file the receiver stored and verified
 */
struct ReceivedFile {
    uint32_t index = 0;
    std::string manifestPath;
    std::filesystem::path path;  ///< Final location (may carry a " (n)" suffix)
    uint64_t size = 0;
};

//=============================================================================
// Callback Types
//=============================================================================

/// Called on every state change, from the thread running the session
using TransferStateCallback = std::function<void(TransferState state)>;

/**
 * @brief Progress callback
 *
 * Throttled to one call per progressIntervalMs, plus a forced call when
 * each file completes. May be called from worker threads.
 */
using TransferProgressCallback = std::function<void(const TransferProgress& progress)>;

/**
 * @brief Engine tuning
 */
struct TransferOptions {
    std::string downloadDir = ".";                            ///< Receiver destination
    uint64_t maxIncomingBytes = DEFAULT_MAX_INCOMING_SIZE_BYTES;
    size_t parallelStreams = MAX_PARALLEL_STREAMS;            ///< Concurrent file streams (multiplexed only)
    uint32_t idleTimeoutMs = IDLE_TIMEOUT_MS;                 ///< 0 disables
    uint32_t progressIntervalMs = PROGRESS_THROTTLE_MS;
    uint32_t abortLingerMs = ABORT_LINGER_MS;
    bool keepPartialFiles = true;                             ///< Leave ".part" files after a failure
};

//=============================================================================
// ThrottledProgress
//=============================================================================

/**
 * @class ThrottledProgress
 * @brief Wraps a progress callback with throttling
 *
 * Callbacks are only invoked if at least intervalMs have elapsed since the
 * last one, unless the report is forced.
 */
class ThrottledProgress {
public:
    ThrottledProgress(TransferProgressCallback callback, uint32_t intervalMs);

    void operator()(const TransferProgress& progress, bool force = false);

private:
    TransferProgressCallback m_callback;
    std::chrono::milliseconds m_interval;
    std::chrono::steady_clock::time_point m_lastUpdate;
    bool m_reported;
    std::mutex m_mutex;
};

//=============================================================================
// TransferSession
//=============================================================================

/**
 * @class TransferSession
 * @brief Runs the transfer protocol over one verified Connection
 *
 * Usage (sender):
 * @code
 *   TransferSession session(options, onState, onProgress);
 *   SessionError error;
 *   bool ok = session.runSender(*connection, manifest, sourcePaths, error);
 * @endcode
 *
 * Usage (receiver):
 * @code
 *   TransferSession session(options, onState, onProgress);
 *   bool ok = session.runReceiver(*connection, ticket.nonce, error);
 * @endcode
 *
 * Tcp connections carry every file in manifest order on one stream.
 * Multiplexed connections carry one stream per file, up to parallelStreams
 * at a time; the receiver reassembles by the index in FILE_BEGIN.
 *
 * A session runs once. run*() returns after the connection is closed and
 * every worker thread has been joined.
 */
class TransferSession {
public:
    TransferSession(TransferOptions options,
                    TransferStateCallback stateCallback = nullptr,
                    TransferProgressCallback progressCallback = nullptr);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * @brief Serve the manifest to the connected receiver
     *
     * @param sourcePaths Local file for each manifest entry (same order)
     */
    bool runSender(Connection& connection,
                   const FileManifest& manifest,
                   const std::vector<std::string>& sourcePaths,
                   SessionError& error);

    /**
     * @brief Receive files into options.downloadDir
     *
     * @param expectedNonce Nonce from the ticket; echoed in HELLO and required
     *        in the manifest
     */
    bool runReceiver(Connection& connection, uint64_t expectedNonce, SessionError& error);

    /**
     * @brief Cancel a running session from any thread
     *
     * Blocked reads and writes return promptly; the session fails with
     * Cancelled.
     */
    void cancel();

    TransferState state() const { return m_state.load(); }

    /// Manifest sent or received (empty before ManifestExchange completes)
    const FileManifest& manifest() const { return m_manifest; }

    /// Verified files in completion order (receiver)
    std::vector<ReceivedFile> receivedFiles() const;

    uint64_t bytesTransferred() const { return m_sessionBytes.load(); }

private:
    //-------------------------------------------------------------------------
    // Sender
    //-------------------------------------------------------------------------
    bool senderHandshake(TransportStream& control, SessionError& error);
    bool sendSequential(TransportStream& control, SessionError& error);
    bool sendMultiplexed(Connection& connection, TransportStream& control, SessionError& error);
    bool sendFile(TransportStream& stream, uint32_t index, TransportStream* abortWatch, SessionError& error);
    bool senderFinalize(TransportStream& control, SessionError& error);

    //-------------------------------------------------------------------------
    // Receiver
    //-------------------------------------------------------------------------
    bool receiverHandshake(TransportStream& control, uint64_t expectedNonce, SessionError& error);
    bool prepareDestination(SessionError& error);
    bool receiveSequential(TransportStream& control, SessionError& error);
    bool receiveMultiplexed(Connection& connection, TransportStream& control, SessionError& error);
    bool receiveFile(TransportStream& stream, int expectedIndex, SessionError& error);
    bool receiverFinalize(TransportStream& control, SessionError& error);

    //-------------------------------------------------------------------------
    // Shared
    //-------------------------------------------------------------------------
    bool begin(Connection& connection, SessionError& error);
    void finish(Connection& connection, TransportStream* control, bool success, SessionError& error);

    /// Read one frame, mapping I/O failures and peer ABORT to session errors
    bool readExpected(TransportStream& stream, FrameType expected, Frame& frame, SessionError& error);
    bool readAny(TransportStream& stream, Frame& frame, SessionError& error);
    bool write(TransportStream& stream, FrameType type, const std::vector<uint8_t>& payload, SessionError& error);

    /// Cancelled, Timeout or ConnectionLost for a failed stream operation
    void ioFailure(const TransportStream& stream, const std::string& what,
                   const std::string& detail, SessionError& error);

    /**
     * @brief Handle a control frame that arrived while files were streaming
     *
     * TRANSFER_DONE is remembered (receiver); ABORT and anything else fail.
     */
    bool handleControlInput(TransportStream& control, SessionError& error);

    void recordFailure(const SessionError& error);
    bool hasFailed() const { return m_failed.load(); }
    void setState(TransferState state);
    void reportProgress(uint32_t index, uint64_t fileBytes, uint64_t fileSize, bool force);
    void joinWorkers();
    void removePartialFiles();

    TransferOptions m_options;
    TransferStateCallback m_stateCallback;
    ThrottledProgress m_progress;

    std::atomic<TransferState> m_state;
    std::atomic<bool> m_cancelRequested;
    std::atomic<bool> m_failed;
    std::atomic<bool> m_peerAborted;
    std::atomic<uint64_t> m_sessionBytes;

    FileManifest m_manifest;
    uint64_t m_sessionTotal;
    bool m_transferDoneSeen;
    bool m_receiving;
    std::vector<std::string> m_sourcePaths;
    std::vector<std::filesystem::path> m_destinations;  ///< Desired final path per entry

    mutable std::mutex m_mutex;  ///< Guards the members below
    std::condition_variable m_cv;
    SessionError m_failure;
    Connection* m_connection;
    std::vector<ReceivedFile> m_received;
    std::set<uint32_t> m_claimedFiles;
    std::set<std::filesystem::path> m_partialFiles;
    size_t m_activeWorkers;
    size_t m_completedFiles;
    uint32_t m_nextFile;
    std::vector<std::thread> m_workers;
};

}  // namespace FastDrop
