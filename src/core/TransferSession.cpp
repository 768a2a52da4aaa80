/**
 * @file TransferSession.cpp
 * @brief Transfer protocol engine implementation
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/TransferSession.h"
#include "fastdrop/AtomicFile.h"
#include "fastdrop/Debug.h"
#include "fastdrop/HashUtils.h"
#include "fastdrop/PathSanitizer.h"
#include "fastdrop/ThreadSafeLog.h"
#include "fastdrop/TransportPolicy.h"

#include <algorithm>
#include <fstream>

// Worker threads report crashes to the session log file
#define LogTransferCrash(msg) FastDrop::ThreadSafeLog::log(msg)

namespace fs = std::filesystem;

namespace FastDrop {

const char* transferStateName(TransferState state) {
    switch (state) {
        case TransferState::AwaitingConnection: return "AwaitingConnection";
        case TransferState::ManifestExchange:   return "ManifestExchange";
        case TransferState::Streaming:          return "Streaming";
        case TransferState::Finalizing:         return "Finalizing";
        case TransferState::Complete:           return "Complete";
        case TransferState::Failed:             return "Failed";
    }
    return "Unknown";
}

//=============================================================================
// ThrottledProgress
//=============================================================================

ThrottledProgress::ThrottledProgress(TransferProgressCallback callback, uint32_t intervalMs)
    : m_callback(std::move(callback))
    , m_interval(intervalMs)
    , m_reported(false)
{
}

void ThrottledProgress::operator()(const TransferProgress& progress, bool force) {
    if (!m_callback) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const auto now = std::chrono::steady_clock::now();
    if (force || !m_reported || now - m_lastUpdate >= m_interval) {
        m_callback(progress);
        m_lastUpdate = now;
        m_reported = true;
    }
}

//=============================================================================
// TransferSession: Constructor / Destructor
//=============================================================================

TransferSession::TransferSession(TransferOptions options,
                                 TransferStateCallback stateCallback,
                                 TransferProgressCallback progressCallback)
    : m_options(std::move(options))
    , m_stateCallback(std::move(stateCallback))
    , m_progress(std::move(progressCallback), m_options.progressIntervalMs)
    , m_state(TransferState::AwaitingConnection)
    , m_cancelRequested(false)
    , m_failed(false)
    , m_peerAborted(false)
    , m_sessionBytes(0)
    , m_sessionTotal(0)
    , m_transferDoneSeen(false)
    , m_receiving(false)
    , m_connection(nullptr)
    , m_activeWorkers(0)
    , m_completedFiles(0)
    , m_nextFile(0)
{
    if (m_options.parallelStreams == 0) {
        m_options.parallelStreams = 1;
    }
}

TransferSession::~TransferSession() {
    joinWorkers();
}

//=============================================================================
// TransferSession: Public API
//=============================================================================

bool TransferSession::runSender(Connection& connection,
                                const FileManifest& manifest,
                                const std::vector<std::string>& sourcePaths,
                                SessionError& error) {
    m_manifest = manifest;
    m_sessionTotal = manifest.totalBytes();
    m_sourcePaths = sourcePaths;

    SessionError local;
    bool ok = begin(connection, local);
    if (ok && sourcePaths.size() != manifest.fileCount()) {
        local.set(ErrorKind::ManifestInvalid, "Manifest and source file list differ in length");
        ok = false;
    }

    // The receiver opens the control stream
    std::shared_ptr<TransportStream> control;
    if (ok) {
        std::string streamError;
        control = connection.acceptStream(m_options.idleTimeoutMs, streamError);
        if (!control) {
            if (m_cancelRequested.load()) {
                local.set(ErrorKind::Cancelled, "Transfer cancelled");
            } else if (connection.isClosed()) {
                local.set(ErrorKind::ConnectionLost, "Connection lost before the receiver spoke: " + streamError);
            } else {
                local.set(ErrorKind::Timeout, "Receiver never opened the control stream");
            }
            ok = false;
        }
    }

    ok = ok && senderHandshake(*control, local);
    if (ok) {
        ok = connection.supportsMultiplexing() ? sendMultiplexed(connection, *control, local)
                                               : sendSequential(*control, local);
    }
    ok = ok && senderFinalize(*control, local);

    if (!ok && local.isSet()) {
        recordFailure(local);
    }
    finish(connection, control.get(), ok, error);
    return ok;
}

bool TransferSession::runReceiver(Connection& connection, uint64_t expectedNonce, SessionError& error) {
    m_receiving = true;

    SessionError local;
    bool ok = begin(connection, local);

    std::shared_ptr<TransportStream> control;
    if (ok) {
        std::string streamError;
        control = connection.openStream(streamError);
        if (!control) {
            local.set(m_cancelRequested.load() ? ErrorKind::Cancelled : ErrorKind::ConnectionLost,
                      "Cannot open control stream: " + streamError);
            ok = false;
        }
    }

    ok = ok && receiverHandshake(*control, expectedNonce, local);
    if (ok) {
        ok = connection.supportsMultiplexing() ? receiveMultiplexed(connection, *control, local)
                                               : receiveSequential(*control, local);
    }
    ok = ok && receiverFinalize(*control, local);

    if (!ok && local.isSet()) {
        recordFailure(local);
    }
    finish(connection, control.get(), ok, error);
    return ok;
}

void TransferSession::cancel() {
    if (isTerminalState(m_state.load())) {
        return;
    }

    m_cancelRequested.store(true);
    recordFailure(SessionError(ErrorKind::Cancelled, "Transfer cancelled"));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection) {
        m_connection->close();
    }
}

std::vector<ReceivedFile> TransferSession::receivedFiles() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_received;
}

//=============================================================================
// TransferSession: Sender
//=============================================================================

bool TransferSession::senderHandshake(TransportStream& control, SessionError& error) {
    Frame frame;
    if (!readExpected(control, FrameType::HELLO, frame, error)) {
        return false;
    }

    uint64_t nonce = 0;
    if (!decodeHello(frame.payload, nonce)) {
        error.set(ErrorKind::ProtocolError, "Malformed HELLO frame");
        return false;
    }
    // Only a receiver that read our ticket knows the nonce
    if (nonce != m_manifest.nonce()) {
        error.set(ErrorKind::IdentityMismatch, "Receiver did not present this session's ticket nonce");
        return false;
    }

    const std::string manifestJson = m_manifest.toJson();
    if (manifestJson.size() > MAX_MANIFEST_BYTES) {
        error.set(ErrorKind::ManifestInvalid,
                  "Manifest exceeds " + std::to_string(MAX_MANIFEST_BYTES) + " bytes");
        return false;
    }
    if (!write(control, FrameType::MANIFEST,
               std::vector<uint8_t>(manifestJson.begin(), manifestJson.end()), error)) {
        return false;
    }

    if (!readExpected(control, FrameType::MANIFEST_ACK, frame, error)) {
        return false;
    }

    LOG_INFO("Receiver accepted manifest: " << m_manifest.fileCount() << " file(s), "
             << formatBytes(m_sessionTotal));
    return true;
}

bool TransferSession::sendSequential(TransportStream& control, SessionError& error) {
    setState(TransferState::Streaming);

    for (uint32_t index = 0; index < m_manifest.fileCount(); ++index) {
        if (!sendFile(control, index, &control, error)) {
            return false;
        }
    }
    return true;
}

bool TransferSession::sendMultiplexed(Connection& connection, TransportStream& control, SessionError& error) {
    setState(TransferState::Streaming);

    const uint32_t fileCount = static_cast<uint32_t>(m_manifest.fileCount());
    const size_t workerCount = std::min<size_t>(m_options.parallelStreams, fileCount);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_nextFile = 0;
        m_activeWorkers = workerCount;
    }

    for (size_t w = 0; w < workerCount; ++w) {
        m_workers.emplace_back([this, &connection, fileCount]() {
            try {
                while (!hasFailed()) {
                    uint32_t index = 0;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        if (m_nextFile >= fileCount) {
                            break;
                        }
                        index = m_nextFile++;
                    }

                    SessionError workerError;
                    std::string streamError;
                    std::shared_ptr<TransportStream> stream = connection.openStream(streamError);
                    if (!stream) {
                        workerError.set(m_cancelRequested.load() ? ErrorKind::Cancelled : ErrorKind::ConnectionLost,
                                        "Cannot open file stream: " + streamError);
                        recordFailure(workerError);
                        break;
                    }

                    if (!sendFile(*stream, index, nullptr, workerError)) {
                        if (workerError.isSet()) {
                            recordFailure(workerError);
                        }
                        break;
                    }
                    if (!stream->finish(streamError)) {
                        ioFailure(*stream, "finish file stream", streamError, workerError);
                        recordFailure(workerError);
                        break;
                    }
                }
            } catch (const std::exception& e) {
                LogTransferCrash(std::string("=== sender worker: UNCAUGHT EXCEPTION === ") + e.what());
                recordFailure(SessionError(ErrorKind::FileAccess, e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_activeWorkers;
            }
            m_cv.notify_all();
        });
    }

    // Watch the control stream for ABORT while the workers stream
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_activeWorkers > 0 && !m_failed.load()) {
        lock.unlock();
        if (control.hasPendingInput() && !handleControlInput(control, error)) {
            return false;
        }
        lock.lock();
        m_cv.wait_for(lock, std::chrono::milliseconds(STOP_POLL_INTERVAL_MS),
                      [this]() { return m_activeWorkers == 0 || m_failed.load(); });
    }
    lock.unlock();

    if (hasFailed()) {
        return false;
    }
    joinWorkers();
    return true;
}

bool TransferSession::sendFile(TransportStream& stream, uint32_t index,
                               TransportStream* abortWatch, SessionError& error) {
    const FileManifestEntry& entry = m_manifest.entries()[index];
    const std::string& sourcePath = m_sourcePaths[index];

    std::ifstream file(sourcePath, std::ios::binary);
    if (!file) {
        error.set(ErrorKind::FileAccess, "Cannot open " + sourcePath);
        return false;
    }

    FileMarker marker;
    marker.index = index;
    marker.length = entry.size;
    if (!write(stream, FrameType::FILE_BEGIN, marker.encode(), error)) {
        return false;
    }

    std::vector<uint8_t> buffer(CHUNK_SIZE);
    uint64_t sent = 0;
    while (sent < entry.size) {
        if (m_cancelRequested.load()) {
            error.set(ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
        if (hasFailed()) {
            return false;
        }
        if (abortWatch && abortWatch->hasPendingInput()) {
            handleControlInput(*abortWatch, error);
            return false;
        }

        const size_t want = static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, entry.size - sent));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const size_t got = static_cast<size_t>(file.gcount());
        if (got == 0) {
            break;
        }

        std::string ioError;
        if (!writeFrame(stream, FrameType::FILE_DATA, buffer.data(), got, ioError)) {
            ioFailure(stream, "send file data", ioError, error);
            return false;
        }

        sent += got;
        m_sessionBytes.fetch_add(got);
        reportProgress(index, sent, entry.size, false);

        if (got < want) {
            break;
        }
    }

    if (file.bad()) {
        error.set(ErrorKind::FileAccess, "Read error on " + sourcePath);
        return false;
    }

    // Bytes beyond the declared length mean the file grew after the manifest was built
    const bool grew = (sent == entry.size) &&
                      file.peek() != std::ifstream::traits_type::eof();

    marker.length = sent;
    if (!write(stream, FrameType::FILE_END, marker.encode(), error)) {
        return false;
    }

    if (sent != entry.size || grew) {
        error.set(ErrorKind::TruncatedTransfer,
                  entry.path + " changed size after the manifest was built (declared " +
                  std::to_string(entry.size) + " bytes, " +
                  (grew ? std::string("more available") : "read " + std::to_string(sent)) + ")");
        return false;
    }

    reportProgress(index, sent, entry.size, true);
    LOG_DEBUG("Sent " << entry.path << " (" << formatBytes(sent) << ") on stream " << stream.streamId());
    return true;
}

bool TransferSession::senderFinalize(TransportStream& control, SessionError& error) {
    setState(TransferState::Finalizing);

    if (!write(control, FrameType::TRANSFER_DONE, {}, error)) {
        return false;
    }

    Frame frame;
    if (!readExpected(control, FrameType::TRANSFER_DONE_ACK, frame, error)) {
        return false;
    }

    LOG_INFO("Transfer complete: " << m_manifest.fileCount() << " file(s), "
             << formatBytes(m_sessionTotal) << " acknowledged by receiver");
    return true;
}

//=============================================================================
// TransferSession: Receiver
//=============================================================================

bool TransferSession::receiverHandshake(TransportStream& control, uint64_t expectedNonce, SessionError& error) {
    if (!write(control, FrameType::HELLO, encodeHello(expectedNonce), error)) {
        return false;
    }

    Frame frame;
    if (!readExpected(control, FrameType::MANIFEST, frame, error)) {
        return false;
    }

    FileManifest manifest;
    if (!FileManifest::fromJson(std::string(frame.payload.begin(), frame.payload.end()), manifest, error)) {
        return false;
    }
    if (!manifest.validate(m_options.maxIncomingBytes, error)) {
        return false;
    }
    if (manifest.nonce() != expectedNonce) {
        error.set(ErrorKind::ManifestInvalid, "Manifest belongs to a different session");
        return false;
    }

    m_manifest = manifest;
    m_sessionTotal = manifest.totalBytes();

    if (!prepareDestination(error)) {
        return false;
    }
    if (!write(control, FrameType::MANIFEST_ACK, {}, error)) {
        return false;
    }

    LOG_INFO("Accepted manifest: " << m_manifest.fileCount() << " file(s), "
             << formatBytes(m_sessionTotal) << " into " << m_options.downloadDir);
    return true;
}

bool TransferSession::prepareDestination(SessionError& error) {
    const fs::path directory(m_options.downloadDir);

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory, ec)) {
        error.set(ErrorKind::FileAccess, "Download directory unavailable: " + m_options.downloadDir);
        return false;
    }

    m_destinations.clear();
    for (const FileManifestEntry& entry : m_manifest.entries()) {
        fs::path destination;
        std::string pathError;
        if (!resolveUnderDirectory(directory, entry.path, destination, pathError)) {
            error.set(ErrorKind::ManifestInvalid, pathError);
            return false;
        }
        m_destinations.push_back(destination);
    }
    return true;
}

bool TransferSession::receiveSequential(TransportStream& control, SessionError& error) {
    setState(TransferState::Streaming);

    for (uint32_t index = 0; index < m_manifest.fileCount(); ++index) {
        if (m_cancelRequested.load()) {
            error.set(ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
        if (!receiveFile(control, static_cast<int>(index), error)) {
            return false;
        }
    }
    return true;
}

bool TransferSession::receiveMultiplexed(Connection& connection, TransportStream& control, SessionError& error) {
    setState(TransferState::Streaming);

    const size_t fileCount = m_manifest.fileCount();
    size_t accepted = 0;
    auto lastAccept = std::chrono::steady_clock::now();

    while (accepted < fileCount) {
        if (hasFailed()) {
            return false;
        }
        if (!m_transferDoneSeen && control.hasPendingInput() && !handleControlInput(control, error)) {
            return false;
        }

        std::string streamError;
        std::shared_ptr<TransportStream> stream = connection.acceptStream(STOP_POLL_INTERVAL_MS, streamError);
        if (!stream) {
            if (connection.isClosed()) {
                error.set(m_cancelRequested.load() ? ErrorKind::Cancelled : ErrorKind::ConnectionLost,
                          "Connection lost while waiting for file streams: " + streamError);
                return false;
            }

            size_t active = 0;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                active = m_activeWorkers;
            }
            const auto idle = std::chrono::steady_clock::now() - lastAccept;
            if (active == 0 && m_options.idleTimeoutMs > 0 &&
                idle > std::chrono::milliseconds(m_options.idleTimeoutMs)) {
                error.set(ErrorKind::Timeout, "Sender stopped opening file streams (" +
                          std::to_string(accepted) + " of " + std::to_string(fileCount) + " received)");
                return false;
            }
            continue;
        }

        ++accepted;
        lastAccept = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_activeWorkers;
        }

        m_workers.emplace_back([this, stream]() {
            try {
                SessionError workerError;
                if (!receiveFile(*stream, -1, workerError) && workerError.isSet()) {
                    recordFailure(workerError);
                }
            } catch (const std::exception& e) {
                LogTransferCrash(std::string("=== receiver worker: UNCAUGHT EXCEPTION === ") + e.what());
                recordFailure(SessionError(ErrorKind::FileAccess, e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_activeWorkers;
            }
            m_cv.notify_all();
        });
    }

    // Every stream is accepted; wait for the workers to verify their files
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_activeWorkers > 0 && !m_failed.load()) {
        lock.unlock();
        if (!m_transferDoneSeen && control.hasPendingInput() && !handleControlInput(control, error)) {
            return false;
        }
        lock.lock();
        m_cv.wait_for(lock, std::chrono::milliseconds(STOP_POLL_INTERVAL_MS),
                      [this]() { return m_activeWorkers == 0 || m_failed.load(); });
    }
    lock.unlock();

    if (hasFailed()) {
        return false;
    }
    joinWorkers();
    return true;
}

bool TransferSession::receiveFile(TransportStream& stream, int expectedIndex, SessionError& error) {
    Frame frame;
    if (!readExpected(stream, FrameType::FILE_BEGIN, frame, error)) {
        return false;
    }

    FileMarker begin;
    if (!FileMarker::decode(frame.payload, begin) || begin.index >= m_manifest.fileCount()) {
        error.set(ErrorKind::ProtocolError, "Malformed FILE_BEGIN frame");
        return false;
    }
    if (expectedIndex >= 0 && begin.index != static_cast<uint32_t>(expectedIndex)) {
        error.set(ErrorKind::ProtocolError, "File " + std::to_string(begin.index) +
                  " arrived out of manifest order (expected " + std::to_string(expectedIndex) + ")");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_claimedFiles.insert(begin.index).second) {
            error.set(ErrorKind::ProtocolError, "File " + std::to_string(begin.index) + " sent twice");
            return false;
        }
    }

    const FileManifestEntry& entry = m_manifest.entries()[begin.index];
    if (begin.length != entry.size) {
        error.set(ErrorKind::TruncatedTransfer,
                  entry.path + ": stream declares " + std::to_string(begin.length) +
                  " bytes, manifest declares " + std::to_string(entry.size));
        return false;
    }

    const AtomicFilePaths paths = computeAtomicFilePaths(m_destinations[begin.index]);

    std::error_code ec;
    fs::create_directories(paths.tempPath.parent_path(), ec);
    if (ec) {
        error.set(ErrorKind::FileAccess, "Cannot create " + paths.tempPath.parent_path().string() +
                  ": " + ec.message());
        return false;
    }

    std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        error.set(ErrorKind::FileAccess, "Cannot create " + paths.tempPath.string());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_partialFiles.insert(paths.tempPath);
    }

    HashUtils::IncrementalHash hash;
    uint64_t received = 0;

    while (true) {
        if (!readAny(stream, frame, error)) {
            return false;
        }

        if (frame.type == FrameType::FILE_DATA) {
            if (frame.payload.size() > entry.size - received) {
                error.set(ErrorKind::TruncatedTransfer,
                          entry.path + ": sender streamed more than the declared " +
                          std::to_string(entry.size) + " bytes");
                return false;
            }
            out.write(reinterpret_cast<const char*>(frame.payload.data()),
                      static_cast<std::streamsize>(frame.payload.size()));
            if (!out) {
                error.set(ErrorKind::FileAccess, "Write error on " + paths.tempPath.string());
                return false;
            }
            if (entry.hasChecksum() && !hash.update(frame.payload.data(), frame.payload.size())) {
                error.set(ErrorKind::FileAccess, "SHA-256 update failed for " + entry.path);
                return false;
            }

            received += frame.payload.size();
            m_sessionBytes.fetch_add(frame.payload.size());
            reportProgress(begin.index, received, entry.size, false);
            continue;
        }

        if (frame.type == FrameType::FILE_END) {
            break;
        }

        if (frame.type == FrameType::ABORT) {
            m_peerAborted.store(true);
            const SessionError peer = decodeAbort(frame.payload);
            error.set(peer.kind, peer.message);
            return false;
        }

        error.set(ErrorKind::ProtocolError,
                  std::string("Unexpected ") + frameTypeName(frame.type) + " inside " + entry.path);
        return false;
    }

    out.close();
    if (out.fail()) {
        error.set(ErrorKind::FileAccess, "Cannot flush " + paths.tempPath.string());
        return false;
    }

    FileMarker end;
    if (!FileMarker::decode(frame.payload, end) || end.index != begin.index) {
        error.set(ErrorKind::ProtocolError, "Malformed FILE_END frame for " + entry.path);
        return false;
    }

    // Incomplete data stays under the ".part" name
    if (received != entry.size || end.length != received) {
        error.set(ErrorKind::TruncatedTransfer,
                  entry.path + ": received " + std::to_string(received) + " of " +
                  std::to_string(entry.size) + " bytes; partial data left in " + paths.tempPath.string());
        return false;
    }

    if (entry.hasChecksum()) {
        Sha256Digest actual{};
        Sha256Digest expected{};
        if (!hash.finalize(actual) || !HashUtils::fromHex(entry.sha256, expected)) {
            error.set(ErrorKind::FileAccess, "SHA-256 computation failed for " + entry.path);
            return false;
        }
        if (!HashUtils::digestsEqual(actual, expected)) {
            error.set(ErrorKind::ChecksumMismatch,
                      entry.path + ": SHA-256 " + HashUtils::toHex(actual) + " does not match manifest " +
                      entry.sha256 + "; data left in " + paths.tempPath.string());
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const fs::path finalPath = generateUniquePath(paths.finalPath, paths.tempPath);
        std::string renameError;
        if (!atomicRenameToFinal(paths.tempPath, finalPath, renameError)) {
            error.set(ErrorKind::FileAccess, renameError);
            return false;
        }
        m_partialFiles.erase(paths.tempPath);

        ReceivedFile file;
        file.index = begin.index;
        file.manifestPath = entry.path;
        file.path = finalPath;
        file.size = received;
        m_received.push_back(file);
        ++m_completedFiles;
    }

    reportProgress(begin.index, received, entry.size, true);
    LOG_DEBUG("Received " << entry.path << " (" << formatBytes(received) << ")");
    return true;
}

bool TransferSession::receiverFinalize(TransportStream& control, SessionError& error) {
    setState(TransferState::Finalizing);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_completedFiles != m_manifest.fileCount()) {
            error.set(ErrorKind::ProtocolError,
                      "Only " + std::to_string(m_completedFiles) + " of " +
                      std::to_string(m_manifest.fileCount()) + " files arrived");
            return false;
        }
    }

    Frame frame;
    if (!m_transferDoneSeen && !readExpected(control, FrameType::TRANSFER_DONE, frame, error)) {
        return false;
    }
    if (!write(control, FrameType::TRANSFER_DONE_ACK, {}, error)) {
        return false;
    }

    LOG_INFO("Received " << m_manifest.fileCount() << " file(s), " << formatBytes(m_sessionTotal)
             << " into " << m_options.downloadDir);
    return true;
}

//=============================================================================
// TransferSession: Shared helpers
//=============================================================================

bool TransferSession::begin(Connection& connection, SessionError& error) {
    if (m_state.load() != TransferState::AwaitingConnection) {
        error.set(ErrorKind::ProtocolError, "Transfer session already ran");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connection = &connection;
    }
    if (m_cancelRequested.load()) {
        error.set(ErrorKind::Cancelled, "Transfer cancelled");
        return false;
    }

    connection.setIdleTimeout(m_options.idleTimeoutMs);
    setState(TransferState::ManifestExchange);
    return true;
}

void TransferSession::finish(Connection& connection, TransportStream* control, bool success, SessionError& error) {
    if (success) {
        joinWorkers();
        setState(TransferState::Complete);
        connection.closeGracefully(m_options.abortLingerMs);
    } else {
        SessionError failure;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            failure = m_failure;
        }
        if (!failure.isSet()) {
            failure = SessionError(ErrorKind::ProtocolError, "Transfer failed");
        }

        // Tell the peer why, unless it already knows or cannot hear us
        const bool notifyPeer = control && !m_peerAborted.load() &&
                                failure.kind != ErrorKind::ConnectionLost &&
                                failure.kind != ErrorKind::Timeout &&
                                failure.kind != ErrorKind::Cancelled;
        std::string abortError;
        if (notifyPeer && writeFrame(*control, FrameType::ABORT, encodeAbort(failure), abortError)) {
            connection.closeGracefully(m_options.abortLingerMs);
        } else {
            if (notifyPeer) {
                LOG_DEBUG("Could not deliver ABORT: " << abortError);
            }
            connection.close();
        }

        joinWorkers();
        if (!m_options.keepPartialFiles) {
            removePartialFiles();
        }

        LOG_ERROR("Transfer failed: " << failure.toString());
        error.set(failure.kind, failure.message, failure.network);
        setState(TransferState::Failed);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_connection = nullptr;
}

bool TransferSession::readAny(TransportStream& stream, Frame& frame, SessionError& error) {
    std::string ioError;
    switch (readFrame(stream, frame, ioError)) {
        case FrameReadResult::Ok:
            return true;
        case FrameReadResult::Malformed:
            error.set(ErrorKind::ProtocolError, ioError);
            return false;
        case FrameReadResult::IoError:
            ioFailure(stream, "read", ioError, error);
            return false;
    }
    return false;
}

bool TransferSession::readExpected(TransportStream& stream, FrameType expected, Frame& frame, SessionError& error) {
    if (!readAny(stream, frame, error)) {
        return false;
    }

    if (frame.type == FrameType::ABORT) {
        m_peerAborted.store(true);
        const SessionError peer = decodeAbort(frame.payload);
        error.set(peer.kind, peer.message);
        return false;
    }
    if (frame.type != expected) {
        error.set(ErrorKind::ProtocolError, std::string("Expected ") + frameTypeName(expected) +
                  ", received " + frameTypeName(frame.type));
        return false;
    }
    return true;
}

bool TransferSession::write(TransportStream& stream, FrameType type,
                            const std::vector<uint8_t>& payload, SessionError& error) {
    std::string ioError;
    if (!writeFrame(stream, type, payload, ioError)) {
        ioFailure(stream, std::string("send ") + frameTypeName(type), ioError, error);
        return false;
    }
    return true;
}

void TransferSession::ioFailure(const TransportStream& stream, const std::string& what,
                                const std::string& detail, SessionError& error) {
    if (m_cancelRequested.load()) {
        error.set(ErrorKind::Cancelled, "Transfer cancelled");
    } else if (stream.timedOut()) {
        error.set(ErrorKind::Timeout, "No progress from peer (" + what + "): " + detail);
    } else {
        error.set(ErrorKind::ConnectionLost, "Connection lost (" + what + "): " + detail);
    }
}

bool TransferSession::handleControlInput(TransportStream& control, SessionError& error) {
    Frame frame;
    if (!readAny(control, frame, error)) {
        return false;
    }

    // Multiplexed receiver: DONE may overtake the last file streams
    if (frame.type == FrameType::TRANSFER_DONE && m_receiving) {
        m_transferDoneSeen = true;
        return true;
    }
    if (frame.type == FrameType::ABORT) {
        m_peerAborted.store(true);
        const SessionError peer = decodeAbort(frame.payload);
        error.set(peer.kind, peer.message);
        return false;
    }

    error.set(ErrorKind::ProtocolError,
              std::string("Unexpected ") + frameTypeName(frame.type) + " while files were streaming");
    return false;
}

void TransferSession::recordFailure(const SessionError& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_failure.isSet()) {
            m_failure = error;
        }
        m_failed.store(true);
    }
    m_cv.notify_all();
}

void TransferSession::setState(TransferState state) {
    m_state.store(state);
    LOG_DEBUG("Transfer state: " << transferStateName(state));
    if (m_stateCallback) {
        m_stateCallback(state);
    }
}

void TransferSession::reportProgress(uint32_t index, uint64_t fileBytes, uint64_t fileSize, bool force) {
    TransferProgress progress;
    progress.fileIndex = index;
    progress.fileBytes = fileBytes;
    progress.fileSize = fileSize;
    progress.sessionBytes = m_sessionBytes.load();
    progress.sessionTotal = m_sessionTotal;
    m_progress(progress, force);
}

void TransferSession::joinWorkers() {
    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void TransferSession::removePartialFiles() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const fs::path& partial : m_partialFiles) {
        std::error_code ec;
        fs::remove(partial, ec);
        if (ec) {
            LOG_WARNING("Could not remove " << partial.string() << ": " << ec.message());
        }
    }
    m_partialFiles.clear();
}

}  // namespace FastDrop
