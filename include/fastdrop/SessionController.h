/**
 * @file SessionController.h
 * @brief Drives discovery, ticket exchange, connection and transfer for one role
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "DiscoveredPeer.h"
#include "LocalIdentity.h"
#include "RadioAdapter.h"
#include "SessionError.h"
#include "SessionOptions.h"
#include "SessionTicket.h"
#include "TransferSession.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FastDrop {

class AdvertiseHandle;
class ScanSession;
class TransportDialer;
class TransportListener;

/**
 * @brief Coarse phase of a controller session, for UI display
 */
enum class SessionPhase {
    Idle,
    Preparing,      ///< Sender: building the manifest and binding the listener
    Advertising,    ///< Sender: waiting for a receiver
    Scanning,       ///< Receiver: collecting advertisements
    Connecting,     ///< Receiver: reading the ticket and dialing
    Transferring,   ///< Transfer engine running
    Complete,
    Failed
};

const char* sessionPhaseName(SessionPhase phase);

using SessionPhaseCallback = std::function<void(SessionPhase phase)>;

/// Called on the controller thread for every newly discovered sender
using PeerDiscoveredCallback = std::function<void(const DiscoveredPeer& peer)>;

/**
 * @brief Pick the sender to receive from once the scan window has closed
 * @return Index into peers, or -1 to give up
 */
using PeerSelector = std::function<int(const std::vector<DiscoveredPeer>& peers)>;

/**
 * @class SessionController
 * @brief Runs one sender or receiver session at a time
 *
 * Sender: manifest -> transport policy -> bind -> ticket -> advertise ->
 * accept -> stop advertising -> transfer.
 * Receiver: scan -> select -> read ticket -> dial and verify -> transfer.
 *
 * Any failure cancels whatever is still running and is reported as one
 * SessionError. Nothing is retried; a new attempt is a new run*() call.
 * The controller owns the process identity and borrows the radio.
 *
 * Thread Safety:
 * - run*() must not be called concurrently
 * - cancel() may be called from any thread
 */
class SessionController {
public:
    SessionController(std::shared_ptr<const LocalIdentity> identity,
                      RadioAdapter& radio,
                      SessionOptions options = SessionOptions());
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Create the process identity described by options
     *
     * Loads or creates a persistent identity when options.identityDir is
     * set, otherwise generates an ephemeral one.
     */
    static std::shared_ptr<const LocalIdentity> createIdentity(const SessionOptions& options,
                                                               std::string& errorMsg);

    /**
     * @brief Send files to the first receiver that dials in
     * @return true when the session reached Complete
     */
    bool runSender(const std::vector<std::string>& paths, SessionError& error);

    /**
     * @brief Scan, select a sender and receive its files
     * @return true when the session reached Complete
     */
    bool runReceiver(SessionError& error);

    /**
     * @brief Abort the running session (scan, accept, dial or transfer)
     *
     * When no session is running, the next run*() call fails with Cancelled.
     */
    void cancel();

    //-------------------------------------------------------------------------
    // Callbacks (set before run*)
    //-------------------------------------------------------------------------
    void setPhaseCallback(SessionPhaseCallback callback) { m_phaseCallback = std::move(callback); }
    void setStateCallback(TransferStateCallback callback) { m_stateCallback = std::move(callback); }
    void setProgressCallback(TransferProgressCallback callback) { m_progressCallback = std::move(callback); }
    void setPeerDiscoveredCallback(PeerDiscoveredCallback callback) { m_peerCallback = std::move(callback); }
    void setPeerSelector(PeerSelector selector) { m_peerSelector = std::move(selector); }

    //-------------------------------------------------------------------------
    // Accessors
    //-------------------------------------------------------------------------
    const PeerIdentity& identity() const { return m_identity->peerIdentity(); }
    SessionPhase phase() const { return m_phase.load(); }
    const SessionOptions& options() const { return m_options; }

    /// Ticket advertised (sender) or read (receiver) by the last session
    SessionTicket lastTicket() const;

    /// Manifest of the last session
    FileManifest lastManifest() const;

    /// Files stored by the last receiver session
    std::vector<ReceivedFile> receivedFiles() const;

private:
    bool beginSession(SessionError& error);
    bool endSession(bool success, const SessionError& error);
    void setPhase(SessionPhase phase);
    bool checkCancelled(SessionError& error) const;

    bool buildTicket(const TransportListener& listener, TransportProtocol protocol,
                     uint64_t nonce, SessionTicket& ticket, SessionError& error) const;
    bool selectPeer(ScanSession& scan, DiscoveredPeer& selected, SessionError& error);
    bool runTransfer(Connection& connection, bool sender, const FileManifest* manifest,
                     const std::vector<std::string>* paths, uint64_t nonce, SessionError& error);

    std::shared_ptr<const LocalIdentity> m_identity;
    RadioAdapter& m_radio;
    SessionOptions m_options;

    SessionPhaseCallback m_phaseCallback;
    TransferStateCallback m_stateCallback;
    TransferProgressCallback m_progressCallback;
    PeerDiscoveredCallback m_peerCallback;
    PeerSelector m_peerSelector;

    std::atomic<SessionPhase> m_phase;
    std::atomic<bool> m_running;
    std::atomic<bool> m_cancelRequested;

    mutable std::mutex m_mutex;  ///< Guards the members below
    AdvertiseHandle* m_activeAdvert;
    ScanSession* m_activeScan;
    TransportListener* m_activeListener;
    TransportDialer* m_activeDialer;
    TransferSession* m_activeTransfer;
    SessionTicket m_lastTicket;
    FileManifest m_lastManifest;
    std::vector<ReceivedFile> m_received;
};

}  // namespace FastDrop
