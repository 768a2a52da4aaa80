/**
 * @file SessionController.cpp
 * @brief Sender and receiver session orchestration
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/SessionController.h"
#include "fastdrop/Advertiser.h"
#include "fastdrop/Scanner.h"
#include "fastdrop/SocketUtils.h"
#include "fastdrop/TicketCodec.h"
#include "fastdrop/TransportDialer.h"
#include "fastdrop/TransportListener.h"
#include "fastdrop/TransportPolicy.h"
#include "fastdrop/UuidGenerator.h"
#include "fastdrop/Debug.h"
#include "fastdrop/ThreadSafeLog.h"

namespace FastDrop {

namespace {
    #define LogSession(msg) FastDrop::ThreadSafeLog::log(msg)

    /**
     * @brief Publishes a running sub-operation to cancel() for its lifetime
     */
    template <typename T>
    class ActiveGuard {
    public:
        ActiveGuard(std::mutex& mutex, T*& slot, T* value)
            : m_mutex(mutex), m_slot(slot) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_slot = value;
        }
        ~ActiveGuard() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_slot = nullptr;
        }

        ActiveGuard(const ActiveGuard&) = delete;
        ActiveGuard& operator=(const ActiveGuard&) = delete;

    private:
        std::mutex& m_mutex;
        T*& m_slot;
    };
}

const char* sessionPhaseName(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle:         return "Idle";
        case SessionPhase::Preparing:    return "Preparing";
        case SessionPhase::Advertising:  return "Advertising";
        case SessionPhase::Scanning:     return "Scanning";
        case SessionPhase::Connecting:   return "Connecting";
        case SessionPhase::Transferring: return "Transferring";
        case SessionPhase::Complete:     return "Complete";
        case SessionPhase::Failed:       return "Failed";
    }
    return "Unknown";
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

SessionController::SessionController(std::shared_ptr<const LocalIdentity> identity,
                                     RadioAdapter& radio,
                                     SessionOptions options)
    : m_identity(std::move(identity))
    , m_radio(radio)
    , m_options(std::move(options))
    , m_phase(SessionPhase::Idle)
    , m_running(false)
    , m_cancelRequested(false)
    , m_activeAdvert(nullptr)
    , m_activeScan(nullptr)
    , m_activeListener(nullptr)
    , m_activeDialer(nullptr)
    , m_activeTransfer(nullptr)
{
}

SessionController::~SessionController() {
    cancel();
}

std::shared_ptr<const LocalIdentity> SessionController::createIdentity(const SessionOptions& options,
                                                                       std::string& errorMsg) {
    const std::string commonName = options.displayName.empty() ? SERVICE_NAME : options.displayName;
    if (!options.identityDir.empty()) {
        return LocalIdentity::loadOrCreate(options.identityDir, commonName, errorMsg);
    }
    return LocalIdentity::generate(commonName, errorMsg);
}

//=============================================================================
// Public Methods
//=============================================================================

bool SessionController::runSender(const std::vector<std::string>& paths, SessionError& error) {
    if (!beginSession(error)) {
        return false;
    }
    setPhase(SessionPhase::Preparing);
    if (checkCancelled(error)) {
        return endSession(false, error);
    }

    uint64_t nonce = 0;
    if (!UuidGenerator::randomU64(nonce)) {
        error.set(ErrorKind::ProtocolError, "Random number generator failed");
        return endSession(false, error);
    }

    FileManifest manifest;
    if (!FileManifest::buildFromFiles(paths, m_options.computeChecksums, nonce, manifest, error)) {
        return endSession(false, error);
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastManifest = manifest;
    }

    // Decided once, from the fixed file set, before anything is bound
    const TransportProtocol protocol = TransportPolicy::choose(manifest.fileCount(), manifest.totalBytes());
    LOG_INFO("Sending " << manifest.fileCount() << " file(s), " << formatBytes(manifest.totalBytes())
             << " via " << transportProtocolName(protocol) << " ("
             << TransportPolicy::explain(manifest.fileCount(), manifest.totalBytes()) << ")");

    TransportListener listener(m_identity);
    ActiveGuard<TransportListener> listenerGuard(m_mutex, m_activeListener, &listener);
    if (checkCancelled(error) || !listener.bind(protocol, m_options.bindAddress, error)) {
        return endSession(false, error);
    }

    SessionTicket ticket;
    if (!buildTicket(listener, protocol, nonce, ticket, error)) {
        return endSession(false, error);
    }
    std::vector<uint8_t> ticketBytes;
    if (!TicketCodec::encode(ticket, ticketBytes, error)) {
        return endSession(false, error);
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastTicket = ticket;
    }

    Advertiser advertiser(m_radio);
    std::unique_ptr<AdvertiseHandle> advert =
        advertiser.advertise(serviceTagFor(protocol), m_options.displayName, ticketBytes, error);
    if (!advert) {
        return endSession(false, error);
    }
    ActiveGuard<AdvertiseHandle> advertGuard(m_mutex, m_activeAdvert, advert.get());
    setPhase(SessionPhase::Advertising);
    LogSession("Sender advertising, listening on " + listener.localEndpoint().toString());

    if (checkCancelled(error)) {
        return endSession(false, error);
    }
    std::unique_ptr<Connection> connection = listener.acceptOne(m_options.acceptTimeoutMs, error);

    // One receiver per session
    advert->stop();
    if (!connection) {
        return endSession(false, error);
    }

    LOG_INFO("Receiver " << connection->peerIdentity() << " connected from " << connection->peerAddress());
    const bool ok = runTransfer(*connection, true, &manifest, &paths, nonce, error);
    return endSession(ok, error);
}

bool SessionController::runReceiver(SessionError& error) {
    if (!beginSession(error)) {
        return false;
    }
    setPhase(SessionPhase::Scanning);
    if (checkCancelled(error)) {
        return endSession(false, error);
    }

    Scanner scanner(m_radio);
    const std::vector<std::string> serviceTags = {serviceTagFor(TransportProtocol::Quic),
                                                  serviceTagFor(TransportProtocol::Tcp)};
    std::unique_ptr<ScanSession> scan = scanner.scan(serviceTags, m_options.scanDurationMs, error);
    if (!scan) {
        return endSession(false, error);
    }

    DiscoveredPeer selected;
    std::vector<uint8_t> ticketBytes;
    {
        ActiveGuard<ScanSession> scanGuard(m_mutex, m_activeScan, scan.get());
        if (!selectPeer(*scan, selected, error)) {
            return endSession(false, error);
        }

        setPhase(SessionPhase::Connecting);
        if (!scan->readTicket(selected, ticketBytes, error)) {
            return endSession(false, error);
        }
    }
    // Releases the radio before any network activity
    scan.reset();

    SessionTicket ticket;
    if (!TicketCodec::decode(ticketBytes, ticket, error)) {
        return endSession(false, error);
    }

    TransportProtocol advertised = TransportProtocol::Quic;
    if (!protocolForServiceTag(selected.serviceTag, advertised) || advertised != ticket.protocol) {
        error.set(ErrorKind::TicketMalformed,
                  std::string("Ticket protocol ") + transportProtocolName(ticket.protocol) +
                  " does not match the advertised service " + selected.serviceTag);
        return endSession(false, error);
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastTicket = ticket;
    }
    LogSession("Ticket from " + selected.displayName + ": " + transportProtocolName(ticket.protocol) +
               ", sender " + ticket.senderIdentity.shortId());

    TransportDialer dialer(m_identity);
    std::unique_ptr<Connection> connection;
    {
        ActiveGuard<TransportDialer> dialerGuard(m_mutex, m_activeDialer, &dialer);
        if (checkCancelled(error)) {
            return endSession(false, error);
        }
        connection = dialer.dial(ticket, m_options.connectTimeoutMs, error);
    }
    if (!connection) {
        return endSession(false, error);
    }

    LOG_INFO("Connected to " << selected.displayName << " (" << ticket.senderIdentity << ") via "
             << transportProtocolName(ticket.protocol));
    const bool ok = runTransfer(*connection, false, nullptr, nullptr, ticket.nonce, error);
    return endSession(ok, error);
}

void SessionController::cancel() {
    m_cancelRequested = true;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activeAdvert) {
        m_activeAdvert->stop();
    }
    if (m_activeScan) {
        m_activeScan->cancel();
    }
    if (m_activeListener) {
        m_activeListener->cancel();
    }
    if (m_activeDialer) {
        m_activeDialer->cancel();
    }
    if (m_activeTransfer) {
        m_activeTransfer->cancel();
    }
}

SessionTicket SessionController::lastTicket() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastTicket;
}

FileManifest SessionController::lastManifest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastManifest;
}

std::vector<ReceivedFile> SessionController::receivedFiles() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_received;
}

//=============================================================================
// Private Helper Methods
//=============================================================================

bool SessionController::beginSession(SessionError& error) {
    if (m_running.exchange(true)) {
        error.set(ErrorKind::ProtocolError, "A session is already running on this controller");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastTicket = SessionTicket();
        m_lastManifest = FileManifest();
        m_received.clear();
    }
    return true;
}

bool SessionController::endSession(bool success, const SessionError& error) {
    if (success) {
        setPhase(SessionPhase::Complete);
        LogSession("Session complete");
    } else {
        setPhase(SessionPhase::Failed);
        LOG_ERROR("Session failed: " << error.toString());
        LogSession("Session failed: " + error.toString());
    }
    // A cancel() issued before the next run*() starts applies to that run
    m_cancelRequested = false;
    m_running = false;
    return success;
}

void SessionController::setPhase(SessionPhase phase) {
    m_phase = phase;
    LOG_DEBUG("Session phase: " << sessionPhaseName(phase));
    if (m_phaseCallback) {
        m_phaseCallback(phase);
    }
}

bool SessionController::checkCancelled(SessionError& error) const {
    if (m_cancelRequested.load()) {
        error.set(ErrorKind::Cancelled, "Session cancelled");
        return true;
    }
    return false;
}

bool SessionController::buildTicket(const TransportListener& listener, TransportProtocol protocol,
                                    uint64_t nonce, SessionTicket& ticket, SessionError& error) const {
    ticket.protocol = protocol;
    ticket.senderIdentity = m_identity->peerIdentity();
    ticket.nonce = nonce;
    ticket.endpoints.clear();

    const uint16_t port = listener.localEndpoint().port;
    if (m_options.advertisedAddresses.empty()) {
        ticket.endpoints = listener.reachableEndpoints();
    } else {
        for (const auto& host : m_options.advertisedAddresses) {
            std::string canonical;
            if (!canonicalizeHost(host, canonical)) {
                error.set(ErrorKind::TicketMalformed, "Advertised address is not an IP literal: " + host);
                return false;
            }
            ticket.endpoints.emplace_back(canonical, port);
        }
    }

    if (ticket.endpoints.empty()) {
        error.set(ErrorKind::TicketMalformed, "No reachable address to advertise");
        return false;
    }
    return true;
}

bool SessionController::selectPeer(ScanSession& scan, DiscoveredPeer& selected, SessionError& error) {
    std::vector<DiscoveredPeer> discovered;
    DiscoveredPeer peer;
    while (scan.next(peer)) {
        LOG_INFO("Found " << peer.displayName << " (" << peer.radioAddress << ")");
        if (m_peerCallback) {
            m_peerCallback(peer);
        }
        discovered.push_back(peer);
        if (m_options.stopScanOnFirstPeer) {
            scan.cancel();
            break;
        }
    }

    if (checkCancelled(error)) {
        return false;
    }

    // Refresh lastSeen/rssi, keeping discovery order
    for (const auto& latest : scan.peers()) {
        for (auto& known : discovered) {
            if (known.radioAddress == latest.radioAddress) {
                known = latest;
            }
        }
    }

    if (discovered.empty()) {
        error.set(ErrorKind::PeerNotFound, "No FastDrop sender found within " +
                  std::to_string(m_options.scanDurationMs) + " ms");
        return false;
    }

    int choice = 0;
    if (m_peerSelector) {
        choice = m_peerSelector(discovered);
    }
    if (checkCancelled(error)) {
        return false;
    }
    if (choice < 0 || static_cast<size_t>(choice) >= discovered.size()) {
        error.set(ErrorKind::PeerNotFound, "No sender selected");
        return false;
    }

    selected = discovered[static_cast<size_t>(choice)];
    LogSession("Selected " + selected.displayName + " (" + selected.radioAddress + ")");
    return true;
}

bool SessionController::runTransfer(Connection& connection, bool sender, const FileManifest* manifest,
                                    const std::vector<std::string>* paths, uint64_t nonce,
                                    SessionError& error) {
    setPhase(SessionPhase::Transferring);

    TransferSession transfer(m_options.transferOptions(), m_stateCallback, m_progressCallback);
    bool ok = false;
    {
        ActiveGuard<TransferSession> transferGuard(m_mutex, m_activeTransfer, &transfer);
        if (m_cancelRequested.load()) {
            transfer.cancel();
        }
        ok = sender ? transfer.runSender(connection, *manifest, *paths, error)
                    : transfer.runReceiver(connection, nonce, error);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!sender) {
        m_lastManifest = transfer.manifest();
        m_received = transfer.receivedFiles();
    }
    return ok;
}

}  // namespace FastDrop
