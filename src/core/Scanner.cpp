/**
 * @file Scanner.cpp
 * @brief Bounded, deduplicated discovery scan
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/Scanner.h"
#include "fastdrop/AdvertRecord.h"
#include "fastdrop/config.h"
#include "fastdrop/Debug.h"
#include "fastdrop/ThreadSafeLog.h"

namespace FastDrop {

//=============================================================================
// ScanSession
//=============================================================================

ScanSession::ScanSession(Passkey, RadioAdapter& radio, std::set<std::string> serviceTags,
                         std::chrono::milliseconds duration)
    : m_radio(radio)
    , m_serviceTags(std::move(serviceTags))
    , m_deadline(std::chrono::steady_clock::now() + duration)
{
}

ScanSession::~ScanSession() {
    finish();
    m_radio.release(RadioRole::Scanning);
}

bool ScanSession::next(DiscoveredPeer& peer) {
    if (m_finished.load()) {
        return false;
    }

    switch (m_channel.popUntil(peer, m_deadline)) {
        case EventChannel<DiscoveredPeer>::PopResult::Item:
            return true;
        case EventChannel<DiscoveredPeer>::PopResult::Timeout:
        case EventChannel<DiscoveredPeer>::PopResult::Closed:
            break;
    }

    finish();
    return false;
}

void ScanSession::cancel() {
    m_cancelled = true;
    m_channel.close();
    finish();
}

std::vector<DiscoveredPeer> ScanSession::peers() const {
    std::vector<DiscoveredPeer> out;
    std::lock_guard<std::mutex> lock(m_peerMutex);
    out.reserve(m_seen.size());
    for (const auto& pair : m_seen) {
        out.push_back(pair.second);
    }
    return out;
}

bool ScanSession::readTicket(const DiscoveredPeer& peer, std::vector<uint8_t>& ticket, SessionError& error) {
    {
        std::lock_guard<std::mutex> lock(m_peerMutex);
        if (m_seen.find(peer.radioAddress) == m_seen.end()) {
            error.set(ErrorKind::PeerNotFound, "Peer " + peer.radioAddress + " was not seen by this scan");
            return false;
        }
    }

    std::lock_guard<std::mutex> radioLock(m_radioMutex);
    std::string errorMsg;

    // The window may have closed and powered the radio down
    const bool repower = m_finished.load();
    if (repower && !m_radio.powerOn(errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot enable radio: " + errorMsg);
        return false;
    }

    std::vector<uint8_t> blob;
    const bool ok = m_radio.readBlob(peer.radioAddress, blob, errorMsg);

    if (repower) {
        m_radio.powerOff();
    }

    if (!ok) {
        error.set(ErrorKind::RadioUnavailable, "Cannot read ticket from " + peer.displayName + ": " + errorMsg);
        return false;
    }
    if (blob.size() > MAX_TICKET_SIZE) {
        error.set(ErrorKind::TicketTooLarge,
                  "Ticket from " + peer.displayName + " is " + std::to_string(blob.size()) + " bytes");
        return false;
    }

    ticket = std::move(blob);
    ThreadSafeLog::log("Ticket read from " + peer.radioAddress + " (" + std::to_string(ticket.size()) + " bytes)");
    return true;
}

void ScanSession::onSighting(const RadioSighting& sighting) {
    AdvertRecord record;
    std::string errorMsg;
    if (!decodeAdvertRecord(sighting.record, record, errorMsg)) {
        ++m_skipped;
        LOG_DEBUG("Skipping advertisement from " << sighting.address << ": " << errorMsg);
        return;
    }
    if (m_serviceTags.find(record.serviceTag) == m_serviceTags.end()) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (m_finished.load() || now >= m_deadline) {
        return;
    }

    DiscoveredPeer fresh;
    {
        std::lock_guard<std::mutex> lock(m_peerMutex);
        auto it = m_seen.find(sighting.address);
        if (it != m_seen.end()) {
            it->second.lastSeen = now;
            it->second.displayName = record.displayName;
            if (sighting.rssi) {
                it->second.rssi = sighting.rssi;
            }
            return;
        }

        fresh = DiscoveredPeer(sighting.address, record.displayName, record.serviceTag);
        fresh.lastSeen = now;
        fresh.rssi = sighting.rssi;
        m_seen.emplace(sighting.address, fresh);
    }

    LOG_DEBUG("Discovered " << fresh.displayName << " at " << fresh.radioAddress);
    m_channel.push(std::move(fresh));
}

void ScanSession::finish() {
    std::lock_guard<std::mutex> lock(m_finishMutex);
    if (m_finished.exchange(true)) {
        return;
    }

    // stopScanning waits for an in-flight onSighting call
    {
        std::lock_guard<std::mutex> radioLock(m_radioMutex);
        m_radio.stopScanning();
        m_radio.powerOff();
    }
    m_channel.close();

    std::lock_guard<std::mutex> peerLock(m_peerMutex);
    ThreadSafeLog::log("Scan finished: " + std::to_string(m_seen.size()) + " peer(s), " +
                       std::to_string(m_skipped.load()) + " skipped advertisement(s)" +
                       (m_cancelled.load() ? ", cancelled" : ""));
}

//=============================================================================
// Scanner
//=============================================================================

std::unique_ptr<ScanSession> Scanner::scan(const std::vector<std::string>& serviceTags,
                                           uint32_t durationMs,
                                           SessionError& error) {
    if (!m_radio.acquire(RadioRole::Scanning, error)) {
        return nullptr;
    }

    std::set<std::string> tags(serviceTags.begin(), serviceTags.end());
    auto session = std::make_unique<ScanSession>(ScanSession::Passkey(), m_radio, std::move(tags),
                                                 std::chrono::milliseconds(durationMs));

    std::string errorMsg;
    if (!m_radio.powerOn(errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot enable radio: " + errorMsg);
        return nullptr;
    }

    ScanSession* raw = session.get();
    if (!m_radio.startScanning([raw](const RadioSighting& sighting) { raw->onSighting(sighting); },
                               errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot start scanning: " + errorMsg);
        return nullptr;
    }

    LOG_INFO("Scanning for " << durationMs << " ms");
    ThreadSafeLog::log("Scan started (" + std::to_string(durationMs) + " ms)");
    return session;
}

}  // namespace FastDrop
