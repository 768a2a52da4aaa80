/**
 * @file Scanner.h
 * @brief Receiver-side discovery: bounded, deduplicated scan for senders
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "DiscoveredPeer.h"
#include "EventChannel.h"
#include "RadioAdapter.h"
#include "SessionError.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @class ScanSession
 * @brief One scan window, consumed as a lazy sequence of new peers
 *
 * Radio events are translated into DiscoveredPeer values on the radio's
 * thread and handed to the consumer through an EventChannel. Every radio
 * address is yielded at most once; repeat sightings only refresh lastSeen
 * and rssi. The sequence ends when the window elapses or cancel() is
 * called, and cannot be restarted.
 *
 * The radio stays reserved for scanning until the session is destroyed so
 * readTicket() can still reach a selected peer after the window closed.
 */
class ScanSession {
public:
    /// Construction token; only Scanner::scan() can create one
    class Passkey {
        friend class Scanner;
        Passkey() {}
    };

    ScanSession(Passkey, RadioAdapter& radio, std::set<std::string> serviceTags,
                std::chrono::milliseconds duration);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    /**
     * @brief Wait for the next newly-seen peer
     * @return false once the window has elapsed or the scan was cancelled
     */
    bool next(DiscoveredPeer& peer);

    /// End the sequence early; unblocks a pending next()
    void cancel();

    bool isFinished() const { return m_finished.load(); }
    bool wasCancelled() const { return m_cancelled.load(); }

    /// Snapshot of every peer seen so far, with refreshed lastSeen/rssi
    std::vector<DiscoveredPeer> peers() const;

    /// Advertisements dropped because they could not be decoded
    size_t skippedAdvertisements() const { return m_skipped.load(); }

    /**
     * @brief Read the ticket blob published by a discovered peer
     * @return false with RadioUnavailable, PeerNotFound or TicketTooLarge
     */
    bool readTicket(const DiscoveredPeer& peer, std::vector<uint8_t>& ticket, SessionError& error);

private:
    friend class Scanner;

    void onSighting(const RadioSighting& sighting);
    void finish();

    RadioAdapter& m_radio;
    const std::set<std::string> m_serviceTags;
    const std::chrono::steady_clock::time_point m_deadline;

    EventChannel<DiscoveredPeer> m_channel;

    mutable std::mutex m_peerMutex;
    std::map<std::string, DiscoveredPeer> m_seen;

    std::mutex m_finishMutex;
    std::mutex m_radioMutex;
    std::atomic<bool> m_finished{false};
    std::atomic<bool> m_cancelled{false};
    std::atomic<size_t> m_skipped{0};
};

/**
 * @class Scanner
 * @brief Starts scan windows on a radio adapter
 */
class Scanner {
public:
    explicit Scanner(RadioAdapter& radio) : m_radio(radio) {}

    /**
     * @brief Scan for advertisements of any of serviceTags for durationMs
     * @return Running scan, or nullptr with RadioUnavailable
     */
    std::unique_ptr<ScanSession> scan(const std::vector<std::string>& serviceTags,
                                      uint32_t durationMs,
                                      SessionError& error);

private:
    RadioAdapter& m_radio;
};

}  // namespace FastDrop
