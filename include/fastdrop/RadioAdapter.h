/**
 * @file RadioAdapter.h
 * @brief Abstract short-range radio used for discovery and ticket exchange
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "SessionError.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @brief Which activity currently owns the adapter
 */
enum class RadioRole {
    None,
    Advertising,
    Scanning
};

const char* radioRoleName(RadioRole role);

/**
 * @brief One advertisement as heard by the radio
 */
struct RadioSighting {
    std::string address;          ///< Radio address of the advertiser
    std::vector<uint8_t> record;  ///< Raw advertisement record
    std::optional<int> rssi;      ///< Signal strength, if reported
};

/// Called from the radio's own thread for every advertisement heard
using SightingHandler = std::function<void(const RadioSighting& sighting)>;

/**
 * @class RadioAdapter
 * @brief Platform radio boundary
 *
 * Implementations translate a platform radio (or a stand-in) into
 * advertise/scan/blob primitives. Advertising and scanning are mutually
 * exclusive on one adapter: callers reserve the adapter with acquire()
 * before powering it on.
 *
 * Thread Safety:
 * - acquire()/release() are thread-safe
 * - The sighting handler runs on an adapter thread; stopScanning() returns
 *   only after any in-flight handler call has finished
 */
class RadioAdapter {
public:
    virtual ~RadioAdapter() = default;

    /**
     * @brief Reserve the adapter for one role
     * @return false with RadioUnavailable if another role holds it
     */
    bool acquire(RadioRole role, SessionError& error);

    /// Give up a reservation made with acquire(role)
    void release(RadioRole role);

    RadioRole activeRole() const;

    virtual bool powerOn(std::string& errorMsg) = 0;
    virtual void powerOff() = 0;

    /// Broadcast record until stopAdvertising()
    virtual bool startAdvertising(const std::vector<uint8_t>& record, std::string& errorMsg) = 0;
    virtual void stopAdvertising() = 0;

    /// Make blob readable by scanners that heard our advertisement
    virtual bool publishBlob(const std::vector<uint8_t>& blob, std::string& errorMsg) = 0;

    virtual bool startScanning(SightingHandler handler, std::string& errorMsg) = 0;
    virtual void stopScanning() = 0;

    /**
     * @brief Connect to an advertiser and read its published blob
     */
    virtual bool readBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) = 0;

    /// Our own radio address
    virtual std::string localAddress() const = 0;

private:
    mutable std::mutex m_roleMutex;
    RadioRole m_role = RadioRole::None;
};

}  // namespace FastDrop
