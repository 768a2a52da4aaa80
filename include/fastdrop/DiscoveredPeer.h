/**
 * @file DiscoveredPeer.h
 * @brief Peer information structure for discovered devices
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace FastDrop {

    /**
     * @brief A sender heard during a scan
     *
     * Created on the first matching advertisement from a radio address and
     * updated (lastSeen, rssi, name) on every repeat sighting within the
     * same scan. Only the scan that produced it may update it.
     */
    struct DiscoveredPeer {
        std::string radioAddress;                          ///< Radio-level address (deduplication key)
        std::string displayName;                           ///< Name advertised by the sender
        std::string serviceTag;                            ///< Service tag from the advertisement
        std::chrono::steady_clock::time_point lastSeen;    ///< Timestamp of the latest sighting
        std::optional<int> rssi;                           ///< Signal strength hint (dBm), if the radio reports one

        DiscoveredPeer() : lastSeen(std::chrono::steady_clock::now()) {}

        DiscoveredPeer(const std::string& address, const std::string& name, const std::string& tag)
            : radioAddress(address), displayName(name), serviceTag(tag),
              lastSeen(std::chrono::steady_clock::now()) {}
    };

}  // namespace FastDrop
