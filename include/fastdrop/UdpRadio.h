/**
 * @file UdpRadio.h
 * @brief LAN stand-in for a short-range radio using UDP broadcast beacons
 *
 * Advertising broadcasts a JSON beacon carrying the advertisement record
 * and the port of a small TCP server that hands out the published blob.
 * Scanning listens for those beacons on the beacon port.
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "RadioAdapter.h"
#include "Endpoint.h"
#include "SocketUtils.h"
#include "config.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace FastDrop {

/// Largest beacon datagram sent or accepted
constexpr size_t MAX_BEACON_BYTES = 1024;

/// Beacon protocol identifier
constexpr const char* RADIO_BEACON_PROTOCOL_ID = "fastdrop-radio";

/**
 * @brief Runtime configuration of a UdpRadio
 */
struct UdpRadioOptions {
    uint16_t beaconPort = UDP_RADIO_PORT;    ///< Port scanners listen on
    std::vector<std::string> targets;       ///< Beacon destinations; empty = interface broadcast addresses
    std::string blobBindAddress = "0.0.0.0"; ///< Address of the blob server
};

/**
 * @class UdpRadio
 * @brief RadioAdapter over UDP beacons and a TCP blob server
 *
 * Threading:
 * - Transmitter thread: sends a beacon every ADVERTISE_INTERVAL_MS
 * - Blob server thread: serves the published blob as u16 length + bytes
 * - Listener thread: receives beacons and calls the sighting handler
 */
class UdpRadio : public RadioAdapter {
public:
    explicit UdpRadio(UdpRadioOptions options = UdpRadioOptions());
    ~UdpRadio() override;

    UdpRadio(const UdpRadio&) = delete;
    UdpRadio& operator=(const UdpRadio&) = delete;

    bool powerOn(std::string& errorMsg) override;
    void powerOff() override;

    bool startAdvertising(const std::vector<uint8_t>& record, std::string& errorMsg) override;
    void stopAdvertising() override;

    bool publishBlob(const std::vector<uint8_t>& blob, std::string& errorMsg) override;

    bool startScanning(SightingHandler handler, std::string& errorMsg) override;
    void stopScanning() override;

    bool readBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) override;

    std::string localAddress() const override { return m_address; }

    /// Port of the blob server while advertising, 0 otherwise
    uint16_t blobPort() const { return m_blobPort.load(); }

    /**
     * @brief Subnet broadcast addresses of local interfaces plus 255.255.255.255
     */
    static std::vector<std::string> getBroadcastAddresses();

private:
    void transmitterThreadFunc();
    void blobServerThreadFunc();
    void listenerThreadFunc();

    std::string generateBeaconJson() const;
    void parseBeacon(const std::string& jsonStr, const std::string& senderIp);
    void serveBlob(int clientFd);

    UdpRadioOptions m_options;
    std::string m_address;
    std::atomic<bool> m_powered{false};

    // Advertising
    std::atomic<bool> m_advertising{false};
    SocketHandle m_sendSocket;
    SocketHandle m_blobSocket;
    std::atomic<uint16_t> m_blobPort{0};
    mutable std::mutex m_advertMutex;
    std::vector<uint8_t> m_record;
    std::vector<uint8_t> m_blob;
    std::thread m_transmitterThread;
    std::thread m_blobServerThread;
    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;

    // Scanning
    std::atomic<bool> m_scanning{false};
    SocketHandle m_listenSocket;
    SightingHandler m_handler;
    std::thread m_listenerThread;

    // Radio address -> blob server endpoint, learned from beacons
    mutable std::mutex m_peerMutex;
    std::map<std::string, Endpoint> m_knownPeers;
};

}  // namespace FastDrop
