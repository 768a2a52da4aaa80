/**
 * @file LoopbackRadio.h
 * @brief In-process radio medium for tests and single-host runs
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "RadioAdapter.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace FastDrop {

class LoopbackRadio;

/**
 * @class LoopbackAir
 * @brief Shared medium connecting every LoopbackRadio attached to it
 *
 * Advertisements sent by one radio are delivered to every other radio that
 * is scanning. Tests can inject raw records and switch the medium off to
 * simulate an adapter that cannot be enabled.
 */
class LoopbackAir {
public:
    LoopbackAir() = default;

    LoopbackAir(const LoopbackAir&) = delete;
    LoopbackAir& operator=(const LoopbackAir&) = delete;

    /// When false, powerOn() fails on every attached radio
    void setAvailable(bool available);
    bool isAvailable() const;

    /**
     * @brief Deliver a raw advertisement to every scanning radio
     */
    void inject(const std::string& address,
                const std::vector<uint8_t>& record,
                std::optional<int> rssi = std::nullopt);

private:
    friend class LoopbackRadio;

    void attach(LoopbackRadio* radio);
    void detach(LoopbackRadio* radio);
    void broadcast(const LoopbackRadio* from, const RadioSighting& sighting);
    bool fetchBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg);

    mutable std::mutex m_mutex;
    std::vector<LoopbackRadio*> m_radios;
    std::atomic<bool> m_available{true};
};

/**
 * @class LoopbackRadio
 * @brief RadioAdapter backed by a LoopbackAir
 */
class LoopbackRadio : public RadioAdapter {
public:
    /**
     * @param air Shared medium
     * @param address Radio address; a random one is generated when empty
     * @param rssi Signal strength reported to scanners
     */
    explicit LoopbackRadio(std::shared_ptr<LoopbackAir> air,
                           std::string address = std::string(),
                           int rssi = -50);
    ~LoopbackRadio() override;

    LoopbackRadio(const LoopbackRadio&) = delete;
    LoopbackRadio& operator=(const LoopbackRadio&) = delete;

    bool powerOn(std::string& errorMsg) override;
    void powerOff() override;

    bool startAdvertising(const std::vector<uint8_t>& record, std::string& errorMsg) override;
    void stopAdvertising() override;

    bool publishBlob(const std::vector<uint8_t>& blob, std::string& errorMsg) override;

    bool startScanning(SightingHandler handler, std::string& errorMsg) override;
    void stopScanning() override;

    bool readBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) override;

    std::string localAddress() const override { return m_address; }

    bool isPowered() const { return m_powered.load(); }
    bool isAdvertising() const { return m_advertising.load(); }
    bool isScanning() const;

private:
    friend class LoopbackAir;

    void deliver(const RadioSighting& sighting);
    bool servesBlob(std::vector<uint8_t>& blob) const;
    void transmitterThreadFunc();

    std::shared_ptr<LoopbackAir> m_air;
    std::string m_address;
    int m_rssi;

    std::atomic<bool> m_powered{false};
    std::atomic<bool> m_advertising{false};

    mutable std::mutex m_advertMutex;
    std::vector<uint8_t> m_record;
    std::vector<uint8_t> m_blob;

    std::thread m_transmitterThread;
    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;

    mutable std::mutex m_handlerMutex;
    SightingHandler m_handler;
};

}  // namespace FastDrop
