/**
 * @file LoopbackRadio.cpp
 * @brief In-process radio medium
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/LoopbackRadio.h"
#include "fastdrop/UuidGenerator.h"
#include "fastdrop/config.h"
#include "fastdrop/Debug.h"

#include <algorithm>
#include <chrono>

namespace FastDrop {

//=============================================================================
// LoopbackAir
//=============================================================================

void LoopbackAir::setAvailable(bool available) {
    m_available = available;
}

bool LoopbackAir::isAvailable() const {
    return m_available.load();
}

void LoopbackAir::inject(const std::string& address,
                         const std::vector<uint8_t>& record,
                         std::optional<int> rssi) {
    RadioSighting sighting;
    sighting.address = address;
    sighting.record = record;
    sighting.rssi = rssi;
    broadcast(nullptr, sighting);
}

void LoopbackAir::attach(LoopbackRadio* radio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_radios.push_back(radio);
}

void LoopbackAir::detach(LoopbackRadio* radio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_radios.erase(std::remove(m_radios.begin(), m_radios.end(), radio), m_radios.end());
}

void LoopbackAir::broadcast(const LoopbackRadio* from, const RadioSighting& sighting) {
    // Held during delivery so a radio cannot detach mid-call
    std::lock_guard<std::mutex> lock(m_mutex);
    for (LoopbackRadio* radio : m_radios) {
        if (radio != from) {
            radio->deliver(sighting);
        }
    }
}

bool LoopbackAir::fetchBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) {
    if (!isAvailable()) {
        errorMsg = "Radio medium unavailable";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const LoopbackRadio* radio : m_radios) {
        if (radio->localAddress() == address) {
            if (radio->servesBlob(blob)) {
                return true;
            }
            errorMsg = "Peer " + address + " is not advertising a blob";
            return false;
        }
    }
    errorMsg = "Peer " + address + " is out of range";
    return false;
}

//=============================================================================
// LoopbackRadio
//=============================================================================

LoopbackRadio::LoopbackRadio(std::shared_ptr<LoopbackAir> air, std::string address, int rssi)
    : m_air(std::move(air))
    , m_address(std::move(address))
    , m_rssi(rssi)
{
    if (m_address.empty()) {
        m_address = UuidGenerator::generateWithPrefix("loop_");
    }
    m_air->attach(this);
}

LoopbackRadio::~LoopbackRadio() {
    powerOff();
    m_air->detach(this);
}

bool LoopbackRadio::powerOn(std::string& errorMsg) {
    if (!m_air->isAvailable()) {
        errorMsg = "Loopback radio is switched off";
        return false;
    }
    m_powered = true;
    return true;
}

void LoopbackRadio::powerOff() {
    stopAdvertising();
    stopScanning();
    m_powered = false;
}

bool LoopbackRadio::startAdvertising(const std::vector<uint8_t>& record, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    if (m_advertising.exchange(true)) {
        errorMsg = "Radio is already advertising";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_advertMutex);
        m_record = record;
    }
    m_transmitterThread = std::thread(&LoopbackRadio::transmitterThreadFunc, this);
    return true;
}

void LoopbackRadio::stopAdvertising() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        if (!m_advertising.exchange(false)) {
            return;
        }
    }
    m_stopCv.notify_all();

    if (m_transmitterThread.joinable()) {
        m_transmitterThread.join();
    }

    std::lock_guard<std::mutex> lock(m_advertMutex);
    m_record.clear();
    m_blob.clear();
}

bool LoopbackRadio::publishBlob(const std::vector<uint8_t>& blob, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_advertMutex);
    m_blob = blob;
    return true;
}

bool LoopbackRadio::startScanning(SightingHandler handler, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handler = std::move(handler);
    return true;
}

void LoopbackRadio::stopScanning() {
    // Waits for an in-flight deliver() holding the handler mutex
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handler = nullptr;
}

bool LoopbackRadio::isScanning() const {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    return static_cast<bool>(m_handler);
}

bool LoopbackRadio::readBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    return m_air->fetchBlob(address, blob, errorMsg);
}

void LoopbackRadio::deliver(const RadioSighting& sighting) {
    if (!m_powered) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    if (m_handler) {
        m_handler(sighting);
    }
}

bool LoopbackRadio::servesBlob(std::vector<uint8_t>& blob) const {
    if (!m_advertising) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_advertMutex);
    if (m_blob.empty()) {
        return false;
    }
    blob = m_blob;
    return true;
}

void LoopbackRadio::transmitterThreadFunc() {
    LOG_DEBUG("Loopback radio " << m_address << " advertising");

    while (m_advertising) {
        if (m_air->isAvailable()) {
            RadioSighting sighting;
            sighting.address = m_address;
            sighting.rssi = m_rssi;
            {
                std::lock_guard<std::mutex> lock(m_advertMutex);
                sighting.record = m_record;
            }
            m_air->broadcast(this, sighting);
        }

        std::unique_lock<std::mutex> lock(m_stopMutex);
        m_stopCv.wait_for(lock, std::chrono::milliseconds(ADVERTISE_INTERVAL_MS),
                          [this]() { return !m_advertising.load(); });
    }

    LOG_DEBUG("Loopback radio " << m_address << " stopped advertising");
}

}  // namespace FastDrop
