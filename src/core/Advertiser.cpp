/**
 * @file Advertiser.cpp
 * @brief Advertise a service tag and publish the ticket blob
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/Advertiser.h"
#include "fastdrop/AdvertRecord.h"
#include "fastdrop/config.h"
#include "fastdrop/Debug.h"
#include "fastdrop/ThreadSafeLog.h"

namespace FastDrop {

//=============================================================================
// AdvertiseHandle
//=============================================================================

AdvertiseHandle::AdvertiseHandle(Passkey, RadioAdapter& radio, std::string serviceTag)
    : m_radio(radio)
    , m_serviceTag(std::move(serviceTag))
{
}

AdvertiseHandle::~AdvertiseHandle() {
    stop();
}

void AdvertiseHandle::stop() {
    std::lock_guard<std::mutex> lock(m_stopMutex);
    if (!m_active.exchange(false)) {
        return;
    }

    m_radio.stopAdvertising();
    m_radio.powerOff();
    m_radio.release(RadioRole::Advertising);

    LOG_DEBUG("Stopped advertising " << m_serviceTag);
    ThreadSafeLog::log("Advertising stopped: " + m_serviceTag);
}

//=============================================================================
// Advertiser
//=============================================================================

std::unique_ptr<AdvertiseHandle> Advertiser::advertise(const std::string& serviceTag,
                                                       const std::string& displayName,
                                                       const std::vector<uint8_t>& ticketBytes,
                                                       SessionError& error) {
    if (ticketBytes.size() > MAX_TICKET_SIZE) {
        error.set(ErrorKind::TicketTooLarge,
                  "Ticket is " + std::to_string(ticketBytes.size()) + " bytes, limit is " +
                  std::to_string(MAX_TICKET_SIZE));
        return nullptr;
    }

    if (!m_radio.acquire(RadioRole::Advertising, error)) {
        return nullptr;
    }

    // Handle owns the reservation from here on; its destructor undoes the rest
    auto handle = std::make_unique<AdvertiseHandle>(AdvertiseHandle::Passkey(), m_radio, serviceTag);

    std::string errorMsg;
    if (!m_radio.powerOn(errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot enable radio: " + errorMsg);
        return nullptr;
    }

    if (!m_radio.publishBlob(ticketBytes, errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot publish ticket: " + errorMsg);
        return nullptr;
    }

    AdvertRecord record;
    record.serviceTag = serviceTag;
    record.displayName = displayName;
    if (!m_radio.startAdvertising(encodeAdvertRecord(record), errorMsg)) {
        error.set(ErrorKind::RadioUnavailable, "Cannot start advertising: " + errorMsg);
        return nullptr;
    }

    LOG_INFO("Advertising " << serviceTag << " as \"" << displayName << "\" ("
             << ticketBytes.size() << " byte ticket)");
    ThreadSafeLog::log("Advertising started: " + serviceTag);
    return handle;
}

}  // namespace FastDrop
