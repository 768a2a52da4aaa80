/**
 * @file Advertiser.h
 * @brief Sender-side discovery: advertise a service and publish the ticket
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "RadioAdapter.h"
#include "SessionError.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FastDrop {

/**
 * @class AdvertiseHandle
 * @brief Running advertisement; stops and releases the radio on stop() or destruction
 */
class AdvertiseHandle {
public:
    /// Construction token; only Advertiser::advertise() can create one
    class Passkey {
        friend class Advertiser;
        Passkey() {}
    };

    AdvertiseHandle(Passkey, RadioAdapter& radio, std::string serviceTag);
    ~AdvertiseHandle();

    AdvertiseHandle(const AdvertiseHandle&) = delete;
    AdvertiseHandle& operator=(const AdvertiseHandle&) = delete;

    /// Stop advertising, power the radio off and release it. Idempotent.
    void stop();

    bool isActive() const { return m_active.load(); }

    const std::string& serviceTag() const { return m_serviceTag; }

private:
    RadioAdapter& m_radio;
    std::string m_serviceTag;
    std::mutex m_stopMutex;
    std::atomic<bool> m_active{true};
};

/**
 * @class Advertiser
 * @brief Broadcasts a discoverable record and makes the ticket readable
 */
class Advertiser {
public:
    explicit Advertiser(RadioAdapter& radio) : m_radio(radio) {}

    /**
     * @brief Start advertising serviceTag with ticketBytes published as the blob
     *
     * @return Handle that keeps the advertisement alive, or nullptr with
     *         TicketTooLarge or RadioUnavailable
     */
    std::unique_ptr<AdvertiseHandle> advertise(const std::string& serviceTag,
                                               const std::string& displayName,
                                               const std::vector<uint8_t>& ticketBytes,
                                               SessionError& error);

private:
    RadioAdapter& m_radio;
};

}  // namespace FastDrop
