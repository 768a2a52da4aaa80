/**
 * @file UdpRadio.cpp
 * @brief UDP beacon radio with a TCP blob server
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/UdpRadio.h"
#include "fastdrop/Debug.h"
#include "fastdrop/ThreadSafeLog.h"
#include "fastdrop/UuidGenerator.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <system_error>

using json = nlohmann::json;

namespace FastDrop {

namespace {
    #define LogRadio(msg) FastDrop::ThreadSafeLog::log(msg)

    constexpr const char* LIMITED_BROADCAST = "255.255.255.255";
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

UdpRadio::UdpRadio(UdpRadioOptions options)
    : m_options(std::move(options))
    , m_address(UuidGenerator::generateWithPrefix("udp_"))
{
}

UdpRadio::~UdpRadio() {
    powerOff();
}

//=============================================================================
// Power
//=============================================================================

bool UdpRadio::powerOn(std::string& errorMsg) {
    // Probe that the stack can create datagram sockets at all
    SocketHandle probe(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!probe.valid()) {
        errorMsg = "Cannot create UDP socket: " + socketErrorString(errno);
        return false;
    }
    m_powered = true;
    return true;
}

void UdpRadio::powerOff() {
    stopAdvertising();
    stopScanning();
    m_powered = false;
}

//=============================================================================
// Advertising
//=============================================================================

bool UdpRadio::startAdvertising(const std::vector<uint8_t>& record, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    if (m_advertising.load()) {
        errorMsg = "Radio is already advertising";
        return false;
    }

    SocketHandle sendSocket(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sendSocket.valid()) {
        errorMsg = "Cannot create beacon socket: " + socketErrorString(errno);
        return false;
    }
    int enable = 1;
    if (::setsockopt(sendSocket.get(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
        errorMsg = "Cannot enable broadcast: " + socketErrorString(errno);
        return false;
    }

    // Blob server on an ephemeral port
    Endpoint blobEndpoint(m_options.blobBindAddress, 0);
    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!endpointToSockaddr(blobEndpoint, addr, addrLen)) {
        errorMsg = "Invalid blob bind address: " + m_options.blobBindAddress;
        return false;
    }
    SocketHandle blobSocket(::socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!blobSocket.valid()) {
        errorMsg = "Cannot create blob socket: " + socketErrorString(errno);
        return false;
    }
    ::setsockopt(blobSocket.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
    if (::bind(blobSocket.get(), reinterpret_cast<sockaddr*>(&addr), addrLen) != 0 ||
        ::listen(blobSocket.get(), 4) != 0) {
        errorMsg = "Cannot bind blob server: " + socketErrorString(errno);
        return false;
    }
    sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(blobSocket.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) != 0) {
        errorMsg = "getsockname failed: " + socketErrorString(errno);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_advertMutex);
        m_record = record;
    }
    m_sendSocket = std::move(sendSocket);
    m_blobSocket = std::move(blobSocket);
    m_blobPort = sockaddrToEndpoint(bound).port;
    m_advertising = true;

    try {
        m_transmitterThread = std::thread(&UdpRadio::transmitterThreadFunc, this);
        m_blobServerThread = std::thread(&UdpRadio::blobServerThreadFunc, this);
    } catch (const std::system_error& e) {
        errorMsg = std::string("Cannot start radio threads: ") + e.what();
        stopAdvertising();
        return false;
    }

    LogRadio("UdpRadio " + m_address + " advertising, blob port " + std::to_string(m_blobPort.load()));
    return true;
}

void UdpRadio::stopAdvertising() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        m_advertising = false;
    }
    m_stopCv.notify_all();

    if (m_transmitterThread.joinable()) {
        m_transmitterThread.join();
    }
    if (m_blobServerThread.joinable()) {
        m_blobServerThread.join();
    }

    m_sendSocket.reset();
    m_blobSocket.reset();
    m_blobPort = 0;

    std::lock_guard<std::mutex> lock(m_advertMutex);
    m_record.clear();
    m_blob.clear();
}

bool UdpRadio::publishBlob(const std::vector<uint8_t>& blob, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    if (blob.size() > MAX_TICKET_SIZE) {
        errorMsg = "Blob exceeds " + std::to_string(MAX_TICKET_SIZE) + " bytes";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_advertMutex);
    m_blob = blob;
    return true;
}

//=============================================================================
// Scanning
//=============================================================================

bool UdpRadio::startScanning(SightingHandler handler, std::string& errorMsg) {
    if (!m_powered) {
        errorMsg = "Radio is not powered on";
        return false;
    }
    if (m_scanning.load()) {
        errorMsg = "Radio is already scanning";
        return false;
    }

    SocketHandle listenSocket(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!listenSocket.valid()) {
        errorMsg = "Cannot create scan socket: " + socketErrorString(errno);
        return false;
    }

    int enable = 1;
    ::setsockopt(listenSocket.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    sockaddr_in bindAddr{};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    bindAddr.sin_port = htons(m_options.beaconPort);
    if (::bind(listenSocket.get(), reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) != 0) {
        errorMsg = "Cannot bind beacon port " + std::to_string(m_options.beaconPort) +
                   ": " + socketErrorString(errno);
        return false;
    }

    m_listenSocket = std::move(listenSocket);
    m_handler = std::move(handler);
    m_scanning = true;

    try {
        m_listenerThread = std::thread(&UdpRadio::listenerThreadFunc, this);
    } catch (const std::system_error& e) {
        errorMsg = std::string("Cannot start listener thread: ") + e.what();
        m_scanning = false;
        m_listenSocket.reset();
        m_handler = nullptr;
        return false;
    }

    LogRadio("UdpRadio " + m_address + " scanning on port " + std::to_string(m_options.beaconPort));
    return true;
}

void UdpRadio::stopScanning() {
    m_scanning = false;

    // The listener polls with a short timeout, so the join is bounded
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    m_listenSocket.reset();
    m_handler = nullptr;
}

//=============================================================================
// Blob Read
//=============================================================================

bool UdpRadio::readBlob(const std::string& address, std::vector<uint8_t>& blob, std::string& errorMsg) {
    Endpoint endpoint;
    {
        std::lock_guard<std::mutex> lock(m_peerMutex);
        auto it = m_knownPeers.find(address);
        if (it == m_knownPeers.end()) {
            errorMsg = "Unknown radio address " + address;
            return false;
        }
        endpoint = it->second;
    }

    SocketHandle fd;
    SessionError connectError;
    if (!connectWithTimeout(endpoint, BLOB_READ_TIMEOUT_MS, nullptr, fd, connectError)) {
        errorMsg = "Cannot reach " + endpoint.toString() + ": " + connectError.message;
        return false;
    }
    setSocketTimeouts(fd.get(), BLOB_READ_TIMEOUT_MS, BLOB_READ_TIMEOUT_MS);

    uint8_t lengthBytes[2];
    if (!recvAll(fd.get(), lengthBytes, sizeof(lengthBytes), errorMsg)) {
        return false;
    }
    const size_t length = (static_cast<size_t>(lengthBytes[0]) << 8) | lengthBytes[1];
    if (length == 0) {
        errorMsg = "Peer " + address + " has no published blob";
        return false;
    }
    if (length > MAX_TICKET_SIZE) {
        errorMsg = "Blob from " + address + " exceeds " + std::to_string(MAX_TICKET_SIZE) + " bytes";
        return false;
    }

    blob.resize(length);
    return recvAll(fd.get(), blob.data(), blob.size(), errorMsg);
}

//=============================================================================
// Private Thread Functions
//=============================================================================

void UdpRadio::transmitterThreadFunc() {
    std::vector<std::string> targets = m_options.targets;
    if (targets.empty()) {
        targets = getBroadcastAddresses();
    }

    while (m_advertising.load()) {
        const std::string beacon = generateBeaconJson();

        for (const auto& target : targets) {
            sockaddr_in targetAddr{};
            targetAddr.sin_family = AF_INET;
            targetAddr.sin_port = htons(m_options.beaconPort);
            if (::inet_pton(AF_INET, target.c_str(), &targetAddr.sin_addr) != 1) {
                continue;
            }
            // Best effort; a dropped beacon is repeated on the next tick
            ::sendto(m_sendSocket.get(), beacon.data(), beacon.size(), 0,
                     reinterpret_cast<sockaddr*>(&targetAddr), sizeof(targetAddr));
        }

        std::unique_lock<std::mutex> waitLock(m_stopMutex);
        m_stopCv.wait_for(waitLock,
                          std::chrono::milliseconds(ADVERTISE_INTERVAL_MS),
                          [this]() { return !m_advertising.load(); });
    }
}

void UdpRadio::blobServerThreadFunc() {
    while (m_advertising.load()) {
        pollfd pfd{};
        pfd.fd = m_blobSocket.get();
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(STOP_POLL_INTERVAL_MS));
        if (ready <= 0) {
            continue;
        }

        SocketHandle client(::accept4(m_blobSocket.get(), nullptr, nullptr, SOCK_CLOEXEC));
        if (!client.valid()) {
            continue;
        }
        serveBlob(client.get());
    }
}

void UdpRadio::serveBlob(int clientFd) {
    std::vector<uint8_t> reply;
    {
        std::lock_guard<std::mutex> lock(m_advertMutex);
        reply.reserve(2 + m_blob.size());
        reply.push_back(static_cast<uint8_t>((m_blob.size() >> 8) & 0xFF));
        reply.push_back(static_cast<uint8_t>(m_blob.size() & 0xFF));
        reply.insert(reply.end(), m_blob.begin(), m_blob.end());
    }

    setSocketTimeouts(clientFd, BLOB_READ_TIMEOUT_MS, BLOB_READ_TIMEOUT_MS);
    std::string errorMsg;
    if (!sendAll(clientFd, reply.data(), reply.size(), errorMsg)) {
        LOG_DEBUG("Blob send failed: " << errorMsg);
    }
}

void UdpRadio::listenerThreadFunc() {
    char buffer[MAX_BEACON_BYTES];

    while (m_scanning.load()) {
        pollfd pfd{};
        pfd.fd = m_listenSocket.get();
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(STOP_POLL_INTERVAL_MS));
        if (ready <= 0) {
            continue;
        }

        sockaddr_in senderAddr{};
        socklen_t senderAddrLen = sizeof(senderAddr);
        const ssize_t bytesReceived = ::recvfrom(m_listenSocket.get(), buffer, sizeof(buffer), 0,
                                                 reinterpret_cast<sockaddr*>(&senderAddr),
                                                 &senderAddrLen);
        if (bytesReceived <= 0) {
            continue;
        }

        char senderIp[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &senderAddr.sin_addr, senderIp, sizeof(senderIp));

        try {
            parseBeacon(std::string(buffer, static_cast<size_t>(bytesReceived)), senderIp);
        } catch (const json::exception& e) {
            LOG_DEBUG("Ignoring beacon from " << senderIp << ": " << e.what());
        }
    }
}

//=============================================================================
// Private Helper Methods
//=============================================================================

std::string UdpRadio::generateBeaconJson() const {
    json beacon;
    beacon["protocol_id"] = RADIO_BEACON_PROTOCOL_ID;
    beacon["radio_address"] = m_address;
    beacon["blob_port"] = m_blobPort.load();
    {
        std::lock_guard<std::mutex> lock(m_advertMutex);
        beacon["record"] = std::string(m_record.begin(), m_record.end());
    }
    beacon["timestamp_ms"] = static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    return beacon.dump(-1, ' ', false, json::error_handler_t::replace);
}

void UdpRadio::parseBeacon(const std::string& jsonStr, const std::string& senderIp) {
    json beacon = json::parse(jsonStr);

    if (!beacon.is_object() || !beacon.contains("protocol_id") ||
        beacon["protocol_id"] != RADIO_BEACON_PROTOCOL_ID) {
        return;
    }
    if (!beacon.contains("radio_address") || !beacon.contains("blob_port") ||
        !beacon.contains("record")) {
        return;
    }

    const std::string address = beacon["radio_address"].get<std::string>();
    if (address.empty() || address == m_address) {
        return;
    }
    const int blobPort = beacon["blob_port"].get<int>();
    if (blobPort <= 0 || blobPort > 65535) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_peerMutex);
        m_knownPeers[address] = Endpoint(senderIp, static_cast<uint16_t>(blobPort));
    }

    const std::string record = beacon["record"].get<std::string>();
    RadioSighting sighting;
    sighting.address = address;
    sighting.record.assign(record.begin(), record.end());

    if (m_handler) {
        m_handler(sighting);
    }
}

std::vector<std::string> UdpRadio::getBroadcastAddresses() {
    std::vector<std::string> broadcastAddresses;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) == 0) {
        for (ifaddrs* it = list; it; it = it->ifa_next) {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK) ||
                !(it->ifa_flags & IFF_BROADCAST) || !it->ifa_broadaddr) {
                continue;
            }
            char buf[INET_ADDRSTRLEN] = {};
            const sockaddr_in* bcast = reinterpret_cast<const sockaddr_in*>(it->ifa_broadaddr);
            if (::inet_ntop(AF_INET, &bcast->sin_addr, buf, sizeof(buf)) &&
                std::find(broadcastAddresses.begin(), broadcastAddresses.end(), buf) == broadcastAddresses.end()) {
                broadcastAddresses.emplace_back(buf);
            }
        }
        ::freeifaddrs(list);
    }

    // Also include limited broadcast for compatibility
    broadcastAddresses.push_back(LIMITED_BROADCAST);
    return broadcastAddresses;
}

}  // namespace FastDrop
