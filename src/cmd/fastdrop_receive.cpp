/**
 * @file fastdrop_receive.cpp
 * @brief Scan for nearby FastDrop senders and receive from the chosen one
 *
 * Usage:
 *   fastdrop_receive [--dest DIR] [--scan-ms N] [--radio-port N] [--verbose]
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "cli_common.h"

#include "fastdrop/Debug.h"
#include "fastdrop/SessionController.h"
#include "fastdrop/ThreadSafeLog.h"
#include "fastdrop/UdpRadio.h"
#include "fastdrop/config.h"

#include <iostream>
#include <string>
#include <vector>

using namespace FastDrop;

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--dest DIR] [--scan-ms N] [--radio-port N] [--verbose]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --dest DIR       Destination directory (default: current directory)\n";
    std::cout << "  --scan-ms N      Scan window in milliseconds (default " << DEFAULT_SCAN_DURATION_MS << ")\n";
    std::cout << "  --radio-port N   UDP port of the discovery beacons (default " << UDP_RADIO_PORT << ")\n";
    std::cout << "  --verbose        Print debug logging to stderr\n";
    std::cout << "\nEnvironment: FASTDROP_DOWNLOAD_DIR, FASTDROP_SCAN_MS, FASTDROP_CONNECT_TIMEOUT_MS,\n";
    std::cout << "             FASTDROP_IDENTITY_DIR, FASTDROP_LOG_FILE\n";
}

/**
 * @brief Print the discovered senders and read a 1-based choice from stdin
 */
int promptForPeer(const std::vector<DiscoveredPeer>& peers) {
    std::cout << "\nNearby senders:\n";
    for (size_t i = 0; i < peers.size(); ++i) {
        std::cout << "  " << (i + 1) << ") " << peers[i].displayName
                  << "  [" << peers[i].radioAddress << "]";
        if (peers[i].rssi) {
            std::cout << "  " << *peers[i].rssi << " dBm";
        }
        std::cout << "\n";
    }

    std::cout << "Select a sender (1-" << peers.size() << ", empty to quit): " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) {
        return -1;
    }

    uint64_t choice = 0;
    if (!parseUnsigned(line, peers.size(), choice) || choice == 0) {
        std::cerr << "Invalid selection: " << line << "\n";
        return -1;
    }
    return static_cast<int>(choice - 1);
}

int main(int argc, char* argv[]) {
    FastDropCli::InterruptWatcher interrupts;

    SessionOptions options = SessionOptions::fromEnvironment();
    bool verbose = false;
    UdpRadioOptions radioOptions;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--dest" && i + 1 < argc) {
            options.downloadDir = argv[++i];
        } else if (arg == "--scan-ms" && i + 1 < argc) {
            uint64_t value = 0;
            if (!parseUnsigned(argv[++i], UINT32_MAX, value)) {
                std::cerr << "Error: Invalid scan window: " << argv[i] << "\n";
                return 1;
            }
            options.scanDurationMs = static_cast<uint32_t>(value);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--radio-port" && i + 1 < argc) {
            if (!FastDropCli::parsePort(argv[++i], radioOptions.beaconPort)) {
                std::cerr << "Error: Invalid radio port: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    setLogLevel(verbose ? LogLevel::Debug : LogLevel::Info);

    if (!options.logFile.empty()) {
        ThreadSafeLog::initialize(options.logFile);
    }

    std::string errorMsg;
    std::shared_ptr<const LocalIdentity> identity = SessionController::createIdentity(options, errorMsg);
    if (!identity) {
        std::cerr << "Error: Cannot create identity: " << errorMsg << "\n";
        return 1;
    }

    UdpRadio radio(radioOptions);
    SessionController controller(identity, radio, options);
    interrupts.watch(controller);

    std::cout << "FastDrop receiver \"" << options.displayName << "\"\n";
    std::cout << "Saving to: " << options.downloadDir << "\n";
    std::cout << "Scanning for " << (options.scanDurationMs / 1000.0) << " s...\n";

    controller.setPeerDiscoveredCallback([](const DiscoveredPeer& peer) {
        std::cout << "  found " << peer.displayName << "\n";
    });
    controller.setPeerSelector(promptForPeer);
    controller.setPhaseCallback([](SessionPhase phase) {
        if (phase == SessionPhase::Connecting) {
            std::cout << "Connecting...\n";
        } else if (phase == SessionPhase::Transferring) {
            std::cout << "Connected, receiving...\n";
        }
    });

    controller.setStateCallback([](TransferState state) {
        if (state == TransferState::Finalizing) {
            std::cout << "\nAll data received, verifying...\n";
        }
    });

    FastDropCli::ProgressPrinter printer;
    controller.setProgressCallback([&printer](const TransferProgress& progress) { printer(progress); });

    SessionError error;
    const bool ok = controller.runReceiver(error);
    interrupts.stop();

    if (ok) {
        std::cout << "\n";
        for (const auto& file : controller.receivedFiles()) {
            std::cout << "  saved " << file.path.string() << " (" << formatBytes(file.size) << ")\n";
        }
    }
    return FastDropCli::reportResult(ok, error);
}
