/**
 * @file fastdrop_send.cpp
 * @brief Send files to the first nearby FastDrop receiver
 *
 * Usage:
 *   fastdrop_send [--bind ADDR] [--radio-port N] [--verbose] <file1> [file2 ...]
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
    std::cout << "Usage: " << programName << " [--bind ADDR] [--radio-port N] [--verbose] <file1> [file2 ...]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --bind ADDR      Address the transfer listener binds (default 0.0.0.0)\n";
    std::cout << "  --radio-port N   UDP port of the discovery beacons (default " << UDP_RADIO_PORT << ")\n";
    std::cout << "  --verbose        Print debug logging to stderr\n";
    std::cout << "\nEnvironment: FASTDROP_DISPLAY_NAME, FASTDROP_BIND_ADDRESS, FASTDROP_IDENTITY_DIR,\n";
    std::cout << "             FASTDROP_LOG_FILE\n";
}

int main(int argc, char* argv[]) {
    FastDropCli::InterruptWatcher interrupts;

    SessionOptions options = SessionOptions::fromEnvironment();
    bool verbose = false;
    UdpRadioOptions radioOptions;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--bind" && i + 1 < argc) {
            options.bindAddress = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--radio-port" && i + 1 < argc) {
            if (!FastDropCli::parsePort(argv[++i], radioOptions.beaconPort)) {
                std::cerr << "Error: Invalid radio port: " << argv[i] << "\n";
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        printUsage(argv[0]);
        return 1;
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

    std::cout << "FastDrop sender \"" << options.displayName << "\"\n";
    std::cout << "Identity: " << identity->peerIdentity().toDisplayString() << "\n\n";

    controller.setPhaseCallback([&controller](SessionPhase phase) {
        if (phase == SessionPhase::Advertising) {
            const SessionTicket ticket = controller.lastTicket();
            std::cout << "Waiting for a receiver (" << transportProtocolName(ticket.protocol) << " on";
            for (const auto& endpoint : ticket.endpoints) {
                std::cout << " " << endpoint;
            }
            std::cout << ")... press Ctrl+C to cancel\n";
        } else if (phase == SessionPhase::Transferring) {
            std::cout << "Receiver connected, sending...\n";
        }
    });

    controller.setStateCallback([](TransferState state) {
        if (state == TransferState::Finalizing) {
            std::cout << "\nAll data sent, waiting for verification...\n";
        }
    });

    FastDropCli::ProgressPrinter printer;
    controller.setProgressCallback([&printer](const TransferProgress& progress) { printer(progress); });

    SessionError error;
    const bool ok = controller.runSender(paths, error);
    interrupts.stop();

    return FastDropCli::reportResult(ok, error);
}
