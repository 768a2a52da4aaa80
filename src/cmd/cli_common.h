/**
 * @file cli_common.h
 * @brief Helpers shared by the fastdrop_send and fastdrop_receive tools
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "fastdrop/SessionController.h"
#include "fastdrop/TransportPolicy.h"
#include "fastdrop/UdpRadio.h"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace FastDropCli {

/**
 * @brief Format speed to human-readable string
 */
inline std::string formatSpeed(double bytesPerSecond) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytesPerSecond >= GB) {
        oss << (bytesPerSecond / GB) << " GB/s";
    } else if (bytesPerSecond >= MB) {
        oss << (bytesPerSecond / MB) << " MB/s";
    } else if (bytesPerSecond >= KB) {
        oss << (bytesPerSecond / KB) << " KB/s";
    } else {
        oss << bytesPerSecond << " B/s";
    }
    return oss.str();
}

/**
 * @brief Parse a TCP/UDP port argument
 */
inline bool parsePort(const std::string& text, uint16_t& port) {
    uint64_t value = 0;
    if (!FastDrop::parseUnsigned(text, 65535, value) || value == 0) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

/**
 * @class InterruptWatcher
 * @brief Turns SIGINT/SIGTERM into SessionController::cancel()
 *
 * The signals are blocked in every thread and consumed by a dedicated
 * sigwait() thread, so cancel() never runs inside a signal handler.
 * Construct before any other thread is started.
 */
class InterruptWatcher {
public:
    InterruptWatcher() {
        sigemptyset(&m_signals);
        sigaddset(&m_signals, SIGINT);
        sigaddset(&m_signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &m_signals, nullptr);
    }

    ~InterruptWatcher() {
        stop();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    void watch(FastDrop::SessionController& controller) {
        m_thread = std::thread([this, &controller]() {
            int signal = 0;
            while (sigwait(&m_signals, &signal) == 0) {
                if (m_done.load()) {
                    return;
                }
                std::cout << "\nInterrupted, cancelling...\n";
                controller.cancel();
            }
        });
    }

    void stop() {
        if (!m_thread.joinable()) {
            return;
        }
        m_done = true;
        pthread_kill(m_thread.native_handle(), SIGTERM);
        m_thread.join();
    }

private:
    sigset_t m_signals;
    std::thread m_thread;
    std::atomic<bool> m_done{false};
};

/**
 * @brief Single-line progress display with average speed
 */
class ProgressPrinter {
public:
    ProgressPrinter() : m_start(std::chrono::steady_clock::now()) {}

    void operator()(const FastDrop::TransferProgress& progress) {
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - m_start).count();
        const double speed = elapsed > 0.0 ? static_cast<double>(progress.sessionBytes) / elapsed : 0.0;

        std::cout << "\r  [file " << (progress.fileIndex + 1) << "] "
                  << std::fixed << std::setprecision(1)
                  << FastDrop::calculateProgress(progress.sessionBytes, progress.sessionTotal) << "% "
                  << FastDrop::formatBytes(progress.sessionBytes) << " / "
                  << FastDrop::formatBytes(progress.sessionTotal) << "  "
                  << formatSpeed(speed) << "      " << std::flush;
    }

private:
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief Print the terminal result; returns the process exit code
 */
inline int reportResult(bool ok, const FastDrop::SessionError& error) {
    std::cout << "\n";
    if (ok) {
        std::cout << "Transfer complete.\n";
        return 0;
    }

    std::cerr << "Transfer FAILED: " << error.toString() << "\n";
    if (FastDrop::isIntegrityFailure(error.kind)) {
        std::cerr << "The files were NOT transferred safely. Incomplete files keep the "
                  << FastDrop::PARTIAL_FILE_SUFFIX << " suffix.\n";
    }
    return 1;
}

}  // namespace FastDropCli
