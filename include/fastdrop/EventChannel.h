/**
 * @file EventChannel.h
 * @brief Closable queue that hands radio events to a consuming thread
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace FastDrop {

/**
 * @brief Multi-producer, single-consumer channel with close semantics
 *
 * Producers (radio callbacks) never block. After close(), push() is
 * refused and pop() drains what is left before reporting Closed.
 */
template <typename T>
class EventChannel {
public:
    enum class PopResult {
        Item,
        Timeout,
        Closed
    };

    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_items.push_back(std::move(value));
        }
        m_cv.notify_one();
        return true;
    }

    PopResult popUntil(T& out, std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, deadline, [this]() { return !m_items.empty() || m_closed; });

        if (!m_items.empty()) {
            out = std::move(m_items.front());
            m_items.pop_front();
            return PopResult::Item;
        }
        return m_closed ? PopResult::Closed : PopResult::Timeout;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    bool m_closed = false;
};

}  // namespace FastDrop
