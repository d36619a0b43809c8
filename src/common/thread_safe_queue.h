#ifndef MARIONETTE_THREAD_SAFE_QUEUE_H
#define MARIONETTE_THREAD_SAFE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace marionette {

/**
 * @brief Bounded hand-off queue between producers and one draining consumer
 *
 * When full, push() discards the oldest element so a stalled consumer
 * cannot grow memory without limit; the number discarded is kept until
 * takeDroppedCount() reads it. close() wakes the consumer for good.
 * A capacity of 0 means unbounded.
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity = 0)
        : m_capacity(capacity), m_dropped(0), m_busy(false), m_closed(false) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @return false if the queue has been closed; the item is not taken
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            if (m_capacity > 0 && m_items.size() >= m_capacity) {
                m_items.pop_front();
                ++m_dropped;
            }
            m_items.push_back(std::move(item));
        }
        m_ready.notify_one();
        return true;
    }

    /**
     * @brief Move everything queued into batch, waiting up to timeout for
     * the first element
     *
     * The queue counts as busy until the next call, so waitUntilDrained()
     * also covers the batch the consumer is still working on.
     * @return false once the queue is closed and nothing is left
     */
    bool drain(std::vector<T>& batch, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_busy = false;
        m_idle.notify_all();

        m_ready.wait_for(lock, timeout, [this] { return !m_items.empty() || m_closed; });
        if (m_items.empty()) {
            return !m_closed;
        }

        batch.reserve(batch.size() + m_items.size());
        for (auto& item : m_items) {
            batch.push_back(std::move(item));
        }
        m_items.clear();
        m_busy = true;
        return true;
    }

    // Consumer side: the batch handed out by the last drain() is finished
    void markIdle() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy = false;
        m_idle.notify_all();
    }

    /**
     * @return true if the queue emptied and the consumer went idle in time
     */
    bool waitUntilDrained(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idle.wait_for(lock, timeout, [this] { return m_items.empty() && !m_busy; });
    }

    size_t takeDroppedCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t dropped = m_dropped;
        m_dropped = 0;
        return dropped;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.empty();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_ready.notify_all();
    }

    // Accept items again after close(); anything still queued is kept
    void reopen() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = false;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    std::condition_variable m_idle;
    std::deque<T> m_items;
    size_t m_capacity;
    size_t m_dropped;
    bool m_busy;
    bool m_closed;
};

} // namespace marionette

#endif // MARIONETTE_THREAD_SAFE_QUEUE_H
