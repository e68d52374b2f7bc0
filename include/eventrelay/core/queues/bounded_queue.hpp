#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace EventRelay {

/**
 * @class BoundedQueue
 * @brief Closable multi-producer / multi-consumer FIFO with a fixed capacity.
 *
 * - push() blocks while the queue is full (backpressure)
 * - tryPush() never blocks and reports a full queue to the caller
 * - pop() blocks until an item arrives or the queue is closed and drained
 * - close() is idempotent; items already queued are still delivered
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Enqueue, waiting for space if the queue is full
     * @return false if the queue was closed before the item could be queued
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_);
        not_full_.wait(lock, [this] { return closed_ || dq_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        dq_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    enum class TryPushResult {
        OK,
        FULL,
        CLOSED
    };

    TryPushResult tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (closed_) {
                return TryPushResult::CLOSED;
            }
            if (dq_.size() >= capacity_) {
                return TryPushResult::FULL;
            }
            dq_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return TryPushResult::OK;
    }

    /**
     * @brief Dequeue, waiting for an item
     * @return std::nullopt once the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_);
        not_empty_.wait(lock, [this] { return closed_ || !dq_.empty(); });
        return takeFront(lock);
    }

    // Returns true only for the call that actually closed the queue.
    bool close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (closed_) {
                return false;
            }
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        return true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return dq_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeFront(std::unique_lock<std::mutex>& lock) {
        if (dq_.empty()) {
            return std::nullopt;  // closed and drained
        }
        T item = std::move(dq_.front());
        dq_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> dq_;
    bool closed_ = false;
};

} // namespace EventRelay
