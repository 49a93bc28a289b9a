/**
 * @file thread_safe_queue.hpp
 * @brief Closable FIFO handing jobs from the scanner to pool workers
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace labsync {

/**
 * @brief Blocking multi-producer, multi-consumer FIFO
 *
 * shutdown() closes the queue for pushes and wakes every waiter. Items
 * already queued are still handed out, so pop() returns nullopt only once
 * the queue is both closed and drained.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// Returns false once the queue has been shut down.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /// Blocks until an item arrives or the queue is closed and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return take_front();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    /// Drop queued items without waking anyone.
    size_t clear() {
        std::lock_guard lock(mutex_);
        const size_t dropped = items_.size();
        items_.clear();
        return dropped;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace labsync
