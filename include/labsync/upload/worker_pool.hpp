#pragma once

#include "labsync/core/thread_safe_queue.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace labsync::upload {

/**
 * @brief Fixed number of threads draining a job queue
 *
 * Jobs run in submission order on whichever worker is free. A job that
 * throws is logged and the worker carries on.
 *
 * Shutdown stops new submissions, lets the workers finish what is already
 * queued, and joins them. The destructor shuts down.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(std::string name, std::size_t thread_count);
    ~WorkerPool();

    // Prevent copying (pool owns threads)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Returns false after shutdown().
    bool submit(Job job);

    void shutdown();

    std::size_t thread_count() const { return threads_.size(); }
    std::size_t pending() const { return jobs_.size(); }
    std::size_t busy() const { return busy_.load(); }
    std::size_t completed() const { return completed_.load(); }
    const std::string& name() const { return name_; }

private:
    void run_worker(std::size_t index);

    std::string name_;
    ThreadSafeQueue<Job> jobs_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> busy_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<bool> stopped_{false};
};

} // namespace labsync::upload
