#include "labsync/upload/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace labsync::upload {

WorkerPool::WorkerPool(std::string name, std::size_t thread_count) : name_(std::move(name)) {
    const std::size_t count = std::max<std::size_t>(thread_count, 1);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this, i]() { run_worker(i); });
    }
    spdlog::debug("{} pool started with {} workers", name_, count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    return jobs_.push(std::move(job));
}

void WorkerPool::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    jobs_.shutdown();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("{} pool stopped after {} jobs", name_, completed_.load());
}

void WorkerPool::run_worker(std::size_t index) {
    while (auto job = jobs_.pop()) {
        ++busy_;
        try {
            (*job)();
        } catch (const std::exception& e) {
            spdlog::error("{} worker {}: job threw: {}", name_, index, e.what());
        }
        --busy_;
        ++completed_;
    }
}

} // namespace labsync::upload
