#pragma once

#include "labsync/events/event_bus.hpp"
#include "labsync/remote/repository_api.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace labsync::upload {

/**
 * @brief Asks the repository to verify uploaded files after a delay
 *
 * WHY THE DELAY:
 * The repository ingests staged bytes asynchronously; asking straight away
 * tends to verify a file that is not fully in place yet.
 *
 * Requests are timers on a private io_context served by one thread, so
 * scheduling never blocks an upload worker. Timers are created, armed and
 * canceled only on that thread. cancel_pending() drops every request
 * scheduled before it, including ones whose timer is not armed yet. A 2xx reply means the request
 * was accepted; the verification result itself arrives out of band.
 * Each request publishes a VerificationRequestedEvent.
 */
class VerificationPoller {
public:
    VerificationPoller(remote::RepositoryApi& api, events::EventBus& bus);
    ~VerificationPoller();

    VerificationPoller(const VerificationPoller&) = delete;
    VerificationPoller& operator=(const VerificationPoller&) = delete;

    void schedule_verification(std::uint64_t task_id, std::int64_t datafile_id,
                               std::chrono::milliseconds delay);

    /// Drop every request whose delay has not yet elapsed.
    void cancel_pending();

    /// Block until no request is waiting or running.
    void wait_idle();

    void shutdown();

    std::size_t pending() const;
    std::size_t requests_sent() const { return sent_.load(); }
    std::size_t requests_accepted() const { return accepted_.load(); }

private:
    using Timer = boost::asio::steady_timer;

    void fire(std::uint64_t task_id, std::int64_t datafile_id);
    void finish_one(const std::shared_ptr<Timer>& timer);
    bool canceled_since(std::uint64_t epoch) const;

    remote::RepositoryApi& api_;
    events::EventBus& bus_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;

    // Armed timers; owned by the io thread
    std::set<std::shared_ptr<Timer>> timers_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
    std::uint64_t cancel_epoch_ = 0;
    bool stopped_ = false;

    std::atomic<std::size_t> sent_{0};
    std::atomic<std::size_t> accepted_{0};
};

} // namespace labsync::upload
