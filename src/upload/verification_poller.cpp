#include "labsync/upload/verification_poller.hpp"

#include "labsync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace labsync::upload {

VerificationPoller::VerificationPoller(remote::RepositoryApi& api, events::EventBus& bus)
    : api_(api),
      bus_(bus),
      work_(boost::asio::make_work_guard(io_)),
      thread_([this]() { io_.run(); }) {}

VerificationPoller::~VerificationPoller() {
    shutdown();
}

void VerificationPoller::schedule_verification(std::uint64_t task_id, std::int64_t datafile_id,
                                               std::chrono::milliseconds delay) {
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            spdlog::warn("Verification of datafile {} not scheduled: poller stopped", datafile_id);
            return;
        }
        epoch = cancel_epoch_;
        ++in_flight_;
    }

    spdlog::debug("Verification of datafile {} scheduled in {}ms", datafile_id, delay.count());
    // Timers are only touched on the io thread
    boost::asio::post(io_, [this, task_id, datafile_id, delay, epoch]() {
        if (canceled_since(epoch)) {
            spdlog::debug("Verification of datafile {} dropped", datafile_id);
            finish_one(nullptr);
            return;
        }
        auto timer = std::make_shared<Timer>(io_);
        timers_.insert(timer);
        timer->expires_after(delay);
        timer->async_wait([this, timer, task_id, datafile_id, epoch](const boost::system::error_code& ec) {
            if (!ec && !canceled_since(epoch)) {
                fire(task_id, datafile_id);
            } else {
                spdlog::debug("Verification of datafile {} dropped", datafile_id);
            }
            finish_one(timer);
        });
    });
}

bool VerificationPoller::canceled_since(std::uint64_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_epoch_ != epoch;
}

void VerificationPoller::fire(std::uint64_t task_id, std::int64_t datafile_id) {
    ++sent_;
    auto result = api_.request_verification(datafile_id);
    if (result.is_ok()) {
        ++accepted_;
        spdlog::debug("Verification of datafile {} requested", datafile_id);
        bus_.emit(events::VerificationRequestedEvent(task_id, datafile_id, true));
        return;
    }
    spdlog::warn("Verification request for datafile {} failed: {}", datafile_id,
                 result.error().describe());
    bus_.emit(events::VerificationRequestedEvent(task_id, datafile_id, false,
                                                 result.error().describe()));
}

void VerificationPoller::finish_one(const std::shared_ptr<Timer>& timer) {
    if (timer) {
        timers_.erase(timer);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

void VerificationPoller::cancel_pending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancel_epoch_;
    }
    boost::asio::post(io_, [this]() {
        for (const auto& timer : timers_) {
            timer->cancel();
        }
    });
}

void VerificationPoller::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

void VerificationPoller::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    cancel_pending();
    work_.reset();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t VerificationPoller::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

} // namespace labsync::upload
