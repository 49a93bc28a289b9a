#include "labsync/model/upload_task.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace labsync::model {
namespace {

bool is_allowed(UploadStatus current, UploadStatus target) {
    static const std::unordered_map<UploadStatus, std::vector<UploadStatus>> transitions {
        {UploadStatus::NotStarted, {UploadStatus::InProgress, UploadStatus::Completed,
                                    UploadStatus::Failed, UploadStatus::Canceled}},
        {UploadStatus::InProgress, {UploadStatus::NotStarted, UploadStatus::Completed,
                                    UploadStatus::Failed, UploadStatus::Canceled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadStatus aggregate_status(const std::vector<UploadStatus>& statuses) {
    bool any_failed = false;
    bool any_canceled = false;
    bool any_pending = false;
    bool any_terminal = false;
    for (const auto status : statuses) {
        switch (status) {
            case UploadStatus::InProgress:
                return UploadStatus::InProgress;
            case UploadStatus::NotStarted:
                any_pending = true;
                break;
            case UploadStatus::Failed:
                any_failed = true;
                any_terminal = true;
                break;
            case UploadStatus::Canceled:
                any_canceled = true;
                any_terminal = true;
                break;
            case UploadStatus::Completed:
                any_terminal = true;
                break;
        }
    }
    if (any_pending) {
        return any_terminal ? UploadStatus::InProgress : UploadStatus::NotStarted;
    }
    if (any_failed) {
        return UploadStatus::Failed;
    }
    if (any_canceled) {
        return UploadStatus::Canceled;
    }
    return UploadStatus::Completed;
}

UploadTask::UploadTask(std::uint64_t id,
                       std::uint64_t folder_id,
                       std::filesystem::path local_path,
                       std::string subdirectory,
                       std::string filename,
                       std::uint64_t size,
                       const CancellationToken& run_token)
    : id_(id),
      folder_id_(folder_id),
      local_path_(std::move(local_path)),
      subdirectory_(std::move(subdirectory)),
      filename_(std::move(filename)),
      size_(size),
      token_(run_token.child()) {}

bool UploadTask::try_claim() noexcept {
    bool expected = false;
    return claimed_.compare_exchange_strong(expected, true);
}

void UploadTask::release() noexcept {
    claimed_.store(false);
}

UploadStatus UploadTask::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::uint64_t UploadTask::bytes_transferred() const {
    std::lock_guard lock(mutex_);
    return bytes_transferred_;
}

std::string UploadTask::message() const {
    std::lock_guard lock(mutex_);
    return message_;
}

int UploadTask::retry_count() const {
    std::lock_guard lock(mutex_);
    return retry_count_;
}

Result<void> UploadTask::begin_attempt(std::uint64_t starting_offset) {
    std::lock_guard lock(mutex_);
    if (starting_offset > size_) {
        return Err(ErrorKind::Integrity, "starting offset beyond declared size of " + filename_);
    }
    auto res = transition_locked(UploadStatus::InProgress);
    if (res.is_error()) {
        return res;
    }
    bytes_transferred_ = starting_offset;
    return Ok();
}

Result<void> UploadTask::record_progress(std::uint64_t bytes_transferred) {
    std::lock_guard lock(mutex_);
    if (status_ != UploadStatus::InProgress) {
        return Err(ErrorKind::Protocol, "progress reported for idle task " + filename_);
    }
    if (bytes_transferred < bytes_transferred_ || bytes_transferred > size_) {
        return Err(ErrorKind::Integrity,
                   "progress " + std::to_string(bytes_transferred) + " out of range for " + filename_);
    }
    bytes_transferred_ = bytes_transferred;
    return Ok();
}

Result<void> UploadTask::mark_completed(std::string message) {
    std::lock_guard lock(mutex_);
    auto res = transition_locked(UploadStatus::Completed);
    if (res.is_error()) {
        return res;
    }
    bytes_transferred_ = size_;
    message_ = std::move(message);
    return Ok();
}

Result<void> UploadTask::mark_failed(std::string message) {
    std::lock_guard lock(mutex_);
    auto res = transition_locked(UploadStatus::Failed);
    if (res.is_error()) {
        return res;
    }
    message_ = std::move(message);
    return Ok();
}

Result<void> UploadTask::mark_canceled() {
    std::lock_guard lock(mutex_);
    auto res = transition_locked(UploadStatus::Canceled);
    if (res.is_error()) {
        return res;
    }
    message_ = "Canceled";
    return Ok();
}

Result<void> UploadTask::requeue_for_retry(std::string message) {
    std::lock_guard lock(mutex_);
    auto res = transition_locked(UploadStatus::NotStarted);
    if (res.is_error()) {
        return res;
    }
    ++retry_count_;
    message_ = std::move(message);
    return Ok();
}

void UploadTask::set_message(std::string message) {
    std::lock_guard lock(mutex_);
    message_ = std::move(message);
}

void UploadTask::set_datafile_id(std::int64_t id) {
    std::lock_guard lock(mutex_);
    datafile_id_ = id;
}

std::optional<std::int64_t> UploadTask::datafile_id() const {
    std::lock_guard lock(mutex_);
    return datafile_id_;
}

UploadTaskSnapshot UploadTask::snapshot() const {
    std::lock_guard lock(mutex_);
    UploadTaskSnapshot snap;
    snap.id = id_;
    snap.folder_id = folder_id_;
    snap.subdirectory = subdirectory_;
    snap.filename = filename_;
    snap.size = size_;
    snap.status = status_;
    snap.bytes_transferred = bytes_transferred_;
    snap.message = message_;
    snap.retry_count = retry_count_;
    return snap;
}

Result<void> UploadTask::transition_locked(UploadStatus next) {
    if (!is_allowed(status_, next)) {
        return Err(ErrorKind::Protocol,
                   std::string("illegal upload state transition ") + upload_status_name(status_) +
                   " -> " + upload_status_name(next) + " for " + filename_);
    }
    status_ = next;
    return Ok();
}

} // namespace labsync::model
