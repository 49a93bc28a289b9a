#pragma once

#include "labsync/core/cancellation.hpp"
#include "labsync/core/result.hpp"
#include "labsync/model/upload_status.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace labsync::model {

/// Point-in-time copy of an UploadTask, safe to hand to event subscribers.
struct UploadTaskSnapshot {
    std::uint64_t id = 0;
    std::uint64_t folder_id = 0;
    std::string subdirectory;
    std::string filename;
    std::uint64_t size = 0;
    UploadStatus status = UploadStatus::NotStarted;
    std::uint64_t bytes_transferred = 0;
    std::string message;
    int retry_count = 0;
};

/**
 * @brief Transfer and verification lifecycle of one file
 *
 * Workers take write ownership with try_claim() and hand it back with
 * release(). Status, progress and message are guarded by an internal mutex
 * so the coordinator can snapshot a task that a worker is driving.
 */
class UploadTask {
public:
    UploadTask(std::uint64_t id,
               std::uint64_t folder_id,
               std::filesystem::path local_path,
               std::string subdirectory,
               std::string filename,
               std::uint64_t size,
               const CancellationToken& run_token);

    UploadTask(const UploadTask&) = delete;
    UploadTask& operator=(const UploadTask&) = delete;

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] std::uint64_t folder_id() const noexcept { return folder_id_; }
    [[nodiscard]] const std::filesystem::path& local_path() const noexcept { return local_path_; }
    [[nodiscard]] const std::string& subdirectory() const noexcept { return subdirectory_; }
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

    /// Observes the run-wide abort flag as well as this task's own.
    [[nodiscard]] const CancellationToken& cancel_token() const noexcept { return token_; }
    void cancel() noexcept { token_.cancel(); }

    [[nodiscard]] bool try_claim() noexcept;
    void release() noexcept;
    [[nodiscard]] bool is_claimed() const noexcept { return claimed_.load(); }

    [[nodiscard]] UploadStatus status() const;
    [[nodiscard]] std::uint64_t bytes_transferred() const;
    [[nodiscard]] std::string message() const;
    [[nodiscard]] int retry_count() const;

    /// Move to InProgress with the byte offset the transfer starts from.
    Result<void> begin_attempt(std::uint64_t starting_offset);

    /// Advance bytes_transferred. Values below the current count are rejected.
    Result<void> record_progress(std::uint64_t bytes_transferred);

    Result<void> mark_completed(std::string message);
    Result<void> mark_failed(std::string message);
    Result<void> mark_canceled();

    /// Put a failed attempt back to NotStarted and count the retry.
    Result<void> requeue_for_retry(std::string message);

    void set_message(std::string message);

    void set_datafile_id(std::int64_t id);
    [[nodiscard]] std::optional<std::int64_t> datafile_id() const;

    [[nodiscard]] UploadTaskSnapshot snapshot() const;

private:
    Result<void> transition_locked(UploadStatus next);

    const std::uint64_t id_;
    const std::uint64_t folder_id_;
    const std::filesystem::path local_path_;
    const std::string subdirectory_;
    const std::string filename_;
    const std::uint64_t size_;

    CancellationToken token_;
    std::atomic<bool> claimed_{false};

    mutable std::mutex mutex_;
    UploadStatus status_ = UploadStatus::NotStarted;
    std::uint64_t bytes_transferred_ = 0;
    std::string message_;
    int retry_count_ = 0;
    std::optional<std::int64_t> datafile_id_;
};

} // namespace labsync::model
