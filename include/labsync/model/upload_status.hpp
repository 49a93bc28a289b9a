#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace labsync::model {

enum class UploadStatus {
    NotStarted,
    InProgress,
    Completed,
    Failed,
    Canceled
};

inline const char* upload_status_name(UploadStatus status) {
    switch (status) {
        case UploadStatus::NotStarted: return "NotStarted";
        case UploadStatus::InProgress: return "InProgress";
        case UploadStatus::Completed: return "Completed";
        case UploadStatus::Failed: return "Failed";
        case UploadStatus::Canceled: return "Canceled";
    }
    return "Unknown";
}

inline bool is_terminal(UploadStatus status) {
    return status == UploadStatus::Completed || status == UploadStatus::Failed ||
           status == UploadStatus::Canceled;
}

/**
 * @brief Folder status derived from the statuses of its files
 *
 * Any file still running, or a mix of finished and unstarted files, keeps
 * the folder InProgress. Once every file is
 * terminal, a failure outranks a cancellation, which outranks completion.
 * A folder with no files is Completed.
 */
UploadStatus aggregate_status(const std::vector<UploadStatus>& statuses);

/// Terminal counts of one coordinator run.
struct UploadSummary {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t already_present = 0;   ///< Completed by verification, no transfer
    std::size_t failed = 0;
    std::size_t canceled = 0;
    std::uint64_t bytes_uploaded = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool all_completed() const noexcept { return completed == total; }
};

} // namespace labsync::model
