/**
 * @file events.hpp
 * @brief Notifications published by the scanner and the upload coordinator
 *
 * NAMING CONVENTION:
 * Events are past-tense. Every event carries the wall-clock time it was
 * created so subscribers on other threads can order them.
 */

#pragma once

#include "labsync/core/error.hpp"
#include "labsync/model/folder_record.hpp"
#include "labsync/model/upload_status.hpp"
#include "labsync/model/upload_task.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace labsync::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Scan Events
// ════════════════════════════════════════════════════════

struct ScanStartedEvent {
    std::string data_directory;
    std::string folder_structure;
    Clock::time_point timestamp;

    ScanStartedEvent(std::string dir, std::string structure)
        : data_directory(std::move(dir)),
          folder_structure(std::move(structure)),
          timestamp(Clock::now()) {}
};

/**
 * @brief One dataset folder admitted by a successful scan
 *
 * WHO EMITS:
 * - SyncEngine, once per record, after the scan pass has succeeded
 *
 * WHO SUBSCRIBES:
 * - Logger, Metrics, the CLI folder listing
 */
struct FolderDiscoveredEvent {
    model::FolderRecord folder;
    Clock::time_point timestamp;

    explicit FolderDiscoveredEvent(model::FolderRecord f)
        : folder(std::move(f)), timestamp(Clock::now()) {}
};

/// Published after each top-level identity folder has been walked.
struct ScanProgressEvent {
    std::string identity_folder;
    std::size_t identities_done = 0;
    std::size_t identities_total = 0;
    std::size_t datasets_found = 0;
    Clock::time_point timestamp;

    ScanProgressEvent(std::string identity, std::size_t done, std::size_t total, std::size_t found)
        : identity_folder(std::move(identity)),
          identities_done(done),
          identities_total(total),
          datasets_found(found),
          timestamp(Clock::now()) {}
};

struct ScanCompletedEvent {
    std::size_t folder_count = 0;
    std::chrono::milliseconds duration{0};
    Clock::time_point timestamp;

    ScanCompletedEvent(std::size_t count, std::chrono::milliseconds elapsed)
        : folder_count(count), duration(elapsed), timestamp(Clock::now()) {}
};

/// Reported once per failed pass; the pass produced no folders.
struct ScanFailedEvent {
    Error error;
    Clock::time_point timestamp;

    explicit ScanFailedEvent(Error e) : error(std::move(e)), timestamp(Clock::now()) {}
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

struct UploadStatusChangedEvent {
    model::UploadTaskSnapshot task;
    Clock::time_point timestamp;

    explicit UploadStatusChangedEvent(model::UploadTaskSnapshot snapshot)
        : task(std::move(snapshot)), timestamp(Clock::now()) {}
};

/// Published at chunk boundaries, and at 0% and 100% for whole-file posts.
struct UploadProgressEvent {
    std::uint64_t task_id = 0;
    std::uint64_t folder_id = 0;
    std::string filename;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    Clock::time_point timestamp;

    UploadProgressEvent(std::uint64_t id, std::uint64_t folder, std::string name,
                        std::uint64_t transferred, std::uint64_t total)
        : task_id(id),
          folder_id(folder),
          filename(std::move(name)),
          bytes_transferred(transferred),
          total_bytes(total),
          timestamp(Clock::now()) {}

    int percent() const {
        if (total_bytes == 0) {
            return 100;
        }
        return static_cast<int>(bytes_transferred * 100 / total_bytes);
    }
};

struct FolderStatusChangedEvent {
    std::uint64_t folder_id = 0;
    std::string folder_name;
    model::UploadStatus status = model::UploadStatus::NotStarted;
    std::size_t num_files = 0;
    Clock::time_point timestamp;

    FolderStatusChangedEvent(std::uint64_t id, std::string name,
                             model::UploadStatus s, std::size_t files)
        : folder_id(id),
          folder_name(std::move(name)),
          status(s),
          num_files(files),
          timestamp(Clock::now()) {}
};

/**
 * @brief Outcome of asking the repository to verify an uploaded file
 *
 * accepted means the request was acknowledged with a 2xx status, not that
 * verification has finished.
 */
struct VerificationRequestedEvent {
    std::uint64_t task_id = 0;
    std::int64_t datafile_id = 0;
    bool accepted = false;
    std::string message;
    Clock::time_point timestamp;

    VerificationRequestedEvent(std::uint64_t task, std::int64_t datafile,
                               bool ok, std::string msg = {})
        : task_id(task),
          datafile_id(datafile),
          accepted(ok),
          message(std::move(msg)),
          timestamp(Clock::now()) {}
};

struct UploadsCompletedEvent {
    model::UploadSummary summary;
    bool canceled = false;
    Clock::time_point timestamp;

    UploadsCompletedEvent(model::UploadSummary s, bool was_canceled)
        : summary(s), canceled(was_canceled), timestamp(Clock::now()) {}
};

} // namespace labsync::events
