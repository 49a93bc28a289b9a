/**
 * @file upload_coordinator.hpp
 * @brief Turns scanned folders into verified uploads
 *
 * PIPELINE:
 * Every file of every folder becomes an UploadTask and goes to the
 * verification pool first. A verification worker looks the file up in the
 * repository; a verified record of the same size completes the task with
 * no transfer. Anything else is handed to the upload pool, whose workers
 * call TransferStrategy and, on success, schedule a verification request.
 *
 * OWNERSHIP:
 * A task is claimed when it is queued and released only by the worker that
 * ran it, so it is never queued twice or driven by two workers at once.
 * A retry re-queues the task after the failed attempt has released it.
 */

#pragma once

#include "labsync/core/cancellation.hpp"
#include "labsync/events/event_bus.hpp"
#include "labsync/model/folder_record.hpp"
#include "labsync/model/upload_status.hpp"
#include "labsync/model/upload_task.hpp"
#include "labsync/remote/repository_api.hpp"
#include "labsync/scan/dataset_files.hpp"
#include "labsync/transfer/transfer_strategy.hpp"
#include "labsync/upload/verification_poller.hpp"
#include "labsync/upload/worker_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace labsync::upload {

struct CoordinatorOptions {
    std::size_t upload_workers = 5;
    std::size_t verification_workers = 5;
    int max_retries = 1;
    std::chrono::milliseconds verification_delay{3000};
    scan::FileSelection file_selection;

    static CoordinatorOptions from_settings(const config::Settings& settings);
};

class UploadCoordinator {
public:
    UploadCoordinator(remote::RepositoryApi& api,
                      transfer::TransferStrategy& strategy,
                      events::EventBus& bus,
                      CoordinatorOptions options);
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /**
     * @brief Upload every file of folders and wait for all tasks to finish
     *
     * Updates each folder's num_files and status in place. Returns when
     * every task is terminal; after cancellation that happens as soon as
     * in-flight transfers reach their next chunk boundary. Per-file errors
     * never fail the run; they are counted in the summary.
     */
    model::UploadSummary run(std::vector<model::FolderRecord>& folders,
                             const CancellationToken& token = CancellationToken());

    /// Stop issuing new work. In-flight transfers stop at their next checkpoint.
    void cancel_all();

    /// Cancel one task of the current run. Returns false for an unknown id.
    bool cancel_task(std::uint64_t task_id);

    /// Stop the worker pools and the verification thread, waiting for them.
    void shutdown();

    /// Tasks of the current or most recent run.
    std::vector<model::UploadTaskSnapshot> task_snapshots() const;

private:
    struct FolderState;
    struct TaskEntry {
        std::shared_ptr<model::UploadTask> task;
        std::shared_ptr<FolderState> folder;
        std::time_t modified_time = 0;
    };

    void verify(const TaskEntry& entry);
    void upload(const TaskEntry& entry, const std::optional<remote::RemoteDatafile>& existing);

    bool submit_verification(const TaskEntry& entry);
    bool submit_upload(const TaskEntry& entry, std::optional<remote::RemoteDatafile> existing);

    Result<std::int64_t> dataset_for(FolderState& folder);
    Result<remote::DatafileDescriptor> describe(const TaskEntry& entry, std::int64_t dataset_id);

    void finish(const TaskEntry& entry);
    void handle_failure(const TaskEntry& entry, const Error& error,
                        const std::optional<remote::RemoteDatafile>& existing);
    void publish_status(const model::UploadTask& task);
    void refresh_folder(FolderState& folder);

    remote::RepositoryApi& api_;
    transfer::TransferStrategy& strategy_;
    events::EventBus& bus_;
    CoordinatorOptions options_;

    CancellationToken run_token_;
    WorkerPool verification_pool_;
    WorkerPool upload_pool_;
    VerificationPoller poller_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::vector<TaskEntry> entries_;
    std::size_t remaining_ = 0;
    std::uint64_t next_task_id_ = 0;
    std::size_t already_present_ = 0;
    std::uint64_t bytes_uploaded_ = 0;
};

} // namespace labsync::upload
