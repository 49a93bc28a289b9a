#include "labsync/upload/upload_coordinator.hpp"

#include "labsync/events/events.hpp"
#include "labsync/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace labsync::upload {

using model::UploadStatus;

struct UploadCoordinator::FolderState {
    model::FolderRecord* record = nullptr;
    std::mutex mutex;               ///< Guards dataset lookup
    std::mutex status_mutex;        ///< Guards status
    std::optional<std::int64_t> dataset_id;
    std::optional<Error> dataset_error;
    std::vector<std::shared_ptr<model::UploadTask>> tasks;
    UploadStatus status = UploadStatus::NotStarted;
};

namespace {

void check_transition(const Result<void>& result) {
    if (result.is_error()) {
        spdlog::warn("{}", result.error().message);
    }
}

std::string iso_time(std::time_t time) {
    std::tm local{};
    localtime_r(&time, &local);
    char text[32];
    std::strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%S", &local);
    return text;
}

} // namespace

CoordinatorOptions CoordinatorOptions::from_settings(const config::Settings& settings) {
    CoordinatorOptions options;
    options.upload_workers = static_cast<std::size_t>(std::max(settings.max_upload_threads, 1));
    options.verification_workers = static_cast<std::size_t>(std::max(settings.max_verification_threads, 1));
    options.max_retries = std::max(settings.max_upload_retries, 0);
    options.verification_delay = std::chrono::seconds(std::max(settings.verification_delay, 0));
    options.file_selection = scan::FileSelection::from_settings(settings);
    return options;
}

UploadCoordinator::UploadCoordinator(remote::RepositoryApi& api,
                                     transfer::TransferStrategy& strategy,
                                     events::EventBus& bus,
                                     CoordinatorOptions options)
    : api_(api),
      strategy_(strategy),
      bus_(bus),
      options_(std::move(options)),
      verification_pool_("verification", options_.verification_workers),
      upload_pool_("upload", options_.upload_workers),
      poller_(api, bus) {}

UploadCoordinator::~UploadCoordinator() {
    shutdown();
}

model::UploadSummary UploadCoordinator::run(std::vector<model::FolderRecord>& folders,
                                            const CancellationToken& token) {
    const auto started = std::chrono::steady_clock::now();
    CancellationToken run_token = token.child();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_token_ = run_token;
        entries_.clear();
        remaining_ = 0;
        already_present_ = 0;
        bytes_uploaded_ = 0;
    }

    std::vector<TaskEntry> entries;
    for (auto& folder : folders) {
        auto state = std::make_shared<FolderState>();
        state->record = &folder;

        auto files = scan::DatasetFiles::enumerate(folder.path, options_.file_selection);
        if (files.is_error()) {
            spdlog::error("Cannot list files in {}: {}", folder.path.string(), files.error().describe());
            folder.num_files = 0;
            folder.status = UploadStatus::Failed;
            bus_.emit(events::FolderStatusChangedEvent(folder.id, folder.name, folder.status, 0));
            continue;
        }

        folder.num_files = files.value().size();
        for (const auto& file : files.value()) {
            std::uint64_t task_id = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                task_id = ++next_task_id_;
            }
            auto task = std::make_shared<model::UploadTask>(task_id, folder.id, file.local_path,
                                                            file.subdirectory, file.filename,
                                                            file.size, run_token);
            state->tasks.push_back(task);
            entries.push_back(TaskEntry{task, state, file.modified_time});
        }
        state->status = folder.num_files == 0 ? UploadStatus::Completed : UploadStatus::NotStarted;
        folder.status = state->status;
        bus_.emit(events::FolderStatusChangedEvent(folder.id, folder.name, folder.status, folder.num_files));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = entries;
        remaining_ = entries.size();
    }
    spdlog::info("Uploading {} files from {} folders", entries.size(), folders.size());

    for (const auto& entry : entries) {
        if (!submit_verification(entry)) {
            check_transition(entry.task->mark_canceled());
            publish_status(*entry.task);
            finish(entry);
        }
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this]() { return remaining_ == 0; });
    }
    const bool canceled = run_token.is_canceled();
    if (canceled) {
        poller_.cancel_pending();
    }
    poller_.wait_idle();

    model::UploadSummary summary;
    summary.total = entries.size();
    for (const auto& entry : entries) {
        switch (entry.task->status()) {
            case UploadStatus::Completed: ++summary.completed; break;
            case UploadStatus::Failed: ++summary.failed; break;
            case UploadStatus::Canceled: ++summary.canceled; break;
            default: break;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary.already_present = already_present_;
        summary.bytes_uploaded = bytes_uploaded_;
    }
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Uploads finished: {} completed ({} already present), {} failed, {} canceled",
                 summary.completed, summary.already_present, summary.failed, summary.canceled);
    return summary;
}

bool UploadCoordinator::submit_verification(const TaskEntry& entry) {
    if (!entry.task->try_claim()) {
        spdlog::warn("{} is already queued", entry.task->filename());
        return true;
    }
    if (!verification_pool_.submit([this, entry]() { verify(entry); })) {
        entry.task->release();
        return false;
    }
    return true;
}

bool UploadCoordinator::submit_upload(const TaskEntry& entry, std::optional<remote::RemoteDatafile> existing) {
    if (!entry.task->try_claim()) {
        spdlog::warn("{} is already queued", entry.task->filename());
        return true;
    }
    if (!upload_pool_.submit([this, entry, existing]() { upload(entry, existing); })) {
        entry.task->release();
        return false;
    }
    return true;
}

void UploadCoordinator::verify(const TaskEntry& entry) {
    auto& task = *entry.task;

    auto fail = [&](const std::string& message) {
        spdlog::error("{}: {}", task.local_path().string(), message);
        check_transition(task.mark_failed(message));
        publish_status(task);
        task.release();
        finish(entry);
    };

    if (task.cancel_token().is_canceled()) {
        check_transition(task.mark_canceled());
        publish_status(task);
        task.release();
        finish(entry);
        return;
    }

    auto dataset_id = dataset_for(*entry.folder);
    if (dataset_id.is_error()) {
        fail(dataset_id.error().describe());
        return;
    }

    auto existing = api_.find_datafile(dataset_id.value(), task.filename(), task.subdirectory());
    if (existing.is_error()) {
        fail(existing.error().describe());
        return;
    }

    if (!existing.value()) {
        task.release();
        if (!submit_upload(entry, std::nullopt)) {
            check_transition(task.mark_canceled());
            publish_status(task);
            finish(entry);
        }
        return;
    }

    const auto& record = *existing.value();
    task.set_datafile_id(record.id);
    if (record.size != task.size()) {
        fail("Size mismatch: repository has " + std::to_string(record.size) +
             " bytes, local file has " + std::to_string(task.size()));
        return;
    }

    if (record.verified) {
        check_transition(task.mark_completed("Found verified datafile on server"));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++already_present_;
        }
        publish_status(task);
        task.release();
        finish(entry);
        return;
    }

    if (strategy_.choose(task.size()) == transfer::TransferMethod::Chunked) {
        spdlog::info("{} is unverified on the server, checking staging copy", task.filename());
        task.release();
        if (!submit_upload(entry, record)) {
            check_transition(task.mark_canceled());
            publish_status(task);
            finish(entry);
        }
        return;
    }

    poller_.schedule_verification(task.id(), record.id, options_.verification_delay);
    check_transition(task.mark_completed("Found unverified datafile on server, verification requested"));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++already_present_;
    }
    publish_status(task);
    task.release();
    finish(entry);
}

void UploadCoordinator::upload(const TaskEntry& entry, const std::optional<remote::RemoteDatafile>& existing) {
    auto& task = *entry.task;
    const auto& token = task.cancel_token();

    if (token.is_canceled()) {
        check_transition(task.mark_canceled());
        publish_status(task);
        task.release();
        finish(entry);
        return;
    }

    if (auto res = task.begin_attempt(0); res.is_error()) {
        handle_failure(entry, res.error(), existing);
        return;
    }
    publish_status(task);
    refresh_folder(*entry.folder);

    auto dataset_id = dataset_for(*entry.folder);
    if (dataset_id.is_error()) {
        handle_failure(entry, dataset_id.error(), existing);
        return;
    }

    // A failed chunked attempt may have left a staging record behind
    std::optional<remote::RemoteDatafile> target = existing;
    if (!target && task.retry_count() > 0 &&
        strategy_.choose(task.size()) == transfer::TransferMethod::Chunked) {
        auto previous = api_.find_datafile(dataset_id.value(), task.filename(), task.subdirectory());
        if (previous.is_error()) {
            handle_failure(entry, previous.error(), existing);
            return;
        }
        target = previous.value();
    }

    auto descriptor = describe(entry, dataset_id.value());
    if (descriptor.is_error()) {
        handle_failure(entry, descriptor.error(), target);
        return;
    }

    auto progress = [this, &task](std::uint64_t transferred, std::uint64_t total) {
        if (auto res = task.record_progress(transferred); res.is_error()) {
            spdlog::warn("{}", res.error().message);
            return;
        }
        bus_.emit(events::UploadProgressEvent(task.id(), task.folder_id(), task.filename(),
                                              transferred, total));
    };

    auto sent = strategy_.send(descriptor.value(), task.local_path(), target, token, progress);
    if (sent.is_error()) {
        handle_failure(entry, sent.error(), target);
        return;
    }

    const auto& outcome = sent.value();
    if (outcome.outcome == transfer::TransferOutcome::Canceled) {
        check_transition(task.mark_canceled());
        publish_status(task);
        task.release();
        finish(entry);
        return;
    }

    task.set_datafile_id(outcome.datafile_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_uploaded_ += outcome.bytes_sent;
    }
    const bool resumed_complete = outcome.outcome == transfer::TransferOutcome::AlreadyComplete;
    check_transition(task.mark_completed(resumed_complete ? "Staging copy already complete" : "Upload complete"));
    spdlog::info("Uploaded {} ({} bytes, {})", task.local_path().string(), task.size(),
                 transfer::transfer_method_name(outcome.method));
    publish_status(task);
    poller_.schedule_verification(task.id(), outcome.datafile_id, options_.verification_delay);
    task.release();
    finish(entry);
}

void UploadCoordinator::handle_failure(const TaskEntry& entry, const Error& error,
                                       const std::optional<remote::RemoteDatafile>& existing) {
    auto& task = *entry.task;

    if (error.is(ErrorKind::Canceled) || task.cancel_token().is_canceled()) {
        check_transition(task.mark_canceled());
        publish_status(task);
        task.release();
        finish(entry);
        return;
    }

    if (error.is_retryable() && task.retry_count() < options_.max_retries) {
        spdlog::warn("Upload of {} failed, retrying ({}/{}): {}", task.filename(),
                     task.retry_count() + 1, options_.max_retries, error.describe());
        check_transition(task.requeue_for_retry(error.describe()));
        publish_status(task);
        task.release();
        if (!submit_upload(entry, existing)) {
            check_transition(task.mark_canceled());
            publish_status(task);
            finish(entry);
        }
        return;
    }

    spdlog::error("Upload of {} failed: {}", task.local_path().string(), error.describe());
    check_transition(task.mark_failed(error.describe()));
    publish_status(task);
    task.release();
    finish(entry);
}

Result<std::int64_t> UploadCoordinator::dataset_for(FolderState& folder) {
    std::lock_guard<std::mutex> lock(folder.mutex);
    if (folder.dataset_id) {
        return Ok(*folder.dataset_id);
    }
    if (folder.dataset_error) {
        return Err(*folder.dataset_error);
    }

    auto experiment = api_.get_or_create_experiment(*folder.record);
    if (experiment.is_error()) {
        if (!experiment.error().is_retryable()) {
            folder.dataset_error = experiment.error();
        }
        return Err(experiment.error());
    }
    auto dataset = api_.get_or_create_dataset(*folder.record, experiment.value());
    if (dataset.is_error()) {
        if (!dataset.error().is_retryable()) {
            folder.dataset_error = dataset.error();
        }
        return Err(dataset.error());
    }
    folder.dataset_id = dataset.value();
    return Ok(dataset.value());
}

Result<remote::DatafileDescriptor> UploadCoordinator::describe(const TaskEntry& entry, std::int64_t dataset_id) {
    const auto& task = *entry.task;
    auto md5 = transfer::md5_file(task.local_path(), task.cancel_token());
    if (md5.is_error()) {
        return Err(md5.error());
    }

    remote::DatafileDescriptor descriptor;
    descriptor.dataset_id = dataset_id;
    descriptor.filename = task.filename();
    descriptor.directory = task.subdirectory();
    descriptor.size = task.size();
    descriptor.md5sum = md5.value();
    descriptor.created_time = iso_time(entry.modified_time);
    return Ok(std::move(descriptor));
}

void UploadCoordinator::publish_status(const model::UploadTask& task) {
    bus_.emit(events::UploadStatusChangedEvent(task.snapshot()));
}

void UploadCoordinator::refresh_folder(FolderState& folder) {
    UploadStatus status;
    {
        std::lock_guard<std::mutex> lock(folder.status_mutex);
        std::vector<UploadStatus> statuses;
        statuses.reserve(folder.tasks.size());
        for (const auto& task : folder.tasks) {
            statuses.push_back(task->status());
        }
        status = model::aggregate_status(statuses);
        if (status == folder.status) {
            return;
        }
        folder.status = status;
        folder.record->status = status;
    }
    bus_.emit(events::FolderStatusChangedEvent(folder.record->id, folder.record->name,
                                               status, folder.record->num_files));
}

void UploadCoordinator::finish(const TaskEntry& entry) {
    refresh_folder(*entry.folder);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remaining_ > 0) {
            --remaining_;
        }
    }
    done_cv_.notify_all();
}

void UploadCoordinator::cancel_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_token_.cancel();
    }
    poller_.cancel_pending();
    spdlog::info("Cancel requested, waiting for transfers to reach a checkpoint");
}

bool UploadCoordinator::cancel_task(std::uint64_t task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.task->id() == task_id) {
            entry.task->cancel();
            return true;
        }
    }
    return false;
}

void UploadCoordinator::shutdown() {
    verification_pool_.shutdown();
    upload_pool_.shutdown();
    poller_.shutdown();
}

std::vector<model::UploadTaskSnapshot> UploadCoordinator::task_snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::UploadTaskSnapshot> snapshots;
    snapshots.reserve(entries_.size());
    for (const auto& entry : entries_) {
        snapshots.push_back(entry.task->snapshot());
    }
    return snapshots;
}

} // namespace labsync::upload
