/**
 * @file components.hpp
 * @brief Event subscribers shipped with the engine
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "labsync/events/event_bus.hpp"
#include "labsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace labsync::events {

/**
 * @brief Logs every engine event through spdlog
 *
 * Chunk progress is logged at debug level; status changes at info; failed
 * uploads, failed scans and rejected verification requests at warn or error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<ScanStartedEvent>([](const ScanStartedEvent& e) {
            spdlog::info("[ScanStarted] dir={} structure=\"{}\"", e.data_directory, e.folder_structure);
        }));

        ids_.push_back(bus_.subscribe<ScanProgressEvent>([](const ScanProgressEvent& e) {
            spdlog::debug("[ScanProgress] {} ({}/{}) datasets={}",
                          e.identity_folder, e.identities_done, e.identities_total, e.datasets_found);
        }));

        ids_.push_back(bus_.subscribe<FolderDiscoveredEvent>([](const FolderDiscoveredEvent& e) {
            spdlog::info("[FolderDiscovered] id={} path={} owner={} experiment=\"{}\"",
                         e.folder.id, e.folder.path.string(), e.folder.owner.label(),
                         e.folder.experiment_title);
        }));

        ids_.push_back(bus_.subscribe<ScanCompletedEvent>([](const ScanCompletedEvent& e) {
            spdlog::info("[ScanCompleted] folders={} duration={}ms", e.folder_count, e.duration.count());
        }));

        ids_.push_back(bus_.subscribe<ScanFailedEvent>([](const ScanFailedEvent& e) {
            if (e.error.is(ErrorKind::Canceled)) {
                spdlog::info("[ScanCanceled]");
                return;
            }
            spdlog::error("[ScanFailed] {}", e.error.describe());
        }));

        ids_.push_back(bus_.subscribe<UploadStatusChangedEvent>([](const UploadStatusChangedEvent& e) {
            const auto& t = e.task;
            if (t.status == model::UploadStatus::Failed) {
                spdlog::warn("[UploadStatus] task={} file={} status=Failed retries={} message={}",
                             t.id, t.filename, t.retry_count, t.message);
                return;
            }
            spdlog::info("[UploadStatus] task={} file={} status={} bytes={}/{}",
                         t.id, t.filename, model::upload_status_name(t.status),
                         t.bytes_transferred, t.size);
        }));

        ids_.push_back(bus_.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[UploadProgress] task={} file={} {}/{} ({}%)",
                          e.task_id, e.filename, e.bytes_transferred, e.total_bytes, e.percent());
        }));

        ids_.push_back(bus_.subscribe<FolderStatusChangedEvent>([](const FolderStatusChangedEvent& e) {
            spdlog::info("[FolderStatus] id={} name={} status={} files={}",
                         e.folder_id, e.folder_name, model::upload_status_name(e.status), e.num_files);
        }));

        ids_.push_back(bus_.subscribe<VerificationRequestedEvent>([](const VerificationRequestedEvent& e) {
            if (e.accepted) {
                spdlog::info("[VerificationRequested] task={} datafile={}", e.task_id, e.datafile_id);
            } else {
                spdlog::warn("[VerificationRequested] task={} datafile={} rejected: {}",
                             e.task_id, e.datafile_id, e.message);
            }
        }));

        ids_.push_back(bus_.subscribe<UploadsCompletedEvent>([](const UploadsCompletedEvent& e) {
            const auto& s = e.summary;
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Uploads {}: {} files, {} completed ({} already present), {} failed, {} canceled",
                         e.canceled ? "canceled" : "finished",
                         s.total, s.completed, s.already_present, s.failed, s.canceled);
            spdlog::info("Uploaded {} bytes in {}ms", s.bytes_uploaded, s.duration.count());
            spdlog::info("════════════════════════════════════════════");
        }));
    }

    ~LoggerComponent() {
        bus_.unsubscribe<ScanStartedEvent>(ids_[0]);
        bus_.unsubscribe<ScanProgressEvent>(ids_[1]);
        bus_.unsubscribe<FolderDiscoveredEvent>(ids_[2]);
        bus_.unsubscribe<ScanCompletedEvent>(ids_[3]);
        bus_.unsubscribe<ScanFailedEvent>(ids_[4]);
        bus_.unsubscribe<UploadStatusChangedEvent>(ids_[5]);
        bus_.unsubscribe<UploadProgressEvent>(ids_[6]);
        bus_.unsubscribe<FolderStatusChangedEvent>(ids_[7]);
        bus_.unsubscribe<VerificationRequestedEvent>(ids_[8]);
        bus_.unsubscribe<UploadsCompletedEvent>(ids_[9]);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<size_t> ids_;
};

/**
 * @brief Running counters over engine events
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().files_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> scans_completed{0};
        std::atomic<uint64_t> scans_failed{0};
        std::atomic<uint64_t> folders_discovered{0};
        std::atomic<uint64_t> files_completed{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> files_canceled{0};
        std::atomic<uint64_t> progress_reports{0};
        std::atomic<uint64_t> verifications_requested{0};
        std::atomic<uint64_t> verifications_rejected{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<ScanCompletedEvent>([this](const ScanCompletedEvent&) {
            stats_.scans_completed++;
        }));

        ids_.push_back(bus_.subscribe<ScanFailedEvent>([this](const ScanFailedEvent&) {
            stats_.scans_failed++;
        }));

        ids_.push_back(bus_.subscribe<FolderDiscoveredEvent>([this](const FolderDiscoveredEvent&) {
            stats_.folders_discovered++;
        }));

        ids_.push_back(bus_.subscribe<UploadStatusChangedEvent>([this](const UploadStatusChangedEvent& e) {
            on_status_changed(e);
        }));

        ids_.push_back(bus_.subscribe<UploadProgressEvent>([this](const UploadProgressEvent&) {
            stats_.progress_reports++;
        }));

        ids_.push_back(bus_.subscribe<VerificationRequestedEvent>([this](const VerificationRequestedEvent& e) {
            if (e.accepted) {
                stats_.verifications_requested++;
            } else {
                stats_.verifications_rejected++;
            }
        }));
    }

    ~MetricsComponent() {
        bus_.unsubscribe<ScanCompletedEvent>(ids_[0]);
        bus_.unsubscribe<ScanFailedEvent>(ids_[1]);
        bus_.unsubscribe<FolderDiscoveredEvent>(ids_[2]);
        bus_.unsubscribe<UploadStatusChangedEvent>(ids_[3]);
        bus_.unsubscribe<UploadProgressEvent>(ids_[4]);
        bus_.unsubscribe<VerificationRequestedEvent>(ids_[5]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Pass statistics:");
        spdlog::info("  Folders discovered:   {}", stats_.folders_discovered.load());
        spdlog::info("  Files completed:      {}", stats_.files_completed.load());
        spdlog::info("  Files failed:         {}", stats_.files_failed.load());
        spdlog::info("  Files canceled:       {}", stats_.files_canceled.load());
        spdlog::info("  Verifications sent:   {}", stats_.verifications_requested.load());
        spdlog::info("  Verifications refused:{}", stats_.verifications_rejected.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_status_changed(const UploadStatusChangedEvent& e) {
        switch (e.task.status) {
            case model::UploadStatus::Completed:
                stats_.files_completed++;
                break;
            case model::UploadStatus::Failed:
                stats_.files_failed++;
                break;
            case model::UploadStatus::Canceled:
                stats_.files_canceled++;
                break;
            default:
                break;
        }
    }

    EventBus& bus_;
    std::vector<size_t> ids_;
    Stats stats_;
};

} // namespace labsync::events
