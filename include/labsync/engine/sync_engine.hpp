#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/core/cancellation.hpp"
#include "labsync/events/event_bus.hpp"
#include "labsync/model/folder_record.hpp"
#include "labsync/model/id_allocator.hpp"
#include "labsync/model/upload_status.hpp"
#include "labsync/remote/identity_resolver.hpp"
#include "labsync/remote/repository_api.hpp"
#include "labsync/scan/folder_scanner.hpp"
#include "labsync/transfer/staging_transport.hpp"
#include "labsync/transfer/transfer_strategy.hpp"
#include "labsync/upload/upload_coordinator.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace labsync::engine {

/// What one upload pass did.
struct PassReport {
    std::optional<Error> scan_error;        ///< Set when the scan failed; nothing was uploaded
    bool canceled = false;
    std::vector<model::FolderRecord> folders;
    model::UploadSummary summary;

    bool ok() const {
        return !scan_error && !canceled && summary.failed == 0 && summary.canceled == 0;
    }
};

/**
 * @brief One "upload pass now": scan the data directory, then upload
 *
 * The folder list is rebuilt from scratch on every pass. A failed scan is
 * reported once through ScanFailedEvent and no uploads start. Folder ids
 * keep increasing across passes.
 *
 * cancel() may be called from any thread; it stops the scan at the next
 * identity folder and the uploads at their next checkpoint.
 */
class SyncEngine {
public:
    SyncEngine(config::Settings settings,
               remote::RepositoryApi& api,
               transfer::StagingTransport* transport,
               events::EventBus& bus);

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    PassReport run_pass();

    void cancel();

    const config::Settings& settings() const { return settings_; }

private:
    PassReport fail_scan(PassReport report, Error error);

    config::Settings settings_;
    events::EventBus& bus_;
    model::IdAllocator folder_ids_;
    remote::IdentityResolver resolver_;
    scan::FolderScanner scanner_;
    transfer::TransferStrategy strategy_;
    upload::UploadCoordinator coordinator_;

    std::mutex mutex_;
    CancellationToken pass_token_;
};

} // namespace labsync::engine
