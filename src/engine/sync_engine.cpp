#include "labsync/engine/sync_engine.hpp"

#include "labsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace labsync::engine {

SyncEngine::SyncEngine(config::Settings settings,
                       remote::RepositoryApi& api,
                       transfer::StagingTransport* transport,
                       events::EventBus& bus)
    : settings_(std::move(settings)),
      bus_(bus),
      resolver_(api, settings_.group_prefix),
      scanner_(resolver_, folder_ids_),
      strategy_(api, transport, transfer::TransferPolicy::from_settings(settings_)),
      coordinator_(api, strategy_, bus, upload::CoordinatorOptions::from_settings(settings_)) {}

PassReport SyncEngine::fail_scan(PassReport report, Error error) {
    if (error.is(ErrorKind::Canceled)) {
        spdlog::info("Scan canceled");
        report.canceled = true;
        return report;
    }
    spdlog::error("Scan failed: {}", error.describe());
    bus_.emit(events::ScanFailedEvent(error));
    report.scan_error = std::move(error);
    return report;
}

PassReport SyncEngine::run_pass() {
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pass_token_ = token;
    }

    PassReport report;
    auto options = scan::ScanOptions::from_settings(settings_);
    if (options.is_error()) {
        return fail_scan(std::move(report), options.error());
    }

    bus_.emit(events::ScanStartedEvent(settings_.data_directory.string(),
                                       model::folder_structure_name(settings_.folder_structure)));
    const auto started = std::chrono::steady_clock::now();
    auto folders = scanner_.scan(options.value(), token,
        [this](const std::string& identity, std::size_t done, std::size_t total, std::size_t found) {
            bus_.emit(events::ScanProgressEvent(identity, done, total, found));
        });
    if (folders.is_error()) {
        return fail_scan(std::move(report), folders.error());
    }

    report.folders = std::move(folders.value());
    bus_.emit(events::ScanCompletedEvent(
        report.folders.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)));
    for (const auto& folder : report.folders) {
        bus_.emit(events::FolderDiscoveredEvent(folder));
    }

    if (token.is_canceled()) {
        report.canceled = true;
        return report;
    }

    report.summary = coordinator_.run(report.folders, token);
    report.canceled = token.is_canceled();
    bus_.emit(events::UploadsCompletedEvent(report.summary, report.canceled));
    return report;
}

void SyncEngine::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    pass_token_.cancel();
}

} // namespace labsync::engine
