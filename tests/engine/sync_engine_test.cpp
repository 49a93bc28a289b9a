#include "labsync/engine/sync_engine.hpp"

#include "labsync/events/events.hpp"

#include "support/fake_repository.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <vector>

using namespace labsync;
using labsync::engine::PassReport;
using labsync::engine::SyncEngine;
using labsync::model::UploadStatus;
using labsync::test_support::FakeRepository;
using labsync::test_support::FakeStagingTransport;
using labsync::test_support::TempDir;
using labsync::test_support::write_file;

namespace {

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.data_directory = root.path();
        settings.instrument_name = "Microscope 1";
        settings.username = "facility";
        settings.api_key = "key";
        settings.repository_url = "http://repo.invalid";
        settings.ignore_new_files = false;
        settings.verification_delay = 0;
        settings.max_upload_threads = 2;
        settings.max_verification_threads = 1;
        settings.upload_method = config::UploadMethod::Post;

        bus.subscribe<events::ScanStartedEvent>([this](const events::ScanStartedEvent&) { scans_started++; });
        bus.subscribe<events::ScanCompletedEvent>([this](const events::ScanCompletedEvent&) { scans_completed++; });
        bus.subscribe<events::ScanFailedEvent>([this](const events::ScanFailedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            scan_failures.push_back(e.error);
        });
        bus.subscribe<events::FolderDiscoveredEvent>([this](const events::FolderDiscoveredEvent&) {
            folders_discovered++;
        });
        bus.subscribe<events::UploadsCompletedEvent>([this](const events::UploadsCompletedEvent&) {
            uploads_completed++;
        });
    }

    PassReport run_pass(transfer::StagingTransport* staging = nullptr) {
        SyncEngine engine(settings, api, staging, bus);
        return engine.run_pass();
    }

    TempDir root;
    config::Settings settings;
    FakeRepository api;
    events::EventBus bus;
    std::mutex mutex;
    std::vector<Error> scan_failures;
    std::atomic<int> scans_started{0};
    std::atomic<int> scans_completed{0};
    std::atomic<int> folders_discovered{0};
    std::atomic<int> uploads_completed{0};
};

} // namespace

TEST_F(SyncEngineTest, ScansAndPostsSmallDataset) {
    api.add_user("alice", "alice@example.org", "Alice Smith");
    write_file(root / "alice/Dataset1/a.txt", "hello");
    write_file(root / "alice/Dataset1/b.txt", "world");

    const auto report = run_pass();

    ASSERT_FALSE(report.scan_error.has_value());
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.folders.size(), 1u);
    const auto& folder = report.folders[0];
    EXPECT_EQ(folder.owner.username, "alice");
    EXPECT_EQ(folder.name, "Dataset1");
    EXPECT_EQ(folder.experiment_title, "Microscope 1 - Alice Smith");
    EXPECT_EQ(report.summary.total, 2u);
    EXPECT_EQ(report.summary.completed, 2u);
    EXPECT_EQ(report.summary.bytes_uploaded, 10u);
    EXPECT_EQ(api.post_attempts(), 2u);
    EXPECT_EQ(api.verifications().size(), 2u);

    EXPECT_EQ(scans_started.load(), 1);
    EXPECT_EQ(scans_completed.load(), 1);
    EXPECT_EQ(folders_discovered.load(), 1);
    EXPECT_EQ(uploads_completed.load(), 1);
    EXPECT_TRUE(scan_failures.empty());
}

TEST_F(SyncEngineTest, UnmatchedIdentityIsSkipped) {
    settings.unmatched_identity_policy = config::UnmatchedIdentityPolicy::Skip;
    api.add_user("alice");
    write_file(root / "alice/Dataset1/a.txt", "a");
    write_file(root / "bob/Dataset2/b.txt", "b");

    const auto report = run_pass();

    ASSERT_FALSE(report.scan_error.has_value());
    ASSERT_EQ(report.folders.size(), 1u);
    EXPECT_EQ(report.folders[0].identity_folder, "alice");
    EXPECT_EQ(report.summary.total, 1u);
    EXPECT_EQ(report.summary.completed, 1u);
}

TEST_F(SyncEngineTest, ScanFailureIsReportedOnceWithoutUploads) {
    settings.unmatched_identity_policy = config::UnmatchedIdentityPolicy::Fail;
    write_file(root / "mallory/Dataset1/a.txt", "a");

    const auto report = run_pass();

    ASSERT_TRUE(report.scan_error.has_value());
    EXPECT_TRUE(report.scan_error->is(ErrorKind::IdentityNotFound));
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(report.folders.empty());
    ASSERT_EQ(scan_failures.size(), 1u);
    EXPECT_TRUE(scan_failures[0].is(ErrorKind::IdentityNotFound));
    EXPECT_EQ(scans_completed.load(), 0);
    EXPECT_EQ(uploads_completed.load(), 0);
    EXPECT_EQ(api.post_attempts(), 0u);
}

TEST_F(SyncEngineTest, BadSettingsFailTheScan) {
    settings.ignore_old_datasets = true;
    settings.ignore_interval_unit = "aeons";

    const auto report = run_pass();

    ASSERT_TRUE(report.scan_error.has_value());
    EXPECT_TRUE(report.scan_error->is(ErrorKind::Configuration));
    EXPECT_EQ(scan_failures.size(), 1u);
    EXPECT_EQ(scans_started.load(), 0);
}

TEST_F(SyncEngineTest, LargeFilesGoThroughStaging) {
    settings.upload_method = config::UploadMethod::Staging;
    settings.large_file_size = 1000;
    settings.default_chunk_size = 256;
    settings.max_chunk_size = 4096;
    settings.staging.location = "/stage";
    api.add_user("alice");
    const auto big = test_support::pattern_bytes(3000);
    write_file(root / "alice/Dataset1/big.bin", big);
    write_file(root / "alice/Dataset1/small.txt", "tiny");
    FakeStagingTransport staging;

    auto report = run_pass(&staging);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.summary.completed, 2u);
    EXPECT_EQ(api.staged_records(), 1u);
    EXPECT_EQ(api.post_attempts(), 1u);
    ASSERT_EQ(report.folders.size(), 1u);
    auto experiment = api.get_or_create_experiment(report.folders[0]);
    auto dataset = api.get_or_create_dataset(report.folders[0], experiment.value());
    EXPECT_EQ(staging.file("/stage/ds" + std::to_string(dataset.value()) + "/big.bin"), big);
}

TEST_F(SyncEngineTest, FolderIdsKeepGrowingAcrossPasses) {
    api.add_user("alice");
    write_file(root / "alice/Dataset1/a.txt", "a");
    write_file(root / "alice/Dataset2/b.txt", "b");
    SyncEngine engine(settings, api, nullptr, bus);

    const auto first = engine.run_pass();
    const auto second = engine.run_pass();

    ASSERT_EQ(first.folders.size(), 2u);
    ASSERT_EQ(second.folders.size(), 2u);
    EXPECT_EQ(first.folders[0].id, 1u);
    EXPECT_EQ(first.folders[1].id, 2u);
    EXPECT_EQ(second.folders[0].id, 3u);
    EXPECT_EQ(second.folders[1].id, 4u);
    // Already uploaded, so the second pass only re-checks
    EXPECT_EQ(api.post_attempts(), 2u);
    EXPECT_EQ(second.summary.completed, 2u);
}

TEST_F(SyncEngineTest, CancelDuringPassSkipsUploads) {
    api.add_user("alice");
    write_file(root / "alice/Dataset1/a.txt", "a");
    SyncEngine engine(settings, api, nullptr, bus);
    bus.subscribe<events::FolderDiscoveredEvent>([&engine](const events::FolderDiscoveredEvent&) {
        engine.cancel();
    });

    const auto report = engine.run_pass();

    EXPECT_TRUE(report.canceled);
    EXPECT_FALSE(report.scan_error.has_value());
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_EQ(uploads_completed.load(), 0);
}

TEST_F(SyncEngineTest, CancelBeforePassIsNotCarriedOver) {
    api.add_user("alice");
    write_file(root / "alice/Dataset1/a.txt", "a");
    SyncEngine engine(settings, api, nullptr, bus);

    engine.cancel();
    const auto report = engine.run_pass();

    EXPECT_FALSE(report.canceled);
    EXPECT_EQ(report.summary.completed, 1u);
}
