#include "labsync/upload/upload_coordinator.hpp"

#include "labsync/events/events.hpp"

#include "support/fake_repository.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace labsync;
using labsync::model::UploadStatus;
using labsync::test_support::FakeRepository;
using labsync::test_support::FakeStagingTransport;
using labsync::test_support::TempDir;
using labsync::upload::CoordinatorOptions;
using labsync::upload::UploadCoordinator;

namespace {

transfer::TransferPolicy test_policy() {
    transfer::TransferPolicy policy;
    policy.large_file_size = 1000;
    policy.chunks = transfer::ChunkPolicy{256, 4096};
    policy.staging_location = "/stage";
    return policy;
}

CoordinatorOptions test_options(int max_retries = 1) {
    CoordinatorOptions options;
    options.upload_workers = 2;
    options.verification_workers = 2;
    options.max_retries = max_retries;
    options.verification_delay = std::chrono::milliseconds(10);
    return options;
}

model::FolderRecord make_folder(const TempDir& root, const std::string& name, std::uint64_t id) {
    model::FolderRecord folder;
    folder.id = id;
    folder.name = name;
    folder.path = root / name;
    folder.identity_folder = "alice";
    folder.experiment_title = "Instrument 1 - alice";
    std::filesystem::create_directories(folder.path);
    return folder;
}

/// Dataset id the coordinator will get for folder from the fake repository.
std::int64_t dataset_of(FakeRepository& api, const model::FolderRecord& folder) {
    auto experiment = api.get_or_create_experiment(folder);
    return api.get_or_create_dataset(folder, experiment.value()).value();
}

/// Fixture owning the collaborators a coordinator needs.
class UploadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus.subscribe<events::FolderStatusChangedEvent>([this](const events::FolderStatusChangedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            folder_statuses[e.folder_id] = e.status;
        });
        bus.subscribe<events::UploadProgressEvent>([this](const events::UploadProgressEvent&) {
            progress_events++;
        });
    }

    model::UploadSummary run(std::vector<model::FolderRecord>& folders,
                             const CoordinatorOptions& options = test_options(),
                             const CancellationToken& token = CancellationToken()) {
        transfer::TransferStrategy strategy(api, &transport, test_policy());
        UploadCoordinator coordinator(api, strategy, bus, options);
        auto summary = coordinator.run(folders, token);
        snapshots = coordinator.task_snapshots();
        return summary;
    }

    UploadStatus last_folder_status(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        return folder_statuses.at(id);
    }

    const model::UploadTaskSnapshot& snapshot_of(const std::string& filename) {
        for (const auto& snapshot : snapshots) {
            if (snapshot.filename == filename) {
                return snapshot;
            }
        }
        throw std::runtime_error("no task for " + filename);
    }

    TempDir root;
    FakeRepository api;
    FakeStagingTransport transport;
    events::EventBus bus;
    std::mutex mutex;
    std::map<std::uint64_t, UploadStatus> folder_statuses;
    std::atomic<int> progress_events{0};
    std::vector<model::UploadTaskSnapshot> snapshots;
};

} // namespace

TEST_F(UploadCoordinatorTest, SmallFilesArePostedAndVerified) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    test_support::write_file(folder.path / "b.txt", "world");
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.already_present, 0u);
    EXPECT_EQ(summary.bytes_uploaded, 10u);
    EXPECT_EQ(folders[0].num_files, 2u);
    EXPECT_EQ(folders[0].status, UploadStatus::Completed);
    EXPECT_EQ(last_folder_status(1), UploadStatus::Completed);
    EXPECT_EQ(api.post_attempts(), 2u);
    EXPECT_EQ(api.verifications().size(), 2u);
    EXPECT_GE(progress_events.load(), 4);

    std::vector<std::string> bodies;
    for (const auto& posted : api.posted()) {
        bodies.push_back(posted.second);
    }
    std::sort(bodies.begin(), bodies.end());
    EXPECT_EQ(bodies, (std::vector<std::string>{"hello", "world"}));
}

TEST_F(UploadCoordinatorTest, VerifiedFileIsNotUploadedAgain) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    api.add_datafile(dataset_of(api, folder), "a.txt", "", 5, true);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.already_present, 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_TRUE(api.verifications().empty());
    EXPECT_EQ(snapshot_of("a.txt").status, UploadStatus::Completed);
}

TEST_F(UploadCoordinatorTest, UnverifiedSmallFileGetsVerificationRequest) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    const auto id = api.add_datafile(dataset_of(api, folder), "a.txt", "", 5, false);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.already_present, 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
    const auto requests = api.verifications();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].datafile_id, id);
}

TEST_F(UploadCoordinatorTest, SizeMismatchFailsWithoutUpload) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    api.add_datafile(dataset_of(api, folder), "a.txt", "", 99, true);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_EQ(folders[0].status, UploadStatus::Failed);
    EXPECT_NE(snapshot_of("a.txt").message.find("Size mismatch"), std::string::npos);
}

TEST_F(UploadCoordinatorTest, TransientFailureIsRetried) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    api.fail_next_posts(1);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders, test_options(1));

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(api.post_attempts(), 2u);
    EXPECT_EQ(snapshot_of("a.txt").retry_count, 1);
}

TEST_F(UploadCoordinatorTest, RetryBudgetIsBounded) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    api.fail_next_posts(5);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders, test_options(2));

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(api.post_attempts(), 3u);
    EXPECT_EQ(snapshot_of("a.txt").retry_count, 2);
    EXPECT_EQ(snapshot_of("a.txt").status, UploadStatus::Failed);
    EXPECT_EQ(last_folder_status(1), UploadStatus::Failed);
}

TEST_F(UploadCoordinatorTest, LookupFailureIsNotRetried) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    api.fail_next_finds(1);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(api.find_calls(), 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
}

TEST_F(UploadCoordinatorTest, LargeFileIsChunkedIntoStaging) {
    auto folder = make_folder(root, "Dataset1", 1);
    const auto data = test_support::pattern_bytes(5000);
    test_support::write_file(folder.path / "raw" / "big.bin", data);
    const auto dataset = dataset_of(api, folder);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.bytes_uploaded, 5000u);
    EXPECT_EQ(api.staged_records(), 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_EQ(transport.file("/stage/ds" + std::to_string(dataset) + "/raw/big.bin"), data);
    EXPECT_EQ(api.verifications().size(), 1u);
    EXPECT_EQ(snapshot_of("big.bin").subdirectory, "raw");
}

TEST_F(UploadCoordinatorTest, UnverifiedLargeFileResumesStagingCopy) {
    auto folder = make_folder(root, "Dataset1", 1);
    const auto data = test_support::pattern_bytes(4096);
    test_support::write_file(folder.path / "big.bin", data);
    const auto id = api.add_datafile(dataset_of(api, folder), "big.bin", "", data.size(), false, "old/big.bin");
    transport.set_file("/stage/old/big.bin", data.substr(0, 2048));
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.bytes_uploaded, 2048u);
    EXPECT_EQ(api.staged_records(), 0u);
    EXPECT_EQ(transport.file("/stage/old/big.bin"), data);
    const auto requests = api.verifications();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].datafile_id, id);
}

TEST_F(UploadCoordinatorTest, CanceledResumeKeepsStagedBytes) {
    auto folder = make_folder(root, "Dataset1", 1);
    const auto data = test_support::pattern_bytes(4096);
    test_support::write_file(folder.path / "big.bin", data);
    api.add_datafile(dataset_of(api, folder), "big.bin", "", data.size(), false, "old/big.bin");
    transport.set_file("/stage/old/big.bin", data.substr(0, 2048));
    std::vector<model::FolderRecord> folders{folder};

    CancellationToken token;
    transport.after_query([&]() { token.cancel(); });
    const auto summary = run(folders, test_options(), token);

    EXPECT_EQ(summary.canceled, 1u);
    EXPECT_EQ(transport.appends(), 0u);
    EXPECT_EQ(transport.file("/stage/old/big.bin").size(), 2048u);
    EXPECT_EQ(snapshot_of("big.bin").status, UploadStatus::Canceled);
    EXPECT_EQ(snapshot_of("big.bin").bytes_transferred, 2048u);
    EXPECT_TRUE(api.verifications().empty());
}

TEST_F(UploadCoordinatorTest, CanceledRunUploadsNothing) {
    auto folder = make_folder(root, "Dataset1", 1);
    test_support::write_file(folder.path / "a.txt", "hello");
    test_support::write_file(folder.path / "b.txt", "world");
    std::vector<model::FolderRecord> folders{folder};

    CancellationToken token;
    token.cancel();
    const auto summary = run(folders, test_options(), token);

    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.canceled, 2u);
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_EQ(folders[0].status, UploadStatus::Canceled);
}

TEST_F(UploadCoordinatorTest, CancelDuringChunkedTransferStopsAtChunkBoundary) {
    auto folder = make_folder(root, "Dataset1", 1);
    const auto data = test_support::pattern_bytes(8192);
    test_support::write_file(folder.path / "big.bin", data);
    std::vector<model::FolderRecord> folders{folder};

    CancellationToken token;
    transport.after_append([&]() {
        if (transport.appends() == 3) {
            token.cancel();
        }
    });
    const auto summary = run(folders, test_options(), token);

    EXPECT_EQ(summary.canceled, 1u);
    EXPECT_EQ(transport.appends(), 3u);
    EXPECT_EQ(snapshot_of("big.bin").bytes_transferred, 3u * 256u);
    EXPECT_TRUE(api.verifications().empty());
}

TEST_F(UploadCoordinatorTest, EmptyFolderIsCompleted) {
    auto folder = make_folder(root, "Empty", 4);
    std::vector<model::FolderRecord> folders{folder};

    const auto summary = run(folders);

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(folders[0].num_files, 0u);
    EXPECT_EQ(folders[0].status, UploadStatus::Completed);
}

TEST_F(UploadCoordinatorTest, FoldersShareOneRunButKeepSeparateStatus) {
    auto good = make_folder(root, "Good", 1);
    test_support::write_file(good.path / "a.txt", "hello");
    auto bad = make_folder(root, "Bad", 2);
    test_support::write_file(bad.path / "b.txt", "world");
    api.add_datafile(dataset_of(api, bad), "b.txt", "", 1, true);
    std::vector<model::FolderRecord> folders{good, bad};

    const auto summary = run(folders);

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(folders[0].status, UploadStatus::Completed);
    EXPECT_EQ(folders[1].status, UploadStatus::Failed);
}
