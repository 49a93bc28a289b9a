#include "labsync/transfer/local_transport.hpp"
#include "labsync/transfer/ssh_transport.hpp"
#include "labsync/transfer/transfer_strategy.hpp"

#include "support/fake_repository.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace labsync;
using namespace labsync::transfer;
using labsync::test_support::FakeRepository;
using labsync::test_support::FakeStagingTransport;
using labsync::test_support::TempDir;

namespace {

TransferPolicy small_policy() {
    TransferPolicy policy;
    policy.method = config::UploadMethod::Staging;
    policy.large_file_size = 1000;
    policy.chunks = ChunkPolicy{256, 4096};
    policy.staging_location = "/var/staging";
    return policy;
}

remote::DatafileDescriptor describe(std::int64_t dataset, const std::string& name, std::uint64_t size) {
    remote::DatafileDescriptor descriptor;
    descriptor.dataset_id = dataset;
    descriptor.filename = name;
    descriptor.size = size;
    return descriptor;
}

} // namespace

TEST(TransferStrategyTest, ThresholdChoosesMethod) {
    FakeRepository api;
    FakeStagingTransport transport;
    TransferStrategy strategy(api, &transport, small_policy());

    EXPECT_EQ(strategy.choose(0), TransferMethod::Post);
    EXPECT_EQ(strategy.choose(1000), TransferMethod::Post);
    EXPECT_EQ(strategy.choose(1001), TransferMethod::Chunked);
}

TEST(TransferStrategyTest, PostMethodNeverChunks) {
    FakeRepository api;
    auto policy = small_policy();
    policy.method = config::UploadMethod::Post;
    TransferStrategy strategy(api, nullptr, policy);

    EXPECT_EQ(strategy.choose(1ull << 40), TransferMethod::Post);
}

TEST(TransferStrategyTest, SmallFileIsPostedWithTwoProgressReports) {
    TempDir dir;
    test_support::write_file(dir / "a.txt", "hello");

    FakeRepository api;
    FakeStagingTransport transport;
    TransferStrategy strategy(api, &transport, small_policy());

    std::vector<std::uint64_t> reported;
    auto sent = strategy.send(describe(3, "a.txt", 5), dir / "a.txt", std::nullopt, CancellationToken(),
                              [&](std::uint64_t done, std::uint64_t) { reported.push_back(done); });
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(sent.value().method, TransferMethod::Post);
    EXPECT_EQ(sent.value().bytes_sent, 5u);
    EXPECT_EQ(reported, (std::vector<std::uint64_t>{0, 5}));
    EXPECT_EQ(api.posted().at(sent.value().datafile_id), "hello");
    EXPECT_TRUE(transport.log().empty());
}

TEST(TransferStrategyTest, LargeFileIsStagedUnderLocation) {
    TempDir dir;
    const auto data = test_support::pattern_bytes(3000);
    test_support::write_file(dir / "big.bin", data);

    FakeRepository api;
    FakeStagingTransport transport;
    TransferStrategy strategy(api, &transport, small_policy());

    auto sent = strategy.send(describe(9, "big.bin", data.size()), dir / "big.bin", std::nullopt,
                              CancellationToken());
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(sent.value().method, TransferMethod::Chunked);
    EXPECT_EQ(sent.value().outcome, TransferOutcome::Completed);
    EXPECT_EQ(api.staged_records(), 1u);
    EXPECT_EQ(api.post_attempts(), 0u);
    EXPECT_EQ(transport.file("/var/staging/ds9/big.bin"), data);
}

TEST(TransferStrategyTest, ExistingRecordResumesIntoItsReplica) {
    TempDir dir;
    const auto data = test_support::pattern_bytes(2048);
    test_support::write_file(dir / "big.bin", data);

    FakeRepository api;
    FakeStagingTransport transport;
    transport.set_file("/var/staging/old/big.bin", data.substr(0, 1024));
    TransferStrategy strategy(api, &transport, small_policy());

    remote::RemoteDatafile existing;
    existing.id = 77;
    existing.filename = "big.bin";
    existing.size = data.size();
    existing.replica_uri = "old/big.bin";

    auto sent = strategy.send(describe(9, "big.bin", data.size()), dir / "big.bin", existing,
                              CancellationToken());
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(sent.value().datafile_id, 77);
    EXPECT_EQ(sent.value().bytes_sent, 1024u);
    EXPECT_EQ(api.staged_records(), 0u);
    EXPECT_EQ(transport.file("/var/staging/old/big.bin"), data);
}

TEST(TransferStrategyTest, ExistingRecordWithoutReplicaIsProtocolError) {
    TempDir dir;
    test_support::write_file(dir / "big.bin", test_support::pattern_bytes(2048));

    FakeRepository api;
    FakeStagingTransport transport;
    TransferStrategy strategy(api, &transport, small_policy());

    remote::RemoteDatafile existing;
    existing.id = 5;
    auto sent = strategy.send(describe(9, "big.bin", 2048), dir / "big.bin", existing, CancellationToken());
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::Protocol);
}

TEST(TransferStrategyTest, ChunkedWithoutTransportIsConfigurationError) {
    TempDir dir;
    test_support::write_file(dir / "big.bin", test_support::pattern_bytes(2048));

    FakeRepository api;
    TransferStrategy strategy(api, nullptr, small_policy());
    auto sent = strategy.send(describe(9, "big.bin", 2048), dir / "big.bin", std::nullopt, CancellationToken());
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::Configuration);
}

TEST(TransferStrategyTest, PostFailurePropagates) {
    TempDir dir;
    test_support::write_file(dir / "a.txt", "hello");

    FakeRepository api;
    api.fail_next_posts(1);
    TransferStrategy strategy(api, nullptr, small_policy());
    auto sent = strategy.send(describe(3, "a.txt", 5), dir / "a.txt", std::nullopt, CancellationToken());
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::Http);
    EXPECT_EQ(sent.error().status_code, 503);
}

TEST(MakeStagingTransport, FollowsSettings) {
    config::Settings settings;
    settings.upload_method = config::UploadMethod::Post;
    EXPECT_EQ(make_staging_transport(settings).get(), nullptr);

    settings.upload_method = config::UploadMethod::Staging;
    settings.staging.transport = config::StagingTransportKind::Local;
    auto local = make_staging_transport(settings);
    EXPECT_NE(dynamic_cast<LocalStagingTransport*>(local.get()), nullptr);

    settings.staging.transport = config::StagingTransportKind::Ssh;
    auto ssh = make_staging_transport(settings);
    EXPECT_NE(dynamic_cast<SshStagingTransport*>(ssh.get()), nullptr);
}
