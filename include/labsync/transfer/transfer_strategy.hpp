#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/remote/repository_api.hpp"
#include "labsync/transfer/chunk_uploader.hpp"
#include "labsync/transfer/staging_transport.hpp"

#include <memory>
#include <optional>

namespace labsync::transfer {

enum class TransferMethod { Post, Chunked };

const char* transfer_method_name(TransferMethod method);

struct TransferPolicy {
    config::UploadMethod method = config::UploadMethod::Staging;
    std::uint64_t large_file_size = 10 * config::kMebibyte;
    ChunkPolicy chunks;
    std::string staging_location;

    static TransferPolicy from_settings(const config::Settings& settings);
};

struct SendResult {
    TransferOutcome outcome = TransferOutcome::Completed;
    TransferMethod method = TransferMethod::Post;
    std::int64_t datafile_id = 0;
    std::uint64_t bytes_sent = 0;
};

/**
 * @brief Picks and runs the byte transfer for one file
 *
 * Files up to large_file_size, and every file when the upload method is
 * "post", go as one multipart POST: no resume, progress reported at 0 and
 * at 100%. Larger files get a staging record from the repository and are
 * copied with ResumableChunkUploader.
 */
class TransferStrategy {
public:
    /// transport may be null when every file is posted.
    TransferStrategy(remote::RepositoryApi& api, StagingTransport* transport, TransferPolicy policy);

    TransferMethod choose(std::uint64_t size) const;

    /**
     * @brief Send local_path as the datafile described by descriptor
     *
     * existing is an unverified record already in the repository; chunked
     * transfers resume into its replica instead of creating a new record.
     */
    Result<SendResult> send(const remote::DatafileDescriptor& descriptor,
                            const std::filesystem::path& local_path,
                            const std::optional<remote::RemoteDatafile>& existing,
                            const CancellationToken& token,
                            const ProgressCallback& progress = nullptr);

private:
    Result<SendResult> send_with_post(const remote::DatafileDescriptor& descriptor,
                                      const std::filesystem::path& local_path,
                                      const CancellationToken& token,
                                      const ProgressCallback& progress);
    Result<SendResult> send_chunked(const remote::DatafileDescriptor& descriptor,
                                    const std::filesystem::path& local_path,
                                    const std::optional<remote::RemoteDatafile>& existing,
                                    const CancellationToken& token,
                                    const ProgressCallback& progress);

    remote::RepositoryApi& api_;
    StagingTransport* transport_;
    TransferPolicy policy_;
};

/// Transport named by settings.staging, or null for the "post" upload method.
std::unique_ptr<StagingTransport> make_staging_transport(const config::Settings& settings);

} // namespace labsync::transfer
