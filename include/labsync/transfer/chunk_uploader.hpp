/**
 * @file chunk_uploader.hpp
 * @brief Resumable, append-based chunked copy into the staging area
 *
 * PROTOCOL:
 * 1. Ask the transport how many bytes of the final file already exist.
 * 2. Decide: AlreadyComplete, Resume at a chunk boundary, or Restart.
 * 3. For each remaining chunk: read it into a local temporary file, copy
 *    that to "<dir>/.<name>.chunk", then append the chunk onto the final
 *    file (truncating on the first chunk) and delete it.
 * 4. Remove any leftover chunk file.
 *
 * INVARIANT:
 * Between chunks the final file is always a whole number of chunks long.
 * That is what makes "remote size / chunk size" a safe resume index, and
 * why a remote size that is not chunk-aligned forces a restart.
 */

#pragma once

#include "labsync/core/cancellation.hpp"
#include "labsync/core/result.hpp"
#include "labsync/transfer/staging_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace labsync::transfer {

/// Chunk count above which the chunk size is doubled.
constexpr std::uint64_t kTargetChunkCount = 50;

/**
 * @brief Smallest power-of-two multiple of default_chunk giving at most
 * kTargetChunkCount chunks for file_size, capped at max_chunk
 */
std::uint64_t choose_chunk_size(std::uint64_t file_size,
                                std::uint64_t default_chunk,
                                std::uint64_t max_chunk);

enum class ResumeDecision {
    AlreadyComplete,
    Resume,
    Restart
};

const char* resume_decision_name(ResumeDecision decision);

struct ResumePlan {
    ResumeDecision decision = ResumeDecision::Restart;
    std::uint64_t start_offset = 0;
    std::uint64_t skip_chunks = 0;
    bool oversize = false;          ///< Remote file was larger than the local one
};

/// Where to start given the remote byte count of the final file.
ResumePlan plan_resume(std::uint64_t remote_size,
                       std::uint64_t declared_size,
                       std::uint64_t chunk_size);

struct ChunkPolicy {
    std::uint64_t default_chunk_size = 1024 * 1024;
    std::uint64_t max_chunk_size = 256ull * 1024 * 1024;
};

struct ChunkUploadRequest {
    std::filesystem::path local_path;
    std::string remote_path;
    std::uint64_t size = 0;
};

enum class TransferOutcome {
    Completed,
    AlreadyComplete,
    Canceled
};

struct ChunkUploadResult {
    TransferOutcome outcome = TransferOutcome::Completed;
    ResumePlan plan;
    std::uint64_t chunk_size = 0;
    std::uint64_t bytes_transferred = 0;   ///< Bytes of the final file in place
    std::uint64_t bytes_sent = 0;          ///< Bytes copied during this call
    std::size_t chunks_sent = 0;
};

/// Called after every appended chunk with the final file's length.
using ProgressCallback = std::function<void(std::uint64_t bytes_transferred, std::uint64_t total)>;

/**
 * @brief Drives the chunk loop for one file over a StagingTransport
 *
 * Cancellation is checked before each chunk. A canceled upload returns
 * Ok with outcome Canceled and bytes_transferred at the last appended
 * chunk, so a later call resumes from there.
 *
 * Errors: Transport from the staging side, LocalIo when the local file
 * cannot be read or is shorter than its declared size.
 */
class ResumableChunkUploader {
public:
    ResumableChunkUploader(StagingTransport& transport, ChunkPolicy policy,
                           std::filesystem::path scratch_dir = std::filesystem::temp_directory_path());

    Result<ChunkUploadResult> upload(const ChunkUploadRequest& request,
                                     const CancellationToken& token,
                                     const ProgressCallback& progress = nullptr);

private:
    StagingTransport& transport_;
    ChunkPolicy policy_;
    std::filesystem::path scratch_dir_;
};

} // namespace labsync::transfer
