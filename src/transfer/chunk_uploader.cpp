#include "labsync/transfer/chunk_uploader.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <vector>

namespace labsync::transfer {
namespace fs = std::filesystem;

namespace {

/// Local file holding one chunk between read and copy. Removed on destruction.
class ScratchFile {
public:
    explicit ScratchFile(const fs::path& dir) {
        static std::atomic<std::uint64_t> counter{0};
        path_ = dir / ("labsync-" + std::to_string(::getpid()) + "-" +
                       std::to_string(counter.fetch_add(1)) + ".chunk");
    }

    ~ScratchFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const fs::path& path() const { return path_; }

    Result<void> write(const std::vector<char>& data, std::size_t length) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err(ErrorKind::LocalIo, "Cannot create scratch file " + path_.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(length));
        out.flush();
        if (!out) {
            return Err(ErrorKind::LocalIo, "Cannot write scratch file " + path_.string());
        }
        return Ok();
    }

private:
    fs::path path_;
};

} // namespace

std::uint64_t choose_chunk_size(std::uint64_t file_size,
                                std::uint64_t default_chunk,
                                std::uint64_t max_chunk) {
    std::uint64_t chunk = std::max<std::uint64_t>(default_chunk, 1);
    while ((file_size + chunk - 1) / chunk > kTargetChunkCount && chunk < max_chunk) {
        chunk = std::min(chunk * 2, max_chunk);
    }
    return chunk;
}

const char* resume_decision_name(ResumeDecision decision) {
    switch (decision) {
        case ResumeDecision::AlreadyComplete: return "AlreadyComplete";
        case ResumeDecision::Resume: return "Resume";
        case ResumeDecision::Restart: return "Restart";
    }
    return "Unknown";
}

ResumePlan plan_resume(std::uint64_t remote_size,
                       std::uint64_t declared_size,
                       std::uint64_t chunk_size) {
    ResumePlan plan;
    if (remote_size == declared_size && declared_size > 0) {
        plan.decision = ResumeDecision::AlreadyComplete;
        plan.start_offset = declared_size;
        return plan;
    }
    if (remote_size > declared_size) {
        plan.oversize = true;
        return plan;
    }
    if (remote_size > 0 && chunk_size > 0 && remote_size % chunk_size == 0) {
        plan.decision = ResumeDecision::Resume;
        plan.start_offset = remote_size;
        plan.skip_chunks = remote_size / chunk_size;
    }
    return plan;
}

ResumableChunkUploader::ResumableChunkUploader(StagingTransport& transport, ChunkPolicy policy,
                                               fs::path scratch_dir)
    : transport_(transport), policy_(policy), scratch_dir_(std::move(scratch_dir)) {}

Result<ChunkUploadResult> ResumableChunkUploader::upload(const ChunkUploadRequest& request,
                                                         const CancellationToken& token,
                                                         const ProgressCallback& progress) {
    ChunkUploadResult result;
    result.chunk_size = choose_chunk_size(request.size, policy_.default_chunk_size, policy_.max_chunk_size);

    if (token.is_canceled()) {
        result.outcome = TransferOutcome::Canceled;
        return Ok(result);
    }

    auto remote_size = transport_.query_size(request.remote_path);
    if (remote_size.is_error()) {
        return Err(remote_size.error());
    }
    result.plan = plan_resume(remote_size.value(), request.size, result.chunk_size);

    if (result.plan.oversize) {
        spdlog::warn("Integrity warning: {} has {} bytes in staging but {} locally, restarting upload",
                     request.remote_path, remote_size.value(), request.size);
    }
    if (result.plan.decision == ResumeDecision::AlreadyComplete) {
        spdlog::debug("{} is already complete in staging", request.remote_path);
        result.outcome = TransferOutcome::AlreadyComplete;
        result.bytes_transferred = request.size;
        if (progress) {
            progress(request.size, request.size);
        }
        return Ok(result);
    }
    if (result.plan.decision == ResumeDecision::Resume) {
        spdlog::info("Resuming {} at chunk {} ({} of {} bytes present)",
                     request.remote_path, result.plan.skip_chunks, result.plan.start_offset, request.size);
        // The staged prefix is a checkpoint even if no further chunk is sent
        result.bytes_transferred = result.plan.start_offset;
        if (progress) {
            progress(result.plan.start_offset, request.size);
        }
    } else if (remote_size.value() > 0 && !result.plan.oversize) {
        spdlog::info("{} has {} bytes in staging, not a multiple of {}, restarting upload",
                     request.remote_path, remote_size.value(), result.chunk_size);
    }

    if (auto res = transport_.ensure_directory(remote_parent(request.remote_path)); res.is_error()) {
        return Err(res.error());
    }
    const std::string chunk_path = remote_chunk_path(request.remote_path);
    if (auto res = transport_.remove(chunk_path); res.is_error()) {
        spdlog::warn("Could not remove stale chunk {}: {}", chunk_path, res.error().message);
    }

    std::ifstream input(request.local_path, std::ios::binary);
    if (!input) {
        return Err(ErrorKind::LocalIo, "Cannot open " + request.local_path.string());
    }

    ScratchFile scratch(scratch_dir_);
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(result.chunk_size, std::max<std::uint64_t>(request.size, 1))));
    std::uint64_t offset = result.plan.start_offset;
    result.bytes_transferred = offset;

    while (offset < request.size || (request.size == 0 && result.chunks_sent == 0)) {
        if (token.is_canceled()) {
            spdlog::info("Upload of {} canceled at {} of {} bytes", request.local_path.string(),
                         offset, request.size);
            result.outcome = TransferOutcome::Canceled;
            return Ok(result);
        }

        const auto wanted = static_cast<std::size_t>(std::min(result.chunk_size, request.size - offset));
        input.seekg(static_cast<std::streamoff>(offset));
        input.read(buffer.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (got != wanted) {
            return Err(ErrorKind::LocalIo,
                       request.local_path.string() + " is shorter than its declared size of " +
                       std::to_string(request.size) + " bytes");
        }

        if (auto res = scratch.write(buffer, got); res.is_error()) {
            return Err(res.error());
        }
        if (auto res = transport_.put_temp(scratch.path(), chunk_path); res.is_error()) {
            return Err(res.error());
        }
        if (auto res = transport_.append_and_cleanup(chunk_path, request.remote_path, offset == 0);
            res.is_error()) {
            return Err(res.error());
        }

        offset += got;
        result.bytes_transferred = offset;
        result.bytes_sent += got;
        ++result.chunks_sent;
        if (progress) {
            progress(offset, request.size);
        }
    }

    if (auto res = transport_.remove(chunk_path); res.is_error()) {
        spdlog::warn("Could not remove {}: {}", chunk_path, res.error().message);
    }
    result.outcome = TransferOutcome::Completed;
    return Ok(result);
}

} // namespace labsync::transfer
