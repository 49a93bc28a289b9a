#include "labsync/transfer/transfer_strategy.hpp"

#include "labsync/transfer/local_transport.hpp"
#include "labsync/transfer/ssh_transport.hpp"

#include <spdlog/spdlog.h>

namespace labsync::transfer {

const char* transfer_method_name(TransferMethod method) {
    return method == TransferMethod::Post ? "post" : "chunked";
}

TransferPolicy TransferPolicy::from_settings(const config::Settings& settings) {
    TransferPolicy policy;
    policy.method = settings.upload_method;
    policy.large_file_size = settings.large_file_size;
    policy.chunks.default_chunk_size = settings.default_chunk_size;
    policy.chunks.max_chunk_size = settings.max_chunk_size;
    policy.staging_location = settings.staging.location;
    return policy;
}

TransferStrategy::TransferStrategy(remote::RepositoryApi& api, StagingTransport* transport,
                                   TransferPolicy policy)
    : api_(api), transport_(transport), policy_(std::move(policy)) {}

TransferMethod TransferStrategy::choose(std::uint64_t size) const {
    if (policy_.method == config::UploadMethod::Post || size <= policy_.large_file_size) {
        return TransferMethod::Post;
    }
    return TransferMethod::Chunked;
}

Result<SendResult> TransferStrategy::send(const remote::DatafileDescriptor& descriptor,
                                          const std::filesystem::path& local_path,
                                          const std::optional<remote::RemoteDatafile>& existing,
                                          const CancellationToken& token,
                                          const ProgressCallback& progress) {
    if (choose(descriptor.size) == TransferMethod::Post) {
        return send_with_post(descriptor, local_path, token, progress);
    }
    return send_chunked(descriptor, local_path, existing, token, progress);
}

Result<SendResult> TransferStrategy::send_with_post(const remote::DatafileDescriptor& descriptor,
                                                    const std::filesystem::path& local_path,
                                                    const CancellationToken& token,
                                                    const ProgressCallback& progress) {
    SendResult result;
    result.method = TransferMethod::Post;
    if (token.is_canceled()) {
        result.outcome = TransferOutcome::Canceled;
        return Ok(result);
    }

    if (progress) {
        progress(0, descriptor.size);
    }
    auto id = api_.upload_datafile_with_post(local_path, descriptor);
    if (id.is_error()) {
        return Err(id.error());
    }
    result.datafile_id = id.value();
    result.bytes_sent = descriptor.size;
    if (progress) {
        progress(descriptor.size, descriptor.size);
    }
    return Ok(result);
}

Result<SendResult> TransferStrategy::send_chunked(const remote::DatafileDescriptor& descriptor,
                                                  const std::filesystem::path& local_path,
                                                  const std::optional<remote::RemoteDatafile>& existing,
                                                  const CancellationToken& token,
                                                  const ProgressCallback& progress) {
    if (transport_ == nullptr) {
        return Err(ErrorKind::Configuration, "Chunked upload requested without a staging transport");
    }

    SendResult result;
    result.method = TransferMethod::Chunked;
    if (token.is_canceled()) {
        result.outcome = TransferOutcome::Canceled;
        return Ok(result);
    }

    std::string staging_path;
    if (existing) {
        if (existing->replica_uri.empty()) {
            return Err(ErrorKind::Protocol,
                       "Datafile " + std::to_string(existing->id) + " has no staging replica to resume");
        }
        result.datafile_id = existing->id;
        staging_path = existing->replica_uri;
    } else {
        auto staged = api_.create_staged_datafile(descriptor);
        if (staged.is_error()) {
            return Err(staged.error());
        }
        result.datafile_id = staged.value().id;
        staging_path = staged.value().staging_path;
    }

    ChunkUploadRequest request;
    request.local_path = local_path;
    request.remote_path = resolve_staging_path(policy_.staging_location, staging_path);
    request.size = descriptor.size;

    ResumableChunkUploader uploader(*transport_, policy_.chunks);
    auto uploaded = uploader.upload(request, token, progress);
    if (uploaded.is_error()) {
        return Err(uploaded.error());
    }
    result.outcome = uploaded.value().outcome;
    result.bytes_sent = uploaded.value().bytes_sent;
    return Ok(result);
}

std::unique_ptr<StagingTransport> make_staging_transport(const config::Settings& settings) {
    if (settings.upload_method == config::UploadMethod::Post) {
        return nullptr;
    }
    if (settings.staging.transport == config::StagingTransportKind::Local) {
        return std::make_unique<LocalStagingTransport>();
    }
    spdlog::debug("Staging over ssh to {}@{}:{}", settings.staging.username, settings.staging.host,
                  settings.staging.port);
    return std::make_unique<SshStagingTransport>(SshOptions::from_settings(settings));
}

} // namespace labsync::transfer
