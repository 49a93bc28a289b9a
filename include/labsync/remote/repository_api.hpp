#pragma once

#include "labsync/core/result.hpp"
#include "labsync/model/folder_record.hpp"
#include "labsync/model/owner.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace labsync::remote {

/**
 * @brief Datafile record as stored by the repository
 */
struct RemoteDatafile {
    std::int64_t id = 0;
    std::string filename;
    std::string directory;
    std::uint64_t size = 0;
    std::string md5sum;
    bool verified = false;      ///< At least one replica has been verified
    std::string replica_uri;    ///< Staging location of the first replica, may be relative
};

/**
 * @brief Metadata sent when creating a datafile record
 */
struct DatafileDescriptor {
    std::int64_t dataset_id = 0;
    std::string filename;
    std::string directory;      ///< Relative to the dataset folder, "" at the top
    std::uint64_t size = 0;
    std::string md5sum;
    std::string mimetype = "application/octet-stream";
    std::string created_time;   ///< ISO 8601, local file mtime

    nlohmann::json to_json() const;
};

/// Record created for a staging upload and where its bytes must be written.
struct StagedDatafile {
    std::int64_t id = 0;
    std::string staging_path;
};

/**
 * @brief Operations the engine needs from the research-data repository
 *
 * Lookups return every match; callers decide what zero or several mean.
 * Errors: Transport for connection problems and timeouts, Http (with the
 * status code) for non-2xx replies, Protocol for malformed bodies.
 */
class RepositoryApi {
public:
    virtual ~RepositoryApi() = default;

    virtual Result<std::vector<model::Owner>> find_user_by_username(const std::string& username) = 0;
    virtual Result<std::vector<model::Owner>> find_user_by_email(const std::string& email) = 0;
    virtual Result<std::vector<model::Owner>> find_group_by_name(const std::string& name) = 0;

    virtual Result<std::int64_t> get_or_create_experiment(const model::FolderRecord& folder) = 0;
    virtual Result<std::int64_t> get_or_create_dataset(const model::FolderRecord& folder,
                                                       std::int64_t experiment_id) = 0;

    /// nullopt when no record matches; Protocol error when several do.
    virtual Result<std::optional<RemoteDatafile>> find_datafile(std::int64_t dataset_id,
                                                                const std::string& filename,
                                                                const std::string& directory) = 0;

    virtual Result<StagedDatafile> create_staged_datafile(const DatafileDescriptor& descriptor) = 0;

    /// Create the record and send the bytes in one multipart request.
    virtual Result<std::int64_t> upload_datafile_with_post(const std::filesystem::path& local_path,
                                                           const DatafileDescriptor& descriptor) = 0;

    /// Success means the request was accepted, not that verification finished.
    virtual Result<void> request_verification(std::int64_t datafile_id) = 0;
};

} // namespace labsync::remote
