#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/network/http_client.hpp"
#include "labsync/network/url.hpp"
#include "labsync/remote/repository_api.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace labsync::remote {

/**
 * @brief RepositoryApi over the repository's REST API (api/v1)
 *
 * List endpoints answer {"meta": {"total_count": N}, "objects": [...]}.
 * Every request carries "Authorization: ApiKey <username>:<api_key>" and
 * JSON Content-Type/Accept headers.
 */
class HttpRepositoryClient : public RepositoryApi {
public:
    static Result<std::unique_ptr<HttpRepositoryClient>> create(const config::Settings& settings);

    HttpRepositoryClient(network::Url base, network::HttpClient client, const config::Settings& settings);

    Result<std::vector<model::Owner>> find_user_by_username(const std::string& username) override;
    Result<std::vector<model::Owner>> find_user_by_email(const std::string& email) override;
    Result<std::vector<model::Owner>> find_group_by_name(const std::string& name) override;

    Result<std::int64_t> get_or_create_experiment(const model::FolderRecord& folder) override;
    Result<std::int64_t> get_or_create_dataset(const model::FolderRecord& folder,
                                               std::int64_t experiment_id) override;

    Result<std::optional<RemoteDatafile>> find_datafile(std::int64_t dataset_id,
                                                        const std::string& filename,
                                                        const std::string& directory) override;

    Result<StagedDatafile> create_staged_datafile(const DatafileDescriptor& descriptor) override;
    Result<std::int64_t> upload_datafile_with_post(const std::filesystem::path& local_path,
                                                   const DatafileDescriptor& descriptor) override;
    Result<void> request_verification(std::int64_t datafile_id) override;

private:
    using Params = std::vector<std::pair<std::string, std::string>>;

    network::Url endpoint(const std::string& resource, const Params& params = {}) const;
    Result<nlohmann::json> get_json(const network::Url& url, const std::string& what);
    Result<nlohmann::json> list(const std::string& resource, Params params, const std::string& what);
    Result<std::int64_t> create_record(const std::string& resource, const nlohmann::json& body,
                                       const std::string& what);

    network::Url base_;
    network::HttpClient client_;
    std::string folder_structure_;
    std::string instrument_name_;
    std::string facility_name_;
};

/// Numeric id at the end of a resource URI ("/api/v1/dataset_file/42/").
Result<std::int64_t> id_from_resource_uri(const std::string& uri);

} // namespace labsync::remote
