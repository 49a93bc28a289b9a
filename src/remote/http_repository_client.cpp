#include "labsync/remote/http_repository_client.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace labsync::remote {

using json = nlohmann::json;
using network::HttpResponse;

namespace {

Error http_error(const HttpResponse& response, const std::string& what) {
    std::string body = response.body_as_string();
    if (body.size() > 200) {
        body.resize(200);
    }
    return Error(ErrorKind::Http,
                 what + " failed: HTTP " + std::to_string(response.status_code) +
                 (body.empty() ? "" : " " + body),
                 response.status_code);
}

std::string display_name_of(const json& user) {
    std::string first = user.value("first_name", "");
    std::string last = user.value("last_name", "");
    std::string name = first;
    if (!last.empty()) {
        name += name.empty() ? last : " " + last;
    }
    return name;
}

model::Owner user_from_json(const json& object) {
    model::Owner owner;
    owner.kind = model::OwnerKind::Individual;
    owner.id = object.value("id", std::int64_t{0});
    owner.username = object.value("username", "");
    owner.email = object.value("email", "");
    owner.display_name = display_name_of(object);
    if (owner.display_name.empty()) {
        owner.display_name = owner.username;
    }
    if (object.contains("groups") && object["groups"].is_array()) {
        for (const auto& group : object["groups"]) {
            owner.groups.push_back({group.value("id", std::int64_t{0}), group.value("name", "")});
        }
    }
    return owner;
}

model::Owner group_from_json(const json& object) {
    model::Owner owner;
    owner.kind = model::OwnerKind::Group;
    owner.id = object.value("id", std::int64_t{0});
    owner.display_name = object.value("name", "");
    return owner;
}

bool any_replica_verified(const json& object) {
    auto replicas = object.find("replicas");
    if (replicas == object.end() || !replicas->is_array()) {
        return false;
    }
    for (const auto& replica : *replicas) {
        if (replica.value("verified", false)) {
            return true;
        }
    }
    return false;
}

/// Location of the first replica, used to resume an unverified staging upload.
std::string first_replica_uri(const json& object) {
    auto replicas = object.find("replicas");
    if (replicas == object.end() || !replicas->is_array() || replicas->empty()) {
        return {};
    }
    const auto& uri = (*replicas)[0].value("uri", json());
    return uri.is_string() ? uri.get<std::string>() : std::string();
}

std::uint64_t size_from_json(const json& value) {
    // Older servers serialize size as a string
    if (value.is_string()) {
        return std::stoull(value.get<std::string>());
    }
    return value.get<std::uint64_t>();
}

Result<std::vector<model::Owner>> owners_from(const Result<json>& objects,
                                              model::Owner (*convert)(const json&)) {
    if (objects.is_error()) {
        return Err(objects.error());
    }
    std::vector<model::Owner> owners;
    for (const auto& object : objects.value()) {
        owners.push_back(convert(object));
    }
    return Ok(std::move(owners));
}

/// Created-record id from a Location header, falling back to the body's "id".
Result<std::int64_t> created_id(const HttpResponse& response, const std::string& what) {
    const std::string location = response.get_header("Location");
    if (!location.empty()) {
        return id_from_resource_uri(location);
    }
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("id") &&
        body["id"].is_number_integer()) {
        return Ok(body["id"].get<std::int64_t>());
    }
    return Err(ErrorKind::Protocol, what + ": response has neither a Location header nor an id");
}

} // namespace

nlohmann::json DatafileDescriptor::to_json() const {
    return json{
        {"dataset", "/api/v1/dataset/" + std::to_string(dataset_id) + "/"},
        {"filename", filename},
        {"directory", directory},
        {"md5sum", md5sum},
        {"size", size},
        {"mimetype", mimetype},
        {"created_time", created_time},
    };
}

Result<std::int64_t> id_from_resource_uri(const std::string& uri) {
    std::string trimmed = uri;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    const auto slash = trimmed.rfind('/');
    const std::string tail = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    if (tail.empty() || tail.find_first_not_of("0123456789") != std::string::npos) {
        return Err(ErrorKind::Protocol, "No record id in \"" + uri + "\"");
    }
    return Ok(static_cast<std::int64_t>(std::stoll(tail)));
}

Result<std::unique_ptr<HttpRepositoryClient>> HttpRepositoryClient::create(const config::Settings& settings) {
    auto base = network::Url::parse(settings.repository_url);
    if (base.is_error()) {
        return Err(base.error());
    }

    network::HttpClient::Options options;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings.request_timeout_duration());
    options.default_headers["Authorization"] = settings.authorization_header();
    options.default_headers["Content-Type"] = "application/json";
    options.default_headers["Accept"] = "application/json";

    return Ok(std::make_unique<HttpRepositoryClient>(
        std::move(base.value()), network::HttpClient(std::move(options)), settings));
}

HttpRepositoryClient::HttpRepositoryClient(network::Url base, network::HttpClient client,
                                           const config::Settings& settings)
    : base_(std::move(base)),
      client_(std::move(client)),
      folder_structure_(model::folder_structure_name(settings.folder_structure)),
      instrument_name_(settings.instrument_name),
      facility_name_(settings.facility_name) {}

network::Url HttpRepositoryClient::endpoint(const std::string& resource, const Params& params) const {
    std::string prefix = base_.target.substr(0, base_.target.find('?'));
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    std::string target = prefix + "/api/v1/" + resource + "/";
    if (!params.empty()) {
        target += "?" + network::build_query(params);
    }
    return base_.with_target(std::move(target));
}

Result<json> HttpRepositoryClient::get_json(const network::Url& url, const std::string& what) {
    auto response = client_.get(url);
    if (response.is_error()) {
        return Err(response.error());
    }
    if (!response.value().is_success()) {
        return Err(http_error(response.value(), what));
    }
    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err(ErrorKind::Protocol, what + ": response is not JSON");
    }
    return Ok(std::move(body));
}

Result<json> HttpRepositoryClient::list(const std::string& resource, Params params, const std::string& what) {
    params.insert(params.begin(), std::make_pair(std::string("format"), std::string("json")));
    auto body = get_json(endpoint(resource, params), what);
    if (body.is_error()) {
        return body;
    }
    const auto& document = body.value();
    if (!document.is_object() || !document.contains("objects") || !document["objects"].is_array()) {
        return Err(ErrorKind::Protocol, what + ": response has no objects list");
    }
    const auto count = document.contains("meta")
        ? document["meta"].value("total_count", document["objects"].size())
        : document["objects"].size();
    if (count != document["objects"].size()) {
        spdlog::debug("{}: total_count {} but {} objects returned", what, count, document["objects"].size());
    }
    return Ok(document["objects"]);
}

Result<std::int64_t> HttpRepositoryClient::create_record(const std::string& resource, const json& body,
                                                  const std::string& what) {
    auto response = client_.post_json(endpoint(resource), body.dump());
    if (response.is_error()) {
        return Err(response.error());
    }
    if (!response.value().is_success()) {
        return Err(http_error(response.value(), what));
    }
    return created_id(response.value(), what);
}

Result<std::vector<model::Owner>> HttpRepositoryClient::find_user_by_username(const std::string& username) {
    return owners_from(list("user", {{"username", username}}, "User lookup for \"" + username + "\""),
                       &user_from_json);
}

Result<std::vector<model::Owner>> HttpRepositoryClient::find_user_by_email(const std::string& email) {
    return owners_from(list("user", {{"email__iexact", email}}, "User lookup for \"" + email + "\""),
                       &user_from_json);
}

Result<std::vector<model::Owner>> HttpRepositoryClient::find_group_by_name(const std::string& name) {
    return owners_from(list("group", {{"name", name}}, "Group lookup for \"" + name + "\""),
                       &group_from_json);
}

Result<std::int64_t> HttpRepositoryClient::get_or_create_experiment(const model::FolderRecord& folder) {
    const std::string what = "Experiment \"" + folder.experiment_title + "\"";
    auto existing = list("mydata_experiment",
                         {{"title", folder.experiment_title},
                          {"folder_structure", folder_structure_},
                          {"user_folder_name", folder.identity_folder}},
                         what + " lookup");
    if (existing.is_error()) {
        return Err(existing.error());
    }
    if (!existing.value().empty()) {
        if (existing.value().size() > 1) {
            spdlog::warn("{} matches {} records, using the first", what, existing.value().size());
        }
        return Ok(existing.value().front().value("id", std::int64_t{0}));
    }

    json body{
        {"title", folder.experiment_title},
        {"description", "Instrument: " + instrument_name_ + "\nUser folder name: " +
                        folder.identity_folder + "\nUploaded from: " + facility_name_},
        {"immutable", false},
        {"folder_structure", folder_structure_},
        {"user_folder_name", folder.identity_folder},
    };
    if (!folder.owner.not_found && !folder.owner.username.empty()) {
        body["owner"] = folder.owner.username;
    }
    if (folder.group && !folder.group->not_found) {
        body["group"] = folder.group->display_name;
    }
    spdlog::info("Creating experiment \"{}\"", folder.experiment_title);
    return create_record("mydata_experiment", body, what + " creation");
}

Result<std::int64_t> HttpRepositoryClient::get_or_create_dataset(const model::FolderRecord& folder,
                                                                 std::int64_t experiment_id) {
    const std::string what = "Dataset \"" + folder.name + "\"";
    auto existing = list("dataset",
                         {{"experiments__id", std::to_string(experiment_id)},
                          {"description", folder.name}},
                         what + " lookup");
    if (existing.is_error()) {
        return Err(existing.error());
    }
    if (!existing.value().empty()) {
        return Ok(existing.value().front().value("id", std::int64_t{0}));
    }

    json body{
        {"description", folder.name},
        {"experiments", json::array({"/api/v1/experiment/" + std::to_string(experiment_id) + "/"})},
        {"immutable", false},
    };
    spdlog::info("Creating dataset \"{}\" in experiment {}", folder.name, experiment_id);
    return create_record("dataset", body, what + " creation");
}

Result<std::optional<RemoteDatafile>> HttpRepositoryClient::find_datafile(std::int64_t dataset_id,
                                                                          const std::string& filename,
                                                                          const std::string& directory) {
    const std::string what = "Datafile lookup for \"" + filename + "\"";
    auto objects = list("mydata_dataset_file",
                        {{"dataset__id", std::to_string(dataset_id)},
                         {"filename", filename},
                         {"directory", directory}},
                        what);
    if (objects.is_error()) {
        return Err(objects.error());
    }
    const auto& found = objects.value();
    if (found.empty()) {
        return Ok(std::optional<RemoteDatafile>());
    }
    if (found.size() > 1) {
        return Err(ErrorKind::Protocol,
                   "Multiple datafiles matching " + filename + " were found in the repository");
    }

    const auto& object = found.front();
    RemoteDatafile datafile;
    try {
        datafile.id = object.value("id", std::int64_t{0});
        datafile.filename = object.value("filename", filename);
        datafile.directory = object.value("directory", directory);
        datafile.size = object.contains("size") ? size_from_json(object["size"]) : 0;
        datafile.md5sum = object.value("md5sum", "");
        datafile.verified = any_replica_verified(object);
        datafile.replica_uri = first_replica_uri(object);
    } catch (const std::exception& e) {
        return Err(ErrorKind::Protocol, what + ": malformed record: " + e.what());
    }
    return Ok(std::optional<RemoteDatafile>(std::move(datafile)));
}

Result<StagedDatafile> HttpRepositoryClient::create_staged_datafile(const DatafileDescriptor& descriptor) {
    const std::string what = "Staging record for \"" + descriptor.filename + "\"";
    auto response = client_.post_json(endpoint("mydata_dataset_file"), descriptor.to_json().dump());
    if (response.is_error()) {
        return Err(response.error());
    }
    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err(http_error(reply, what));
    }

    auto id = created_id(reply, what);
    if (id.is_error()) {
        return Err(id.error());
    }

    // The body is the staging path, either bare or as a JSON string
    StagedDatafile staged;
    staged.id = id.value();
    auto body = json::parse(reply.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_string()) {
        staged.staging_path = body.get<std::string>();
    } else if (!body.is_discarded() && body.is_object()) {
        staged.staging_path = body.value("staging_path", "");
    } else {
        staged.staging_path = reply.body_as_string();
    }
    while (!staged.staging_path.empty() &&
           (staged.staging_path.back() == '\n' || staged.staging_path.back() == ' ')) {
        staged.staging_path.pop_back();
    }
    if (staged.staging_path.empty()) {
        return Err(ErrorKind::Protocol, what + ": no staging path in response");
    }
    return Ok(std::move(staged));
}

Result<std::int64_t> HttpRepositoryClient::upload_datafile_with_post(const std::filesystem::path& local_path,
                                                                     const DatafileDescriptor& descriptor) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Err(ErrorKind::LocalIo, "Cannot open " + local_path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err(ErrorKind::LocalIo, "Cannot read " + local_path.string());
    }

    network::MultipartForm form;
    form.add_field("json_data", descriptor.to_json().dump());
    form.add_file("attached_file", descriptor.filename, bytes);

    const std::string what = "Upload of \"" + descriptor.filename + "\"";
    auto response = client_.post(endpoint("dataset_file"), form.content_type(), form.finish());
    if (response.is_error()) {
        return Err(response.error());
    }
    if (!response.value().is_success()) {
        return Err(http_error(response.value(), what));
    }
    return created_id(response.value(), what);
}

Result<void> HttpRepositoryClient::request_verification(std::int64_t datafile_id) {
    auto response = client_.get(endpoint("dataset_file/" + std::to_string(datafile_id) + "/verify"));
    if (response.is_error()) {
        return Err(response.error());
    }
    if (!response.value().is_success()) {
        return Err(http_error(response.value(), "Verification request for datafile " +
                                                std::to_string(datafile_id)));
    }
    return Ok();
}

} // namespace labsync::remote
