#include "labsync/config/settings.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace labsync::config {

using json = nlohmann::json;

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

template<typename T>
void read(const json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it != document.end() && !it->is_null()) {
        target = it->template get<T>();
    }
}

void read_path(const json& document, const char* key, std::filesystem::path& target) {
    std::string text;
    read(document, key, text);
    if (!text.empty()) {
        target = text;
    }
}

Result<UnmatchedIdentityPolicy> parse_identity_policy(const std::string& text) {
    if (text == "placeholder") {
        return Ok(UnmatchedIdentityPolicy::Placeholder);
    }
    if (text == "skip") {
        return Ok(UnmatchedIdentityPolicy::Skip);
    }
    if (text == "fail") {
        return Ok(UnmatchedIdentityPolicy::Fail);
    }
    return Err(ErrorKind::Configuration, "Unknown unmatched_identity_policy: " + text);
}

Result<void> read_staging(const json& node, StagingSettings& staging) {
    if (!node.is_object()) {
        return Err(ErrorKind::Configuration, "\"staging\" must be an object");
    }
    std::string transport = "ssh";
    read(node, "transport", transport);
    if (transport == "ssh") {
        staging.transport = StagingTransportKind::Ssh;
    } else if (transport == "local") {
        staging.transport = StagingTransportKind::Local;
    } else {
        return Err(ErrorKind::Configuration, "Unknown staging transport: " + transport);
    }
    read(node, "host", staging.host);
    if (node.contains("port") && node["port"].is_number_integer()) {
        staging.port = std::to_string(node["port"].get<int>());
    } else {
        read(node, "port", staging.port);
    }
    read(node, "username", staging.username);
    read(node, "private_key_path", staging.private_key_path);
    read(node, "location", staging.location);
    read(node, "copy_timeout", staging.copy_timeout);
    return Ok();
}

} // namespace

const char* upload_method_name(UploadMethod method) {
    return method == UploadMethod::Staging ? "staging" : "post";
}

Result<std::int64_t> interval_unit_seconds(const std::string& unit) {
    std::string singular = unit;
    if (!singular.empty() && singular.back() == 's') {
        singular.pop_back();
    }
    const std::int64_t year = static_cast<std::int64_t>(365.25 * kSecondsPerDay);
    if (singular == "day") {
        return Ok(kSecondsPerDay);
    }
    if (singular == "week") {
        return Ok(7 * kSecondsPerDay);
    }
    if (singular == "month") {
        return Ok(year / 12);
    }
    if (singular == "year") {
        return Ok(year);
    }
    return Err(ErrorKind::Configuration, "Unknown interval unit: " + unit);
}

Result<std::vector<std::string>> read_glob_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err(ErrorKind::Configuration, "Cannot open glob file " + path.string());
    }
    std::vector<std::string> patterns;
    std::string line;
    while (std::getline(in, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        std::string pattern = line.substr(first, last - first + 1);
        if (pattern.front() == '#' || pattern.front() == ';') {
            continue;
        }
        patterns.push_back(std::move(pattern));
    }
    return Ok(std::move(patterns));
}

Result<Settings> Settings::load_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err(ErrorKind::Configuration, "Cannot open settings file " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err(ErrorKind::Configuration, "Settings file is not a JSON object: " + path.string());
    }

    auto parsed = from_json(document);
    if (parsed.is_error()) {
        return parsed;
    }
    auto settings = std::move(parsed.value());

    auto globs = settings.load_glob_files();
    if (globs.is_error()) {
        return Err(globs.error());
    }
    spdlog::debug("Loaded settings from {}", path.string());
    return Ok(std::move(settings));
}

Result<Settings> Settings::from_json(const json& document) {
    Settings settings;
    try {
        read_path(document, "data_directory", settings.data_directory);
        read(document, "instrument_name", settings.instrument_name);
        read(document, "facility_name", settings.facility_name);
        read(document, "contact_name", settings.contact_name);
        read(document, "contact_email", settings.contact_email);
        read(document, "repository_url", settings.repository_url);
        read(document, "username", settings.username);
        read(document, "api_key", settings.api_key);

        std::string structure;
        read(document, "folder_structure", structure);
        if (!structure.empty()) {
            auto parsed = model::parse_folder_structure(structure);
            if (parsed.is_error()) {
                return Err(parsed.error());
            }
            settings.folder_structure = parsed.value();
        }

        read(document, "user_filter", settings.user_filter);
        read(document, "dataset_filter", settings.dataset_filter);
        read(document, "experiment_filter", settings.experiment_filter);
        read(document, "group_prefix", settings.group_prefix);
        read(document, "ignore_old_datasets", settings.ignore_old_datasets);
        read(document, "ignore_interval_number", settings.ignore_interval_number);
        read(document, "ignore_interval_unit", settings.ignore_interval_unit);
        read(document, "ignore_new_files", settings.ignore_new_files);
        read(document, "ignore_new_files_minutes", settings.ignore_new_files_minutes);
        read(document, "use_includes_file", settings.use_includes_file);
        read_path(document, "includes_file", settings.includes_file);
        read(document, "use_excludes_file", settings.use_excludes_file);
        read_path(document, "excludes_file", settings.excludes_file);
        read(document, "validate_folder_structure", settings.validate_folder_structure);
        read(document, "background_mode", settings.background_mode);

        // upload_invalid_user_folders predates the three-way policy
        bool upload_invalid = true;
        read(document, "upload_invalid_user_folders", upload_invalid);
        settings.unmatched_identity_policy =
            upload_invalid ? UnmatchedIdentityPolicy::Placeholder : UnmatchedIdentityPolicy::Skip;
        std::string policy;
        read(document, "unmatched_identity_policy", policy);
        if (!policy.empty()) {
            auto parsed = parse_identity_policy(policy);
            if (parsed.is_error()) {
                return Err(parsed.error());
            }
            settings.unmatched_identity_policy = parsed.value();
        }

        read(document, "max_upload_threads", settings.max_upload_threads);
        read(document, "max_verification_threads", settings.max_verification_threads);
        read(document, "max_upload_retries", settings.max_upload_retries);
        read(document, "verification_delay", settings.verification_delay);
        read(document, "request_timeout", settings.request_timeout);

        std::string method;
        read(document, "upload_method", method);
        if (method == "post") {
            settings.upload_method = UploadMethod::Post;
        } else if (!method.empty() && method != "staging") {
            return Err(ErrorKind::Configuration, "Unknown upload_method: " + method);
        }

        read(document, "large_file_size", settings.large_file_size);
        read(document, "default_chunk_size", settings.default_chunk_size);
        read(document, "max_chunk_size", settings.max_chunk_size);

        auto staging = document.find("staging");
        if (staging != document.end()) {
            auto res = read_staging(*staging, settings.staging);
            if (res.is_error()) {
                return Err(res.error());
            }
        }
    } catch (const json::exception& e) {
        return Err(ErrorKind::Configuration, std::string("Invalid settings value: ") + e.what());
    }
    return Ok(std::move(settings));
}

Result<void> Settings::load_glob_files() {
    if (use_includes_file) {
        auto patterns = read_glob_file(includes_file);
        if (patterns.is_error()) {
            return Err(patterns.error());
        }
        include_patterns = std::move(patterns.value());
    }
    if (use_excludes_file) {
        auto patterns = read_glob_file(excludes_file);
        if (patterns.is_error()) {
            return Err(patterns.error());
        }
        exclude_patterns = std::move(patterns.value());
    }
    return Ok();
}

Result<std::int64_t> Settings::ignore_interval_seconds() const {
    auto unit = interval_unit_seconds(ignore_interval_unit);
    if (unit.is_error()) {
        return unit;
    }
    return Ok(static_cast<std::int64_t>(ignore_interval_number) * unit.value());
}

Result<void> Settings::validate() const {
    if (data_directory.empty()) {
        return Err(ErrorKind::Configuration, "data_directory is required");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(data_directory, ec)) {
        return Err(ErrorKind::Configuration,
                   "Data directory " + data_directory.string() + " does not exist");
    }
    if (repository_url.empty()) {
        return Err(ErrorKind::Configuration, "repository_url is required");
    }
    if (username.empty() || api_key.empty()) {
        return Err(ErrorKind::Configuration, "username and api_key are required");
    }
    if (folder_structure == model::FolderStructure::GroupInstrumentFullNameDataset &&
        instrument_name.empty()) {
        return Err(ErrorKind::Configuration,
                   "instrument_name is required for the user group folder structure");
    }
    if (max_upload_threads < 1 || max_verification_threads < 1) {
        return Err(ErrorKind::Configuration, "Thread counts must be at least 1");
    }
    if (max_upload_retries < 0 || verification_delay < 0 || request_timeout < 1) {
        return Err(ErrorKind::Configuration,
                   "max_upload_retries and verification_delay must not be negative, "
                   "request_timeout must be positive");
    }
    if (default_chunk_size == 0 || max_chunk_size < default_chunk_size) {
        return Err(ErrorKind::Configuration,
                   "default_chunk_size must be positive and not exceed max_chunk_size");
    }
    if (ignore_old_datasets) {
        auto interval = ignore_interval_seconds();
        if (interval.is_error()) {
            return Err(interval.error());
        }
    }
    if (upload_method == UploadMethod::Staging) {
        if (staging.location.empty()) {
            return Err(ErrorKind::Configuration, "staging.location is required for staging uploads");
        }
        if (staging.transport == StagingTransportKind::Ssh &&
            (staging.host.empty() || staging.username.empty())) {
            return Err(ErrorKind::Configuration, "staging.host and staging.username are required for ssh");
        }
    }
    return Ok();
}

} // namespace labsync::config
