#pragma once

#include "labsync/core/result.hpp"
#include "labsync/model/folder_structure.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace labsync::config {

enum class UploadMethod { Staging, Post };

/// What a scan does with an identity folder that has no unique remote match.
enum class UnmatchedIdentityPolicy { Placeholder, Skip, Fail };

enum class StagingTransportKind { Ssh, Local };

struct StagingSettings {
    StagingTransportKind transport = StagingTransportKind::Ssh;
    std::string host;
    std::string port = "22";
    std::string username;
    std::string private_key_path;
    std::string location;   ///< Root of the staging area on the staging host
    int copy_timeout = 600; ///< seconds allowed for one chunk copy
};

constexpr std::uint64_t kMebibyte = 1024ull * 1024ull;

/**
 * @brief Engine configuration
 *
 * Loaded from a JSON document whose keys match the member names. Missing
 * keys keep the defaults below.
 */
struct Settings {
    // Instrument and repository
    std::filesystem::path data_directory;
    std::string instrument_name;
    std::string facility_name;
    std::string contact_name;
    std::string contact_email;
    std::string repository_url;
    std::string username;
    std::string api_key;

    // Folder discovery
    model::FolderStructure folder_structure = model::FolderStructure::UsernameDataset;
    std::string user_filter;
    std::string dataset_filter;
    std::string experiment_filter;
    std::string group_prefix;
    bool ignore_old_datasets = false;
    int ignore_interval_number = 0;
    std::string ignore_interval_unit = "months";
    bool ignore_new_files = true;
    int ignore_new_files_minutes = 1;
    bool use_includes_file = false;
    std::filesystem::path includes_file;
    bool use_excludes_file = false;
    std::filesystem::path excludes_file;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    bool validate_folder_structure = true;
    UnmatchedIdentityPolicy unmatched_identity_policy = UnmatchedIdentityPolicy::Placeholder;
    bool background_mode = false;

    // Upload scheduling
    int max_upload_threads = 5;
    int max_verification_threads = 5;
    int max_upload_retries = 1;
    int verification_delay = 3;             ///< seconds
    int request_timeout = 30;               ///< seconds, per remote call

    // Transfer
    UploadMethod upload_method = UploadMethod::Staging;
    std::uint64_t large_file_size = 10 * kMebibyte;
    std::uint64_t default_chunk_size = kMebibyte;
    std::uint64_t max_chunk_size = 256 * kMebibyte;
    StagingSettings staging;

    static Result<Settings> load_file(const std::filesystem::path& path);
    static Result<Settings> from_json(const nlohmann::json& document);

    Result<void> validate() const;

    /// Read includes_file / excludes_file into the pattern lists when enabled.
    Result<void> load_glob_files();

    /// Age beyond which datasets are skipped, in seconds.
    Result<std::int64_t> ignore_interval_seconds() const;

    std::chrono::seconds request_timeout_duration() const {
        return std::chrono::seconds(request_timeout);
    }

    /// Value of the Authorization header sent with every API request.
    std::string authorization_header() const {
        return "ApiKey " + username + ":" + api_key;
    }
};

/// Seconds in one unit of "day", "week", "month" or "year" (plural allowed).
Result<std::int64_t> interval_unit_seconds(const std::string& unit);

/// One glob per line; blank lines and lines starting with '#' or ';' are skipped.
Result<std::vector<std::string>> read_glob_file(const std::filesystem::path& path);

const char* upload_method_name(UploadMethod method);

} // namespace labsync::config
