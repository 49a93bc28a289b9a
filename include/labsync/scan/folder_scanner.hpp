#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/core/cancellation.hpp"
#include "labsync/core/result.hpp"
#include "labsync/model/folder_record.hpp"
#include "labsync/model/folder_structure.hpp"
#include "labsync/model/id_allocator.hpp"
#include "labsync/remote/identity_resolver.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace labsync::scan {

/**
 * @brief Everything one scan pass needs, resolved from Settings up front
 */
struct ScanOptions {
    std::filesystem::path data_directory;
    model::FolderStructure structure = model::FolderStructure::UsernameDataset;
    std::string user_filter;
    std::string experiment_filter;
    std::string dataset_filter;
    std::string instrument_name;
    std::string default_owner;          ///< Username owning group datasets with no matching user
    bool ignore_old_datasets = false;
    std::int64_t max_age_seconds = 0;
    std::int64_t interval_number = 0;   ///< For the "older than N unit" message
    std::string interval_unit;
    config::UnmatchedIdentityPolicy identity_policy = config::UnmatchedIdentityPolicy::Placeholder;
    bool background_mode = false;
    bool validate_structure = true;

    static Result<ScanOptions> from_settings(const config::Settings& settings);
};

/// Called after each top-level identity folder: (name, done, total, datasets so far).
using ScanProgressCallback =
    std::function<void(const std::string&, std::size_t, std::size_t, std::size_t)>;

/**
 * @brief Walks the data directory into FolderRecords
 *
 * The walk follows the configured layout exactly: at each depth it lists the
 * subdirectories and descends, never deeper than the dataset level. Each
 * dataset folder then goes through the age filter, ownership resolution,
 * experiment-title derivation and id assignment, in that order.
 *
 * A structural error, a Fail-policy identity miss, a repository failure or
 * cancellation ends the pass with an error and no records.
 */
class FolderScanner {
public:
    FolderScanner(remote::IdentityResolver& resolver, model::IdAllocator& ids);

    Result<std::vector<model::FolderRecord>> scan(const ScanOptions& options,
                                                  const CancellationToken& token,
                                                  const ScanProgressCallback& progress = {});

    /// Number of dataset folders under the layout, without identity lookups or age filtering.
    static Result<std::size_t> count_datasets(const ScanOptions& options);

private:
    remote::IdentityResolver& resolver_;
    model::IdAllocator& ids_;
};

/// Substring match of `filter` against `name` as the glob "*filter*". Empty matches all.
bool matches_filter(const std::string& name, const std::string& filter);

/// Directory change time (st_ctime).
Result<std::time_t> change_time(const std::filesystem::path& path);

} // namespace labsync::scan
