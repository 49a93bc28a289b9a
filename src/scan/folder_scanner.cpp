#include "labsync/scan/folder_scanner.hpp"

#include <spdlog/spdlog.h>

#include <fnmatch.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <optional>
#include <set>

namespace labsync::scan {

namespace fs = std::filesystem;
using model::Segment;

namespace {

struct PathContext {
    std::string identity;
    std::optional<std::string> experiment;
    std::string instrument;
    std::string full_name;
};

Error structure_error(const std::string& message) {
    return Error(ErrorKind::InvalidFolderStructure, message);
}

Result<std::vector<fs::path>> list_directories(const fs::path& dir) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Err(ErrorKind::LocalIo, "Cannot list " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return Ok(std::move(dirs));
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/**
 * @brief State of one walk over the data directory
 *
 * With a resolver, admitted datasets become FolderRecords. Without one the
 * walk only counts dataset folders.
 */
class Walk {
public:
    Walk(const ScanOptions& options,
         const CancellationToken& token,
         remote::IdentityResolver* resolver,
         model::IdAllocator* ids)
        : options_(options),
          layout_(model::layout_of(options.structure)),
          token_(token),
          resolver_(resolver),
          ids_(ids) {}

    Result<void> identity(const fs::path& dir) {
        PathContext ctx;
        ctx.identity = dir.filename().string();
        return descend(dir, 1, ctx);
    }

    std::vector<model::FolderRecord>& records() { return records_; }
    std::size_t datasets() const { return datasets_; }

private:
    Result<void> descend(const fs::path& dir, std::size_t depth, PathContext ctx) {
        const Segment segment = layout_.segments[depth];

        if (segment == Segment::Marker) {
            return enter_marker(dir, depth, ctx);
        }

        auto children = list_directories(dir);
        if (children.is_error()) {
            return Err(children.error());
        }

        if (segment == Segment::Instrument) {
            return enter_instrument(dir, children.value(), depth, ctx);
        }

        for (const auto& child : children.value()) {
            if (token_.is_canceled()) {
                return Err(ErrorKind::Canceled, "Scan canceled");
            }
            const std::string name = child.filename().string();
            switch (segment) {
                case Segment::Experiment:
                    if (!matches_filter(name, options_.experiment_filter)) {
                        continue;
                    }
                    ctx.experiment = name;
                    break;
                case Segment::FullName:
                    ctx.full_name = name;
                    break;
                case Segment::Dataset: {
                    if (!matches_filter(name, options_.dataset_filter)) {
                        continue;
                    }
                    auto admitted = admit(child, ctx);
                    if (admitted.is_error()) {
                        return admitted;
                    }
                    continue;
                }
                default:
                    break;
            }
            auto res = descend(child, depth + 1, ctx);
            if (res.is_error()) {
                return res;
            }
        }
        return Ok();
    }

    Result<void> enter_marker(const fs::path& dir, std::size_t depth, const PathContext& ctx) {
        auto children = list_directories(dir);
        if (children.is_error()) {
            return Err(children.error());
        }
        const std::string marker = lower(model::kMarkerFolderName);
        for (const auto& child : children.value()) {
            if (lower(child.filename().string()) == marker) {
                return descend(child, depth + 1, ctx);
            }
        }
        return Err(structure_error(std::string(model::kMarkerFolderName) +
                                   " folder not found in " + dir.string()));
    }

    Result<void> enter_instrument(const fs::path& dir, const std::vector<fs::path>& children,
                                  std::size_t depth, PathContext ctx) {
        if (children.empty()) {
            return instrument_problem("No instrument folder found in " + dir.string());
        }
        for (const auto& child : children) {
            const std::string name = child.filename().string();
            if (name != options_.instrument_name) {
                auto res = instrument_problem("Instrument folder \"" + name + "\" in " + dir.string() +
                                              " does not match instrument name \"" +
                                              options_.instrument_name + "\"");
                if (res.is_error()) {
                    return res;
                }
                continue;
            }
            ctx.instrument = name;
            auto res = descend(child, depth + 1, ctx);
            if (res.is_error()) {
                return res;
            }
        }
        return Ok();
    }

    // Unattended runs log the problem and skip the subtree
    Result<void> instrument_problem(const std::string& message) {
        if (options_.background_mode) {
            spdlog::warn("{}; skipping", message);
            return Ok();
        }
        return Err(structure_error(message));
    }

    Result<void> admit(const fs::path& dataset_dir, const PathContext& ctx) {
        auto created = change_time(dataset_dir);
        if (created.is_error()) {
            return Err(created.error());
        }

        if (options_.ignore_old_datasets) {
            const std::time_t now = std::time(nullptr);
            const auto age = static_cast<std::int64_t>(std::difftime(now, created.value()));
            if (age > options_.max_age_seconds) {
                spdlog::info("Ignoring \"{}\", because it is older than {} {}",
                             dataset_dir.string(), options_.interval_number, options_.interval_unit);
                return Ok();
            }
        }

        // Counting only: no identity lookups, no ids
        if (resolver_ == nullptr) {
            datasets_++;
            return Ok();
        }

        model::FolderRecord record;
        record.path = dataset_dir;
        record.name = dataset_dir.filename().string();
        record.identity_folder = ctx.identity;
        record.experiment_folder = ctx.experiment;
        record.created_time = created.value();

        auto owned = assign_ownership(record, ctx);
        if (owned.is_error()) {
            return Err(owned.error());
        }
        if (!owned.value()) {
            return Ok();
        }

        if (ctx.experiment) {
            record.experiment_title = *ctx.experiment;
        } else if (layout_.structure == model::FolderStructure::GroupInstrumentFullNameDataset) {
            record.experiment_title = ctx.instrument + " - " + ctx.full_name;
        } else {
            const std::string& who = record.owner.not_found ? ctx.identity : record.owner.label();
            record.experiment_title = options_.instrument_name + " - " + who;
        }

        record.id = ids_->next();
        datasets_++;
        spdlog::debug("Dataset folder {} (id {}) owned by {}", record.path.string(), record.id,
                      record.owner.label());
        records_.push_back(std::move(record));
        return Ok();
    }

    /**
     * @brief Resolve the identity folder and fill owner and group
     *
     * Returns false when the identity is unmatched and the policy says skip.
     */
    Result<bool> assign_ownership(model::FolderRecord& record, const PathContext& ctx) {
        auto identity = resolve_identity(ctx.identity);
        if (identity.is_error()) {
            return Err(identity.error());
        }
        if (!identity.value()) {
            return Ok(false);
        }

        if (layout_.identity != model::IdentityKind::GroupName) {
            record.owner = std::move(*identity.value());
            return Ok(true);
        }

        record.group = std::move(*identity.value());
        auto owner = resolve_group_member(ctx.full_name);
        if (owner.is_error()) {
            return Err(owner.error());
        }
        record.owner = std::move(owner.value());
        return Ok(true);
    }

    Result<std::optional<model::Owner>> resolve_identity(const std::string& name) {
        if (skipped_.count(name) > 0) {
            return Ok(std::optional<model::Owner>());
        }
        if (token_.is_canceled()) {
            return Err(ErrorKind::Canceled, "Scan canceled");
        }

        auto lookup = resolver_->resolve(layout_.identity, name);
        if (lookup.is_error()) {
            return Err(lookup.error());
        }
        if (lookup.value().found()) {
            return Ok(std::optional<model::Owner>(lookup.value().owner));
        }

        const bool ambiguous = lookup.value().outcome == remote::LookupOutcome::Ambiguous;
        const std::string kind = model::identity_kind_name(layout_.identity);
        const std::string reason = ambiguous
            ? std::to_string(lookup.value().match_count) + " repository records match " + kind + " \"" + name + "\""
            : "no repository record matches " + kind + " \"" + name + "\"";

        switch (options_.identity_policy) {
            case config::UnmatchedIdentityPolicy::Placeholder:
                spdlog::warn("{}; using a placeholder owner for {}", reason, name);
                return Ok(std::optional<model::Owner>(model::Owner::placeholder(layout_.identity, name)));
            case config::UnmatchedIdentityPolicy::Skip:
                spdlog::warn("{}; skipping folder \"{}\"", reason, name);
                skipped_.insert(name);
                return Ok(std::optional<model::Owner>());
            case config::UnmatchedIdentityPolicy::Fail:
                break;
        }
        return Err(ambiguous ? ErrorKind::IdentityAmbiguous : ErrorKind::IdentityNotFound, reason);
    }

    // A full-name folder is matched by username, then falls back to the default owner
    Result<model::Owner> resolve_group_member(const std::string& full_name) {
        for (const std::string& candidate : {full_name, options_.default_owner}) {
            if (candidate.empty()) {
                continue;
            }
            if (token_.is_canceled()) {
                return Err(ErrorKind::Canceled, "Scan canceled");
            }
            auto lookup = resolver_->resolve(model::IdentityKind::Username, candidate);
            if (lookup.is_error()) {
                return Err(lookup.error());
            }
            if (lookup.value().found()) {
                return Ok(lookup.value().owner);
            }
        }
        spdlog::warn("No repository user for \"{}\" or default owner \"{}\"; using a placeholder",
                     full_name, options_.default_owner);
        return Ok(model::Owner::placeholder(model::IdentityKind::Username, full_name));
    }

    const ScanOptions& options_;
    const model::FolderLayout& layout_;
    const CancellationToken& token_;
    remote::IdentityResolver* resolver_;
    model::IdAllocator* ids_;
    std::vector<model::FolderRecord> records_;
    std::set<std::string> skipped_;
    std::size_t datasets_ = 0;
};

Result<std::vector<fs::path>> identity_folders(const ScanOptions& options) {
    std::error_code ec;
    if (!fs::is_directory(options.data_directory, ec)) {
        return Err(ErrorKind::InvalidFolderStructure,
                   "Data directory " + options.data_directory.string() + " does not exist");
    }
    auto dirs = list_directories(options.data_directory);
    if (dirs.is_error()) {
        return dirs;
    }
    auto& list = dirs.value();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&options](const fs::path& p) {
                                  return !matches_filter(p.filename().string(), options.user_filter);
                              }),
               list.end());

    if (list.empty()) {
        const std::string message = "No " + std::string(model::identity_kind_name(
            model::layout_of(options.structure).identity)) + " folders found in " +
            options.data_directory.string();
        if (options.validate_structure) {
            return Err(structure_error(message));
        }
        spdlog::warn("{}", message);
    }
    return dirs;
}

} // namespace

bool matches_filter(const std::string& name, const std::string& filter) {
    if (filter.empty()) {
        return true;
    }
    const std::string pattern = "*" + filter + "*";
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

Result<std::time_t> change_time(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return Err(ErrorKind::LocalIo, "Cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return Ok(static_cast<std::time_t>(st.st_ctime));
}

Result<ScanOptions> ScanOptions::from_settings(const config::Settings& settings) {
    ScanOptions options;
    options.data_directory = settings.data_directory;
    options.structure = settings.folder_structure;
    options.user_filter = settings.user_filter;
    options.experiment_filter = settings.experiment_filter;
    options.dataset_filter = settings.dataset_filter;
    options.instrument_name = settings.instrument_name;
    options.default_owner = settings.username;
    options.ignore_old_datasets = settings.ignore_old_datasets;
    options.interval_number = settings.ignore_interval_number;
    options.interval_unit = settings.ignore_interval_unit;
    if (settings.ignore_old_datasets) {
        auto seconds = settings.ignore_interval_seconds();
        if (seconds.is_error()) {
            return Err(seconds.error());
        }
        options.max_age_seconds = seconds.value();
    }
    options.identity_policy = settings.unmatched_identity_policy;
    options.background_mode = settings.background_mode;
    options.validate_structure = settings.validate_folder_structure;
    return Ok(std::move(options));
}

FolderScanner::FolderScanner(remote::IdentityResolver& resolver, model::IdAllocator& ids)
    : resolver_(resolver), ids_(ids) {}

Result<std::vector<model::FolderRecord>> FolderScanner::scan(const ScanOptions& options,
                                                             const CancellationToken& token,
                                                             const ScanProgressCallback& progress) {
    resolver_.clear_cache();

    auto identities = identity_folders(options);
    if (identities.is_error()) {
        return Err(identities.error());
    }

    Walk walk(options, token, &resolver_, &ids_);
    const auto total = identities.value().size();
    std::size_t done = 0;
    for (const auto& dir : identities.value()) {
        if (token.is_canceled()) {
            return Err(ErrorKind::Canceled, "Scan canceled");
        }
        auto res = walk.identity(dir);
        if (res.is_error()) {
            return Err(res.error());
        }
        done++;
        if (progress) {
            progress(dir.filename().string(), done, total, walk.records().size());
        }
    }

    spdlog::info("Found {} dataset folder(s) in {}", walk.records().size(),
                 options.data_directory.string());
    return Ok(std::move(walk.records()));
}

Result<std::size_t> FolderScanner::count_datasets(const ScanOptions& options) {
    auto identities = identity_folders(options);
    if (identities.is_error()) {
        return Err(identities.error());
    }
    CancellationToken never;
    Walk walk(options, never, nullptr, nullptr);
    for (const auto& dir : identities.value()) {
        auto res = walk.identity(dir);
        if (res.is_error()) {
            return Err(res.error());
        }
    }
    return Ok(walk.datasets());
}

} // namespace labsync::scan
