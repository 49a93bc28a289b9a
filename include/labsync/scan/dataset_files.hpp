#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/core/result.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace labsync::scan {

struct DatasetFile {
    std::filesystem::path local_path;
    std::string subdirectory;   ///< Relative to the dataset folder, '/'-separated, "" at the top
    std::string filename;
    std::uint64_t size = 0;
    std::time_t modified_time = 0;
};

/**
 * @brief Which files of a dataset folder are candidates for upload
 *
 * With only an includes list, a file must match one of its globs. With only
 * an excludes list, a file matching one is dropped. With both, excluded
 * files are dropped unless they also match an include. Files modified more
 * recently than the ignore-new-files window are left for a later pass.
 */
struct FileSelection {
    bool use_includes = false;
    std::vector<std::string> include_patterns;
    bool use_excludes = false;
    std::vector<std::string> exclude_patterns;
    bool ignore_new_files = false;
    int ignore_new_files_minutes = 0;

    static FileSelection from_settings(const config::Settings& settings);

    bool accepts_name(const std::string& filename) const;
};

class DatasetFiles {
public:
    /// Regular files under `folder`, recursively, sorted by relative path.
    static Result<std::vector<DatasetFile>> enumerate(const std::filesystem::path& folder,
                                                      const FileSelection& selection);

    static Result<std::vector<DatasetFile>> enumerate(const std::filesystem::path& folder,
                                                      const config::Settings& settings) {
        return enumerate(folder, FileSelection::from_settings(settings));
    }
};

/// Name of the temporary file a chunked upload stages next to `filename`.
std::string chunk_file_name(const std::string& filename);

/// Whether `filename` is such a temporary chunk file.
bool is_chunk_file_name(const std::string& filename);

} // namespace labsync::scan
