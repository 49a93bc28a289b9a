#include "labsync/scan/dataset_files.hpp"

#include <spdlog/spdlog.h>

#include <fnmatch.h>
#include <sys/stat.h>

#include <algorithm>

namespace labsync::scan {

namespace fs = std::filesystem;

namespace {

bool matches_any(const std::string& name, const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [&name](const std::string& pattern) {
        return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
    });
}

} // namespace

std::string chunk_file_name(const std::string& filename) {
    return "." + filename + ".chunk";
}

bool is_chunk_file_name(const std::string& filename) {
    const std::string suffix = ".chunk";
    return filename.size() > suffix.size() + 1 && filename.front() == '.' &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileSelection FileSelection::from_settings(const config::Settings& settings) {
    FileSelection selection;
    selection.use_includes = settings.use_includes_file;
    selection.include_patterns = settings.include_patterns;
    selection.use_excludes = settings.use_excludes_file;
    selection.exclude_patterns = settings.exclude_patterns;
    selection.ignore_new_files = settings.ignore_new_files;
    selection.ignore_new_files_minutes = settings.ignore_new_files_minutes;
    return selection;
}

bool FileSelection::accepts_name(const std::string& filename) const {
    if (is_chunk_file_name(filename)) {
        return false;
    }
    if (use_includes && use_excludes) {
        return matches_any(filename, include_patterns) || !matches_any(filename, exclude_patterns);
    }
    if (use_includes) {
        return matches_any(filename, include_patterns);
    }
    if (use_excludes) {
        return !matches_any(filename, exclude_patterns);
    }
    return true;
}

Result<std::vector<DatasetFile>> DatasetFiles::enumerate(const fs::path& folder,
                                                         const FileSelection& selection) {
    std::vector<DatasetFile> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err(ErrorKind::LocalIo, "Cannot list " + folder.string() + ": " + ec.message());
    }

    const std::time_t newest_allowed =
        std::time(nullptr) - static_cast<std::time_t>(selection.ignore_new_files_minutes) * 60;

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return Err(ErrorKind::LocalIo, "Cannot list " + folder.string() + ": " + ec.message());
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }

        const fs::path& path = it->path();
        const std::string filename = path.filename().string();
        if (!selection.accepts_name(filename)) {
            spdlog::debug("Not uploading {}: excluded by file patterns", path.string());
            continue;
        }

        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            return Err(ErrorKind::LocalIo, "Cannot stat " + path.string());
        }
        if (selection.ignore_new_files && st.st_mtime > newest_allowed) {
            spdlog::info("Not uploading {} yet: modified within the last {} minute(s)",
                         path.string(), selection.ignore_new_files_minutes);
            continue;
        }

        DatasetFile file;
        file.local_path = path;
        file.filename = filename;
        file.subdirectory = path.parent_path().lexically_relative(folder).generic_string();
        if (file.subdirectory == ".") {
            file.subdirectory.clear();
        }
        file.size = static_cast<std::uint64_t>(st.st_size);
        file.modified_time = st.st_mtime;
        files.push_back(std::move(file));
    }

    std::sort(files.begin(), files.end(), [](const DatasetFile& a, const DatasetFile& b) {
        return a.local_path < b.local_path;
    });
    return Ok(std::move(files));
}

} // namespace labsync::scan
