#include "labsync/transfer/staging_transport.hpp"

#include "labsync/scan/dataset_files.hpp"

namespace labsync::transfer {

std::string remote_parent(const std::string& remote_path) {
    const auto slash = remote_path.find_last_of('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return remote_path.substr(0, slash);
}

std::string remote_chunk_path(const std::string& remote_path) {
    const auto slash = remote_path.find_last_of('/');
    const std::string name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    const std::string chunk = scan::chunk_file_name(name);
    if (slash == std::string::npos) {
        return chunk;
    }
    return remote_path.substr(0, slash + 1) + chunk;
}

std::string resolve_staging_path(const std::string& location, const std::string& path) {
    if (path.empty() || path.front() == '/' || location.empty()) {
        return path;
    }
    if (location.back() == '/') {
        return location + path;
    }
    return location + "/" + path;
}

} // namespace labsync::transfer
