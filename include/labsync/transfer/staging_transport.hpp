#pragma once

#include "labsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace labsync::transfer {

/**
 * @brief File operations on the staging area used by chunked uploads
 *
 * WHY THIS INTERFACE EXISTS:
 * The chunk loop only needs four things from the far side: how many bytes
 * of a file are there, put a local file at a remote path, append one
 * remote file onto another and delete the first, and make sure a directory
 * exists. Keeping the loop behind these operations lets it run over ssh,
 * a locally mounted staging directory, or an in-memory fake in tests.
 *
 * Remote paths are plain strings in the staging host's path syntax.
 * Every call is one remote round-trip; failures come back as Transport
 * errors and are never retried here.
 */
class StagingTransport {
public:
    virtual ~StagingTransport() = default;

    /// Byte length of remote_path. A file that does not exist has length 0.
    virtual Result<std::uint64_t> query_size(const std::string& remote_path) = 0;

    /// Copy a local file to remote_path, replacing anything already there.
    virtual Result<void> put_temp(const std::filesystem::path& local_path,
                                  const std::string& remote_path) = 0;

    /**
     * @brief Append chunk_path onto final_path, then delete chunk_path
     *
     * truncate=true replaces final_path instead of appending (first chunk).
     * Returns an error if either the append or the removal failed.
     */
    virtual Result<void> append_and_cleanup(const std::string& chunk_path,
                                            const std::string& final_path,
                                            bool truncate) = 0;

    /// Delete remote_path if it exists. A missing file is not an error.
    virtual Result<void> remove(const std::string& remote_path) = 0;

    /**
     * @brief Create remote_dir and its parents once per transport instance
     *
     * Successful creations are remembered so later calls for the same
     * directory cost no round-trip. Failures are not remembered.
     */
    Result<void> ensure_directory(const std::string& remote_dir) {
        {
            std::lock_guard<std::mutex> lock(dirs_mutex_);
            if (created_dirs_.count(remote_dir) != 0) {
                return Ok();
            }
        }
        auto result = make_directory(remote_dir);
        if (result.is_ok()) {
            std::lock_guard<std::mutex> lock(dirs_mutex_);
            created_dirs_.insert(remote_dir);
        }
        return result;
    }

    std::size_t directories_created() const {
        std::lock_guard<std::mutex> lock(dirs_mutex_);
        return created_dirs_.size();
    }

protected:
    virtual Result<void> make_directory(const std::string& remote_dir) = 0;

private:
    mutable std::mutex dirs_mutex_;
    std::set<std::string> created_dirs_;
};

/// Remote directory part of a staging path ("/a/b/c.dat" -> "/a/b").
std::string remote_parent(const std::string& remote_path);

/// Remote name of the temporary chunk file for a staging path: "<dir>/.<name>.chunk".
std::string remote_chunk_path(const std::string& remote_path);

/**
 * @brief Absolute staging path for a path returned by the repository
 *
 * Relative paths are taken to be under the configured staging location.
 */
std::string resolve_staging_path(const std::string& location, const std::string& path);

} // namespace labsync::transfer
