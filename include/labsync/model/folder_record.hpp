#pragma once

#include "labsync/model/owner.hpp"
#include "labsync/model/upload_status.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace labsync::model {

/**
 * @brief One local dataset folder discovered by a scan pass
 */
struct FolderRecord {
    std::uint64_t id = 0;
    std::filesystem::path path;
    std::string name;                       ///< Dataset folder name
    std::string identity_folder;            ///< Top-level user or group folder name
    std::optional<std::string> experiment_folder;
    Owner owner;
    std::optional<Owner> group;
    std::string experiment_title;
    std::time_t created_time = 0;           ///< Directory ctime
    UploadStatus status = UploadStatus::NotStarted;
    std::size_t num_files = 0;
};

} // namespace labsync::model
