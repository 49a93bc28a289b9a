#pragma once

#include "labsync/core/cancellation.hpp"
#include "labsync/core/result.hpp"

#include <filesystem>
#include <string>

namespace labsync::transfer {

/**
 * @brief Lower-case hex MD5 of a file, as stored in datafile records
 *
 * Reads in 1 MiB blocks and checks token between blocks; a canceled
 * computation returns a Canceled error.
 */
Result<std::string> md5_file(const std::filesystem::path& path,
                             const CancellationToken& token = CancellationToken());

} // namespace labsync::transfer
