#pragma once

#include "labsync/transfer/staging_transport.hpp"

namespace labsync::transfer {

/**
 * @brief Staging area on a locally mounted filesystem
 *
 * Remote paths are ordinary local paths. Used when the staging share is
 * mounted on the instrument PC, and by tests.
 */
class LocalStagingTransport : public StagingTransport {
public:
    Result<std::uint64_t> query_size(const std::string& remote_path) override;
    Result<void> put_temp(const std::filesystem::path& local_path,
                          const std::string& remote_path) override;
    Result<void> append_and_cleanup(const std::string& chunk_path,
                                    const std::string& final_path,
                                    bool truncate) override;
    Result<void> remove(const std::string& remote_path) override;

protected:
    Result<void> make_directory(const std::string& remote_dir) override;
};

} // namespace labsync::transfer
