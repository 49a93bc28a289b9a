#include "labsync/transfer/local_transport.hpp"

#include <fstream>

namespace labsync::transfer {
namespace fs = std::filesystem;

Result<std::uint64_t> LocalStagingTransport::query_size(const std::string& remote_path) {
    std::error_code ec;
    const auto size = fs::file_size(remote_path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Ok(std::uint64_t{0});
        }
        return Err(ErrorKind::Transport, "Cannot stat " + remote_path + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<void> LocalStagingTransport::put_temp(const fs::path& local_path, const std::string& remote_path) {
    std::error_code ec;
    fs::copy_file(local_path, remote_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err(ErrorKind::Transport,
                   "Cannot copy " + local_path.string() + " to " + remote_path + ": " + ec.message());
    }
    return Ok();
}

Result<void> LocalStagingTransport::append_and_cleanup(const std::string& chunk_path,
                                                       const std::string& final_path,
                                                       bool truncate) {
    {
        std::ifstream input(chunk_path, std::ios::binary);
        if (!input) {
            return Err(ErrorKind::Transport, "Cannot open chunk " + chunk_path);
        }
        const auto mode = std::ios::binary | (truncate ? std::ios::trunc : std::ios::app);
        std::ofstream output(final_path, mode);
        if (!output) {
            return Err(ErrorKind::Transport, "Cannot open " + final_path + " for writing");
        }
        // Inserting an empty streambuf sets failbit, so an empty chunk writes nothing
        if (input.peek() != std::ifstream::traits_type::eof()) {
            output << input.rdbuf();
        }
        output.flush();
        if (!output) {
            return Err(ErrorKind::Transport, "Failed to append " + chunk_path + " to " + final_path);
        }
    }
    return remove(chunk_path);
}

Result<void> LocalStagingTransport::remove(const std::string& remote_path) {
    std::error_code ec;
    fs::remove(remote_path, ec);
    if (ec) {
        return Err(ErrorKind::Transport, "Cannot remove " + remote_path + ": " + ec.message());
    }
    return Ok();
}

Result<void> LocalStagingTransport::make_directory(const std::string& remote_dir) {
    std::error_code ec;
    fs::create_directories(remote_dir, ec);
    if (ec && !fs::is_directory(remote_dir)) {
        return Err(ErrorKind::Transport, "Cannot create directory " + remote_dir + ": " + ec.message());
    }
    return Ok();
}

} // namespace labsync::transfer
