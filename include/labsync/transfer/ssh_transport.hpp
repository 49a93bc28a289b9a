#pragma once

#include "labsync/config/settings.hpp"
#include "labsync/transfer/staging_transport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace labsync::transfer {

struct SshOptions {
    std::string host;
    std::string port = "22";
    std::string username;
    std::string private_key_path;
    std::chrono::seconds command_timeout{30};
    std::chrono::seconds copy_timeout{600};
    std::string ssh_program = "ssh";
    std::string scp_program = "scp";

    static SshOptions from_settings(const config::Settings& settings);
};

/// Output of one finished child process.
struct CommandOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

/**
 * @brief Staging area reached through the OpenSSH ssh and scp clients
 *
 * Each operation runs one child process. Remote commands:
 *   query_size         wc -c '<path>'
 *   make_directory     mkdir -p '<dir>'
 *   append_and_cleanup cat '<chunk>' >|>> '<final>' && /bin/rm -f '<chunk>'
 *   remove             /bin/rm -f '<path>'
 * put_temp is a single scp. Authentication is by key only; password
 * prompts are disabled so a misconfigured key fails instead of hanging.
 *
 * A process that outlives its timeout is killed and reported as a
 * Transport error.
 */
class SshStagingTransport : public StagingTransport {
public:
    explicit SshStagingTransport(SshOptions options);

    Result<std::uint64_t> query_size(const std::string& remote_path) override;
    Result<void> put_temp(const std::filesystem::path& local_path,
                          const std::string& remote_path) override;
    Result<void> append_and_cleanup(const std::string& chunk_path,
                                    const std::string& final_path,
                                    bool truncate) override;
    Result<void> remove(const std::string& remote_path) override;

    std::vector<std::string> ssh_arguments(const std::string& remote_command) const;
    std::vector<std::string> scp_arguments(const std::filesystem::path& local_path,
                                           const std::string& remote_path) const;

protected:
    Result<void> make_directory(const std::string& remote_dir) override;

private:
    Result<CommandOutput> run_remote(const std::string& remote_command);
    Result<void> run_checked(const std::string& remote_command, const std::string& what);

    SshOptions options_;
};

/// Run program (looked up on PATH) with args, killing it after timeout.
Result<CommandOutput> run_command(const std::string& program,
                                  const std::vector<std::string>& args,
                                  std::chrono::seconds timeout);

/// Single-quote text for a POSIX shell.
std::string shell_quote(const std::string& text);

/**
 * @brief Byte count from "wc -c" output ("  1234 /path/name")
 *
 * A "No such file or directory" diagnostic maps to 0.
 */
Result<std::uint64_t> parse_byte_count(const CommandOutput& output);

} // namespace labsync::transfer
