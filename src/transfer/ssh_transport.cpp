#include "labsync/transfer/ssh_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <future>

namespace labsync::transfer {
namespace bp = boost::process;

namespace {

const std::vector<std::string> kSshOptions = {
    "-oPasswordAuthentication=no",
    "-oNoHostAuthenticationForLocalhost=yes",
    "-oStrictHostKeyChecking=no",
};

std::string first_line(const std::string& text) {
    const auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

SshOptions SshOptions::from_settings(const config::Settings& settings) {
    SshOptions options;
    options.host = settings.staging.host;
    options.port = settings.staging.port;
    options.username = settings.staging.username;
    options.private_key_path = settings.staging.private_key_path;
    options.command_timeout = settings.request_timeout_duration();
    options.copy_timeout = std::chrono::seconds(settings.staging.copy_timeout);
    return options;
}

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

Result<std::uint64_t> parse_byte_count(const CommandOutput& output) {
    if (output.exit_code != 0) {
        if (output.err.find("No such file or directory") != std::string::npos) {
            return Ok(std::uint64_t{0});
        }
        return Err(Error(ErrorKind::Transport,
                         "Byte count failed: " + first_line(output.err), output.exit_code));
    }

    std::size_t pos = 0;
    while (pos < output.out.size() && std::isspace(static_cast<unsigned char>(output.out[pos]))) {
        ++pos;
    }
    const auto end = output.out.find_first_not_of("0123456789", pos);
    const std::string digits = output.out.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if (digits.empty()) {
        return Err(ErrorKind::Protocol, "Unexpected byte count output: \"" + first_line(output.out) + "\"");
    }
    return Ok(static_cast<std::uint64_t>(std::stoull(digits)));
}

Result<CommandOutput> run_command(const std::string& program,
                                  const std::vector<std::string>& args,
                                  std::chrono::seconds timeout) {
    const auto executable = bp::search_path(program);
    if (executable.empty()) {
        return Err(ErrorKind::Transport, program + " was not found on PATH");
    }

    boost::asio::io_context io;
    std::future<std::string> out;
    std::future<std::string> err;
    std::error_code ec;
    bp::child child(executable, bp::args(args),
                    bp::std_in.close(), bp::std_out > out, bp::std_err > err, io, ec);
    if (ec) {
        return Err(ErrorKind::Transport, "Cannot start " + program + ": " + ec.message());
    }

    io.run_for(timeout);
    if (!io.stopped()) {
        spdlog::warn("{} did not finish within {}s, terminating", program, timeout.count());
        child.terminate(ec);
        io.run_for(std::chrono::seconds(5));
        return Err(ErrorKind::Transport,
                   program + " timed out after " + std::to_string(timeout.count()) + "s");
    }

    child.wait(ec);
    if (ec) {
        return Err(ErrorKind::Transport, "Waiting for " + program + " failed: " + ec.message());
    }

    CommandOutput output;
    output.exit_code = child.exit_code();
    output.out = out.get();
    output.err = err.get();
    return Ok(std::move(output));
}

SshStagingTransport::SshStagingTransport(SshOptions options) : options_(std::move(options)) {}

std::vector<std::string> SshStagingTransport::ssh_arguments(const std::string& remote_command) const {
    std::vector<std::string> args{"-p", options_.port};
    if (!options_.private_key_path.empty()) {
        args.push_back("-i");
        args.push_back(options_.private_key_path);
    }
    args.insert(args.end(), kSshOptions.begin(), kSshOptions.end());
    args.push_back("-l");
    args.push_back(options_.username);
    args.push_back(options_.host);
    args.push_back(remote_command);
    return args;
}

std::vector<std::string> SshStagingTransport::scp_arguments(const std::filesystem::path& local_path,
                                                            const std::string& remote_path) const {
    std::vector<std::string> args{"-P", options_.port};
    if (!options_.private_key_path.empty()) {
        args.push_back("-i");
        args.push_back(options_.private_key_path);
    }
    args.insert(args.end(), kSshOptions.begin(), kSshOptions.end());
    args.push_back(local_path.string());
    args.push_back(options_.username + "@" + options_.host + ":" + shell_quote(remote_path));
    return args;
}

Result<CommandOutput> SshStagingTransport::run_remote(const std::string& remote_command) {
    spdlog::debug("ssh {}@{}: {}", options_.username, options_.host, remote_command);
    return run_command(options_.ssh_program, ssh_arguments(remote_command), options_.command_timeout);
}

Result<void> SshStagingTransport::run_checked(const std::string& remote_command, const std::string& what) {
    auto output = run_remote(remote_command);
    if (output.is_error()) {
        return Err(output.error());
    }
    if (output.value().exit_code != 0) {
        return Err(Error(ErrorKind::Transport,
                         what + " failed: " + first_line(output.value().err),
                         output.value().exit_code));
    }
    return Ok();
}

Result<std::uint64_t> SshStagingTransport::query_size(const std::string& remote_path) {
    auto output = run_remote("wc -c " + shell_quote(remote_path));
    if (output.is_error()) {
        return Err(output.error());
    }
    return parse_byte_count(output.value());
}

Result<void> SshStagingTransport::put_temp(const std::filesystem::path& local_path,
                                           const std::string& remote_path) {
    spdlog::debug("scp {} -> {}:{}", local_path.string(), options_.host, remote_path);
    auto output = run_command(options_.scp_program, scp_arguments(local_path, remote_path),
                              options_.copy_timeout);
    if (output.is_error()) {
        return Err(output.error());
    }
    if (output.value().exit_code != 0) {
        return Err(Error(ErrorKind::Transport,
                         "Copy to " + remote_path + " failed: " + first_line(output.value().err),
                         output.value().exit_code));
    }
    return Ok();
}

Result<void> SshStagingTransport::append_and_cleanup(const std::string& chunk_path,
                                                     const std::string& final_path,
                                                     bool truncate) {
    const std::string redirect = truncate ? " > " : " >> ";
    return run_checked("cat " + shell_quote(chunk_path) + redirect + shell_quote(final_path) +
                       " && /bin/rm -f " + shell_quote(chunk_path),
                       "Appending chunk to " + final_path);
}

Result<void> SshStagingTransport::remove(const std::string& remote_path) {
    return run_checked("/bin/rm -f " + shell_quote(remote_path), "Removing " + remote_path);
}

Result<void> SshStagingTransport::make_directory(const std::string& remote_dir) {
    return run_checked("mkdir -p " + shell_quote(remote_dir), "Creating directory " + remote_dir);
}

} // namespace labsync::transfer
