/**
 * @file process_executor.cpp
 * @brief POSIX implementation of process_executor
 */

#include "fmri_sync/remote/process_executor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fmri_sync::remote {

namespace {

/**
 * @brief Owns a pipe pair and closes whatever end is still open
 */
class pipe_pair {
public:
    pipe_pair() = default;
    ~pipe_pair() {
        close_read();
        close_write();
    }

    pipe_pair(const pipe_pair&) = delete;
    pipe_pair& operator=(const pipe_pair&) = delete;

    [[nodiscard]] auto open(int flags) -> bool {
        return ::pipe2(fds_.data(), flags) == 0;
    }

    [[nodiscard]] auto read_end() const noexcept -> int { return fds_[0]; }
    [[nodiscard]] auto write_end() const noexcept -> int { return fds_[1]; }

    void close_read() noexcept { close_fd(fds_[0]); }
    void close_write() noexcept { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    std::array<int, 2> fds_{-1, -1};
};

/// Drain whatever is currently readable from a non-blocking descriptor
void drain(int fd, std::string& out) {
    std::array<char, 4096> buffer{};
    ssize_t n = 0;
    while ((n = ::read(fd, buffer.data(), buffer.size())) > 0) {
        out.append(buffer.data(), static_cast<std::size_t>(n));
    }
}

}  // namespace

process_executor::process_executor(std::chrono::milliseconds timeout,
                                   std::shared_ptr<di::ILogger> logger)
    : timeout_(timeout), logger_(logger ? std::move(logger) : di::null_logger()) {}

auto process_executor::run(const command_line& cmd) -> Result<command_output> {
    if (cmd.program.empty()) {
        return fmri_sync_error<command_output>(error_codes::invalid_argument,
                                               "Empty program path");
    }

    logger_->debug_fmt("exec: {}", cmd.to_display_string());

    pipe_pair out_pipe;
    pipe_pair err_pipe;
    pipe_pair exec_pipe;
    if (!out_pipe.open(0) || !err_pipe.open(0) || !exec_pipe.open(O_CLOEXEC)) {
        return fmri_sync_error<command_output>(error_codes::spawn_failed,
                                               "Failed to create pipes",
                                               std::strerror(errno));
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& arg : cmd.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return fmri_sync_error<command_output>(error_codes::spawn_failed,
                                               "Failed to fork", std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        ::close(out_pipe.read_end());
        ::close(err_pipe.read_end());
        ::close(exec_pipe.read_end());

        ::execv(cmd.program.c_str(), argv.data());

        const int exec_errno = errno;
        [[maybe_unused]] const auto written =
            ::write(exec_pipe.write_end(), &exec_errno, sizeof(exec_errno));
        ::_exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    // Blocks until execv succeeds (EOF) or the child reports its errno
    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int ignored = 0;
        ::waitpid(pid, &ignored, 0);
        return fmri_sync_error<command_output>(
            error_codes::spawn_failed, "Cannot execute " + cmd.program,
            std::strerror(exec_errno));
    }

    ::fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    command_output output;
    const auto start = std::chrono::steady_clock::now();
    int status = 0;

    while (true) {
        drain(out_pipe.read_end(), output.stdout_text);
        drain(err_pipe.read_end(), output.stderr_text);

        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            return fmri_sync_error<command_output>(
                error_codes::spawn_failed, "waitpid failed for " + cmd.program,
                std::strerror(errno));
        }

        if (timeout_.count() > 0 &&
            std::chrono::steady_clock::now() - start >= timeout_) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            logger_->warn_fmt("Command timed out after {} ms: {}", timeout_.count(),
                              cmd.program);
            return fmri_sync_error<command_output>(
                error_codes::command_timeout,
                "Command timed out after " + std::to_string(timeout_.count()) + " ms",
                cmd.to_display_string());
        }

        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }

    drain(out_pipe.read_end(), output.stdout_text);
    drain(err_pipe.read_end(), output.stderr_text);

    if (WIFEXITED(status)) {
        output.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_status = -WTERMSIG(status);
    }

    if (!output.succeeded()) {
        logger_->debug_fmt("{} exited with status {}", cmd.program, output.exit_status);
    }

    return Result<command_output>::ok(std::move(output));
}

}  // namespace fmri_sync::remote
