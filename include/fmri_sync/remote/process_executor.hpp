/**
 * @file process_executor.hpp
 * @brief Child process execution with captured output
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/command_line.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace fmri_sync::remote {

/**
 * @brief Outcome of a child process that was started successfully
 */
struct command_output {
    /// Exit status, or -signal when the child was killed by a signal
    int exit_status = 0;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return exit_status == 0; }
};

/**
 * @brief Abstract command executor
 *
 * A non-zero exit status is reported through command_output, not as an
 * error; only failing to run the program at all is an error.
 */
class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    [[nodiscard]] virtual auto run(const command_line& cmd) -> Result<command_output> = 0;
};

/**
 * @brief fork/execv based executor
 *
 * The program is executed directly (no shell), stdout and stderr are
 * captured through pipes. Exec failures are detected through a
 * close-on-exec status pipe and reported as spawn_failed.
 */
class process_executor final : public ICommandExecutor {
public:
    /**
     * @param timeout Kill the child after this long; zero waits forever
     * @param logger Logger for command tracing
     */
    explicit process_executor(std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
                              std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto run(const command_line& cmd) -> Result<command_output> override;

private:
    std::chrono::milliseconds timeout_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::remote
