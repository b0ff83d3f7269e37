/**
 * @file staged_transfer_engine.hpp
 * @brief Continuous mirroring of the confirmed series
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/core/retry_policy.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/transfer/directory_mirror.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace fmri_sync::transfer {

/**
 * @brief Pacing and failure budget of the transfer loop
 */
struct engine_config {
    /// Pause between two successful passes
    std::chrono::milliseconds iteration_delay{1};

    /// Consecutive failed passes tolerated before giving up
    core::retry_config retry;

    /// Longest stretch of a backoff wait without checking for a stop
    std::chrono::milliseconds stop_check_interval{100};
};

/**
 * @brief Totals over the lifetime of an engine
 */
struct transfer_summary {
    std::size_t iterations = 0;
    std::size_t files_transferred = 0;
    std::size_t failed_iterations = 0;
};

/**
 * @brief Repeats the staged mirror pass until told to stop
 *
 * A successful pass resets the failure count. A pass that fails while a
 * stop is pending is not counted: the copy tool usually receives the same
 * interrupt as this process. Errors that retry_policy deems non-retryable
 * end the loop at once.
 */
class staged_transfer_engine {
public:
    staged_transfer_engine(std::shared_ptr<IDirectoryMirror> mirror,
                           transfer_job job,
                           engine_config config = {},
                           core::sleeper wait = core::thread_sleeper(),
                           std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Perform a single mirror pass
     */
    [[nodiscard]] auto run_once() -> Result<mirror_report>;

    /**
     * @brief Loop run_once() until stop_requested() returns true
     * @return The totals on stop, a non-retryable mirror error, or
     *         retry_exhausted
     */
    [[nodiscard]] auto run(const std::function<bool()>& stop_requested)
        -> Result<transfer_summary>;

    [[nodiscard]] auto job() const -> const transfer_job& { return job_; }
    [[nodiscard]] auto summary() const -> const transfer_summary& { return summary_; }

private:
    void log_failure(const std::string& message) const;

    std::shared_ptr<IDirectoryMirror> mirror_;
    transfer_job job_;
    engine_config config_;
    core::sleeper wait_;
    std::shared_ptr<di::ILogger> logger_;
    transfer_summary summary_;
};

}  // namespace fmri_sync::transfer
