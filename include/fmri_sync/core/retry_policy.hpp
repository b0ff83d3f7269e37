/**
 * @file retry_policy.hpp
 * @brief Bounded retry with exponential backoff and jitter
 *
 * Used by the change detector and the staged transfer engine so that a
 * transient ssh/rsync failure does not end a scanning session, while a
 * persistent one ends it with a distinguishable retry_exhausted error.
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <random>

namespace fmri_sync::core {

/**
 * @brief Blocking wait primitive, injectable so tests never sleep
 */
using sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sleeper backed by std::this_thread::sleep_for
 */
[[nodiscard]] auto thread_sleeper() -> sleeper;

/**
 * @brief Wait @p delay in slices of at most @p slice
 *
 * @p stop_requested is checked before every slice.
 * @return false when the wait was cut short by a stop request
 */
auto wait_unless_stopped(const sleeper& wait,
                         std::chrono::milliseconds delay,
                         std::chrono::milliseconds slice,
                         const std::function<bool()>& stop_requested) -> bool;

/**
 * @brief Retry policy configuration
 */
struct retry_config {
    /// Total number of attempts, including the first one
    std::size_t max_attempts = 5;

    /// Delay before the second attempt
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{30000};

    /// Growth factor applied per attempt
    double backoff_multiplier = 2.0;

    /// Relative jitter, 0.1 means +/-10%
    double jitter_factor = 0.1;
};

/**
 * @brief Backoff schedule for the long-running loops
 *
 * Errors coded invalid_argument or cancelled are not retryable; callers
 * return them immediately and retry every other error until
 * max_attempts consecutive failures.
 */
class retry_policy {
public:
    explicit retry_policy(retry_config config = {},
                          std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Delay to wait after the given failed attempt
     * @param attempt 1-based number of the attempt that just failed
     * @return min(initial * multiplier^(attempt-1), max_delay), with jitter
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) -> std::chrono::milliseconds;

    /**
     * @brief Check whether an error code is worth another attempt
     */
    [[nodiscard]] static auto is_retryable(int code) noexcept -> bool;

    [[nodiscard]] auto config() const noexcept -> const retry_config& { return config_; }

private:
    retry_config config_;
    std::shared_ptr<di::ILogger> logger_;
    std::mt19937 rng_;
};

}  // namespace fmri_sync::core
