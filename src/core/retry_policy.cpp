/**
 * @file retry_policy.cpp
 * @brief Backoff delay computation and stop-aware waiting
 */

#include "fmri_sync/core/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace fmri_sync::core {

auto thread_sleeper() -> sleeper {
    return [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    };
}

auto wait_unless_stopped(const sleeper& wait,
                         std::chrono::milliseconds delay,
                         std::chrono::milliseconds slice,
                         const std::function<bool()>& stop_requested) -> bool {
    if (slice.count() <= 0) {
        slice = delay;
    }

    auto left = delay;
    while (left.count() > 0) {
        if (stop_requested && stop_requested()) {
            return false;
        }
        const auto step = std::min(left, slice);
        if (wait) {
            wait(step);
        }
        left -= step;
    }
    return true;
}

retry_policy::retry_policy(retry_config config, std::shared_ptr<di::ILogger> logger)
    : config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()),
      rng_(std::random_device{}()) {}

auto retry_policy::delay_for(std::size_t attempt) -> std::chrono::milliseconds {
    if (attempt == 0) {
        attempt = 1;
    }

    const auto max_ms = static_cast<double>(config_.max_delay.count());
    double base = static_cast<double>(config_.initial_delay.count()) *
                  std::pow(config_.backoff_multiplier, static_cast<double>(attempt - 1));
    base = std::min(base, max_ms);

    if (config_.jitter_factor > 0.0) {
        std::uniform_real_distribution<double> dist(-config_.jitter_factor,
                                                    config_.jitter_factor);
        base += base * dist(rng_);
    }

    base = std::clamp(base, 0.0, max_ms);
    return std::chrono::milliseconds(static_cast<long long>(base));
}

auto retry_policy::is_retryable(int code) noexcept -> bool {
    return code != error_codes::invalid_argument && code != error_codes::cancelled;
}

}  // namespace fmri_sync::core
