/**
 * @file change_detector.hpp
 * @brief Polling state machine that waits for a new functional series
 *
 * State transitions:
 * @code
 *   baseline --> polling --(new series)--> series_changed
 *   series_changed --(fMRI/EPI)--> confirmed
 *   series_changed --(other)-----> polling   (baseline := rejected series)
 * @endcode
 */

#pragma once

#include "fmri_sync/classify/series_classifier.hpp"
#include "fmri_sync/core/result.hpp"
#include "fmri_sync/core/retry_policy.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/exam_path_resolver.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace fmri_sync::detect {

/**
 * @brief Change detector states
 */
enum class detector_state {
    baseline,
    polling,
    series_changed,
    confirmed
};

[[nodiscard]] auto to_string(detector_state state) -> const char*;

/**
 * @brief Pacing and failure budget of the polling loop
 */
struct detector_config {
    std::chrono::milliseconds poll_interval{1000};

    /// Uniform jitter added to each interval, as a fraction of it
    double poll_jitter = 0.0;

    /// Consecutive poll failures tolerated before giving up
    core::retry_config retry;
};

/**
 * @brief The series handed over to the transfer engine
 */
struct confirmed_series {
    remote::series_descriptor series;
    classify::sample_metadata metadata;
};

/**
 * @brief Watches one exam for the first new fMRI/EPI series
 *
 * Not thread-safe; driven from a single thread.
 */
class change_detector {
public:
    change_detector(std::shared_ptr<remote::exam_path_resolver> resolver,
                    std::shared_ptr<classify::ISeriesClassifier> classifier,
                    remote::series_descriptor baseline,
                    detector_config config = {},
                    core::sleeper wait = core::thread_sleeper(),
                    std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Perform one poll
     * @return true once a functional series has been confirmed
     */
    [[nodiscard]] auto poll_once() -> Result<bool>;

    /**
     * @brief Poll until confirmed, stopped, or the failure budget is spent
     *
     * @param stop_requested Checked before every poll; returns cancelled
     */
    [[nodiscard]] auto run(const std::function<bool()>& stop_requested = {})
        -> Result<confirmed_series>;

    [[nodiscard]] auto state() const noexcept -> detector_state { return state_; }
    [[nodiscard]] auto baseline() const -> const remote::series_descriptor& { return baseline_; }
    [[nodiscard]] auto confirmed() const -> const std::optional<confirmed_series>& {
        return confirmed_;
    }
    [[nodiscard]] auto poll_count() const noexcept -> std::size_t { return polls_; }

private:
    [[nodiscard]] auto next_interval() -> std::chrono::milliseconds;

    std::shared_ptr<remote::exam_path_resolver> resolver_;
    std::shared_ptr<classify::ISeriesClassifier> classifier_;
    remote::series_descriptor baseline_;
    detector_config config_;
    core::sleeper wait_;
    std::shared_ptr<di::ILogger> logger_;

    detector_state state_ = detector_state::baseline;
    std::optional<confirmed_series> confirmed_;
    std::size_t polls_ = 0;
    std::mt19937 rng_;
};

}  // namespace fmri_sync::detect
