/**
 * @file change_detector.cpp
 * @brief Implementation of the series change detector
 */

#include "fmri_sync/detect/change_detector.hpp"
#include "fmri_sync/integration/logger_adapter.hpp"

namespace fmri_sync::detect {

using integration::logger_adapter;
using integration::session_event;

auto to_string(detector_state state) -> const char* {
    switch (state) {
        case detector_state::baseline: return "baseline";
        case detector_state::polling: return "polling";
        case detector_state::series_changed: return "series_changed";
        case detector_state::confirmed: return "confirmed";
    }
    return "unknown";
}

change_detector::change_detector(std::shared_ptr<remote::exam_path_resolver> resolver,
                                 std::shared_ptr<classify::ISeriesClassifier> classifier,
                                 remote::series_descriptor baseline,
                                 detector_config config,
                                 core::sleeper wait,
                                 std::shared_ptr<di::ILogger> logger)
    : resolver_(std::move(resolver)),
      classifier_(std::move(classifier)),
      baseline_(std::move(baseline)),
      config_(config),
      wait_(std::move(wait)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      rng_(std::random_device{}()) {}

auto change_detector::poll_once() -> Result<bool> {
    if (state_ == detector_state::confirmed) {
        return Result<bool>::ok(true);
    }

    state_ = detector_state::polling;
    ++polls_;

    auto latest = resolver_->locate_latest_series(baseline_.exam_dir);
    if (latest.is_err()) {
        return Result<bool>::err(latest.error());
    }

    const auto& series_dir = latest.value();
    if (series_dir == baseline_.series_dir) {
        logger_->debug_fmt("waiting... current series: {}", series_dir);
        return Result<bool>::ok(false);
    }

    state_ = detector_state::series_changed;
    logger_->info_fmt("New series detected: {}", series_dir);

    auto verdict = classifier_->classify(series_dir);
    if (verdict.is_err()) {
        // Baseline unchanged: the next poll classifies the same series again
        state_ = detector_state::polling;
        return Result<bool>::err(verdict.error());
    }

    remote::series_descriptor current{baseline_.exam_dir, series_dir};
    const auto fields = verdict.value().metadata.audit_fields();

    if (verdict.value().is_functional) {
        state_ = detector_state::confirmed;
        confirmed_ = confirmed_series{current, verdict.value().metadata};
        logger_adapter::log_session_event(session_event::series_confirmed, series_dir, fields);
        return Result<bool>::ok(true);
    }

    logger_->info_fmt("No fMRI found in {}; watching for the next series", series_dir);
    logger_adapter::log_session_event(session_event::series_rejected, series_dir, fields);
    baseline_ = std::move(current);
    state_ = detector_state::polling;
    return Result<bool>::ok(false);
}

auto change_detector::run(const std::function<bool()>& stop_requested)
    -> Result<confirmed_series> {
    core::retry_policy backoff(config_.retry, logger_);
    std::size_t consecutive_failures = 0;

    while (true) {
        if (stop_requested && stop_requested()) {
            return fmri_sync_error<confirmed_series>(error_codes::cancelled,
                                                     "Polling stopped before a series was confirmed");
        }

        auto polled = poll_once();
        if (polled.is_ok()) {
            consecutive_failures = 0;
            if (polled.value()) {
                return Result<confirmed_series>::ok(*confirmed_);
            }
            if (wait_) {
                wait_(next_interval());
            }
            continue;
        }

        const auto& error = polled.error();
        if (!core::retry_policy::is_retryable(error.code)) {
            return Result<confirmed_series>::err(error);
        }

        ++consecutive_failures;
        if (consecutive_failures >= config_.retry.max_attempts) {
            logger_->error_fmt("Polling failed {} times in a row: {}",
                               consecutive_failures, error.message);
            return fmri_sync_error<confirmed_series>(
                error_codes::retry_exhausted,
                "Polling failed " + std::to_string(consecutive_failures) + " times in a row",
                error.message);
        }

        const auto delay = backoff.delay_for(consecutive_failures);
        logger_->warn_fmt("Poll failed ({}): {}. Retrying in {} ms",
                          error_code_name(error.code), error.message, delay.count());
        if (wait_) {
            wait_(delay);
        }
    }
}

auto change_detector::next_interval() -> std::chrono::milliseconds {
    auto interval = config_.poll_interval;
    if (config_.poll_jitter > 0.0 && interval.count() > 0) {
        std::uniform_real_distribution<double> dist(0.0, config_.poll_jitter);
        interval += std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(interval.count()) * dist(rng_)));
    }
    return interval;
}

}  // namespace fmri_sync::detect
