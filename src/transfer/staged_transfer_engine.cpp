/**
 * @file staged_transfer_engine.cpp
 * @brief Implementation of the staged transfer loop
 */

#include "fmri_sync/transfer/staged_transfer_engine.hpp"
#include "fmri_sync/integration/logger_adapter.hpp"

namespace fmri_sync::transfer {

using integration::logger_adapter;
using integration::session_event;

staged_transfer_engine::staged_transfer_engine(std::shared_ptr<IDirectoryMirror> mirror,
                                               transfer_job job,
                                               engine_config config,
                                               core::sleeper wait,
                                               std::shared_ptr<di::ILogger> logger)
    : mirror_(std::move(mirror)),
      job_(std::move(job)),
      config_(config),
      wait_(std::move(wait)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto staged_transfer_engine::run_once() -> Result<mirror_report> {
    ++summary_.iterations;
    logger_->trace_fmt("iter: {}", summary_.iterations);

    auto report = mirror_->mirror(job_);
    if (report.is_err()) {
        ++summary_.failed_iterations;
        return report;
    }

    summary_.files_transferred += report.value().files_transferred;
    if (report.value().files_transferred > 0) {
        logger_->info_fmt("Transferred {} new file(s) into {}",
                          report.value().files_transferred,
                          job_.destination_dir.string());
    }
    return report;
}

void staged_transfer_engine::log_failure(const std::string& message) const {
    logger_adapter::log_session_event(
        session_event::transfer_failed, job_.source_dir,
        {{"error", message},
         {"files_transferred", std::to_string(summary_.files_transferred)}});
}

auto staged_transfer_engine::run(const std::function<bool()>& stop_requested)
    -> Result<transfer_summary> {
    auto stopping = [&stop_requested]() { return stop_requested && stop_requested(); };

    core::retry_policy backoff(config_.retry, logger_);
    std::size_t consecutive_failures = 0;

    logger_adapter::log_session_event(
        session_event::transfer_started, job_.source_dir,
        {{"destination", job_.destination_dir.string()},
         {"staging", job_.staging_dir.string()}});

    while (!stopping()) {
        auto pass = run_once();
        if (pass.is_ok()) {
            consecutive_failures = 0;
            if (wait_) {
                wait_(config_.iteration_delay);
            }
            continue;
        }

        if (stopping()) {
            --summary_.failed_iterations;
            logger_->debug("Pass interrupted by stop request");
            break;
        }

        const auto& error = pass.error();
        if (!core::retry_policy::is_retryable(error.code)) {
            logger_->error_fmt("rsync of {} cannot be retried: {}", job_.source_dir,
                               error.message);
            log_failure(error.message);
            return Result<transfer_summary>::err(error);
        }

        ++consecutive_failures;
        if (consecutive_failures >= config_.retry.max_attempts) {
            logger_->error_fmt("rsync of {} failed {} times in a row: {}",
                               job_.source_dir, consecutive_failures, error.message);
            log_failure(error.message);
            return fmri_sync_error<transfer_summary>(
                error_codes::retry_exhausted,
                "Transfer failed " + std::to_string(consecutive_failures) +
                    " times in a row",
                error.message);
        }

        const auto delay = backoff.delay_for(consecutive_failures);
        logger_->warn_fmt("Transfer pass failed ({}): {}. Retrying in {} ms",
                          error_code_name(error.code), error.message, delay.count());
        if (!core::wait_unless_stopped(wait_, delay, config_.stop_check_interval, stopping)) {
            logger_->debug("Backoff cut short by stop request");
        }
    }

    logger_adapter::log_session_event(
        session_event::transfer_stopped, job_.source_dir,
        {{"iterations", std::to_string(summary_.iterations)},
         {"files_transferred", std::to_string(summary_.files_transferred)}});
    return Result<transfer_summary>::ok(summary_);
}

}  // namespace fmri_sync::transfer
