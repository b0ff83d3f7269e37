/**
 * @file fmri_sync.cpp
 * @brief Mirrors a new fMRI series from the scanner console to FIRMM
 *
 * Start it after the series preceding the fMRI has finished. It records
 * the newest series of the current exam, waits for the operator, then
 * polls the console until a new series whose SeriesDescription starts
 * with "fMRI" or "EPI" appears, and finally mirrors that series into a
 * fresh directory under FIRMM's incoming folder until stopped with Ctrl-C.
 *
 * Usage:
 *   fmri_sync [options]
 *
 * Example:
 *   fmri_sync --host 172.22.13.7 --user sdc --poll-interval 500
 */

#include "fmri_sync/app/cancellation_handler.hpp"
#include "fmri_sync/classify/series_classifier.hpp"
#include "fmri_sync/config/sync_config.hpp"
#include "fmri_sync/core/header_reader.hpp"
#include "fmri_sync/detect/change_detector.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/integration/logger_adapter.hpp"
#include "fmri_sync/remote/directory_lister.hpp"
#include "fmri_sync/remote/exam_path_resolver.hpp"
#include "fmri_sync/remote/process_executor.hpp"
#include "fmri_sync/transfer/local_staged_mirror.hpp"
#include "fmri_sync/transfer/rsync_mirror.hpp"
#include "fmri_sync/transfer/sample_fetcher.hpp"
#include "fmri_sync/transfer/staged_transfer_engine.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#ifndef FMRI_SYNC_VERSION
#define FMRI_SYNC_VERSION "unknown"
#endif

namespace {

using namespace fmri_sync;
using integration::logger_adapter;

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
fmri_sync - real-time fMRI transfer from the scanner console to FIRMM

Usage: )" << program_name << R"( [options]

Console:
  --host <addr>            Console host (default: 172.22.13.7)
  --user <name>            Console login (default: sdc)
  --root <dir>             Image pool root on the console
                           (default: /export/home1/sdc_image_pool/images)
  --local                  Read the image pool from a local mount instead
                           of ssh/rsync

Local directories:
  --staging-dir <dir>      Landing area for partial files (default: ~/temp)
  --incoming-dir <dir>     FIRMM incoming root (default: ~/FIRMM/incoming_DICOM)
  --run-name <name>        Per-run directory (default: firmmsync_<date>_<time>)

Pacing and retries:
  --poll-interval <ms>     Delay between console polls (default: 1000)
  --poll-jitter <frac>     Random extra delay, fraction of the interval (default: 0.1)
  --transfer-delay <ms>    Delay between rsync passes (default: 1)
  --max-attempts <n>       Consecutive failures tolerated (default: 5)
  --timeout <ms>           Kill ssh/rsync after this long, 0 = never (default: 0)

Tools and logging:
  --rsync <path>           rsync binary (default: /usr/bin/rsync)
  --ssh <path>             ssh binary (default: /usr/bin/ssh)
  --log-dir <dir>          Log and audit directory (default: ~/.fmri_sync/logs)
  --log-level <level>      trace, debug, info, warn, error (default: info)
  --config <file>          JSON configuration file
  --no-wait                Start polling without waiting for return
  --quiet                  Less console output
  --version                Show version
  --help                   Show this help message

Environment:
  FMRI_SYNC_HOST, FMRI_SYNC_USER, FMRI_SYNC_ROOT, FMRI_SYNC_STAGING_DIR,
  FMRI_SYNC_INCOMING_DIR, FMRI_SYNC_POLL_INTERVAL_MS, FMRI_SYNC_LOG_DIR

Press Ctrl-C once the fMRI series is complete; the study summary of the
transferred series is printed before exiting.
)";
}

void report_failure(const char* stage, const error_info& error) {
    std::cerr << stage << " failed [" << error_code_name(error.code) << "]: "
              << error.message << "\n";
    if (error.details && !error.details->empty()) {
        std::cerr << "  " << *error.details << "\n";
    }
    logger_adapter::error("{} failed [{}]: {}", stage, error_code_name(error.code),
                          error.message);
}

auto create_directory(const std::filesystem::path& dir) -> bool {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << dir.string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

/**
 * @brief Collaborators shared by the detection and transfer phases
 */
struct session_components {
    std::shared_ptr<remote::IDirectoryLister> lister;
    std::shared_ptr<transfer::IDirectoryMirror> mirror;
    std::shared_ptr<remote::exam_path_resolver> resolver;
    std::shared_ptr<core::IHeaderReader> reader;
    std::shared_ptr<classify::ISeriesClassifier> classifier;
};

auto build_components(const config::sync_config& cfg,
                      const std::shared_ptr<di::ILogger>& logger) -> session_components {
    session_components parts;

    if (cfg.local_mode) {
        parts.lister = std::make_shared<remote::local_directory_lister>(logger);
        parts.mirror = std::make_shared<transfer::local_staged_mirror>(logger);
    } else {
        auto executor = std::make_shared<remote::process_executor>(cfg.command_timeout, logger);
        parts.lister = std::make_shared<remote::ssh_directory_lister>(
            executor, cfg.ssh_program, cfg.identity(), logger);
        parts.mirror = std::make_shared<transfer::rsync_mirror>(
            executor, cfg.rsync_program, cfg.identity(), cfg.verbose, logger);
    }

    parts.resolver = std::make_shared<remote::exam_path_resolver>(parts.lister, logger);
    parts.reader = std::make_shared<core::dicom_header_reader>(logger);

    auto fetcher = std::make_shared<transfer::sample_fetcher>(parts.lister, parts.mirror, logger);
    parts.classifier = std::make_shared<classify::sample_series_classifier>(
        fetcher, parts.reader, cfg.staging_dir, logger);
    return parts;
}

auto run_session(const config::sync_config& cfg) -> int {
    auto logger = std::make_shared<di::LoggerService>();
    const auto destination = cfg.destination_dir();

    if (!create_directory(cfg.staging_dir) || !create_directory(destination)) {
        return 1;
    }

    auto parts = build_components(cfg, logger);

    // Baseline: the newest series before the fMRI starts
    auto baseline = parts.resolver->locate_latest(cfg.image_root);
    if (baseline.is_err()) {
        report_failure("Resolving the latest series", baseline.error());
        return 1;
    }

    const auto& location = baseline.value();
    std::cout << "Latest image:   " << location.image_path() << "\n"
              << "Exam:           " << location.exam_dir << "\n"
              << "Series:         " << location.series_dir << "\n"
              << "Destination:    " << destination.string() << "\n";
    logger_adapter::log_session_event(integration::session_event::baseline_resolved,
                                      location.series_dir,
                                      {{"exam_dir", location.exam_dir},
                                       {"destination", destination.string()}});

    if (cfg.wait_for_operator) {
        std::cout << "Press return to begin polling for new DICOMs..." << std::flush;
        std::string ignored;
        std::getline(std::cin, ignored);
    }

    detect::detector_config detector_cfg;
    detector_cfg.poll_interval = cfg.poll_interval;
    detector_cfg.poll_jitter = cfg.poll_jitter;
    detector_cfg.retry = cfg.retry;

    detect::change_detector detector(
        parts.resolver, parts.classifier,
        remote::series_descriptor{location.exam_dir, location.series_dir},
        detector_cfg, core::thread_sleeper(), logger);

    auto confirmed = detector.run();
    if (confirmed.is_err()) {
        report_failure("Watching for a new fMRI series", confirmed.error());
        return 1;
    }

    const auto& series = confirmed.value();
    std::cout << "Found a new fMRI series: " << series.metadata.series_description << "\n"
              << "Copying files from " << series.series.series_dir << "\n";

    transfer::transfer_job job;
    job.source_dir = series.series.series_dir;
    job.staging_dir = cfg.staging_dir;
    job.destination_dir = destination;
    job.skip_existing = true;

    transfer::engine_config engine_cfg;
    engine_cfg.iteration_delay = cfg.transfer_delay;
    engine_cfg.retry = cfg.retry;

    transfer::staged_transfer_engine engine(parts.mirror, job, engine_cfg,
                                            core::thread_sleeper(), logger);

    app::cancellation_handler handler(destination, parts.reader, std::cout, logger);
    handler.install();

    auto summary = engine.run([] { return app::cancellation_handler::stop_requested(); });
    if (summary.is_err()) {
        report_failure("Transferring the series", summary.error());
        return 1;
    }

    const int status = handler.report();
    std::cout << "Passes: " << summary.value().iterations
              << ", files transferred: " << summary.value().files_transferred << "\n";
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto loaded = config::load_sync_config(args, config::process_environment(),
                                           std::chrono::system_clock::now());
    if (loaded.is_err()) {
        std::cerr << "Error: " << loaded.error().message << "\n";
        if (loaded.error().details && !loaded.error().details->empty()) {
            std::cerr << "  " << *loaded.error().details << "\n";
        }
        print_usage(argv[0]);
        return 1;
    }

    const auto& outcome = loaded.value();
    if (outcome.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (outcome.show_version) {
        std::cout << "fmri_sync " << FMRI_SYNC_VERSION << "\n";
        return 0;
    }

    const auto& cfg = outcome.config;

    integration::logger_config log_cfg;
    log_cfg.log_directory = cfg.log_directory;
    log_cfg.min_level =
        integration::log_level_from_string(cfg.log_level, integration::log_level::info);
    log_cfg.enable_console = cfg.verbose;
    logger_adapter::initialize(log_cfg);

    const int status = run_session(cfg);

    logger_adapter::shutdown();
    return status;
}
