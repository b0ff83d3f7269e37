/**
 * @file cancellation_handler.cpp
 * @brief Implementation of the transfer loop cancellation handler
 */

#include "fmri_sync/app/cancellation_handler.hpp"
#include "fmri_sync/classify/sample_metadata.hpp"

#include <atomic>
#include <ostream>
#include <string>
#include <system_error>

namespace fmri_sync::app {

namespace fs = std::filesystem;

namespace {

/// Only state shared with the signal handler
std::atomic<bool> g_stop_requested{false};

extern "C" void on_stop_signal(int /*signal*/) {
    g_stop_requested.store(true);
}

}  // namespace

auto find_sample_image(const fs::path& dir) -> std::optional<fs::path> {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::nullopt;
    }

    std::optional<fs::path> first;
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        const auto name = it->path().filename().string();
        std::error_code status_ec;
        if (name.empty() || name.front() != 'i' || !it->is_regular_file(status_ec)) {
            continue;
        }
        if (!first || name < first->filename().string()) {
            first = it->path();
        }
    }
    return first;
}

cancellation_handler::cancellation_handler(fs::path destination_dir,
                                           std::shared_ptr<core::IHeaderReader> reader,
                                           std::ostream& out,
                                           std::shared_ptr<di::ILogger> logger)
    : destination_dir_(std::move(destination_dir)),
      reader_(std::move(reader)),
      out_(out),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

cancellation_handler::~cancellation_handler() {
    if (installed_) {
        std::signal(SIGINT, previous_sigint_);
        std::signal(SIGTERM, previous_sigterm_);
    }
}

void cancellation_handler::install() {
    if (installed_) {
        return;
    }
    previous_sigint_ = std::signal(SIGINT, on_stop_signal);
    previous_sigterm_ = std::signal(SIGTERM, on_stop_signal);
    if (previous_sigint_ == SIG_ERR) {
        previous_sigint_ = SIG_DFL;
    }
    if (previous_sigterm_ == SIG_ERR) {
        previous_sigterm_ = SIG_DFL;
    }
    installed_ = true;
    logger_->debug("Stop handler installed for SIGINT and SIGTERM");
}

auto cancellation_handler::stop_requested() noexcept -> bool {
    return g_stop_requested.load();
}

void cancellation_handler::request_stop() noexcept {
    g_stop_requested.store(true);
}

void cancellation_handler::reset() noexcept {
    g_stop_requested.store(false);
}

auto cancellation_handler::report() -> int {
    out_ << "Process intentionally STOPPED. (Ctrl-C)\n";

    const auto sample = find_sample_image(destination_dir_);
    if (!sample) {
        out_ << "No DICOM file found in: " << destination_dir_.string() << "\n";
        logger_->warn_fmt("Stopped with an empty destination: {}", destination_dir_.string());
        out_ << "Quitting!\n";
        return 0;
    }

    auto meta = classify::read_sample_metadata(*sample, *reader_);
    if (meta.is_err()) {
        out_ << "Could not read study information from " << sample->string() << ": "
             << meta.error().message << "\n";
        logger_->error_fmt("Cannot read {}: {}", sample->string(), meta.error().message);
    } else {
        out_ << "Series transferred:\n" << classify::format_study_summary(meta.value());
    }

    out_ << "Quitting!\n";
    return 0;
}

}  // namespace fmri_sync::app
