/**
 * @file rsync_mirror.cpp
 * @brief Implementation of the rsync based mirror
 */

#include "fmri_sync/transfer/rsync_mirror.hpp"
#include "fmri_sync/remote/exam_path_resolver.hpp"


namespace fmri_sync::transfer {

rsync_mirror::rsync_mirror(std::shared_ptr<remote::ICommandExecutor> executor,
                           std::string rsync_program,
                           remote::remote_identity identity,
                           bool verbose,
                           std::shared_ptr<di::ILogger> logger)
    : executor_(std::move(executor)),
      rsync_program_(std::move(rsync_program)),
      identity_(std::move(identity)),
      verbose_(verbose),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto rsync_mirror::count_transferred(std::string_view stdout_text) -> std::size_t {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < stdout_text.size()) {
        auto end = stdout_text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = stdout_text.size();
        }
        const auto line = stdout_text.substr(pos, end - pos);
        if (line.substr(0, transfer_marker.size()) == transfer_marker) {
            ++count;
        }
        pos = end + 1;
    }
    return count;
}

auto rsync_mirror::run_rsync(const remote::rsync_options& options,
                             const std::string& source,
                             const std::string& destination) -> Result<mirror_report> {
    const auto cmd = remote::make_rsync_command(rsync_program_, options, source, destination);
    logger_->debug_fmt("rsync cmd: {}", cmd.to_display_string());

    auto run_result = executor_->run(cmd);
    if (run_result.is_err()) {
        return Result<mirror_report>::err(run_result.error());
    }

    const auto& output = run_result.value();
    if (!output.succeeded()) {
        return fmri_sync_error<mirror_report>(
            error_codes::transfer_failed,
            "rsync of " + source + " failed with status " +
                std::to_string(output.exit_status),
            output.stderr_text);
    }

    mirror_report report;
    report.files_transferred = count_transferred(output.stdout_text);
    return Result<mirror_report>::ok(report);
}

auto rsync_mirror::mirror(const transfer_job& job) -> Result<mirror_report> {
    remote::rsync_options options;
    options.verbose = verbose_;
    options.ignore_existing = job.skip_existing;
    options.temp_dir = job.staging_dir.string();
    options.out_format = std::string(transfer_marker) + "%n";

    // The remote shell expands the glob to the files of the series
    const auto source = identity_.qualify(remote::join_path(job.source_dir, "*"));
    const auto destination = job.destination_dir.string() + "/";

    return run_rsync(options, source, destination);
}

auto rsync_mirror::fetch(const std::string& source_file,
                         const std::filesystem::path& local_dir) -> Result<mirror_report> {
    remote::rsync_options options;
    options.verbose = verbose_;
    options.out_format = std::string(transfer_marker) + "%n";

    auto report = run_rsync(options, identity_.qualify(source_file),
                            local_dir.string() + "/");
    if (report.is_ok() && report.value().files_transferred == 0) {
        auto skipped = report.value();
        skipped.files_skipped = 1;
        return Result<mirror_report>::ok(skipped);
    }
    return report;
}

}  // namespace fmri_sync::transfer
