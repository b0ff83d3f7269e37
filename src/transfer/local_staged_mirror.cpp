/**
 * @file local_staged_mirror.cpp
 * @brief Implementation of the local staged mirror
 */

#include "fmri_sync/transfer/local_staged_mirror.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <unistd.h>

namespace fmri_sync::transfer {

namespace fs = std::filesystem;

local_staged_mirror::local_staged_mirror(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

auto local_staged_mirror::next_temp_name(const fs::path& source) -> fs::path {
    return "." + source.filename().string() + "." + std::to_string(::getpid()) + "." +
           std::to_string(++temp_counter_) + ".part";
}

auto local_staged_mirror::stage_and_publish(const fs::path& source,
                                            const fs::path& staging_dir,
                                            const fs::path& target) -> VoidResult {
    const auto temp_path = staging_dir / next_temp_name(source);

    auto discard = [&temp_path]() {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
    };

    std::error_code ec;
    fs::copy_file(source, temp_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        discard();
        return fmri_sync_void_error(error_codes::transfer_failed,
                                    "Cannot copy " + source.string() + " to staging",
                                    ec.message());
    }

    const auto perms = fs::status(source, ec).permissions();
    if (!ec) {
        fs::permissions(temp_path, perms, fs::perm_options::replace, ec);
    }
    if (!ec) {
        const auto mtime = fs::last_write_time(source, ec);
        if (!ec) {
            fs::last_write_time(temp_path, mtime, ec);
        }
    }
    if (ec) {
        discard();
        return fmri_sync_void_error(error_codes::transfer_failed,
                                    "Cannot preserve attributes of " + source.string(),
                                    ec.message());
    }

    // rename(2) is atomic within one filesystem and never copies across
    if (std::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int rename_errno = errno;
        discard();
        std::string details = std::strerror(rename_errno);
        if (rename_errno == EXDEV) {
            details = "staging and destination are on different filesystems";
        }
        return fmri_sync_void_error(error_codes::transfer_failed,
                                    "Cannot publish " + target.string(), details);
    }

    return ok();
}

auto local_staged_mirror::mirror(const transfer_job& job) -> Result<mirror_report> {
    std::error_code ec;
    fs::directory_iterator it(job.source_dir, ec);
    if (ec) {
        return fmri_sync_error<mirror_report>(error_codes::transfer_failed,
                                              "Cannot list " + job.source_dir,
                                              ec.message());
    }

    mirror_report report;
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        const auto& entry = *it;

        std::error_code status_ec;
        if (!entry.is_regular_file(status_ec) || entry.is_symlink(status_ec)) {
            continue;
        }

        const auto target = job.destination_dir / entry.path().filename();
        if (job.skip_existing && fs::exists(fs::symlink_status(target, status_ec))) {
            ++report.files_skipped;
            continue;
        }

        FMRI_SYNC_RETURN_IF_ERROR(
            stage_and_publish(entry.path(), job.staging_dir, target));
        ++report.files_transferred;
        logger_->trace_fmt("published {}", target.string());
    }

    if (ec) {
        return fmri_sync_error<mirror_report>(error_codes::transfer_failed,
                                              "Cannot list " + job.source_dir,
                                              ec.message());
    }

    return Result<mirror_report>::ok(report);
}

auto local_staged_mirror::fetch(const std::string& source_file,
                                const fs::path& local_dir) -> Result<mirror_report> {
    std::error_code ec;
    const auto status = fs::symlink_status(source_file, ec);
    if (ec || !fs::is_regular_file(status)) {
        return fmri_sync_error<mirror_report>(error_codes::transfer_failed,
                                              "Not a regular file: " + source_file,
                                              ec ? ec.message() : std::string{});
    }

    const fs::path source{source_file};
    const auto target = local_dir / source.filename();

    mirror_report report;
    if (fs::exists(fs::symlink_status(target, ec))) {
        report.files_skipped = 1;
        return Result<mirror_report>::ok(report);
    }

    fs::copy_file(source, target, fs::copy_options::skip_existing, ec);
    if (ec) {
        return fmri_sync_error<mirror_report>(error_codes::transfer_failed,
                                              "Cannot copy " + source_file,
                                              ec.message());
    }

    const auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(target, mtime, ec);
    }
    if (ec) {
        logger_->warn_fmt("Cannot preserve modification time of {}: {}",
                          target.string(), ec.message());
    }

    report.files_transferred = 1;
    return Result<mirror_report>::ok(report);
}

}  // namespace fmri_sync::transfer
