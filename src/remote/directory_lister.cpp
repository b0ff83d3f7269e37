/**
 * @file directory_lister.cpp
 * @brief Implementation of the ssh and local directory listers
 */

#include "fmri_sync/remote/directory_lister.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fmri_sync::remote {

namespace fs = std::filesystem;

auto clean_listing_name(std::string_view raw) -> std::string {
    auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };

    while (!raw.empty() && is_space(raw.front())) {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && is_space(raw.back())) {
        raw.remove_suffix(1);
    }
    if (!raw.empty() && (raw.back() == '*' || raw.back() == '/' || raw.back() == '@')) {
        raw.remove_suffix(1);
    }
    return std::string(raw);
}

// =============================================================================
// ssh_directory_lister
// =============================================================================

ssh_directory_lister::ssh_directory_lister(std::shared_ptr<ICommandExecutor> executor,
                                           std::string ssh_program,
                                           remote_identity identity,
                                           std::shared_ptr<di::ILogger> logger)
    : executor_(std::move(executor)),
      ssh_program_(std::move(ssh_program)),
      identity_(std::move(identity)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto ssh_directory_lister::list_latest_child(const std::string& dir)
    -> Result<std::string> {
    if (dir.empty()) {
        return fmri_sync_error<std::string>(error_codes::invalid_argument,
                                            "Empty directory path");
    }

    const auto cmd = make_ssh_command(ssh_program_, identity_, {"ls", "-1rt", dir});
    auto run_result = executor_->run(cmd);
    if (run_result.is_err()) {
        return Result<std::string>::err(run_result.error());
    }

    const auto& output = run_result.value();
    if (!output.succeeded()) {
        return fmri_sync_error<std::string>(
            error_codes::remote_command_failed,
            "Listing of " + dir + " on " + identity_.str() + " failed with status " +
                std::to_string(output.exit_status),
            output.stderr_text);
    }

    // Oldest first, so the newest entry is the last non-empty line
    std::string latest;
    std::istringstream lines(output.stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        auto name = clean_listing_name(line);
        if (!name.empty()) {
            latest = std::move(name);
        }
    }

    if (latest.empty()) {
        return fmri_sync_error<std::string>(error_codes::not_found,
                                            "Directory is empty: " + dir);
    }

    logger_->trace_fmt("latest entry of {}: {}", dir, latest);
    return Result<std::string>::ok(std::move(latest));
}

// =============================================================================
// local_directory_lister
// =============================================================================

local_directory_lister::local_directory_lister(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

auto local_directory_lister::list_latest_child(const std::string& dir)
    -> Result<std::string> {
    if (dir.empty()) {
        return fmri_sync_error<std::string>(error_codes::invalid_argument,
                                            "Empty directory path");
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return fmri_sync_error<std::string>(error_codes::remote_command_failed,
                                            "Cannot list " + dir, ec.message());
    }

    std::string latest;
    fs::file_time_type latest_time{};
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code time_ec;
        const auto mtime = entry.last_write_time(time_ec);
        if (time_ec) {
            continue;
        }

        auto name = entry.path().filename().string();
        if (latest.empty() || mtime > latest_time ||
            (mtime == latest_time && name > latest)) {
            latest = std::move(name);
            latest_time = mtime;
        }
    }

    if (ec) {
        return fmri_sync_error<std::string>(error_codes::remote_command_failed,
                                            "Cannot list " + dir, ec.message());
    }

    if (latest.empty()) {
        return fmri_sync_error<std::string>(error_codes::not_found,
                                            "Directory is empty: " + dir);
    }

    logger_->trace_fmt("latest entry of {}: {}", dir, latest);
    return Result<std::string>::ok(std::move(latest));
}

}  // namespace fmri_sync::remote
