/**
 * @file rsync_mirror.hpp
 * @brief IDirectoryMirror backed by rsync over ssh
 */

#pragma once

#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/command_line.hpp"
#include "fmri_sync/remote/process_executor.hpp"
#include "fmri_sync/transfer/directory_mirror.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace fmri_sync::transfer {

/**
 * @brief Mirrors a console series with "rsync -ptg --ignore-existing --temp-dir"
 *
 * rsync writes partial files into the staging directory and renames them
 * into the destination once complete. Transferred files are counted from
 * --out-format marker lines.
 */
class rsync_mirror final : public IDirectoryMirror {
public:
    /// Prefix of the per-file lines requested with --out-format
    static constexpr std::string_view transfer_marker = ">>fmri_sync:";

    rsync_mirror(std::shared_ptr<remote::ICommandExecutor> executor,
                 std::string rsync_program,
                 remote::remote_identity identity,
                 bool verbose = true,
                 std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto mirror(const transfer_job& job) -> Result<mirror_report> override;

    [[nodiscard]] auto fetch(const std::string& source_file,
                             const std::filesystem::path& local_dir)
        -> Result<mirror_report> override;

    /**
     * @brief Count the marker lines in rsync's stdout
     */
    [[nodiscard]] static auto count_transferred(std::string_view stdout_text) -> std::size_t;

private:
    [[nodiscard]] auto run_rsync(const remote::rsync_options& options,
                                 const std::string& source,
                                 const std::string& destination) -> Result<mirror_report>;

    std::shared_ptr<remote::ICommandExecutor> executor_;
    std::string rsync_program_;
    remote::remote_identity identity_;
    bool verbose_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::transfer
