/**
 * @file local_staged_mirror.hpp
 * @brief IDirectoryMirror over a locally mounted image pool
 */

#pragma once

#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/transfer/directory_mirror.hpp"

#include <cstdint>
#include <memory>

namespace fmri_sync::transfer {

/**
 * @brief Staged copy with the same guarantees as the rsync mirror
 *
 * Each new regular file is copied to a unique temporary name inside the
 * staging directory, given the source's permissions and modification time,
 * then renamed into the destination. Symbolic links are never followed.
 * The staging and destination directories must be on the same filesystem;
 * a cross-device rename fails with transfer_failed.
 */
class local_staged_mirror final : public IDirectoryMirror {
public:
    explicit local_staged_mirror(std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto mirror(const transfer_job& job) -> Result<mirror_report> override;

    [[nodiscard]] auto fetch(const std::string& source_file,
                             const std::filesystem::path& local_dir)
        -> Result<mirror_report> override;

private:
    [[nodiscard]] auto stage_and_publish(const std::filesystem::path& source,
                                         const std::filesystem::path& staging_dir,
                                         const std::filesystem::path& target) -> VoidResult;

    [[nodiscard]] auto next_temp_name(const std::filesystem::path& source)
        -> std::filesystem::path;

    std::shared_ptr<di::ILogger> logger_;
    std::uint64_t temp_counter_ = 0;
};

}  // namespace fmri_sync::transfer
