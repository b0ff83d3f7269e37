/**
 * @file directory_mirror.hpp
 * @brief Incremental, staged copy of a series directory
 */

#pragma once

#include "fmri_sync/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace fmri_sync::transfer {

/**
 * @brief What to mirror, created once the series is confirmed
 */
struct transfer_job {
    /// Series directory on the console (or the local mount)
    std::string source_dir;

    /// Landing area for in-flight files
    std::filesystem::path staging_dir;

    /// Directory watched by the downstream consumer
    std::filesystem::path destination_dir;

    /// Leave files that already exist in the destination untouched
    bool skip_existing = true;
};

/**
 * @brief Counters for one mirror or fetch pass
 */
struct mirror_report {
    std::size_t files_transferred = 0;
    std::size_t files_skipped = 0;
};

/**
 * @brief Abstract directory mirroring primitive
 */
class IDirectoryMirror {
public:
    virtual ~IDirectoryMirror() = default;

    /**
     * @brief Copy every new regular file of job.source_dir
     *
     * Files become visible in the destination only once complete; files
     * already present are skipped.
     */
    [[nodiscard]] virtual auto mirror(const transfer_job& job) -> Result<mirror_report> = 0;

    /**
     * @brief Copy one file into a local directory, skipping it if present
     */
    [[nodiscard]] virtual auto fetch(const std::string& source_file,
                                     const std::filesystem::path& local_dir)
        -> Result<mirror_report> = 0;
};

}  // namespace fmri_sync::transfer
