/**
 * @file sample_fetcher.hpp
 * @brief One-shot copy of the newest image of a series
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/directory_lister.hpp"
#include "fmri_sync/transfer/directory_mirror.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fmri_sync::transfer {

/**
 * @brief Copies one sample image so its header can be classified
 *
 * The copy goes straight into the scratch directory, without staging;
 * an image already present there is reused.
 */
class sample_fetcher {
public:
    sample_fetcher(std::shared_ptr<remote::IDirectoryLister> lister,
                   std::shared_ptr<IDirectoryMirror> mirror,
                   std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Copy the newest 'i' file of a series into a local directory
     * @return Local path of the copied image
     */
    [[nodiscard]] auto fetch_sample(const std::string& series_dir,
                                    const std::filesystem::path& scratch_dir)
        -> Result<std::filesystem::path>;

private:
    std::shared_ptr<remote::IDirectoryLister> lister_;
    std::shared_ptr<IDirectoryMirror> mirror_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::transfer
