/**
 * @file sample_fetcher.cpp
 * @brief Implementation of the sample image fetcher
 */

#include "fmri_sync/transfer/sample_fetcher.hpp"
#include "fmri_sync/remote/exam_path_resolver.hpp"

#include <system_error>

namespace fmri_sync::transfer {

namespace fs = std::filesystem;

sample_fetcher::sample_fetcher(std::shared_ptr<remote::IDirectoryLister> lister,
                               std::shared_ptr<IDirectoryMirror> mirror,
                               std::shared_ptr<di::ILogger> logger)
    : lister_(std::move(lister)),
      mirror_(std::move(mirror)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto sample_fetcher::fetch_sample(const std::string& series_dir,
                                  const fs::path& scratch_dir) -> Result<fs::path> {
    auto image = lister_->list_latest_child(series_dir);
    if (image.is_err()) {
        return Result<fs::path>::err(image.error());
    }

    const auto& image_name = image.value();
    if (image_name.empty() || image_name.front() != 'i') {
        return fmri_sync_error<fs::path>(
            error_codes::naming_convention_error,
            "Images not found in " + series_dir,
            "newest entry '" + image_name + "' does not start with 'i'");
    }

    const auto source = remote::join_path(series_dir, image_name);
    auto copied = mirror_->fetch(source, scratch_dir);
    if (copied.is_err()) {
        logger_->error_fmt("Copy of sample {} failed: {}", source, copied.error().message);
        return Result<fs::path>::err(copied.error());
    }

    auto local_path = scratch_dir / image_name;
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return fmri_sync_error<fs::path>(error_codes::not_found,
                                         "Sample image missing after copy",
                                         local_path.string());
    }

    logger_->info_fmt("Fetched sample {} into {}", source, scratch_dir.string());
    return Result<fs::path>::ok(std::move(local_path));
}

}  // namespace fmri_sync::transfer
