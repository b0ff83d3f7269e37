/**
 * @file series_classifier.cpp
 * @brief Implementation of the sample based series classifier
 */

#include "fmri_sync/classify/series_classifier.hpp"

namespace fmri_sync::classify {

sample_series_classifier::sample_series_classifier(
    std::shared_ptr<transfer::sample_fetcher> fetcher,
    std::shared_ptr<core::IHeaderReader> reader,
    std::filesystem::path scratch_dir,
    std::shared_ptr<di::ILogger> logger)
    : fetcher_(std::move(fetcher)),
      reader_(std::move(reader)),
      scratch_dir_(std::move(scratch_dir)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto sample_series_classifier::classify(const std::string& series_dir)
    -> Result<series_classification> {
    auto sample = fetcher_->fetch_sample(series_dir, scratch_dir_);
    if (sample.is_err()) {
        return Result<series_classification>::err(sample.error());
    }

    auto meta = read_sample_metadata(sample.value(), *reader_);
    if (meta.is_err()) {
        return Result<series_classification>::err(meta.error());
    }

    series_classification verdict;
    verdict.metadata = std::move(meta.value());
    verdict.is_functional = is_functional_series(verdict.metadata);

    logger_->info_fmt("Found series: {} ({})", verdict.metadata.series_description,
                      verdict.is_functional ? "fMRI" : "not fMRI");
    return Result<series_classification>::ok(std::move(verdict));
}

}  // namespace fmri_sync::classify
