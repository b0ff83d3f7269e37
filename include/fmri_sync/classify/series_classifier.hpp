/**
 * @file series_classifier.hpp
 * @brief Decides whether a newly started series should be mirrored
 */

#pragma once

#include "fmri_sync/classify/sample_metadata.hpp"
#include "fmri_sync/core/header_reader.hpp"
#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/transfer/sample_fetcher.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fmri_sync::classify {

/**
 * @brief Verdict for one series with the metadata it is based on
 */
struct series_classification {
    bool is_functional = false;
    sample_metadata metadata;
};

/**
 * @brief Abstract series classifier
 */
class ISeriesClassifier {
public:
    virtual ~ISeriesClassifier() = default;

    [[nodiscard]] virtual auto classify(const std::string& series_dir)
        -> Result<series_classification> = 0;
};

/**
 * @brief Classifies a series by fetching and reading one of its images
 */
class sample_series_classifier final : public ISeriesClassifier {
public:
    sample_series_classifier(std::shared_ptr<transfer::sample_fetcher> fetcher,
                             std::shared_ptr<core::IHeaderReader> reader,
                             std::filesystem::path scratch_dir,
                             std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto classify(const std::string& series_dir)
        -> Result<series_classification> override;

private:
    std::shared_ptr<transfer::sample_fetcher> fetcher_;
    std::shared_ptr<core::IHeaderReader> reader_;
    std::filesystem::path scratch_dir_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::classify
