/**
 * @file exam_path_resolver.hpp
 * @brief Descent of the console's patient/exam/series/image hierarchy
 *
 * GE consoles store images as <root>/p<N>/e<N>/s<N>/i<N>... . The resolver
 * follows the newest entry at every level and checks the exam, series and
 * image prefixes.
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/directory_lister.hpp"

#include <memory>
#include <string>

namespace fmri_sync::remote {

/**
 * @brief Join two console path components with a single '/'
 */
[[nodiscard]] auto join_path(const std::string& parent, const std::string& child)
    -> std::string;

/**
 * @brief Result of a full descent from the image pool root
 */
struct exam_location {
    std::string exam_dir;
    std::string series_dir;
    std::string image_name;

    [[nodiscard]] auto image_path() const -> std::string {
        return join_path(series_dir, image_name);
    }
};

/**
 * @brief The series currently tracked, with the exam it belongs to
 *
 * Replaced as a whole on every change, never edited in place.
 */
struct series_descriptor {
    std::string exam_dir;
    std::string series_dir;

    [[nodiscard]] auto operator==(const series_descriptor& other) const -> bool = default;
};

/**
 * @brief Resolves the newest exam, series and image below a root
 */
class exam_path_resolver {
public:
    explicit exam_path_resolver(std::shared_ptr<IDirectoryLister> lister,
                                std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Follow the newest entry down four levels
     *
     * The patient level is not checked; exam, series and image names must
     * start with 'e', 's' and 'i', otherwise naming_convention_error.
     */
    [[nodiscard]] auto locate_latest(const std::string& root) -> Result<exam_location>;

    /**
     * @brief Newest series directory of a known exam
     */
    [[nodiscard]] auto locate_latest_series(const std::string& exam_dir)
        -> Result<std::string>;

private:
    [[nodiscard]] auto latest_with_prefix(const std::string& dir, char prefix,
                                          const char* level) -> Result<std::string>;

    std::shared_ptr<IDirectoryLister> lister_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::remote
