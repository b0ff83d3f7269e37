/**
 * @file exam_path_resolver.cpp
 * @brief Implementation of the console hierarchy descent
 */

#include "fmri_sync/remote/exam_path_resolver.hpp"

namespace fmri_sync::remote {

auto join_path(const std::string& parent, const std::string& child) -> std::string {
    if (parent.empty()) {
        return child;
    }
    if (parent.back() == '/') {
        return parent + child;
    }
    return parent + "/" + child;
}

exam_path_resolver::exam_path_resolver(std::shared_ptr<IDirectoryLister> lister,
                                       std::shared_ptr<di::ILogger> logger)
    : lister_(std::move(lister)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto exam_path_resolver::latest_with_prefix(const std::string& dir, char prefix,
                                            const char* level) -> Result<std::string> {
    auto name = lister_->list_latest_child(dir);
    if (name.is_err()) {
        return name;
    }

    if (name.value().empty() || name.value().front() != prefix) {
        return fmri_sync_error<std::string>(
            error_codes::naming_convention_error,
            std::string(level) + " not found in " + dir,
            "newest entry '" + name.value() + "' does not start with '" +
                std::string(1, prefix) + "'");
    }

    return Result<std::string>::ok(join_path(dir, name.value()));
}

auto exam_path_resolver::locate_latest(const std::string& root) -> Result<exam_location> {
    auto patient = lister_->list_latest_child(root);
    if (patient.is_err()) {
        return Result<exam_location>::err(patient.error());
    }
    const auto patient_dir = join_path(root, patient.value());

    auto exam_dir = latest_with_prefix(patient_dir, 'e', "Exam");
    if (exam_dir.is_err()) {
        return Result<exam_location>::err(exam_dir.error());
    }

    auto series_dir = latest_with_prefix(exam_dir.value(), 's', "Series");
    if (series_dir.is_err()) {
        return Result<exam_location>::err(series_dir.error());
    }

    auto image = lister_->list_latest_child(series_dir.value());
    if (image.is_err()) {
        return Result<exam_location>::err(image.error());
    }
    if (image.value().empty() || image.value().front() != 'i') {
        return fmri_sync_error<exam_location>(
            error_codes::naming_convention_error,
            "Images not found in " + series_dir.value(),
            "newest entry '" + image.value() + "' does not start with 'i'");
    }

    exam_location location{exam_dir.value(), series_dir.value(), image.value()};
    logger_->debug_fmt("Latest image: {}", location.image_path());
    return Result<exam_location>::ok(std::move(location));
}

auto exam_path_resolver::locate_latest_series(const std::string& exam_dir)
    -> Result<std::string> {
    return latest_with_prefix(exam_dir, 's', "Series");
}

}  // namespace fmri_sync::remote
