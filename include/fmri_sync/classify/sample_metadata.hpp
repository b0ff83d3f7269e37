/**
 * @file sample_metadata.hpp
 * @brief The seven header fields read from one sample image
 */

#pragma once

#include "fmri_sync/core/header_reader.hpp"
#include "fmri_sync/core/result.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace fmri_sync::classify {

/// Value stored for an attribute that the image does not carry
inline constexpr std::string_view missing_value = "null";

/**
 * @brief Study and series identification of one image
 *
 * Every field is always set; absent attributes hold missing_value.
 */
struct sample_metadata {
    std::string study_id{missing_value};
    std::string patient_id{missing_value};
    std::string patient_name{missing_value};
    std::string protocol_name{missing_value};
    std::string series_description{missing_value};
    std::string series_date{missing_value};
    std::string series_time{missing_value};

    /// DICOM keywords of the fields, in declaration order
    static constexpr std::array<std::string_view, 7> keywords = {
        "StudyID", "PatientID", "PatientName", "ProtocolName",
        "SeriesDescription", "SeriesDate", "SeriesTime"};

    /**
     * @brief Keyword -> value view of all seven fields
     */
    [[nodiscard]] auto to_map() const -> std::map<std::string, std::string>;

    /**
     * @brief to_map() without PatientName, for the audit trail
     */
    [[nodiscard]] auto audit_fields() const -> std::map<std::string, std::string>;
};

/**
 * @brief Read the seven fields from one image without touching Pixel Data
 *
 * Missing attributes never cause an error; only an unreadable or
 * non-DICOM file does.
 */
[[nodiscard]] auto read_sample_metadata(const std::filesystem::path& path,
                                        core::IHeaderReader& reader)
    -> Result<sample_metadata>;

/**
 * @brief Whether a series is a functional acquisition
 *
 * True when SeriesDescription starts with "fMRI" or "EPI" (case-sensitive).
 */
[[nodiscard]] auto is_functional_series(const sample_metadata& meta) -> bool;

/**
 * @brief Multi-line operator summary; PatientName is never included
 */
[[nodiscard]] auto format_study_summary(const sample_metadata& meta) -> std::string;

}  // namespace fmri_sync::classify
