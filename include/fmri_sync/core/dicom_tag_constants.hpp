/**
 * @file dicom_tag_constants.hpp
 * @brief The tags fmri_sync reads and the keyword table over them
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"

#include <optional>
#include <string_view>

namespace fmri_sync::core::tags {

// File meta
inline constexpr dicom_tag file_meta_information_group_length{0x0002, 0x0000};
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};

// Study and series identification, in dataset order
inline constexpr dicom_tag series_date{0x0008, 0x0021};
inline constexpr dicom_tag series_time{0x0008, 0x0031};
inline constexpr dicom_tag series_description{0x0008, 0x103E};
inline constexpr dicom_tag patient_name{0x0010, 0x0010};
inline constexpr dicom_tag patient_id{0x0010, 0x0020};
inline constexpr dicom_tag protocol_name{0x0018, 0x1030};
inline constexpr dicom_tag series_instance_uid{0x0020, 0x000E};
inline constexpr dicom_tag study_id{0x0020, 0x0010};

// Reading stops here when pixels are not wanted
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

// Sequence framing (always implicit VR)
inline constexpr dicom_tag item{0xFFFE, 0xE000};
inline constexpr dicom_tag item_delimitation_item{0xFFFE, 0xE00D};
inline constexpr dicom_tag sequence_delimitation_item{0xFFFE, 0xE0DD};

}  // namespace fmri_sync::core::tags

namespace fmri_sync::core {

/**
 * @brief Look up a tag by its DICOM keyword (e.g. "SeriesDescription")
 * @return The tag, or nullopt for keywords outside the table above
 */
[[nodiscard]] auto find_tag_by_keyword(std::string_view keyword)
    -> std::optional<dicom_tag>;

}  // namespace fmri_sync::core
