/**
 * @file dicom_tag.cpp
 * @brief Tag formatting and keyword lookup
 */

#include "fmri_sync/core/dicom_tag.hpp"
#include "fmri_sync/core/dicom_tag_constants.hpp"
#include "fmri_sync/compat/format.hpp"

#include <array>

namespace fmri_sync::core {

namespace {

struct keyword_entry {
    std::string_view keyword;
    dicom_tag tag;
};

constexpr std::array<keyword_entry, 8> keyword_table = {{
    {"SeriesDate", tags::series_date},
    {"SeriesTime", tags::series_time},
    {"SeriesDescription", tags::series_description},
    {"PatientName", tags::patient_name},
    {"PatientID", tags::patient_id},
    {"ProtocolName", tags::protocol_name},
    {"SeriesInstanceUID", tags::series_instance_uid},
    {"StudyID", tags::study_id},
}};

}  // namespace

auto dicom_tag::to_string() const -> std::string {
    return compat::format("({:04X},{:04X})", group, element);
}

auto find_tag_by_keyword(std::string_view keyword) -> std::optional<dicom_tag> {
    for (const auto& entry : keyword_table) {
        if (entry.keyword == keyword) {
            return entry.tag;
        }
    }
    return std::nullopt;
}

}  // namespace fmri_sync::core
