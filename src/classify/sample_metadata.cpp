/**
 * @file sample_metadata.cpp
 * @brief Implementation of sample metadata reading and classification
 */

#include "fmri_sync/classify/sample_metadata.hpp"

#include <vector>

namespace fmri_sync::classify {

namespace {

constexpr std::array<std::string_view, 2> functional_prefixes = {"fMRI", "EPI"};

auto value_or_missing(const core::header_values& values, std::string_view keyword)
    -> std::string {
    const auto it = values.find(std::string(keyword));
    if (it == values.end()) {
        return std::string(missing_value);
    }
    return it->second;
}

}  // namespace

auto sample_metadata::to_map() const -> std::map<std::string, std::string> {
    return {
        {"StudyID", study_id},
        {"PatientID", patient_id},
        {"PatientName", patient_name},
        {"ProtocolName", protocol_name},
        {"SeriesDescription", series_description},
        {"SeriesDate", series_date},
        {"SeriesTime", series_time},
    };
}

auto sample_metadata::audit_fields() const -> std::map<std::string, std::string> {
    auto fields = to_map();
    fields.erase("PatientName");
    return fields;
}

auto read_sample_metadata(const std::filesystem::path& path, core::IHeaderReader& reader)
    -> Result<sample_metadata> {
    const std::vector<std::string> wanted(sample_metadata::keywords.begin(),
                                          sample_metadata::keywords.end());

    auto values = reader.read(path, wanted, true);
    if (values.is_err()) {
        return Result<sample_metadata>::err(values.error());
    }

    const auto& v = values.value();
    sample_metadata meta;
    meta.study_id = value_or_missing(v, "StudyID");
    meta.patient_id = value_or_missing(v, "PatientID");
    meta.patient_name = value_or_missing(v, "PatientName");
    meta.protocol_name = value_or_missing(v, "ProtocolName");
    meta.series_description = value_or_missing(v, "SeriesDescription");
    meta.series_date = value_or_missing(v, "SeriesDate");
    meta.series_time = value_or_missing(v, "SeriesTime");
    return Result<sample_metadata>::ok(std::move(meta));
}

auto is_functional_series(const sample_metadata& meta) -> bool {
    const std::string_view description = meta.series_description;
    for (const auto prefix : functional_prefixes) {
        if (description.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }
    return false;
}

auto format_study_summary(const sample_metadata& meta) -> std::string {
    std::string summary;
    summary += "Study ID: " + meta.study_id + "\n";
    summary += "Patient ID: " + meta.patient_id + "\n";
    summary += "Series Description: " + meta.series_description + "\n";
    summary += "Series Date: " + meta.series_date + "\n";
    summary += "Series Time: " + meta.series_time + "\n";
    summary += "Protocol: " + meta.protocol_name + "\n";
    return summary;
}

}  // namespace fmri_sync::classify
