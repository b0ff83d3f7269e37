/**
 * @file dicom_tag.hpp
 * @brief (group, element) pair identifying a DICOM data element
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace fmri_sync::core {

/**
 * @brief DICOM tag ordered the way elements appear in a dataset
 *
 * The three-way comparison is on group first, then element, so a
 * header reader can stop as soon as it passes the last tag it wants.
 */
struct dicom_tag {
    uint16_t group = 0;
    uint16_t element = 0;

    constexpr dicom_tag() noexcept = default;
    constexpr dicom_tag(uint16_t g, uint16_t e) noexcept : group(g), element(e) {}

    /// "(GGGG,EEEE)" in upper-case hex
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag&) const noexcept
        -> std::strong_ordering = default;
    [[nodiscard]] constexpr auto operator==(const dicom_tag&) const noexcept -> bool = default;
};

}  // namespace fmri_sync::core
