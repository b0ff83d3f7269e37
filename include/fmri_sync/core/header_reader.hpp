/**
 * @file header_reader.hpp
 * @brief Selective DICOM header reading
 *
 * This file provides the IHeaderReader interface and dicom_header_reader,
 * which walks the top-level elements of a DICOM file and returns the text
 * value of a requested subset of attributes without decoding Pixel Data.
 *
 * Supported layouts:
 * - DICOM Part 10 (128-byte preamble, "DICM", group 0002 meta information)
 * - Raw datasets without preamble, as written by GE consoles; the VR
 *   encoding is detected from the first element
 *
 * @see DICOM PS3.5 Section 7 - Data Set encoding
 * @see DICOM PS3.10 Section 7 - DICOM File Format
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fmri_sync::core {

/// Keyword -> text value of the attributes that were present
using header_values = std::map<std::string, std::string>;

/**
 * @brief Abstract header reader, injectable for tests
 */
class IHeaderReader {
public:
    virtual ~IHeaderReader() = default;

    /**
     * @brief Read selected attributes from one file
     *
     * @param path File to read
     * @param keywords DICOM keywords of the wanted attributes
     * @param stop_before_pixels Stop at (7FE0,0010) without reading it
     * @return Values of the wanted attributes that exist in the file;
     *         absent attributes are simply not in the map
     */
    [[nodiscard]] virtual auto read(const std::filesystem::path& path,
                                    const std::vector<std::string>& keywords,
                                    bool stop_before_pixels)
        -> Result<header_values> = 0;
};

/**
 * @brief Streaming reader for top-level DICOM header elements
 *
 * Sequences are skipped rather than decoded. Reading stops as soon as
 * every wanted attribute has been seen, or at Pixel Data when requested,
 * so the image payload is never loaded.
 *
 * @example
 * @code
 * dicom_header_reader reader;
 * auto values = reader.read("i1234.MRDC.1", {"SeriesDescription"}, true);
 * if (values.is_ok() && values.value().count("SeriesDescription")) {
 *     std::cout << values.value().at("SeriesDescription") << "\n";
 * }
 * @endcode
 */
class dicom_header_reader final : public IHeaderReader {
public:
    explicit dicom_header_reader(std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto read(const std::filesystem::path& path,
                            const std::vector<std::string>& keywords,
                            bool stop_before_pixels)
        -> Result<header_values> override;

private:
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::core
