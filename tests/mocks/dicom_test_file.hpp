/**
 * @file dicom_test_file.hpp
 * @brief Byte-level builder for small synthetic DICOM images
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fmri_sync::test {

/**
 * @brief Builds Part 10 or raw datasets element by element
 *
 * Elements must be added in ascending tag order, as in a real file.
 */
class dicom_test_builder {
public:
    enum class layout {
        part10_explicit_le,
        part10_implicit_le,
        part10_explicit_be,
        part10_deflated,
        raw_implicit_le,
        raw_explicit_le
    };

    explicit dicom_test_builder(layout kind = layout::part10_explicit_le) : kind_(kind) {
        explicit_vr_ = kind != layout::part10_implicit_le && kind != layout::raw_implicit_le;
        little_endian_ = kind != layout::part10_explicit_be;
        if (kind == layout::raw_implicit_le || kind == layout::raw_explicit_le) {
            return;
        }
        write_meta();
    }

    /// Add a text element, padded to even length
    auto add_text(uint16_t group, uint16_t element, std::string_view vr, std::string value)
        -> dicom_test_builder& {
        if (value.size() % 2 != 0) {
            value.push_back(vr == "UI" ? '\0' : ' ');
        }
        write_header(group, element, vr, static_cast<uint32_t>(value.size()));
        data_.insert(data_.end(), value.begin(), value.end());
        return *this;
    }

    /// Add an undefined-length sequence holding one undefined-length item
    auto add_undefined_sequence(uint16_t group, uint16_t element) -> dicom_test_builder& {
        write_header(group, element, "SQ", 0xFFFFFFFF);
        write_item_tag(0xE000, 0xFFFFFFFF);
        add_text(0x0008, 0x0100, "SH", "CODE1");
        write_item_tag(0xE00D, 0);
        write_item_tag(0xE0DD, 0);
        return *this;
    }

    /// Add a defined-length sequence holding one defined-length item
    auto add_defined_sequence(uint16_t group, uint16_t element) -> dicom_test_builder& {
        dicom_test_builder inner(kind_ == layout::part10_implicit_le ||
                                         kind_ == layout::raw_implicit_le
                                     ? layout::raw_implicit_le
                                     : layout::raw_explicit_le);
        inner.little_endian_ = little_endian_;
        inner.add_text(0x0008, 0x0104, "LO", "Meaning");
        const auto item = inner.bytes();

        write_header(group, element, "SQ", static_cast<uint32_t>(item.size() + 8));
        write_item_tag(0xE000, static_cast<uint32_t>(item.size()));
        data_.insert(data_.end(), item.begin(), item.end());
        return *this;
    }

    /// Add OW Pixel Data of the given size
    auto add_pixel_data(std::size_t size) -> dicom_test_builder& {
        write_header(0x7FE0, 0x0010, "OW", static_cast<uint32_t>(size));
        data_.insert(data_.end(), size, 0x5A);
        return *this;
    }

    /// Append raw bytes, e.g. to produce a truncated element
    auto add_raw(const std::vector<uint8_t>& bytes) -> dicom_test_builder& {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    /// Header of an element whose value is missing
    auto add_truncated(uint16_t group, uint16_t element, std::string_view vr, uint32_t length)
        -> dicom_test_builder& {
        write_header(group, element, vr, length);
        return *this;
    }

    [[nodiscard]] auto bytes() const -> std::vector<uint8_t> { return data_; }

    auto write(const std::filesystem::path& path) const -> std::filesystem::path {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data_.data()),
                  static_cast<std::streamsize>(data_.size()));
        return path;
    }

private:
    void write_meta() {
        data_.resize(128, 0);
        data_.insert(data_.end(), {'D', 'I', 'C', 'M'});

        std::string ts;
        switch (kind_) {
            case layout::part10_implicit_le: ts = "1.2.840.10008.1.2"; break;
            case layout::part10_explicit_be: ts = "1.2.840.10008.1.2.2"; break;
            case layout::part10_deflated: ts = "1.2.840.10008.1.2.1.99"; break;
            default: ts = "1.2.840.10008.1.2.1"; break;
        }
        if (ts.size() % 2 != 0) {
            ts.push_back('\0');
        }

        // Meta information is always Explicit VR Little Endian
        const bool saved_explicit = explicit_vr_;
        const bool saved_le = little_endian_;
        explicit_vr_ = true;
        little_endian_ = true;

        write_header(0x0002, 0x0000, "UL", 4);
        put_u32(static_cast<uint32_t>(8 + ts.size()));
        write_header(0x0002, 0x0010, "UI", static_cast<uint32_t>(ts.size()));
        data_.insert(data_.end(), ts.begin(), ts.end());

        explicit_vr_ = saved_explicit;
        little_endian_ = saved_le;
    }

    void write_header(uint16_t group, uint16_t element, std::string_view vr, uint32_t length) {
        put_u16(group);
        put_u16(element);
        if (!explicit_vr_) {
            put_u32(length);
            return;
        }
        data_.push_back(static_cast<uint8_t>(vr[0]));
        data_.push_back(static_cast<uint8_t>(vr[1]));
        if (vr == "OB" || vr == "OW" || vr == "SQ" || vr == "UN" || vr == "UT") {
            put_u16(0);
            put_u32(length);
        } else {
            put_u16(static_cast<uint16_t>(length));
        }
    }

    void write_item_tag(uint16_t element, uint32_t length) {
        put_u16(0xFFFE);
        put_u16(element);
        put_u32(length);
    }

    void put_u16(uint16_t v) {
        if (little_endian_) {
            data_.push_back(static_cast<uint8_t>(v & 0xFF));
            data_.push_back(static_cast<uint8_t>(v >> 8));
        } else {
            data_.push_back(static_cast<uint8_t>(v >> 8));
            data_.push_back(static_cast<uint8_t>(v & 0xFF));
        }
    }

    void put_u32(uint32_t v) {
        if (little_endian_) {
            put_u16(static_cast<uint16_t>(v & 0xFFFF));
            put_u16(static_cast<uint16_t>(v >> 16));
        } else {
            put_u16(static_cast<uint16_t>(v >> 16));
            put_u16(static_cast<uint16_t>(v & 0xFFFF));
        }
    }

    layout kind_;
    bool explicit_vr_ = true;
    bool little_endian_ = true;
    std::vector<uint8_t> data_;
};

/**
 * @brief A GE-style image carrying the seven classification fields
 */
inline auto make_series_image(std::string_view description,
                              dicom_test_builder::layout kind =
                                  dicom_test_builder::layout::part10_explicit_le)
    -> dicom_test_builder {
    dicom_test_builder builder(kind);
    builder.add_text(0x0008, 0x0021, "DA", "20240115")
        .add_text(0x0008, 0x0031, "TM", "101500")
        .add_text(0x0008, 0x0060, "CS", "MR")
        .add_text(0x0008, 0x103E, "LO", std::string(description))
        .add_text(0x0010, 0x0010, "PN", "Doe^Jane")
        .add_text(0x0010, 0x0020, "LO", "PAT001")
        .add_text(0x0018, 0x1030, "LO", "BOLD_rest")
        .add_text(0x0020, 0x0010, "SH", "4711")
        .add_pixel_data(64);
    return builder;
}

}  // namespace fmri_sync::test
