/**
 * @file header_reader.cpp
 * @brief Implementation of the streaming DICOM header reader
 */

#include "fmri_sync/core/header_reader.hpp"
#include "fmri_sync/core/dicom_tag_constants.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <optional>
#include <string_view>
#include <system_error>

namespace fmri_sync::core {

namespace {

constexpr uint32_t undefined_length = 0xFFFFFFFF;
constexpr std::size_t preamble_size = 128;
constexpr int max_sequence_depth = 32;

constexpr std::string_view implicit_vr_little_endian = "1.2.840.10008.1.2";
constexpr std::string_view explicit_vr_little_endian = "1.2.840.10008.1.2.1";
constexpr std::string_view deflated_explicit_vr_little_endian = "1.2.840.10008.1.2.1.99";
constexpr std::string_view explicit_vr_big_endian = "1.2.840.10008.1.2.2";

/**
 * @brief Value Representation encoding of a dataset
 */
struct dataset_encoding {
    bool explicit_vr{true};
    bool little_endian{true};
};

constexpr std::array<std::string_view, 34> known_vrs = {
    "AE", "AS", "AT", "CS", "DA", "DS", "DT", "FD", "FL", "IS", "LO", "LT",
    "OB", "OD", "OF", "OL", "OV", "OW", "PN", "SH", "SL", "SQ", "SS", "ST",
    "SV", "TM", "UC", "UI", "UL", "UN", "UR", "US", "UT", "UV"};

/// VRs whose explicit encoding has 2 reserved bytes and a 32-bit length
constexpr std::array<std::string_view, 13> long_length_vrs = {
    "OB", "OD", "OF", "OL", "OV", "OW", "SQ", "SV", "UC", "UN", "UR", "UT", "UV"};

[[nodiscard]] auto is_known_vr(std::string_view vr) noexcept -> bool {
    for (const auto candidate : known_vrs) {
        if (candidate == vr) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] auto has_explicit_32bit_length(std::string_view vr) noexcept -> bool {
    for (const auto candidate : long_length_vrs) {
        if (candidate == vr) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Strip DICOM value padding (trailing spaces and NULs)
 */
[[nodiscard]] auto trim_padding(std::string value) -> std::string {
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    return value;
}

/**
 * @brief Bounds-checked forward reader over an open file
 */
class element_stream {
public:
    element_stream(std::ifstream& in, uint64_t size) : in_(in), size_(size) {}

    [[nodiscard]] auto position() -> uint64_t {
        return static_cast<uint64_t>(in_.tellg());
    }

    [[nodiscard]] auto remaining() -> uint64_t {
        const auto pos = position();
        return pos >= size_ ? 0 : size_ - pos;
    }

    [[nodiscard]] auto seek(uint64_t offset) -> bool {
        if (offset > size_) {
            return false;
        }
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        return static_cast<bool>(in_);
    }

    [[nodiscard]] auto skip(uint64_t count) -> bool {
        if (count > remaining()) {
            return false;
        }
        return seek(position() + count);
    }

    [[nodiscard]] auto read_bytes(char* out, std::size_t count) -> bool {
        if (count > remaining()) {
            return false;
        }
        in_.read(out, static_cast<std::streamsize>(count));
        return static_cast<bool>(in_);
    }

    [[nodiscard]] auto read_u16(bool little_endian) -> std::optional<uint16_t> {
        std::array<unsigned char, 2> b{};
        if (!read_bytes(reinterpret_cast<char*>(b.data()), b.size())) {
            return std::nullopt;
        }
        if (little_endian) {
            return static_cast<uint16_t>(b[0] | (b[1] << 8));
        }
        return static_cast<uint16_t>((b[0] << 8) | b[1]);
    }

    [[nodiscard]] auto read_u32(bool little_endian) -> std::optional<uint32_t> {
        std::array<unsigned char, 4> b{};
        if (!read_bytes(reinterpret_cast<char*>(b.data()), b.size())) {
            return std::nullopt;
        }
        if (little_endian) {
            return static_cast<uint32_t>(b[0]) |
                   (static_cast<uint32_t>(b[1]) << 8) |
                   (static_cast<uint32_t>(b[2]) << 16) |
                   (static_cast<uint32_t>(b[3]) << 24);
        }
        return (static_cast<uint32_t>(b[0]) << 24) |
               (static_cast<uint32_t>(b[1]) << 16) |
               (static_cast<uint32_t>(b[2]) << 8) |
               static_cast<uint32_t>(b[3]);
    }

private:
    std::ifstream& in_;
    uint64_t size_;
};

/**
 * @brief Tag, VR and length of one encoded element
 */
struct element_header {
    dicom_tag tag;
    std::string vr;  ///< Empty for implicit VR and item/delimiter tags
    uint32_t length{0};
};

[[nodiscard]] auto truncated(std::string_view what) -> Result<element_header> {
    return fmri_sync_error<element_header>(
        error_codes::decode_error,
        "Unexpected end of data while reading " + std::string(what));
}

[[nodiscard]] auto read_element_header(element_stream& stream,
                                       const dataset_encoding& encoding)
    -> Result<element_header> {
    const auto group = stream.read_u16(encoding.little_endian);
    const auto element = stream.read_u16(encoding.little_endian);
    if (!group || !element) {
        return truncated("tag");
    }

    element_header header;
    header.tag = dicom_tag{*group, *element};

    // Items and delimiters never carry a VR
    if (*group == tags::item.group || !encoding.explicit_vr) {
        const auto length = stream.read_u32(encoding.little_endian);
        if (!length) {
            return truncated("length field");
        }
        header.length = *length;
        return Result<element_header>::ok(std::move(header));
    }

    char vr_chars[2] = {0, 0};
    if (!stream.read_bytes(vr_chars, 2)) {
        return truncated("VR");
    }
    header.vr.assign(vr_chars, 2);
    if (!is_known_vr(header.vr)) {
        return fmri_sync_error<element_header>(
            error_codes::decode_error,
            "Invalid VR '" + header.vr + "' at " + header.tag.to_string());
    }

    if (has_explicit_32bit_length(header.vr)) {
        const auto length = stream.skip(2) ? stream.read_u32(encoding.little_endian)
                                           : std::nullopt;
        if (!length) {
            return truncated("length field");
        }
        header.length = *length;
    } else {
        const auto length = stream.read_u16(encoding.little_endian);
        if (!length) {
            return truncated("length field");
        }
        header.length = *length;
    }

    return Result<element_header>::ok(std::move(header));
}

auto skip_undefined_length_item(element_stream& stream,
                                const dataset_encoding& encoding,
                                int depth) -> VoidResult;

/**
 * @brief Skip the items of an undefined-length sequence up to its delimiter
 */
auto skip_undefined_length_sequence(element_stream& stream,
                                    const dataset_encoding& encoding,
                                    int depth) -> VoidResult {
    if (depth > max_sequence_depth) {
        return fmri_sync_void_error(error_codes::decode_error,
                                    "Sequence nesting too deep");
    }

    while (true) {
        auto header = read_element_header(stream, encoding);
        if (header.is_err()) {
            return VoidResult(header.error());
        }
        const auto& item = header.value();

        if (item.tag == tags::sequence_delimitation_item) {
            return ok();
        }

        if (item.tag != tags::item) {
            return fmri_sync_void_error(
                error_codes::decode_error,
                "Expected Item tag in sequence, found " + item.tag.to_string());
        }

        if (item.length == undefined_length) {
            FMRI_SYNC_RETURN_IF_ERROR(
                skip_undefined_length_item(stream, encoding, depth + 1));
        } else if (!stream.skip(item.length)) {
            return fmri_sync_void_error(error_codes::decode_error,
                                        "Sequence item length exceeds file size");
        }
    }
}

/**
 * @brief Skip the elements of an undefined-length item up to its delimiter
 */
auto skip_undefined_length_item(element_stream& stream,
                                const dataset_encoding& encoding,
                                int depth) -> VoidResult {
    while (true) {
        auto header = read_element_header(stream, encoding);
        if (header.is_err()) {
            return VoidResult(header.error());
        }
        const auto& element = header.value();

        if (element.tag == tags::item_delimitation_item) {
            return ok();
        }

        if (element.length == undefined_length) {
            FMRI_SYNC_RETURN_IF_ERROR(
                skip_undefined_length_sequence(stream, encoding, depth + 1));
        } else if (!stream.skip(element.length)) {
            return fmri_sync_void_error(error_codes::decode_error,
                                        "Item element length exceeds file size");
        }
    }
}

/**
 * @brief Parse File Meta Information and return the Transfer Syntax UID
 *
 * The stream must be positioned right after the "DICM" prefix; on return
 * it is positioned at the first element of the main dataset.
 */
[[nodiscard]] auto read_transfer_syntax(element_stream& stream) -> Result<std::string> {
    const dataset_encoding meta_encoding{true, true};
    std::string ts_uid;

    while (stream.remaining() >= 8) {
        const auto start = stream.position();
        const auto group = stream.read_u16(true);
        if (!group || !stream.seek(start)) {
            break;
        }
        if (*group != 0x0002) {
            break;
        }

        auto header = read_element_header(stream, meta_encoding);
        if (header.is_err()) {
            return Result<std::string>::err(header.error());
        }
        const auto& element = header.value();

        if (element.length == undefined_length) {
            return fmri_sync_error<std::string>(
                error_codes::invalid_dicom_file,
                "Undefined length in File Meta Information");
        }

        if (element.tag == tags::transfer_syntax_uid) {
            if (element.length > stream.remaining()) {
                return fmri_sync_error<std::string>(
                    error_codes::decode_error, "Truncated Transfer Syntax UID");
            }
            std::string value(element.length, '\0');
            if (!stream.read_bytes(value.data(), value.size())) {
                return fmri_sync_error<std::string>(
                    error_codes::decode_error, "Truncated Transfer Syntax UID");
            }
            ts_uid = trim_padding(std::move(value));
        } else if (!stream.skip(element.length)) {
            return fmri_sync_error<std::string>(
                error_codes::decode_error,
                "Meta information element exceeds file size");
        }
    }

    if (ts_uid.empty()) {
        return fmri_sync_error<std::string>(
            error_codes::invalid_dicom_file,
            "Transfer Syntax UID not found in meta information");
    }
    return Result<std::string>::ok(std::move(ts_uid));
}

[[nodiscard]] auto encoding_for(const std::string& ts_uid) -> Result<dataset_encoding> {
    if (ts_uid == implicit_vr_little_endian) {
        return Result<dataset_encoding>::ok(dataset_encoding{false, true});
    }
    if (ts_uid == explicit_vr_big_endian) {
        return Result<dataset_encoding>::ok(dataset_encoding{true, false});
    }
    if (ts_uid == deflated_explicit_vr_little_endian) {
        return fmri_sync_error<dataset_encoding>(
            error_codes::unsupported_transfer_syntax,
            "Deflated transfer syntax is not supported: " + ts_uid);
    }
    // Explicit VR LE and every encapsulated syntax share the header encoding
    if (ts_uid == explicit_vr_little_endian || ts_uid.rfind("1.2.840.10008.1.2.", 0) == 0) {
        return Result<dataset_encoding>::ok(dataset_encoding{true, true});
    }
    return fmri_sync_error<dataset_encoding>(
        error_codes::unsupported_transfer_syntax,
        "Unsupported transfer syntax: " + ts_uid);
}

/**
 * @brief Guess the encoding of a raw dataset from its first element
 */
[[nodiscard]] auto sniff_raw_encoding(element_stream& stream) -> Result<dataset_encoding> {
    if (stream.remaining() < 8) {
        return fmri_sync_error<dataset_encoding>(
            error_codes::invalid_dicom_file, "File too small to be a DICOM dataset");
    }

    const auto start = stream.position();
    char first[6] = {};
    if (!stream.read_bytes(first, sizeof(first)) || !stream.seek(start)) {
        return fmri_sync_error<dataset_encoding>(
            error_codes::file_read_error, "Failed to read first element");
    }

    const auto group = static_cast<uint16_t>(
        static_cast<unsigned char>(first[0]) | (static_cast<unsigned char>(first[1]) << 8));
    if (group == 0 || group > 0x00FF) {
        return fmri_sync_error<dataset_encoding>(
            error_codes::invalid_dicom_file,
            "Missing DICM prefix and no plausible leading element");
    }

    const bool explicit_vr = is_known_vr(std::string_view(first + 4, 2));
    return Result<dataset_encoding>::ok(dataset_encoding{explicit_vr, true});
}

}  // namespace

// =============================================================================
// dicom_header_reader
// =============================================================================

dicom_header_reader::dicom_header_reader(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

auto dicom_header_reader::read(const std::filesystem::path& path,
                               const std::vector<std::string>& keywords,
                               bool stop_before_pixels) -> Result<header_values> {
    std::map<dicom_tag, std::string> wanted;
    for (const auto& keyword : keywords) {
        const auto tag = find_tag_by_keyword(keyword);
        if (!tag) {
            return fmri_sync_error<header_values>(
                error_codes::invalid_argument, "Unknown DICOM keyword: " + keyword);
        }
        wanted.emplace(*tag, keyword);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return fmri_sync_error<header_values>(
            error_codes::file_read_error,
            "Cannot stat file: " + path.string(), ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fmri_sync_error<header_values>(
            error_codes::file_read_error, "Cannot open file: " + path.string());
    }

    element_stream stream{in, static_cast<uint64_t>(file_size)};

    // Part 10 files carry "DICM" after the preamble; GE raw files do not
    dataset_encoding encoding;
    bool has_prefix = false;
    if (file_size >= preamble_size + 4) {
        char prefix[4] = {};
        if (stream.seek(preamble_size) && stream.read_bytes(prefix, 4)) {
            has_prefix = std::memcmp(prefix, "DICM", 4) == 0;
        }
    }

    if (has_prefix) {
        auto ts_uid = read_transfer_syntax(stream);
        if (ts_uid.is_err()) {
            return Result<header_values>::err(ts_uid.error());
        }
        auto detected = encoding_for(ts_uid.value());
        if (detected.is_err()) {
            return Result<header_values>::err(detected.error());
        }
        encoding = detected.value();
        logger_->debug_fmt("{}: Part 10, transfer syntax {}", path.string(), ts_uid.value());
    } else {
        if (!stream.seek(0)) {
            return fmri_sync_error<header_values>(
                error_codes::file_read_error, "Cannot rewind file: " + path.string());
        }
        auto detected = sniff_raw_encoding(stream);
        if (detected.is_err()) {
            return Result<header_values>::err(detected.error());
        }
        encoding = detected.value();
        logger_->debug_fmt("{}: raw dataset, {} VR", path.string(),
                           encoding.explicit_vr ? "explicit" : "implicit");
    }

    header_values values;
    const auto last_wanted = wanted.empty() ? dicom_tag{} : wanted.rbegin()->first;

    while (stream.remaining() >= 8 && values.size() < wanted.size()) {
        auto header = read_element_header(stream, encoding);
        if (header.is_err()) {
            return Result<header_values>::err(header.error());
        }
        const auto& element = header.value();

        if (stop_before_pixels && element.tag >= tags::pixel_data) {
            break;
        }

        // Elements are stored in ascending tag order
        if (element.tag > last_wanted) {
            break;
        }

        if (element.length == undefined_length) {
            FMRI_SYNC_RETURN_IF_ERROR(
                skip_undefined_length_sequence(stream, encoding, 0));
            continue;
        }

        const auto it = wanted.find(element.tag);
        if (it == wanted.end() || element.vr == "SQ") {
            if (!stream.skip(element.length)) {
                return fmri_sync_error<header_values>(
                    error_codes::decode_error,
                    "Value length exceeds file size at " + element.tag.to_string());
            }
            continue;
        }

        if (element.length > stream.remaining()) {
            return fmri_sync_error<header_values>(
                error_codes::decode_error,
                "Value length exceeds file size at " + element.tag.to_string());
        }
        std::string value(element.length, '\0');
        if (!stream.read_bytes(value.data(), value.size())) {
            return fmri_sync_error<header_values>(
                error_codes::decode_error,
                "Value length exceeds file size at " + element.tag.to_string());
        }
        values[it->second] = trim_padding(std::move(value));
    }

    return Result<header_values>::ok(std::move(values));
}

}  // namespace fmri_sync::core
