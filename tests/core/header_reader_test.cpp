/**
 * @file header_reader_test.cpp
 * @brief Unit tests for dicom_header_reader
 */

#include <catch2/catch_test_macros.hpp>

#include <fmri_sync/core/header_reader.hpp>

#include "../mocks/dicom_test_file.hpp"
#include "../mocks/mock_logger.hpp"
#include "../mocks/temp_directory.hpp"

using namespace fmri_sync;
using namespace fmri_sync::core;
using fmri_sync::test::dicom_test_builder;
using fmri_sync::test::make_series_image;
using fmri_sync::test::temp_directory;

namespace {

const std::vector<std::string> classification_keywords = {
    "StudyID", "PatientID", "PatientName", "ProtocolName",
    "SeriesDescription", "SeriesDate", "SeriesTime"};

}  // namespace

TEST_CASE("dicom_header_reader reads Part 10 explicit VR little endian",
          "[core][header_reader]") {
    temp_directory dir;
    const auto file = make_series_image("fMRI_REST").write(dir / "i1001.MRDC.1");

    dicom_header_reader reader;
    auto result = reader.read(file, classification_keywords, true);

    REQUIRE(result.is_ok());
    const auto& values = result.value();
    CHECK(values.size() == 7);
    CHECK(values.at("SeriesDescription") == "fMRI_REST");
    CHECK(values.at("SeriesDate") == "20240115");
    CHECK(values.at("SeriesTime") == "101500");
    CHECK(values.at("PatientName") == "Doe^Jane");
    CHECK(values.at("PatientID") == "PAT001");
    CHECK(values.at("ProtocolName") == "BOLD_rest");
    CHECK(values.at("StudyID") == "4711");
}

TEST_CASE("dicom_header_reader supports the common encodings", "[core][header_reader]") {
    temp_directory dir;
    dicom_header_reader reader;

    SECTION("Part 10 implicit VR little endian") {
        const auto file = make_series_image("EPI_TASK", dicom_test_builder::layout::part10_implicit_le)
                              .write(dir / "i1.dcm");
        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "EPI_TASK");
    }

    SECTION("Part 10 explicit VR big endian") {
        const auto file = make_series_image("EPI_TASK", dicom_test_builder::layout::part10_explicit_be)
                              .write(dir / "i2.dcm");
        auto result = reader.read(file, {"SeriesDescription", "StudyID"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "EPI_TASK");
        CHECK(result.value().at("StudyID") == "4711");
    }

    SECTION("raw implicit VR dataset without preamble") {
        const auto file = make_series_image("fMRI_1", dicom_test_builder::layout::raw_implicit_le)
                              .write(dir / "i3.MRDC.3");
        auto result = reader.read(file, {"SeriesDescription", "PatientID"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_1");
        CHECK(result.value().at("PatientID") == "PAT001");
    }

    SECTION("raw explicit VR dataset without preamble") {
        const auto file = make_series_image("fMRI_2", dicom_test_builder::layout::raw_explicit_le)
                              .write(dir / "i4.MRDC.4");
        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_2");
    }
}

TEST_CASE("dicom_header_reader omits absent attributes", "[core][header_reader]") {
    temp_directory dir;
    dicom_test_builder builder;
    builder.add_text(0x0008, 0x103E, "LO", "T1_MPRAGE").add_pixel_data(16);
    const auto file = builder.write(dir / "i5.dcm");

    dicom_header_reader reader;
    auto result = reader.read(file, classification_keywords, true);

    REQUIRE(result.is_ok());
    CHECK(result.value().size() == 1);
    CHECK(result.value().at("SeriesDescription") == "T1_MPRAGE");
}

TEST_CASE("dicom_header_reader skips sequences", "[core][header_reader]") {
    temp_directory dir;
    dicom_header_reader reader;

    SECTION("undefined length") {
        dicom_test_builder builder;
        builder.add_text(0x0008, 0x0021, "DA", "20240115")
            .add_undefined_sequence(0x0008, 0x1032)
            .add_text(0x0008, 0x103E, "LO", "fMRI_REST")
            .add_text(0x0020, 0x0010, "SH", "12");
        const auto file = builder.write(dir / "seq1.dcm");

        auto result = reader.read(file, {"SeriesDescription", "StudyID"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_REST");
        CHECK(result.value().at("StudyID") == "12");
    }

    SECTION("undefined length, implicit VR") {
        dicom_test_builder builder(dicom_test_builder::layout::part10_implicit_le);
        builder.add_undefined_sequence(0x0008, 0x1032)
            .add_text(0x0008, 0x103E, "LO", "EPI");
        const auto file = builder.write(dir / "seq2.dcm");

        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "EPI");
    }

    SECTION("defined length") {
        dicom_test_builder builder;
        builder.add_defined_sequence(0x0008, 0x1032)
            .add_text(0x0008, 0x103E, "LO", "fMRI_TASK");
        const auto file = builder.write(dir / "seq3.dcm");

        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_TASK");
    }
}

TEST_CASE("dicom_header_reader stops before pixel data", "[core][header_reader]") {
    temp_directory dir;

    // Declared pixel length far beyond the end of the file
    dicom_test_builder builder;
    builder.add_text(0x0008, 0x103E, "LO", "fMRI_REST")
        .add_truncated(0x7FE0, 0x0010, "OW", 0x00100000)
        .add_raw({0x01, 0x02, 0x03, 0x04});
    const auto file = builder.write(dir / "i6.dcm");

    dicom_header_reader reader;

    SECTION("attributes after Pixel Data are never reached") {
        auto result = reader.read(file, {"SeriesDescription", "StudyID"}, true);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_REST");
        CHECK(result.value().count("StudyID") == 0);
    }

    SECTION("reading stops once every wanted attribute is found") {
        auto result = reader.read(file, {"SeriesDescription"}, false);
        REQUIRE(result.is_ok());
        CHECK(result.value().at("SeriesDescription") == "fMRI_REST");
    }
}

TEST_CASE("dicom_header_reader trims value padding", "[core][header_reader]") {
    temp_directory dir;
    dicom_test_builder builder;
    builder.add_text(0x0008, 0x103E, "LO", "EPI  ")
        .add_text(0x0020, 0x000E, "UI", "1.2.3");
    const auto file = builder.write(dir / "pad.dcm");

    dicom_header_reader reader;
    auto result = reader.read(file, {"SeriesDescription", "SeriesInstanceUID"}, true);

    REQUIRE(result.is_ok());
    CHECK(result.value().at("SeriesDescription") == "EPI");
    CHECK(result.value().at("SeriesInstanceUID") == "1.2.3");
}

TEST_CASE("dicom_header_reader reports failures", "[core][header_reader]") {
    temp_directory dir;
    auto logger = std::make_shared<fmri_sync::test::MockLogger>();
    dicom_header_reader reader(logger);

    SECTION("missing file") {
        auto result = reader.read(dir / "absent.dcm", {"StudyID"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_read_error);
    }

    SECTION("unknown keyword") {
        const auto file = make_series_image("EPI").write(dir / "i7.dcm");
        auto result = reader.read(file, {"NotAKeyword"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("deflated transfer syntax") {
        const auto file = make_series_image("EPI", dicom_test_builder::layout::part10_deflated)
                              .write(dir / "i8.dcm");
        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::unsupported_transfer_syntax);
    }

    SECTION("not a DICOM file") {
        const auto file = dir.write_file("notes.txt", "hello");
        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_dicom_file);
    }

    SECTION("value running past the end of the file") {
        dicom_test_builder builder;
        builder.add_truncated(0x0008, 0x103E, "LO", 200).add_raw({'f', 'M', 'R', 'I'});
        const auto file = builder.write(dir / "i9.dcm");

        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }

    SECTION("corrupt length on a wanted element in a raw dataset") {
        dicom_test_builder builder(dicom_test_builder::layout::raw_implicit_le);
        builder.add_text(0x0008, 0x0021, "DA", "20240115")
            .add_truncated(0x0008, 0x103E, "LO", 0xFFFFFFF0)
            .add_raw({'f', 'M', 'R', 'I'});
        const auto file = builder.write(dir / "i10.MRDC.10");

        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }

    SECTION("corrupt Transfer Syntax UID length") {
        dicom_test_builder builder(dicom_test_builder::layout::raw_explicit_le);
        std::vector<uint8_t> part10(128, 0);
        part10.insert(part10.end(), {'D', 'I', 'C', 'M'});
        // (0002,0010) UI with a length far beyond the file
        part10.insert(part10.end(), {0x02, 0x00, 0x10, 0x00, 'U', 'I', 0xF0, 0xFF});
        part10.insert(part10.end(), {'1', '.', '2', '\0'});
        builder.add_raw(part10);
        const auto file = builder.write(dir / "i11.dcm");

        auto result = reader.read(file, {"SeriesDescription"}, true);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }
}
