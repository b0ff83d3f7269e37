/**
 * @file rsync_mirror_test.cpp
 * @brief Unit tests for rsync_mirror
 */

#include <catch2/catch_test_macros.hpp>

#include <fmri_sync/transfer/rsync_mirror.hpp>

#include "../mocks/fake_collaborators.hpp"

#include <algorithm>

using namespace fmri_sync;
using namespace fmri_sync::transfer;
using fmri_sync::test::fake_command_executor;

namespace {

auto has_arg(const remote::command_line& cmd, const std::string& arg) -> bool {
    return std::find(cmd.args.begin(), cmd.args.end(), arg) != cmd.args.end();
}

auto sample_job() -> transfer_job {
    transfer_job job;
    job.source_dir = "/images/p1/e1/s6";
    job.staging_dir = "/home/firmm/temp";
    job.destination_dir = "/home/firmm/FIRMM/incoming_DICOM/firmmsync_run";
    return job;
}

}  // namespace

TEST_CASE("rsync_mirror builds the staged rsync command", "[transfer][rsync]") {
    auto executor = std::make_shared<fake_command_executor>();
    rsync_mirror mirror(executor, "/usr/bin/rsync", {"sdc", "console"});

    executor->push_output(0, ">>fmri_sync:i1.MRDC.1\n>>fmri_sync:i2.MRDC.2\nsent 10 bytes\n");
    auto result = mirror.mirror(sample_job());

    REQUIRE(result.is_ok());
    CHECK(result.value().files_transferred == 2);

    REQUIRE(executor->commands().size() == 1);
    const auto& cmd = executor->commands().front();
    CHECK(cmd.program == "/usr/bin/rsync");
    CHECK(has_arg(cmd, "-ptg"));
    CHECK(has_arg(cmd, "--no-links"));
    CHECK(has_arg(cmd, "--ignore-existing"));
    CHECK(has_arg(cmd, "--temp-dir=/home/firmm/temp"));
    CHECK(has_arg(cmd, "--out-format=>>fmri_sync:%n"));
    REQUIRE(cmd.args.size() >= 2);
    CHECK(cmd.args[cmd.args.size() - 2] == "sdc@console:/images/p1/e1/s6/*");
    CHECK(cmd.args.back() == "/home/firmm/FIRMM/incoming_DICOM/firmmsync_run/");
}

TEST_CASE("rsync_mirror failures", "[transfer][rsync]") {
    auto executor = std::make_shared<fake_command_executor>();
    rsync_mirror mirror(executor, "/usr/bin/rsync", {"sdc", "console"});

    SECTION("non-zero exit is transfer_failed") {
        executor->push_output(23, "", "some files could not be transferred");
        auto result = mirror.mirror(sample_job());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transfer_failed);
    }

    SECTION("spawn failure passes through") {
        executor->push_error(error_codes::spawn_failed, "no rsync");
        auto result = mirror.mirror(sample_job());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::spawn_failed);
    }
}

TEST_CASE("rsync_mirror fetch copies a single file without staging", "[transfer][rsync]") {
    auto executor = std::make_shared<fake_command_executor>();
    rsync_mirror mirror(executor, "/usr/bin/rsync", {"sdc", "console"}, false);

    SECTION("new file") {
        executor->push_output(0, ">>fmri_sync:i9.MRDC.9\n");
        auto result = mirror.fetch("/images/p1/e1/s6/i9.MRDC.9", "/home/firmm/temp");

        REQUIRE(result.is_ok());
        CHECK(result.value().files_transferred == 1);

        const auto& cmd = executor->commands().front();
        CHECK_FALSE(has_arg(cmd, "-v"));
        for (const auto& arg : cmd.args) {
            CHECK(arg.rfind("--temp-dir", 0) == std::string::npos);
        }
        CHECK(cmd.args[cmd.args.size() - 2] == "sdc@console:/images/p1/e1/s6/i9.MRDC.9");
    }

    SECTION("file already present") {
        executor->push_output(0, "");
        auto result = mirror.fetch("/images/p1/e1/s6/i9.MRDC.9", "/home/firmm/temp");

        REQUIRE(result.is_ok());
        CHECK(result.value().files_transferred == 0);
        CHECK(result.value().files_skipped == 1);
    }
}

TEST_CASE("rsync_mirror count_transferred", "[transfer][rsync]") {
    CHECK(rsync_mirror::count_transferred("") == 0);
    CHECK(rsync_mirror::count_transferred(">>fmri_sync:a") == 1);
    CHECK(rsync_mirror::count_transferred("receiving file list\n>>fmri_sync:a\nx>>fmri_sync:b\n") == 1);
}
