/**
 * @file directory_lister_test.cpp
 * @brief Unit tests for the ssh and local directory listers
 */

#include <catch2/catch_test_macros.hpp>

#include <fmri_sync/remote/directory_lister.hpp>

#include "../mocks/fake_collaborators.hpp"
#include "../mocks/temp_directory.hpp"

using namespace fmri_sync;
using namespace fmri_sync::remote;
using fmri_sync::test::fake_command_executor;
using fmri_sync::test::temp_directory;
using namespace std::chrono_literals;

TEST_CASE("clean_listing_name", "[remote][lister]") {
    CHECK(clean_listing_name("  i123.MRDC.4*\n") == "i123.MRDC.4");
    CHECK(clean_listing_name("s5/") == "s5");
    CHECK(clean_listing_name("e7@") == "e7");
    CHECK(clean_listing_name("p1") == "p1");
    CHECK(clean_listing_name(" \t\n") == "");
}

TEST_CASE("ssh_directory_lister", "[remote][lister]") {
    auto executor = std::make_shared<fake_command_executor>();
    ssh_directory_lister lister(executor, "/usr/bin/ssh", {"sdc", "console"});

    SECTION("returns the last entry of the oldest-first listing") {
        executor->push_output(0, "s1/\ns2/\ns3/\n");
        auto result = lister.list_latest_child("/images/p1/e1");

        REQUIRE(result.is_ok());
        CHECK(result.value() == "s3");

        REQUIRE(executor->commands().size() == 1);
        const auto& cmd = executor->commands().front();
        CHECK(cmd.program == "/usr/bin/ssh");
        const std::vector<std::string> expected = {"sdc@console", "'ls'", "'-1rt'",
                                                   "'/images/p1/e1'"};
        CHECK(cmd.args == expected);
    }

    SECTION("strips the executable marker from image names") {
        executor->push_output(0, "i100.MRDC.1*\ni101.MRDC.2*\n\n");
        auto result = lister.list_latest_child("/images/p1/e1/s3");
        REQUIRE(result.is_ok());
        CHECK(result.value() == "i101.MRDC.2");
    }

    SECTION("empty listing is not_found") {
        executor->push_output(0, "");
        auto result = lister.list_latest_child("/images/p1/e1/s4");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::not_found);
    }

    SECTION("failing ls is remote_command_failed") {
        executor->push_output(2, "", "ls: cannot access");
        auto result = lister.list_latest_child("/missing");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::remote_command_failed);
    }

    SECTION("spawn failure propagates") {
        executor->push_error(error_codes::spawn_failed, "no ssh");
        auto result = lister.list_latest_child("/images");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::spawn_failed);
    }

    SECTION("empty path is rejected without running anything") {
        auto result = lister.list_latest_child("");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
        CHECK(executor->commands().empty());
    }
}

TEST_CASE("local_directory_lister orders by modification time", "[remote][lister]") {
    temp_directory dir;
    local_directory_lister lister;

    SECTION("newest entry wins") {
        fmri_sync::test::set_age(dir.write_file("i3", "x"), 30s);
        fmri_sync::test::set_age(dir.write_file("i1", "x"), 10s);
        fmri_sync::test::set_age(dir.write_file("i2", "x"), 20s);

        auto result = lister.list_latest_child(dir.path().string());
        REQUIRE(result.is_ok());
        CHECK(result.value() == "i1");
    }

    SECTION("ties are broken by name") {
        const auto a = dir.write_file("s1/x", "x").parent_path();
        const auto b = dir.write_file("s2/x", "x").parent_path();
        const auto when = std::filesystem::file_time_type::clock::now() - 5s;
        std::filesystem::last_write_time(a, when);
        std::filesystem::last_write_time(b, when);

        auto result = lister.list_latest_child(dir.path().string());
        REQUIRE(result.is_ok());
        CHECK(result.value() == "s2");
    }

    SECTION("empty directory is not_found") {
        auto result = lister.list_latest_child(dir.path().string());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::not_found);
    }

    SECTION("missing directory is an error") {
        auto result = lister.list_latest_child((dir / "nope").string());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::remote_command_failed);
    }
}
