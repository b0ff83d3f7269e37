/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <fmri_sync/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../mocks/temp_directory.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fmri_sync::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

auto audit_only_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    fmri_sync::test::temp_directory temp_dir("fmri_sync_logger");

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir.path();
        config.enable_console = false;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir.path();
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Log directory is created") {
        logger_config config;
        config.log_directory = temp_dir / "nested/logs";
        config.enable_console = false;

        logger_test_fixture fixture(config);
        CHECK(std::filesystem::is_directory(temp_dir / "nested/logs"));
    }
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    fmri_sync::test::temp_directory temp_dir("fmri_sync_logger");
    logger_config config;
    config.log_directory = temp_dir.path();
    config.enable_console = false;
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("iter: {}", 1);
        logger_adapter::debug("waiting... current series: {}", "/pool/p1/e2/s3");
        logger_adapter::info("New series detected: {}", "/pool/p1/e2/s4");
        logger_adapter::warn("Poll failed: {}", "ssh timeout");
        logger_adapter::error("Transfer failed {} times", 5);
        REQUIRE(logger_adapter::is_level_enabled(log_level::trace));
    }
}

TEST_CASE("logger_adapter honours the configured minimum level", "[logger_adapter][logging]") {
    fmri_sync::test::temp_directory temp_dir("fmri_sync_logger");
    logger_config config;
    config.log_directory = temp_dir.path();
    config.enable_console = false;
    config.enable_audit_log = false;
    config.min_level = log_level::warn;

    logger_test_fixture fixture(config);

    SECTION("Log level filtering") {
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
    }
}

TEST_CASE("log_level_from_string", "[logger_adapter][config]") {
    CHECK(log_level_from_string("trace", log_level::info) == log_level::trace);
    CHECK(log_level_from_string("warning", log_level::info) == log_level::warn);
    CHECK(log_level_from_string("off", log_level::info) == log_level::off);
    CHECK(log_level_from_string("loud", log_level::error) == log_level::error);
}

// =============================================================================
// Session Audit Tests
// =============================================================================

TEST_CASE("logger_adapter session audit trail", "[logger_adapter][audit]") {
    fmri_sync::test::temp_directory temp_dir("fmri_sync_logger");
    logger_test_fixture fixture(audit_only_config(temp_dir.path()));
    const auto audit_path = temp_dir / "audit.json";

    SECTION("Series confirmed") {
        logger_adapter::log_session_event(
            session_event::series_confirmed, "/pool/p1/e2/s4",
            {{"SeriesDescription", "fMRI rest"},
             {"StudyID", "4711"},
             {"PatientName", "Doe^Jane"}});

        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("SERIES_CONFIRMED") != std::string::npos);
        REQUIRE(content.find("\"series_dir\":\"/pool/p1/e2/s4\"") != std::string::npos);
        REQUIRE(content.find("fMRI rest") != std::string::npos);
        REQUIRE(content.find("success") != std::string::npos);
        REQUIRE(content.find("Doe^Jane") == std::string::npos);
        REQUIRE(content.find("PatientName") == std::string::npos);
    }

    SECTION("Transfer failure") {
        logger_adapter::log_session_event(session_event::transfer_failed, "/pool/p1/e2/s4",
                                          {{"error", "rsync exited with \"23\""}});

        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("TRANSFER_FAILED") != std::string::npos);
        REQUIRE(content.find("failure") != std::string::npos);
        REQUIRE(content.find("\\\"23\\\"") != std::string::npos);
    }

    SECTION("One line per event") {
        logger_adapter::log_session_event(session_event::baseline_resolved, "/pool/p1/e2/s3");
        logger_adapter::log_session_event(session_event::transfer_started, "/pool/p1/e2/s4");
        logger_adapter::log_session_event(session_event::transfer_stopped, "/pool/p1/e2/s4");

        std::ifstream file(audit_path);
        std::string line;
        std::size_t lines = 0;
        while (std::getline(file, line)) {
            CHECK(line.front() == '{');
            CHECK(line.back() == '}');
            ++lines;
        }
        CHECK(lines == 3);
    }
}

TEST_CASE("logger_adapter session events before initialization", "[logger_adapter][audit]") {
    REQUIRE_FALSE(logger_adapter::is_initialized());
    logger_adapter::log_session_event(session_event::series_rejected, "/pool/p1/e2/s5");
    SUCCEED();
}

TEST_CASE("session_event names", "[logger_adapter][audit]") {
    CHECK(logger_adapter::session_event_to_string(session_event::baseline_resolved) ==
          "BASELINE_RESOLVED");
    CHECK(logger_adapter::session_event_to_string(session_event::series_rejected) ==
          "SERIES_REJECTED");
    CHECK(logger_adapter::session_event_to_string(session_event::transfer_stopped) ==
          "TRANSFER_STOPPED");
}
