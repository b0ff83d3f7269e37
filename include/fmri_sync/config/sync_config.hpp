/**
 * @file sync_config.hpp
 * @brief Session configuration of fmri_sync
 *
 * Values are layered, later layers overriding earlier ones:
 *   1. built-in defaults (the console layout of the scanner site)
 *   2. JSON file given with --config
 *   3. FMRI_SYNC_* environment variables
 *   4. command-line options
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/core/retry_policy.hpp"
#include "fmri_sync/remote/command_line.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fmri_sync::config {

/**
 * @brief Everything a session needs to know
 */
struct sync_config {
    // Console
    std::string user = "sdc";
    std::string host = "172.22.13.7";
    std::string image_root = "/export/home1/sdc_image_pool/images";

    // Local directories
    std::filesystem::path staging_dir;
    std::filesystem::path incoming_root;
    std::string run_directory_name;
    std::filesystem::path log_directory;
    std::string log_level = "info";

    // External tools
    std::string rsync_program = "/usr/bin/rsync";
    std::string ssh_program = "/usr/bin/ssh";
    std::chrono::milliseconds command_timeout{0};

    // Pacing
    std::chrono::milliseconds poll_interval{1000};
    double poll_jitter = 0.1;
    std::chrono::milliseconds transfer_delay{1};
    core::retry_config retry;

    bool verbose = true;
    bool local_mode = false;
    bool wait_for_operator = true;

    /// incoming_root / run_directory_name, the directory FIRMM watches
    [[nodiscard]] auto destination_dir() const -> std::filesystem::path;

    [[nodiscard]] auto identity() const -> remote::remote_identity;

    /**
     * @brief Reject unusable values
     * @return invalid_config naming the first offending field
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

/// Environment lookup, injectable for tests
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by std::getenv
 */
[[nodiscard]] auto process_environment() -> env_lookup;

/**
 * @brief "firmmsync_<YYYY-MM-DD>_<HH_MM_SS>" in local time
 */
[[nodiscard]] auto make_run_directory_name(std::chrono::system_clock::time_point when)
    -> std::string;

/**
 * @brief Replace a leading "~" with the home directory
 */
[[nodiscard]] auto expand_home(const std::string& path, const std::string& home)
    -> std::filesystem::path;

/**
 * @brief Built-in defaults, directories resolved against a home directory
 */
[[nodiscard]] auto default_sync_config(const std::string& home,
                                       std::chrono::system_clock::time_point now)
    -> sync_config;

/**
 * @brief Overlay the values present in a JSON configuration file
 */
[[nodiscard]] auto load_config_file(const std::filesystem::path& path,
                                    const std::string& home,
                                    sync_config& config) -> VoidResult;

/**
 * @brief Overlay FMRI_SYNC_* environment variables
 *
 * Directory variables get the same "~" expansion as the file layer.
 */
[[nodiscard]] auto apply_environment(const env_lookup& env, const std::string& home,
                                     sync_config& config) -> VoidResult;

/**
 * @brief Outcome of the full layering
 */
struct load_outcome {
    sync_config config;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Build the session configuration from all layers
 *
 * @param args Command-line arguments without the program name
 * @param env Environment lookup
 * @param now Session start, used for the run directory name
 */
[[nodiscard]] auto load_sync_config(const std::vector<std::string>& args,
                                    const env_lookup& env,
                                    std::chrono::system_clock::time_point now)
    -> Result<load_outcome>;

}  // namespace fmri_sync::config
