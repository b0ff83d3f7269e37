/**
 * @file sync_config.cpp
 * @brief Implementation of configuration layering
 */

#include "fmri_sync/config/sync_config.hpp"

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fmri_sync::config {

namespace fs = std::filesystem;

namespace {

auto config_error(const std::string& message, const std::string& details = "")
    -> VoidResult {
    return fmri_sync_void_error(error_codes::invalid_config, message, details);
}

auto parse_integer(const std::string& text, const std::string& field) -> Result<long long> {
    long long value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return fmri_sync_error<long long>(error_codes::invalid_config,
                                          "Invalid integer for " + field + ": '" + text + "'");
    }
    return Result<long long>::ok(value);
}

auto parse_fraction(const std::string& text, const std::string& field) -> Result<double> {
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return fmri_sync_error<double>(error_codes::invalid_config,
                                       "Invalid number for " + field + ": '" + text + "'");
    }
    return Result<double>::ok(value);
}

auto set_millis(const std::string& text, const std::string& field,
                std::chrono::milliseconds& target) -> VoidResult {
    auto value = parse_integer(text, field);
    if (value.is_err()) {
        return VoidResult(value.error());
    }
    target = std::chrono::milliseconds(value.value());
    return ok();
}

template <typename T>
void read_if_present(const json& object, const char* key, T& target) {
    if (object.contains(key)) {
        target = object.at(key).get<T>();
    }
}

void read_millis_if_present(const json& object, const char* key,
                            std::chrono::milliseconds& target) {
    if (object.contains(key)) {
        target = std::chrono::milliseconds(object.at(key).get<long long>());
    }
}

void read_path_if_present(const json& object, const char* key, const std::string& home,
                          fs::path& target) {
    if (object.contains(key)) {
        target = expand_home(object.at(key).get<std::string>(), home);
    }
}

}  // namespace

// =============================================================================
// sync_config
// =============================================================================

auto sync_config::destination_dir() const -> fs::path {
    return incoming_root / run_directory_name;
}

auto sync_config::identity() const -> remote::remote_identity {
    return remote::remote_identity{user, host};
}

auto sync_config::validate() const -> VoidResult {
    if (host.empty() && !local_mode) {
        return config_error("host must not be empty");
    }
    if (image_root.empty()) {
        return config_error("image_root must not be empty");
    }
    if (staging_dir.empty()) {
        return config_error("staging_dir must not be empty");
    }
    if (incoming_root.empty()) {
        return config_error("incoming_root must not be empty");
    }
    if (run_directory_name.empty() || run_directory_name.find('/') != std::string::npos) {
        return config_error("run_directory_name must be a single path component",
                            run_directory_name);
    }
    if (!local_mode && (rsync_program.empty() || ssh_program.empty())) {
        return config_error("rsync and ssh program paths must be set");
    }
    if (poll_interval.count() < 0 || transfer_delay.count() < 0 ||
        command_timeout.count() < 0) {
        return config_error("durations must not be negative");
    }
    if (poll_jitter < 0.0) {
        return config_error("poll_jitter must not be negative");
    }
    if (retry.max_attempts == 0) {
        return config_error("retry.max_attempts must be at least 1");
    }
    if (retry.initial_delay.count() < 0 || retry.max_delay.count() < 0) {
        return config_error("retry delays must not be negative");
    }
    if (retry.backoff_multiplier < 1.0) {
        return config_error("retry.backoff_multiplier must be at least 1");
    }
    if (retry.jitter_factor < 0.0 || retry.jitter_factor > 1.0) {
        return config_error("retry.jitter_factor must be within [0, 1]");
    }
    return ok();
}

// =============================================================================
// Layers
// =============================================================================

auto process_environment() -> env_lookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto make_run_directory_name(std::chrono::system_clock::time_point when) -> std::string {
    const auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H_%M_%S", &tm_buf);
    return std::string("firmmsync_") + buffer;
}

auto expand_home(const std::string& path, const std::string& home) -> fs::path {
    if (path == "~") {
        return fs::path(home);
    }
    if (path.rfind("~/", 0) == 0) {
        return fs::path(home) / path.substr(2);
    }
    return fs::path(path);
}

auto default_sync_config(const std::string& home,
                         std::chrono::system_clock::time_point now) -> sync_config {
    sync_config config;
    const fs::path home_dir(home);
    config.staging_dir = home_dir / "temp";
    config.incoming_root = home_dir / "FIRMM" / "incoming_DICOM";
    config.log_directory = home_dir / ".fmri_sync" / "logs";
    config.run_directory_name = make_run_directory_name(now);
    return config;
}

auto load_config_file(const fs::path& path, const std::string& home,
                      sync_config& config) -> VoidResult {
    std::ifstream file(path);
    if (!file.is_open()) {
        return config_error("Failed to open configuration file: " + path.string());
    }

    try {
        json root;
        file >> root;

        if (!root.is_object()) {
            return config_error("Configuration root must be an object", path.string());
        }

        if (root.contains("console")) {
            const auto& console = root.at("console");
            read_if_present(console, "user", config.user);
            read_if_present(console, "host", config.host);
            read_if_present(console, "image_root", config.image_root);
        }

        if (root.contains("paths")) {
            const auto& paths = root.at("paths");
            read_path_if_present(paths, "staging_dir", home, config.staging_dir);
            read_path_if_present(paths, "incoming_root", home, config.incoming_root);
            read_if_present(paths, "run_directory_name", config.run_directory_name);
        }

        if (root.contains("tools")) {
            const auto& tools = root.at("tools");
            read_if_present(tools, "rsync", config.rsync_program);
            read_if_present(tools, "ssh", config.ssh_program);
            read_millis_if_present(tools, "command_timeout_ms", config.command_timeout);
        }

        if (root.contains("polling")) {
            const auto& polling = root.at("polling");
            read_millis_if_present(polling, "interval_ms", config.poll_interval);
            read_if_present(polling, "jitter", config.poll_jitter);
        }

        if (root.contains("transfer")) {
            read_millis_if_present(root.at("transfer"), "delay_ms", config.transfer_delay);
        }

        if (root.contains("retry")) {
            const auto& retry = root.at("retry");
            if (retry.contains("max_attempts")) {
                const auto attempts = retry.at("max_attempts").get<long long>();
                if (attempts < 0) {
                    return config_error("retry.max_attempts must not be negative",
                                        path.string());
                }
                config.retry.max_attempts = static_cast<std::size_t>(attempts);
            }
            read_millis_if_present(retry, "initial_delay_ms", config.retry.initial_delay);
            read_millis_if_present(retry, "max_delay_ms", config.retry.max_delay);
            read_if_present(retry, "backoff_multiplier", config.retry.backoff_multiplier);
            read_if_present(retry, "jitter_factor", config.retry.jitter_factor);
        }

        if (root.contains("logging")) {
            const auto& logging = root.at("logging");
            read_if_present(logging, "level", config.log_level);
            read_path_if_present(logging, "directory", home, config.log_directory);
        }

        read_if_present(root, "verbose", config.verbose);
        read_if_present(root, "local", config.local_mode);
        read_if_present(root, "wait_for_operator", config.wait_for_operator);
    } catch (const json::exception& ex) {
        return config_error("JSON parsing error in " + path.string(), ex.what());
    }

    return ok();
}

auto apply_environment(const env_lookup& env, const std::string& home,
                       sync_config& config) -> VoidResult {
    if (auto value = env("FMRI_SYNC_HOST")) {
        config.host = *value;
    }
    if (auto value = env("FMRI_SYNC_USER")) {
        config.user = *value;
    }
    if (auto value = env("FMRI_SYNC_ROOT")) {
        config.image_root = *value;
    }
    if (auto value = env("FMRI_SYNC_STAGING_DIR")) {
        config.staging_dir = expand_home(*value, home);
    }
    if (auto value = env("FMRI_SYNC_INCOMING_DIR")) {
        config.incoming_root = expand_home(*value, home);
    }
    if (auto value = env("FMRI_SYNC_LOG_DIR")) {
        config.log_directory = expand_home(*value, home);
    }
    if (auto value = env("FMRI_SYNC_POLL_INTERVAL_MS")) {
        FMRI_SYNC_RETURN_IF_ERROR(
            set_millis(*value, "FMRI_SYNC_POLL_INTERVAL_MS", config.poll_interval));
    }
    return ok();
}

auto load_sync_config(const std::vector<std::string>& args, const env_lookup& env,
                      std::chrono::system_clock::time_point now) -> Result<load_outcome> {
    const auto home = env("HOME").value_or(".");

    load_outcome outcome;
    outcome.config = default_sync_config(home, now);
    auto& config = outcome.config;

    // The file layer sits below the environment, so find it first
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return fmri_sync_error<load_outcome>(error_codes::invalid_config,
                                                     "--config requires a path");
            }
            auto loaded = load_config_file(args[i + 1], home, config);
            if (loaded.is_err()) {
                return Result<load_outcome>::err(loaded.error());
            }
        }
    }

    auto env_result = apply_environment(env, home, config);
    if (env_result.is_err()) {
        return Result<load_outcome>::err(env_result.error());
    }

    auto fail = [](const std::string& message) {
        return fmri_sync_error<load_outcome>(error_codes::invalid_config, message);
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            outcome.show_help = true;
            continue;
        }
        if (arg == "--version") {
            outcome.show_version = true;
            continue;
        }
        if (arg == "--local") {
            config.local_mode = true;
            continue;
        }
        if (arg == "--no-wait") {
            config.wait_for_operator = false;
            continue;
        }
        if (arg == "--quiet") {
            config.verbose = false;
            continue;
        }

        if (i + 1 >= args.size()) {
            return fail("Unknown option or missing value: " + arg);
        }
        const auto& value = args[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "--host") {
            config.host = value;
        } else if (arg == "--user") {
            config.user = value;
        } else if (arg == "--root") {
            config.image_root = value;
        } else if (arg == "--staging-dir") {
            config.staging_dir = expand_home(value, home);
        } else if (arg == "--incoming-dir") {
            config.incoming_root = expand_home(value, home);
        } else if (arg == "--run-name") {
            config.run_directory_name = value;
        } else if (arg == "--log-dir") {
            config.log_directory = expand_home(value, home);
        } else if (arg == "--log-level") {
            config.log_level = value;
        } else if (arg == "--rsync") {
            config.rsync_program = value;
        } else if (arg == "--ssh") {
            config.ssh_program = value;
        } else if (arg == "--poll-interval") {
            auto set = set_millis(value, arg, config.poll_interval);
            if (set.is_err()) {
                return Result<load_outcome>::err(set.error());
            }
        } else if (arg == "--poll-jitter") {
            auto jitter = parse_fraction(value, arg);
            if (jitter.is_err()) {
                return Result<load_outcome>::err(jitter.error());
            }
            config.poll_jitter = jitter.value();
        } else if (arg == "--transfer-delay") {
            auto set = set_millis(value, arg, config.transfer_delay);
            if (set.is_err()) {
                return Result<load_outcome>::err(set.error());
            }
        } else if (arg == "--timeout") {
            auto set = set_millis(value, arg, config.command_timeout);
            if (set.is_err()) {
                return Result<load_outcome>::err(set.error());
            }
        } else if (arg == "--max-attempts") {
            auto attempts = parse_integer(value, arg);
            if (attempts.is_err()) {
                return Result<load_outcome>::err(attempts.error());
            }
            if (attempts.value() < 0) {
                return fail("--max-attempts must not be negative");
            }
            config.retry.max_attempts = static_cast<std::size_t>(attempts.value());
        } else {
            return fail("Unknown option: " + arg);
        }
    }

    if (outcome.show_help || outcome.show_version) {
        return Result<load_outcome>::ok(std::move(outcome));
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<load_outcome>::err(valid.error());
    }
    return Result<load_outcome>::ok(std::move(outcome));
}

}  // namespace fmri_sync::config
