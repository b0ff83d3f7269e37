/**
 * @file logger_adapter.cpp
 * @brief logger_system writers and the JSON-lines audit trail
 */

#include <fmri_sync/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fmri_sync::integration {

namespace {

constexpr std::size_t buffer_size = 8192;

constexpr std::array<kcenon::logger::log_level, 7> backend_levels = {
    kcenon::logger::log_level::trace, kcenon::logger::log_level::debug,
    kcenon::logger::log_level::info,  kcenon::logger::log_level::warn,
    kcenon::logger::log_level::error, kcenon::logger::log_level::fatal,
    kcenon::logger::log_level::off};

auto to_backend(log_level level) -> kcenon::logger::log_level {
    return backend_levels[static_cast<std::size_t>(level)];
}

/// Local time with milliseconds and UTC offset, e.g. 2024-01-15T10:15:00.042+0100
auto timestamp_now() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    char offset[8];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    std::strftime(offset, sizeof(offset), "%z", &local);
    return compat::format("{}.{:03}{}", date, millis, offset);
}

}  // namespace

auto log_level_from_string(const std::string& name, log_level fallback) -> log_level {
    static const std::map<std::string, log_level> names = {
        {"trace", log_level::trace}, {"debug", log_level::debug},
        {"info", log_level::info},   {"warn", log_level::warn},
        {"warning", log_level::warn}, {"error", log_level::error},
        {"fatal", log_level::fatal}, {"off", log_level::off}};

    const auto it = names.find(name);
    return it == names.end() ? fallback : it->second;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config_.enable_file || config_.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config_.log_directory, ec);
            if (ec) {
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        backend_ = std::make_unique<kcenon::logger::logger>(false, buffer_size);
        backend_->set_min_level(to_backend(config_.min_level));

        if (config_.enable_console) {
            backend_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config_.enable_file) {
            backend_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config_.log_directory / "fmri_sync.log").string(),
                config_.max_file_size_mb * 1024 * 1024, config_.max_files));
        }
        backend_->start();

        audit_path_.clear();
        if (config_.enable_audit_log) {
            audit_path_ = config_.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        if (initialized_ && backend_ && is_level_enabled(level)) {
            backend_->log(to_backend(level), message);
        }
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off && level >= min_level_.load();
    }

    void append_audit(const nlohmann::json& record) {
        if (!initialized_ || audit_path_.empty()) {
            return;
        }

        std::lock_guard lock(audit_mutex_);
        std::ofstream file(audit_path_, std::ios::app);
        if (file) {
            file << record.dump() << '\n';
        }
    }

private:
    std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    std::filesystem::path audit_path_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Facade
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

// =============================================================================
// Session Events
// =============================================================================

void logger_adapter::log_session_event(session_event event,
                                       const std::string& series_dir,
                                       const std::map<std::string, std::string>& fields) {
    const auto name = session_event_to_string(event);
    const bool failed = event == session_event::transfer_failed;

    if (failed) {
        error("Session event: {} series={}", name, series_dir);
    } else {
        info("Session event: {} series={}", name, series_dir);
    }

    nlohmann::json record = {{"timestamp", timestamp_now()},
                             {"event_type", name},
                             {"outcome", failed ? "failure" : "success"},
                             {"series_dir", series_dir}};
    for (const auto& [key, value] : fields) {
        if (key == "PatientName" || key == "patient_name") {
            continue;
        }
        record[key] = value;
    }
    pimpl_->append_audit(record);
}

auto logger_adapter::session_event_to_string(session_event event) -> std::string {
    switch (event) {
        case session_event::baseline_resolved: return "BASELINE_RESOLVED";
        case session_event::series_rejected: return "SERIES_REJECTED";
        case session_event::series_confirmed: return "SERIES_CONFIRMED";
        case session_event::transfer_started: return "TRANSFER_STARTED";
        case session_event::transfer_stopped: return "TRANSFER_STOPPED";
        case session_event::transfer_failed: return "TRANSFER_FAILED";
    }
    return "UNKNOWN";
}

}  // namespace fmri_sync::integration
