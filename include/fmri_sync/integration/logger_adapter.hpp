/**
 * @file logger_adapter.hpp
 * @brief Process-wide logging over logger_system plus the session audit trail
 *
 * Diagnostics go to logger_system writers (console and a rotating
 * fmri_sync.log). Session events are additionally appended to audit.json,
 * one JSON object per line, so a run can be reconstructed afterwards.
 */

#pragma once

#include <fmri_sync/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace fmri_sync::integration {

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse "trace" .. "fatal" or "off"; "warning" is accepted for warn
 */
[[nodiscard]] auto log_level_from_string(const std::string& name,
                                         log_level fallback) -> log_level;

/**
 * @brief What happened during a session, as recorded in audit.json
 */
enum class session_event {
    baseline_resolved,
    series_rejected,
    series_confirmed,
    transfer_started,
    transfer_stopped,
    transfer_failed
};

struct logger_config {
    /// Receives fmri_sync.log and audit.json; created on initialize()
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{true};
    bool enable_audit_log{true};

    /// Rotation threshold of fmri_sync.log
    std::size_t max_file_size_mb{50};
    std::size_t max_files{5};
};

/**
 * @brief Static logging facade
 *
 * Every call is a no-op until initialize() has run, so library code can
 * log session events unconditionally.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/home/mri/.fmri_sync/logs";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Watching exam {}", exam_dir);
 * logger_adapter::log_session_event(session_event::series_confirmed, series_dir,
 *                                   {{"SeriesDescription", description}});
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Set up writers and the audit trail
     *
     * When the log directory cannot be created only the console writer is
     * used. Calling it again before shutdown() has no effect.
     */
    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::fatal, fmt, std::forward<Args>(args)...);
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Log a session event and append it to the audit trail
     *
     * PatientName is dropped from @p fields before anything is written.
     * transfer_failed is logged at error level with outcome "failure";
     * every other event is info with outcome "success".
     */
    static void log_session_event(session_event event,
                                  const std::string& series_dir,
                                  const std::map<std::string, std::string>& fields = {});

    /// Upper-case event name, e.g. "SERIES_CONFIRMED"
    [[nodiscard]] static auto session_event_to_string(session_event event) -> std::string;

private:
    template <typename... Args>
    static void emit(log_level level, compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace fmri_sync::integration
