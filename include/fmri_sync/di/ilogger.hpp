/**
 * @file ilogger.hpp
 * @brief Logger interface injected into fmri_sync components
 *
 * Components take an optional std::shared_ptr<ILogger>; nullptr means
 * null_logger(). The application injects LoggerService, tests inject a
 * recording logger.
 */

#pragma once

#include <fmri_sync/integration/logger_adapter.hpp>
#include <fmri_sync/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace fmri_sync::di {

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void trace(std::string_view message) = 0;
    virtual void debug(std::string_view message) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void error(std::string_view message) = 0;
    virtual void fatal(std::string_view message) = 0;

    /**
     * @brief Whether a message at @p level would be written
     *
     * The *_fmt helpers check this before formatting.
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    template <typename... Args>
    void trace_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::trace)) {
            trace(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
};

/**
 * @brief Discards everything
 */
class NullLogger final : public ILogger {
public:
    void trace(std::string_view) override {}
    void debug(std::string_view) override {}
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void fatal(std::string_view) override {}

    [[nodiscard]] bool is_enabled(integration::log_level) const noexcept override {
        return false;
    }
};

/**
 * @brief Forwards to the process-wide logger_adapter
 */
class LoggerService final : public ILogger {
public:
    void trace(std::string_view message) override { forward(integration::log_level::trace, message); }
    void debug(std::string_view message) override { forward(integration::log_level::debug, message); }
    void info(std::string_view message) override { forward(integration::log_level::info, message); }
    void warn(std::string_view message) override { forward(integration::log_level::warn, message); }
    void error(std::string_view message) override { forward(integration::log_level::error, message); }
    void fatal(std::string_view message) override { forward(integration::log_level::fatal, message); }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    static void forward(integration::log_level level, std::string_view message) {
        integration::logger_adapter::log(level, std::string(message));
    }
};

/**
 * @brief Process-wide NullLogger instance
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace fmri_sync::di
