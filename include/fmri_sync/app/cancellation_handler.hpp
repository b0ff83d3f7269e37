/**
 * @file cancellation_handler.hpp
 * @brief Ctrl-C handling for the transfer loop
 *
 * The handler is installed only once mirroring starts. A signal merely
 * sets a process-wide flag; everything else (the destination directory,
 * the header reader, the output stream) is bound into the handler object.
 */

#pragma once

#include "fmri_sync/core/header_reader.hpp"
#include "fmri_sync/di/ilogger.hpp"

#include <csignal>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>

namespace fmri_sync::app {

/**
 * @brief First regular file starting with 'i' in a directory, by name
 */
[[nodiscard]] auto find_sample_image(const std::filesystem::path& dir)
    -> std::optional<std::filesystem::path>;

/**
 * @brief SIGINT/SIGTERM handler bound to one destination directory
 *
 * Previous signal dispositions are restored on destruction.
 */
class cancellation_handler {
public:
    cancellation_handler(std::filesystem::path destination_dir,
                         std::shared_ptr<core::IHeaderReader> reader,
                         std::ostream& out,
                         std::shared_ptr<di::ILogger> logger = nullptr);
    ~cancellation_handler();

    cancellation_handler(const cancellation_handler&) = delete;
    cancellation_handler& operator=(const cancellation_handler&) = delete;

    /**
     * @brief Install the handler for SIGINT and SIGTERM
     */
    void install();

    /**
     * @brief Whether a stop was requested since the last reset()
     */
    [[nodiscard]] static auto stop_requested() noexcept -> bool;

    /**
     * @brief Request a stop as the signal handler would
     */
    static void request_stop() noexcept;

    /**
     * @brief Clear the stop flag
     */
    static void reset() noexcept;

    /**
     * @brief Print the study summary of the transferred series
     * @return Process exit status (always success)
     */
    auto report() -> int;

private:
    std::filesystem::path destination_dir_;
    std::shared_ptr<core::IHeaderReader> reader_;
    std::ostream& out_;
    std::shared_ptr<di::ILogger> logger_;

    bool installed_ = false;
    void (*previous_sigint_)(int) = SIG_DFL;
    void (*previous_sigterm_)(int) = SIG_DFL;
};

}  // namespace fmri_sync::app
