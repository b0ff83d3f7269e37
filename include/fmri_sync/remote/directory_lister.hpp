/**
 * @file directory_lister.hpp
 * @brief Newest-entry lookup on the scanner console or a local mount
 */

#pragma once

#include "fmri_sync/core/result.hpp"
#include "fmri_sync/di/ilogger.hpp"
#include "fmri_sync/remote/command_line.hpp"
#include "fmri_sync/remote/process_executor.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace fmri_sync::remote {

/**
 * @brief Abstract lister returning the most recently modified child
 */
class IDirectoryLister {
public:
    virtual ~IDirectoryLister() = default;

    /**
     * @brief Name of the newest entry of a directory
     * @param dir Directory path (non-empty)
     * @return Bare entry name, or not_found when the directory is empty
     */
    [[nodiscard]] virtual auto list_latest_child(const std::string& dir)
        -> Result<std::string> = 0;
};

/**
 * @brief Strip whitespace and a trailing ls type marker ('*', '/', '@')
 */
[[nodiscard]] auto clean_listing_name(std::string_view raw) -> std::string;

/**
 * @brief Lister that runs "ls -1rt" on the console over ssh
 */
class ssh_directory_lister final : public IDirectoryLister {
public:
    ssh_directory_lister(std::shared_ptr<ICommandExecutor> executor,
                         std::string ssh_program,
                         remote_identity identity,
                         std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto list_latest_child(const std::string& dir)
        -> Result<std::string> override;

private:
    std::shared_ptr<ICommandExecutor> executor_;
    std::string ssh_program_;
    remote_identity identity_;
    std::shared_ptr<di::ILogger> logger_;
};

/**
 * @brief Lister over a locally mounted image pool
 *
 * Entries are ordered by modification time; ties are broken by name so
 * the result is deterministic.
 */
class local_directory_lister final : public IDirectoryLister {
public:
    explicit local_directory_lister(std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto list_latest_child(const std::string& dir)
        -> Result<std::string> override;

private:
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace fmri_sync::remote
