/**
 * @file command_line.hpp
 * @brief Typed argv construction for ssh and rsync
 *
 * Commands are built as a program path plus an argument vector and are
 * executed without a local shell. Only the arguments that ssh forwards to
 * the remote login shell are quoted.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fmri_sync::remote {

/**
 * @brief Login of the scanner console
 */
struct remote_identity {
    std::string user;
    std::string host;

    /// "user@host", or just "host" when no user is set
    [[nodiscard]] auto str() const -> std::string;

    /// "user@host:path" as understood by rsync and scp
    [[nodiscard]] auto qualify(const std::string& path) const -> std::string;
};

/**
 * @brief Program and arguments of one child process
 */
struct command_line {
    std::string program;
    std::vector<std::string> args;

    /// Human readable rendering for logs, arguments shell-quoted
    [[nodiscard]] auto to_display_string() const -> std::string;
};

/**
 * @brief rsync switches used by the sample fetch and the mirror loop
 */
struct rsync_options {
    bool preserve_attributes = true;  ///< -ptg
    bool verbose = true;              ///< -v
    bool no_links = true;             ///< --no-links
    bool ignore_existing = true;      ///< --ignore-existing
    std::string temp_dir;             ///< --temp-dir=<dir>, omitted when empty
    std::string out_format;           ///< --out-format=<fmt>, omitted when empty
};

/**
 * @brief Quote one word for a POSIX shell
 *
 * The word is wrapped in single quotes and every embedded single quote
 * becomes '\'' so "it's" is rendered as 'it'\''s'.
 */
[[nodiscard]] auto shell_quote(std::string_view word) -> std::string;

/**
 * @brief Build "ssh user@host 'arg1' 'arg2' ..."
 *
 * @param ssh_program Absolute path of the ssh client
 * @param identity Remote login
 * @param remote_argv Command to run on the remote side, one word per entry
 */
[[nodiscard]] auto make_ssh_command(const std::string& ssh_program,
                                    const remote_identity& identity,
                                    const std::vector<std::string>& remote_argv)
    -> command_line;

/**
 * @brief Build an rsync invocation from typed options
 */
[[nodiscard]] auto make_rsync_command(const std::string& rsync_program,
                                      const rsync_options& options,
                                      const std::string& source,
                                      const std::string& destination)
    -> command_line;

}  // namespace fmri_sync::remote
