/**
 * @file command_line.cpp
 * @brief Implementation of the ssh/rsync argv builders
 */

#include "fmri_sync/remote/command_line.hpp"

namespace fmri_sync::remote {

auto remote_identity::str() const -> std::string {
    if (user.empty()) {
        return host;
    }
    return user + "@" + host;
}

auto remote_identity::qualify(const std::string& path) const -> std::string {
    return str() + ":" + path;
}

auto command_line::to_display_string() const -> std::string {
    std::string result = program;
    for (const auto& arg : args) {
        result += ' ';
        result += shell_quote(arg);
    }
    return result;
}

auto shell_quote(std::string_view word) -> std::string {
    std::string quoted;
    quoted.reserve(word.size() + 2);
    quoted += '\'';
    for (const char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

auto make_ssh_command(const std::string& ssh_program,
                      const remote_identity& identity,
                      const std::vector<std::string>& remote_argv) -> command_line {
    command_line cmd;
    cmd.program = ssh_program;
    cmd.args.push_back(identity.str());
    // ssh joins these with spaces and hands them to the remote shell
    for (const auto& word : remote_argv) {
        cmd.args.push_back(shell_quote(word));
    }
    return cmd;
}

auto make_rsync_command(const std::string& rsync_program,
                        const rsync_options& options,
                        const std::string& source,
                        const std::string& destination) -> command_line {
    command_line cmd;
    cmd.program = rsync_program;

    if (options.preserve_attributes) {
        cmd.args.emplace_back("-ptg");
    }
    if (options.verbose) {
        cmd.args.emplace_back("-v");
    }
    if (options.no_links) {
        cmd.args.emplace_back("--no-links");
    }
    if (options.ignore_existing) {
        cmd.args.emplace_back("--ignore-existing");
    }
    if (!options.temp_dir.empty()) {
        cmd.args.push_back("--temp-dir=" + options.temp_dir);
    }
    if (!options.out_format.empty()) {
        cmd.args.push_back("--out-format=" + options.out_format);
    }

    cmd.args.push_back(source);
    cmd.args.push_back(destination);
    return cmd;
}

}  // namespace fmri_sync::remote
