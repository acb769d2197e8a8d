// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <config/config.h>

#include <expected>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace hello_sre::api {

/// Parsed command-line options for hello-sred
struct CommandLine {
    std::filesystem::path config_path{"/etc/hello-sre/config.toml"};
    std::optional<std::string> host;
    std::optional<std::string> port;
    bool show_help{false};
    bool show_version{false};
};

/// Parse argv. Unknown options and options missing their argument are errors.
std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const argv[]);

/// Build the effective configuration.
/// Precedence: defaults < config file < environment < command line
std::expected<Config, std::string> resolve_config(const CommandLine& cmdline,
                                                  const EnvLookup& lookup);

void print_usage(std::ostream& out, const char* program_name);
void print_version(std::ostream& out);

/// Resolve configuration, bind, and serve until SIGINT/SIGTERM.
/// Returns the process exit status; diagnostics go to err.
int run(const CommandLine& cmdline, const EnvLookup& lookup,
        std::ostream& out, std::ostream& err);

} // namespace hello_sre::api
