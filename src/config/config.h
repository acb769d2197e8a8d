//
// hello-sre - Configuration Loading
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HELLO_SRE_CONFIG_CONFIG_H
#define HELLO_SRE_CONFIG_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hello_sre {

    //
    // Process-level settings.
    //
    struct DaemonConfig {
        std::string log_level{"info"};  // "debug", "info", "warning", "error"
    };

    // Upper bound for server.threads
    inline constexpr std::size_t max_server_threads{1024};

    //
    // Listening socket and connection handling.
    //
    // Timeouts and keep_alive_max_count are always >= 1.
    //
    struct ServerConfig {
        std::string host{"0.0.0.0"};
        std::uint16_t port{8080};       // 0 = ephemeral
        std::size_t threads{0};         // 0 = library default
        std::chrono::seconds read_timeout{5};
        std::chrono::seconds write_timeout{5};
        std::chrono::seconds keep_alive_timeout{5};
        std::size_t keep_alive_max_count{100};
        bool log_requests{false};
    };

    //
    // Behavior of the fixed-response endpoints.
    //
    struct ServiceConfig {
        std::chrono::milliseconds greeting_delay{0};  // 0 = no artificial latency
    };

    //
    // Top-level configuration structure.
    //
    struct Config {
        DaemonConfig daemon;
        ServerConfig server;
        ServiceConfig service;
    };

    //
    // Map a log level name onto a syslog priority (LOG_DEBUG..LOG_ERR).
    //
    [[nodiscard]] auto log_level_priority(std::string_view level) -> std::optional<int>;

    //
    // Load configuration from a TOML file.
    //
    // Preconditions:
    //   - path must refer to a valid TOML file
    //
    // Postconditions:
    //   - On success: returns parsed and validated Config
    //   - On failure: returns error message describing the failure
    //
    [[nodiscard]] auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string>;

    //
    // Load configuration with defaults for missing values.
    //
    // If the file doesn't exist, returns default configuration.
    // If the file exists but has parse errors, returns error.
    //
    [[nodiscard]] auto load_config_or_default(std::filesystem::path const& path)
        -> std::expected<Config, std::string>;

    //
    // Environment variable lookup. Returns nullopt for unset variables.
    //
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    //
    // Lookup backed by the process environment.
    //
    [[nodiscard]] auto process_environment() -> EnvLookup;

    //
    // Apply HELLO_SRE_HOST / HELLO_SRE_PORT overrides on top of cfg.
    //
    // Postconditions:
    //   - On success: cfg.server reflects any variables that are set
    //   - On failure: cfg is unchanged and the error names the bad variable
    //
    [[nodiscard]] auto apply_environment(Config& cfg, EnvLookup const& lookup)
        -> std::expected<void, std::string>;

    //
    // Parse a TCP port number ("0".."65535").
    //
    [[nodiscard]] auto parse_port(std::string_view text) -> std::optional<std::uint16_t>;

}  // namespace hello_sre

#endif  // HELLO_SRE_CONFIG_CONFIG_H
