//
// hello-sre - Configuration Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <hinder/exception/exception.h>

#include <toml++/toml.hpp>

#include <syslog.h>

#include <charconv>
#include <cstdlib>
#include <format>
#include <limits>

namespace hello_sre {

    HINDER_DEFINE_EXCEPTION(config_error, hinder::generic_error);

    namespace {

        //
        // Extract optional value from TOML table with default.
        //
        template<typename T>
        auto get_or(toml::table const& table, std::string_view key, T default_value) -> T {
            if (auto opt = table[key].value<T>()) {
                return *opt;
            }
            return default_value;
        }

        //
        // Extract optional non-negative integer, rejecting values below zero.
        //
        auto get_non_negative(toml::table const& table, std::string_view key,
                              std::int64_t default_value) -> std::int64_t {
            auto value = get_or(table, key, default_value);
            HINDER_EXPECTS(value >= 0, config_error)
                .message("{} must be >= 0 (got {})", key, value);
            return value;
        }

        //
        // Extract optional integer that must be at least one.
        //
        auto get_positive(toml::table const& table, std::string_view key,
                          std::int64_t default_value) -> std::int64_t {
            auto value = get_or(table, key, default_value);
            HINDER_EXPECTS(value >= 1, config_error)
                .message("{} must be >= 1 (got {})", key, value);
            return value;
        }

        //
        // Parse DaemonConfig section.
        //
        auto parse_daemon(toml::table const& root) -> DaemonConfig {
            DaemonConfig cfg;

            if (auto daemon = root["daemon"].as_table()) {
                cfg.log_level = get_or(*daemon, "log_level", cfg.log_level);
                HINDER_EXPECTS(log_level_priority(cfg.log_level).has_value(), config_error)
                    .message("Invalid log level: {}", cfg.log_level);
            }

            return cfg;
        }

        //
        // Parse ServerConfig section.
        //
        auto parse_server(toml::table const& root) -> ServerConfig {
            ServerConfig cfg;

            if (auto server = root["server"].as_table()) {
                cfg.host = get_or(*server, "host", cfg.host);
                HINDER_EXPECTS(!cfg.host.empty(), config_error)
                    .message("server.host must not be empty");

                auto port = get_or(*server, "port", std::int64_t{cfg.port});
                HINDER_EXPECTS(port >= 0 && port <= std::numeric_limits<std::uint16_t>::max(),
                               config_error)
                    .message("server.port out of range: {}", port);
                cfg.port = static_cast<std::uint16_t>(port);

                auto threads = get_non_negative(*server, "threads",
                                                static_cast<std::int64_t>(cfg.threads));
                HINDER_EXPECTS(threads <= static_cast<std::int64_t>(max_server_threads), config_error)
                    .message("threads must be <= {} (got {})", max_server_threads, threads);
                cfg.threads = static_cast<std::size_t>(threads);

                cfg.read_timeout = std::chrono::seconds{
                    get_positive(*server, "read_timeout_seconds", cfg.read_timeout.count())};
                cfg.write_timeout = std::chrono::seconds{
                    get_positive(*server, "write_timeout_seconds", cfg.write_timeout.count())};
                cfg.keep_alive_timeout = std::chrono::seconds{
                    get_positive(*server, "keep_alive_timeout_seconds",
                                 cfg.keep_alive_timeout.count())};
                cfg.keep_alive_max_count = static_cast<std::size_t>(
                    get_positive(*server, "keep_alive_max_count",
                                 static_cast<std::int64_t>(cfg.keep_alive_max_count)));
            }

            return cfg;
        }

        //
        // Parse the [debug] section into ServiceConfig.
        //
        auto parse_service(toml::table const& root) -> ServiceConfig {
            ServiceConfig cfg;

            if (auto debug = root["debug"].as_table()) {
                cfg.greeting_delay = std::chrono::milliseconds{
                    get_non_negative(*debug, "greeting_delay_ms", cfg.greeting_delay.count())};
            }

            return cfg;
        }

    }  // namespace

    auto log_level_priority(std::string_view level) -> std::optional<int> {
        if (level == "debug") return LOG_DEBUG;
        if (level == "info") return LOG_INFO;
        if (level == "warning") return LOG_WARNING;
        if (level == "error") return LOG_ERR;
        return std::nullopt;
    }

    auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string> {

        try {
            auto toml = toml::parse_file(path.string());

            Config cfg;
            cfg.daemon = parse_daemon(toml);
            cfg.server = parse_server(toml);
            cfg.service = parse_service(toml);
            cfg.server.log_requests = cfg.daemon.log_level == "debug";

            return cfg;
        }
        catch (toml::parse_error const& e) {
            return std::unexpected(std::format("TOML parse error: {}", e.description()));
        }
        catch (config_error const& e) {
            return std::unexpected(std::format("Config error: {}", e.what()));
        }
        catch (std::exception const& e) {
            return std::unexpected(std::format("Unexpected error loading config: {}", e.what()));
        }
    }

    auto load_config_or_default(std::filesystem::path const& path)
        -> std::expected<Config, std::string> {

        if (!std::filesystem::exists(path)) {
            return Config{};
        }

        return load_config(path);
    }

    auto process_environment() -> EnvLookup {
        return [](std::string_view name) -> std::optional<std::string> {
            if (auto const* value = std::getenv(std::string{name}.c_str())) {
                return std::string{value};
            }
            return std::nullopt;
        };
    }

    auto parse_port(std::string_view text) -> std::optional<std::uint16_t> {
        std::uint16_t port{};
        auto const* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, port);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return port;
    }

    auto apply_environment(Config& cfg, EnvLookup const& lookup)
        -> std::expected<void, std::string> {

        auto server = cfg.server;

        if (auto host = lookup("HELLO_SRE_HOST")) {
            if (host->empty()) {
                return std::unexpected("HELLO_SRE_HOST must not be empty");
            }
            server.host = *host;
        }

        if (auto port_str = lookup("HELLO_SRE_PORT")) {
            auto port = parse_port(*port_str);
            if (!port) {
                return std::unexpected(std::format("Invalid HELLO_SRE_PORT: {}", *port_str));
            }
            server.port = *port;
        }

        cfg.server = std::move(server);
        return {};
    }

}  // namespace hello_sre
