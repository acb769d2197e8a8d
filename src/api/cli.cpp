// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "cli.h"
#include "http_server.h"
#include "route_table.h"

#include <systemd/sd-journal.h>

#include <csignal>
#include <cstdlib>
#include <format>
#include <ostream>
#include <utility>

namespace hello_sre::api {

namespace {

volatile std::sig_atomic_t signal_received = 0;
HttpServer* g_server = nullptr;

void signal_handler(int signal) {
    signal_received = signal;
    if (g_server) {
        g_server->stop();
    }
}

} // anonymous namespace

std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const argv[]) {
    CommandLine cmdline;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cmdline.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            cmdline.show_version = true;
            continue;
        }
        if (arg != "-c" && arg != "--config" && arg != "-H" && arg != "--host" &&
            arg != "-p" && arg != "--port") {
            return std::unexpected(std::format("Unknown option: {}", arg));
        }
        if (i + 1 >= argc) {
            return std::unexpected(std::format("{} requires an argument", arg));
        }

        std::string value = argv[++i];
        if (arg == "-c" || arg == "--config") {
            cmdline.config_path = value;
        } else if (arg == "-H" || arg == "--host") {
            cmdline.host = value;
        } else {
            cmdline.port = value;
        }
    }

    return cmdline;
}

std::expected<Config, std::string> resolve_config(const CommandLine& cmdline,
                                                  const EnvLookup& lookup) {
    auto cfg_result = load_config_or_default(cmdline.config_path);
    if (!cfg_result) {
        return std::unexpected(std::format("Failed to load configuration: {}",
                                           cfg_result.error()));
    }
    auto cfg = std::move(*cfg_result);

    auto env_result = apply_environment(cfg, lookup);
    if (!env_result) {
        return std::unexpected(env_result.error());
    }

    if (cmdline.host) {
        if (cmdline.host->empty()) {
            return std::unexpected("--host must not be empty");
        }
        cfg.server.host = *cmdline.host;
    }
    if (cmdline.port) {
        auto port = parse_port(*cmdline.port);
        if (!port) {
            return std::unexpected(std::format("Invalid port: {}", *cmdline.port));
        }
        cfg.server.port = *port;
    }

    return cfg;
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [OPTIONS]\n"
        << "\n"
        << "Greeting and health check HTTP service.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config PATH    Path to configuration file\n"
        << "                       (default: /etc/hello-sre/config.toml)\n"
        << "  -H, --host HOST      Address to listen on (default: 0.0.0.0)\n"
        << "  -p, --port PORT      Port to listen on (default: 8080, 0 = any)\n"
        << "  -h, --help           Show this help message\n"
        << "  -v, --version        Show version information\n"
        << "\n"
        << "Environment:\n"
        << "  HELLO_SRE_HOST, HELLO_SRE_PORT override the configuration file;\n"
        << "  command-line options override both.\n"
        << "\n";
}

void print_version(std::ostream& out) {
    out << "hello-sred 0.1.0\n"
        << "Copyright (C) 2026 Tony Narlock\n"
        << "License: GPL-3.0-or-later\n";
}

int run(const CommandLine& cmdline, const EnvLookup& lookup,
        std::ostream& out, std::ostream& err) {
    auto cfg_result = resolve_config(cmdline, lookup);
    if (!cfg_result) {
        err << "Error: " << cfg_result.error() << "\n";
        sd_journal_print(LOG_ERR, "hello-sred: %s", cfg_result.error().c_str());
        return EXIT_FAILURE;
    }
    const auto& cfg = *cfg_result;

    HttpServer server(cfg.server, make_service_routes(cfg.service));

    // Bind before installing handlers so a busy port fails fast
    auto bind_result = server.bind();
    if (!bind_result) {
        err << "Failed to start HTTP server: " << bind_result.error() << "\n";
        return EXIT_FAILURE;
    }
    out << "Listening on " << cfg.server.host << ":" << *bind_result << std::endl;

    signal_received = 0;
    g_server = &server;

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // A signal that landed before g_server was set is replayed here
    if (signal_received) {
        server.stop();
    }

    // Serve (blocking)
    auto listen_result = server.listen();
    g_server = nullptr;
    if (!listen_result) {
        err << "HTTP server error: " << listen_result.error() << "\n";
        sd_journal_print(LOG_ERR, "hello-sred: %s", listen_result.error().c_str());
        return EXIT_FAILURE;
    }

    if (signal_received) {
        out << "Received signal " << signal_received << ", shutting down\n";
    }

    return EXIT_SUCCESS;
}

} // namespace hello_sre::api
