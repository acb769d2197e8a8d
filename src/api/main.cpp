// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "cli.h"

#include <config/config.h>

#include <systemd/sd-journal.h>

#include <cstdlib>
#include <exception>
#include <iostream>

auto main(int argc, char* argv[]) -> int {
    namespace api = hello_sre::api;

    // Parse command-line arguments
    auto cmdline = api::parse_command_line(argc, argv);
    if (!cmdline) {
        std::cerr << "Error: " << cmdline.error() << "\n";
        api::print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    if (cmdline->show_help) {
        api::print_usage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }
    if (cmdline->show_version) {
        api::print_version(std::cout);
        return EXIT_SUCCESS;
    }

    try {
        return api::run(*cmdline, hello_sre::process_environment(), std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        sd_journal_print(LOG_CRIT, "hello-sred: Fatal error: %s", e.what());
        return EXIT_FAILURE;
    }
}
