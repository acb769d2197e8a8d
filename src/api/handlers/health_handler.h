// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <httplib.h>

#include <string>

namespace hello_sre::api {

/// Health check endpoint handlers
class HealthHandler {
public:
    /// Body for GET /healthz
    /// Returns {"status": "ok"}
    static std::string handle_health();

    /// Handle GET /healthz - always 200 with the JSON payload above
    static void handle(const httplib::Request& req, httplib::Response& res);
};

} // namespace hello_sre::api
