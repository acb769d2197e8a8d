// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <httplib.h>

#include <chrono>
#include <string_view>

namespace hello_sre::api {

/// Root endpoint handler
class GreetingHandler {
public:
    static constexpr std::string_view greeting = "Hello from SRE Test!";

    /// delay is slept before every reply; zero disables it
    explicit GreetingHandler(std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    /// Handle GET / - plain-text greeting, query string and headers ignored
    void handle(const httplib::Request& req, httplib::Response& res) const;

    std::chrono::milliseconds delay() const { return delay_; }

private:
    std::chrono::milliseconds delay_;
};

} // namespace hello_sre::api
