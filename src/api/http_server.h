// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include "route_table.h"

#include <config/config.h>

#include <atomic>
#include <expected>
#include <memory>
#include <string>

// Forward declare httplib::Server to avoid including the header in this file
namespace httplib {
class Server;
}

namespace hello_sre::api {

/// HTTP server that listens on a TCP host/port and dispatches through a RouteTable
class HttpServer {
public:
    HttpServer(ServerConfig config, RouteTable routes);
    ~HttpServer();

    // Non-copyable, non-movable (contains httplib::Server with active socket)
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /// Bind the listening socket without accepting connections yet.
    /// Port 0 picks an ephemeral port. Returns the bound port.
    [[nodiscard]] std::expected<int, std::string> bind();

    /// Accept and serve connections (blocking call).
    /// Binds first if bind() has not been called. Returns after stop(),
    /// immediately if stop() was already requested.
    [[nodiscard]] std::expected<void, std::string> listen();

    /// Stop the HTTP server gracefully. Safe to call before listen()
    /// and from a signal handler.
    void stop();

    bool is_running() const;

    /// Block until the accept loop is running
    void wait_until_ready() const;

    /// Bound port, or -1 before bind()
    int port() const { return bound_port_; }

    const RouteTable& routes() const { return routes_; }

private:
    ServerConfig config_;
    RouteTable routes_;
    std::unique_ptr<httplib::Server> server_;
    int bound_port_{-1};
    std::atomic<bool> stop_requested_{false};

    void configure();
    void setup_routes();
};

} // namespace hello_sre::api
