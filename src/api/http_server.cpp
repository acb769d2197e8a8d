// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "http_server.h"

#include <httplib.h>

#include <systemd/sd-journal.h>

#include <sys/socket.h>

#include <exception>
#include <format>
#include <utility>

namespace hello_sre::api {

HttpServer::HttpServer(ServerConfig config, RouteTable routes)
    : config_(std::move(config)),
      routes_(std::move(routes)),
      server_(std::make_unique<httplib::Server>()) {
    configure();
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::configure() {
    server_->set_read_timeout(config_.read_timeout);
    server_->set_write_timeout(config_.write_timeout);
    server_->set_keep_alive_timeout(config_.keep_alive_timeout.count());
    server_->set_keep_alive_max_count(config_.keep_alive_max_count);

    // SO_REUSEADDR only: a port held by another listener must fail to bind
    server_->set_socket_options([](httplib::socket_t sock) {
        int yes = 1;
        if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
            sd_journal_print(LOG_WARNING, "hello-sred: setsockopt(SO_REUSEADDR) failed");
        }
    });

    if (config_.threads > 0) {
        auto threads = config_.threads;
        server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    }

    // A throwing handler becomes a 500 for that request only
    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            sd_journal_print(LOG_ERR, "hello-sred: %s %s failed: %s",
                             req.method.c_str(), req.path.c_str(), what.c_str());
            res.status = 500;
            res.set_content("Internal Server Error", "text/plain");
        });

    if (config_.log_requests) {
        server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            sd_journal_print(LOG_DEBUG, "hello-sred: %s %s -> %d (%s)",
                             req.method.c_str(), req.path.c_str(), res.status,
                             req.remote_addr.c_str());
        });
    }
}

void HttpServer::setup_routes() {
    for (const auto& [key, handler] : routes_) {
        const auto& [method, path] = key;
        switch (method) {
        case Method::get:
            server_->Get(path, handler);
            break;
        case Method::post:
            server_->Post(path, handler);
            break;
        case Method::put:
            server_->Put(path, handler);
            break;
        case Method::patch:
            server_->Patch(path, handler);
            break;
        case Method::del:
            server_->Delete(path, handler);
            break;
        case Method::options:
            server_->Options(path, handler);
            break;
        }
    }
}

std::expected<int, std::string> HttpServer::bind() {
    if (bound_port_ >= 0) {
        return std::unexpected(std::format("Already bound to {}:{}", config_.host, bound_port_));
    }

    int port = -1;
    if (config_.port == 0) {
        port = server_->bind_to_any_port(config_.host);
    } else if (server_->bind_to_port(config_.host, config_.port)) {
        port = config_.port;
    }

    if (port < 0) {
        auto message = std::format("Failed to bind {}:{}", config_.host, config_.port);
        sd_journal_print(LOG_ERR, "hello-sred: %s", message.c_str());
        return std::unexpected(message);
    }

    bound_port_ = port;
    sd_journal_print(LOG_INFO, "hello-sred: Bound to %s:%d", config_.host.c_str(), bound_port_);
    return bound_port_;
}

std::expected<void, std::string> HttpServer::listen() {
    if (bound_port_ < 0) {
        auto bind_result = bind();
        if (!bind_result) {
            return std::unexpected(bind_result.error());
        }
    }

    sd_journal_print(LOG_INFO, "hello-sred: Serving %zu routes on %s:%d",
                     routes_.size(), config_.host.c_str(), bound_port_);

    if (stop_requested_) {
        sd_journal_print(LOG_INFO, "hello-sred: Stop requested before serving");
        return {};
    }

    if (!server_->listen_after_bind()) {
        return std::unexpected(std::format("Accept loop on {}:{} failed",
                                           config_.host, bound_port_));
    }

    sd_journal_print(LOG_INFO, "hello-sred: Server stopped");
    return {};
}

void HttpServer::stop() {
    stop_requested_ = true;
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

void HttpServer::wait_until_ready() const {
    server_->wait_until_ready();
}

} // namespace hello_sre::api
