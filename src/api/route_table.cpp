// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "route_table.h"
#include "handlers/greeting_handler.h"
#include "handlers/health_handler.h"

#include <hinder/exception/exception.h>

#include <httplib.h>

#include <string_view>

namespace hello_sre::api {

HINDER_DEFINE_EXCEPTION(route_error, hinder::generic_error);

namespace {

// httplib compiles registered paths as regexes (or ':name' parameter patterns)
constexpr std::string_view pattern_characters = R"(.^$*+?()[]{}|\:)";

} // namespace

std::string_view to_string(Method method) {
    switch (method) {
    case Method::get:
        return "GET";
    case Method::post:
        return "POST";
    case Method::put:
        return "PUT";
    case Method::patch:
        return "PATCH";
    case Method::del:
        return "DELETE";
    case Method::options:
        return "OPTIONS";
    }
    return "UNKNOWN";
}

RouteTable::RouteTable(std::vector<Route> routes) {
    for (auto& route : routes) {
        HINDER_EXPECTS(!route.path.empty() && route.path.front() == '/', route_error)
            .message("Route path must start with '/': '{}'", route.path);
        HINDER_EXPECTS(route.path.find_first_of(pattern_characters) == std::string::npos,
                       route_error)
            .message("Route path contains pattern characters: '{}'", route.path);
        HINDER_EXPECTS(static_cast<bool>(route.handler), route_error)
            .message("Route {} {} has no handler", to_string(route.method), route.path);

        auto inserted = routes_.try_emplace(Key{route.method, route.path},
                                            std::move(route.handler)).second;
        HINDER_EXPECTS(inserted, route_error)
            .message("Duplicate route: {} {}", to_string(route.method), route.path);
    }
}

const Handler* RouteTable::find(Method method, std::string_view path) const {
    auto it = routes_.find(Key{method, std::string{path}});
    if (it == routes_.end()) {
        return nullptr;
    }
    return &it->second;
}

RouteTable make_service_routes(const ServiceConfig& config) {
    GreetingHandler greeting{config.greeting_delay};

    std::vector<Route> routes;
    routes.push_back({Method::get, "/",
        [greeting](const httplib::Request& req, httplib::Response& res) {
            greeting.handle(req, res);
        }});
    routes.push_back({Method::get, "/healthz", &HealthHandler::handle});

    return RouteTable{std::move(routes)};
}

} // namespace hello_sre::api
