// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include "handler.h"

#include <config/config.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hello_sre::api {

/// HTTP methods a route can be registered for
enum class Method : std::uint8_t {
    get,
    post,
    put,
    patch,
    del,
    options
};

std::string_view to_string(Method method);

struct Route {
    Method method;
    std::string path;
    Handler handler;
};

/// Immutable mapping from (method, path) to handler.
/// Built once at startup; there is no way to add or remove entries afterwards.
class RouteTable {
public:
    using Key = std::pair<Method, std::string>;
    using Map = std::map<Key, Handler>;

    /// Throws route_error on an empty or relative path, a path containing
    /// pattern characters (paths are matched literally), a missing handler,
    /// or a duplicate (method, path) pair
    explicit RouteTable(std::vector<Route> routes);

    /// Returns nullptr when no route matches
    const Handler* find(Method method, std::string_view path) const;

    std::size_t size() const { return routes_.size(); }

    Map::const_iterator begin() const { return routes_.begin(); }
    Map::const_iterator end() const { return routes_.end(); }

private:
    Map routes_;
};

/// GET / and GET /healthz
RouteTable make_service_routes(const ServiceConfig& config);

} // namespace hello_sre::api
