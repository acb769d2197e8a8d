// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <functional>

// Forward declare httplib types to avoid including the header in this file
namespace httplib {
struct Request;
struct Response;
}

namespace hello_sre::api {

using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

} // namespace hello_sre::api
