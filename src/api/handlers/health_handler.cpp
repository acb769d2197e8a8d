// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "health_handler.h"
#include "../serialization/json.h"

namespace hello_sre::api {

std::string HealthHandler::handle_health() {
    return json::status_response("ok");
}

void HealthHandler::handle(const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content(handle_health(), "application/json");
}

} // namespace hello_sre::api
