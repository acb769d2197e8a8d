// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "greeting_handler.h"

#include <string>
#include <thread>

namespace hello_sre::api {

GreetingHandler::GreetingHandler(std::chrono::milliseconds delay) : delay_(delay) {}

void GreetingHandler::handle(const httplib::Request&, httplib::Response& res) const {
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }

    res.status = 200;
    res.set_content(std::string{greeting}, "text/plain");
}

} // namespace hello_sre::api
