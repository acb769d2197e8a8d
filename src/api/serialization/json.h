// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <string>

namespace hello_sre::api::json {

/// Escape a string for JSON (handles quotes, backslashes, control characters)
std::string escape(const std::string& str);

/// Create a single-field status document, e.g. {"status": "ok"}
std::string status_response(const std::string& status);

} // namespace hello_sre::api::json
