// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_error.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace printdeck {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string format_user_error(const std::string& error_text, const std::string& endpoint,
                              bool has_api_key) {
    if (to_lower(error_text).find("connection refused") != std::string::npos) {
        return fmt::format("Unable to connect to \"{}\" (Key: {}), \n"
                           "maybe OctoPrint not running?",
                           endpoint, has_api_key);
    }

    return fmt::format("Unexpected error: {}", error_text);
}

} // namespace printdeck
