// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace printdeck {

/**
 * @brief Coarse application state that selects the full-screen panel
 */
enum class UiMode {
    SPLASH,  ///< Not connected (or not yet classified)
    IDLE,    ///< Printer operational, no job running
    PRINTING ///< A job is running or paused
};

/**
 * @brief Convert UiMode to string for logging
 */
inline const char* ui_mode_name(UiMode mode) {
    switch (mode) {
    case UiMode::SPLASH:
        return "splash";
    case UiMode::IDLE:
        return "idle";
    case UiMode::PRINTING:
        return "printing";
    default:
        return "unknown";
    }
}

} // namespace printdeck
