// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC
/**
 * @file app_constants.h
 * @brief Centralized application constants and configuration values
 *
 * Timing values for the connection poller and reconciler, plus window
 * defaults used when the configuration does not provide a geometry.
 */

#pragma once

#include <chrono>

namespace printdeck {
namespace AppConstants {

/**
 * @brief Connection polling timing
 */
namespace Connection {
/// Interval between printer status polls
constexpr std::chrono::milliseconds POLL_INTERVAL{5000};

/// Query failures are only shown on the splash screen after this much time
/// has passed since startup
constexpr std::chrono::seconds ERROR_GRACE_PERIOD{30};

/// HTTP timeout for a single status request (must stay below POLL_INTERVAL)
constexpr int REQUEST_TIMEOUT_SEC = 3;
} // namespace Connection

/**
 * @brief Window defaults
 */
namespace Window {
constexpr const char* TITLE = "PrintDeck";
constexpr int DEFAULT_WIDTH = 800;
constexpr int DEFAULT_HEIGHT = 480;
} // namespace Window

/**
 * @brief Main loop timing
 */
namespace MainLoop {
/// Sleep between lv_timer_handler() calls (~200 Hz)
constexpr int FRAME_DELAY_MS = 5;
} // namespace MainLoop

} // namespace AppConstants
} // namespace printdeck
