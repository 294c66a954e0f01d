// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_toast.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <string>

/**
 * @file ui_error_reporting.h
 * @brief Logging macros that also raise a toast
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (logged but not shown to user)
 * LOG_ERROR_INTERNAL("Failed to create widget: {}", widget_name);
 *
 * // User-facing problem (logged + toast notification)
 * NOTIFY_WARNING("Could not read {}, using defaults", path);
 * ```
 *
 * The NOTIFY_* macros touch LVGL and must run on the main thread.
 */

#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

#define NOTIFY_WARNING(msg, ...)                                                                   \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::warn("[USER] {}", formatted_msg);                                                  \
        ui_toast_show(ToastSeverity::WARNING, formatted_msg.c_str());                              \
    } while (0)
