// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>

/**
 * @file ui_toast.h
 * @brief Transient notification banner on LVGL's top layer
 *
 * One toast is visible at a time; showing a new toast replaces the old
 * one. Toasts dismiss themselves after the given duration or when tapped.
 * Main (LVGL) thread only.
 */

enum class ToastSeverity {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
};

/**
 * @brief Show a toast, replacing any visible toast
 *
 * @param severity Controls the accent color
 * @param message Text to show (copied)
 * @param duration_ms Time before auto-dismiss
 */
void ui_toast_show(ToastSeverity severity, const char* message, uint32_t duration_ms = 4000);

void ui_toast_hide();

bool ui_toast_is_visible();
