// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <lvgl.h>

// Theme colors used by code that needs explicit control
// (everything else comes from the LVGL default theme)
#define UI_COLOR_PRIMARY lv_color_hex(0xFF4444)   // Primary/active (red)
#define UI_COLOR_SECONDARY lv_color_hex(0x00AAFF) // Secondary accent (blue)

#define UI_COLOR_TEXT_SECONDARY lv_color_hex(0xAAAAAA)

/**
 * @brief Apply the LVGL default theme to a display
 *
 * @param display Target display
 * @param dark_mode true for the dark palette
 * @param scale_factor From compute_scale_factor(); stored for ui_theme_space()
 */
void ui_theme_init(lv_display_t* display, bool dark_mode, int scale_factor);

/**
 * @brief Base spacing unit (8 px) multiplied by the active scale factor
 */
int32_t ui_theme_space(int multiple = 1);
