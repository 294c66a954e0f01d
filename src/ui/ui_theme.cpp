// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_theme.h"

#include <spdlog/spdlog.h>

static lv_theme_t* current_theme = nullptr;
static bool use_dark_mode = true;
static int theme_scale_factor = 1;

static constexpr int32_t BASE_SPACE_PX = 8;

void ui_theme_init(lv_display_t* display, bool dark_mode, int scale_factor) {
    use_dark_mode = dark_mode;
    theme_scale_factor = scale_factor < 1 ? 1 : scale_factor;

    current_theme = lv_theme_default_init(display, UI_COLOR_PRIMARY, UI_COLOR_SECONDARY,
                                          use_dark_mode, LV_FONT_DEFAULT);
    if (!current_theme) {
        spdlog::error("[Theme] Failed to initialize default theme");
        return;
    }

    lv_display_set_theme(display, current_theme);
    spdlog::debug("[Theme] Initialized: {} mode, scale x{}", use_dark_mode ? "dark" : "light",
                  theme_scale_factor);
}

int32_t ui_theme_space(int multiple) {
    return BASE_SPACE_PX * theme_scale_factor * multiple;
}
