// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// PrintDeck - SDL2 Display Backend Implementation

#ifdef PRINTDECK_DISPLAY_SDL

#include "display_backend_sdl.h"

#include "app_constants.h"

#include <spdlog/spdlog.h>

#include <lvgl.h>

namespace printdeck {

lv_display_t* DisplayBackendSDL::create_display(int width, int height) {
    spdlog::info("[SDL Backend] Creating {}x{} window", width, height);

    display_ = lv_sdl_window_create(width, height);
    if (display_ == nullptr) {
        spdlog::error("[SDL Backend] Failed to create SDL window");
        return nullptr;
    }

    lv_sdl_window_set_title(display_, AppConstants::Window::TITLE);
    return display_;
}

lv_indev_t* DisplayBackendSDL::create_input_pointer() {
    mouse_ = lv_sdl_mouse_create();
    if (mouse_ == nullptr) {
        spdlog::error("[SDL Backend] Failed to create mouse input");
    }
    return mouse_;
}

lv_indev_t* DisplayBackendSDL::create_input_keyboard() {
    keyboard_ = lv_sdl_keyboard_create();
    return keyboard_;
}

} // namespace printdeck

#endif // PRINTDECK_DISPLAY_SDL
