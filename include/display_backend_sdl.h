// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// PrintDeck - SDL2 Display Backend
//
// Desktop development backend. Opens a window titled after the application
// and feeds it mouse and keyboard input.

#pragma once

#ifdef PRINTDECK_DISPLAY_SDL

#include "display_backend.h"

namespace printdeck {

/**
 * @brief SDL2 window backend (desktop)
 *
 * Uses LVGL's SDL driver (lv_sdl_window_create). The SDL event pump runs
 * inside lv_timer_handler(), so no extra event loop is needed.
 */
class DisplayBackendSDL : public DisplayBackend {
  public:
    DisplayBackendSDL() = default;
    ~DisplayBackendSDL() override = default;

    lv_display_t* create_display(int width, int height) override;
    lv_indev_t* create_input_pointer() override;
    lv_indev_t* create_input_keyboard() override;

    DisplayBackendType type() const override {
        return DisplayBackendType::SDL;
    }
    const char* name() const override {
        return "SDL2";
    }
    bool is_available() const override {
        return true;
    }

  private:
    lv_display_t* display_ = nullptr;
    lv_indev_t* mouse_ = nullptr;
    lv_indev_t* keyboard_ = nullptr;
};

} // namespace printdeck

#endif // PRINTDECK_DISPLAY_SDL
