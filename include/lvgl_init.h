// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "display_backend.h"

#include <lvgl.h>
#include <memory>

namespace printdeck {

/**
 * @brief Context holding LVGL display resources
 *
 * The backend must outlive the display (it owns the framebuffer or window).
 */
struct LvglContext {
    std::unique_ptr<DisplayBackend> backend; ///< Display backend (owns framebuffer/SDL window)
    lv_display_t* display = nullptr;         ///< LVGL display handle
    lv_indev_t* pointer = nullptr;           ///< Mouse/touch input device (may be null)
};

/**
 * @brief Initialize LVGL with an auto-detected display backend
 *
 * On the framebuffer a missing touch device is logged and the UI still
 * starts; the poller keeps the screen current without any input.
 *
 * @param width Screen width in pixels
 * @param height Screen height in pixels
 * @param ctx Output context containing display resources
 * @return true on success, false on failure (logged)
 */
bool init_lvgl(int width, int height, LvglContext& ctx);

/**
 * @brief Release the display and deinitialize LVGL
 */
void deinit_lvgl(LvglContext& ctx);

} // namespace printdeck
