// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// PrintDeck - Linux Framebuffer Display Backend
//
// Embedded Linux backend using /dev/fb0 for direct framebuffer access and
// evdev for touch input.

#pragma once

#ifdef PRINTDECK_DISPLAY_FBDEV

#include "display_backend.h"

#include <string>

namespace printdeck {

/**
 * @brief Linux framebuffer display backend for embedded systems
 *
 * Uses LVGL's Linux framebuffer driver (lv_linux_fbdev_create) to
 * render directly to /dev/fb0 without X11/Wayland.
 *
 * Requirements:
 * - /dev/fb0 must exist and be accessible
 * - Touch device at /dev/input/eventN (auto-detected or PRINTDECK_TOUCH_DEVICE)
 */
class DisplayBackendFbdev : public DisplayBackend {
  public:
    DisplayBackendFbdev();

    /**
     * @param fb_device Path to framebuffer device (e.g., "/dev/fb0")
     * @param touch_device Path to touch input device, empty = auto-detect
     */
    DisplayBackendFbdev(const std::string& fb_device, const std::string& touch_device);

    ~DisplayBackendFbdev() override = default;

    lv_display_t* create_display(int width, int height) override;
    lv_indev_t* create_input_pointer() override;

    DisplayBackendType type() const override {
        return DisplayBackendType::FBDEV;
    }
    const char* name() const override {
        return "Linux Framebuffer";
    }
    bool is_available() const override;

  private:
    std::string fb_device_ = "/dev/fb0";
    std::string touch_device_; // Empty = auto-detect
    lv_display_t* display_ = nullptr;
    lv_indev_t* touch_ = nullptr;

    /**
     * @brief Scan /dev/input/event* for a device reporting ABS_X and ABS_Y
     *
     * @return Path to touch device, or empty if none found
     */
    std::string auto_detect_touch_device() const;
};

} // namespace printdeck

#endif // PRINTDECK_DISPLAY_FBDEV
