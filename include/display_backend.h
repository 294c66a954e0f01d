// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file display_backend.h
 * @brief Abstract interface for display and input initialization
 *
 * @pattern Pure virtual interface + static create(type)/create_auto() factory methods
 * @threading Main thread only
 *
 * @see display_backend_sdl.cpp, display_backend_fbdev.cpp
 */

#pragma once

#include <lvgl.h>
#include <memory>
#include <string>

namespace printdeck {

/**
 * @brief Display backend types supported by PrintDeck
 */
enum class DisplayBackendType {
    SDL,   ///< SDL2 window for desktop development
    FBDEV, ///< Linux framebuffer (/dev/fb0) with evdev touch input
    AUTO   ///< Auto-detect best available backend
};

/**
 * @brief Convert DisplayBackendType to string for logging
 */
inline const char* display_backend_type_to_string(DisplayBackendType type) {
    switch (type) {
    case DisplayBackendType::SDL:
        return "SDL";
    case DisplayBackendType::FBDEV:
        return "Framebuffer";
    case DisplayBackendType::AUTO:
        return "Auto";
    default:
        return "Unknown";
    }
}

/**
 * @brief Abstract display backend interface
 *
 * Lifecycle:
 * 1. Factory creates backend via DisplayBackend::create(type) or create_auto()
 * 2. Call create_display() to initialize display hardware
 * 3. Call create_input_pointer() to initialize touch/mouse input
 * 4. Backend is destroyed when unique_ptr goes out of scope
 */
class DisplayBackend {
  public:
    virtual ~DisplayBackend() = default;

    /**
     * @brief Initialize the display
     *
     * @param width Display width in pixels
     * @param height Display height in pixels
     * @return LVGL display object, or nullptr on failure
     */
    virtual lv_display_t* create_display(int width, int height) = 0;

    /**
     * @brief Create pointer input device (mouse/touchscreen)
     *
     * @return LVGL input device, or nullptr on failure
     */
    virtual lv_indev_t* create_input_pointer() = 0;

    /**
     * @brief Create keyboard input device (optional)
     *
     * @return LVGL input device, or nullptr if not supported
     */
    virtual lv_indev_t* create_input_keyboard() {
        return nullptr;
    }

    virtual DisplayBackendType type() const = 0;

    /**
     * @brief Get backend name for logging
     */
    virtual const char* name() const = 0;

    /**
     * @brief Check if this backend is available on the current system
     *
     * For SDL: always true when compiled in
     * For FBDEV: checks if /dev/fb0 exists and is accessible
     */
    virtual bool is_available() const = 0;

    /**
     * @brief Create a specific backend type
     *
     * @return Backend instance, or nullptr if type not compiled in
     */
    static std::unique_ptr<DisplayBackend> create(DisplayBackendType type);

    /**
     * @brief Auto-detect and create the best available backend
     *
     * Detection order (first available wins):
     * 1. PRINTDECK_DISPLAY_BACKEND environment variable ("sdl" or "fbdev")
     * 2. Framebuffer (if compiled and /dev/fb0 accessible)
     * 3. SDL (fallback for desktop)
     *
     * @return Backend instance, or nullptr if no backend available
     */
    static std::unique_ptr<DisplayBackend> create_auto();
};

} // namespace printdeck

#ifdef PRINTDECK_DISPLAY_SDL
#include "display_backend_sdl.h"
#endif

#ifdef PRINTDECK_DISPLAY_FBDEV
#include "display_backend_fbdev.h"
#endif
