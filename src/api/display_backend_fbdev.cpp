// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
//
// PrintDeck - Linux Framebuffer Display Backend Implementation

#ifdef PRINTDECK_DISPLAY_FBDEV

#include "display_backend_fbdev.h"

#include <spdlog/spdlog.h>

#include <lvgl.h>

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace printdeck {

namespace {

/**
 * @brief Read a line from a sysfs file
 * @return File contents (first line) or empty string on error
 */
std::string read_sysfs_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    return line;
}

/**
 * @brief Check if an event device reports ABS_X and ABS_Y
 *
 * The capabilities file holds space-separated hex words; the rightmost word
 * carries the lowest bits.
 */
bool has_touch_capabilities(int event_num) {
    std::string caps = read_sysfs_file("/sys/class/input/event" + std::to_string(event_num) +
                                       "/device/capabilities/abs");
    if (caps.empty()) {
        return false;
    }

    size_t last_space = caps.rfind(' ');
    std::string last_hex = (last_space != std::string::npos) ? caps.substr(last_space + 1) : caps;

    char* end = nullptr;
    unsigned long value = std::strtoul(last_hex.c_str(), &end, 16);
    if (end == last_hex.c_str()) {
        return false;
    }
    return (value & 0x3) == 0x3;
}

} // namespace

DisplayBackendFbdev::DisplayBackendFbdev() = default;

DisplayBackendFbdev::DisplayBackendFbdev(const std::string& fb_device,
                                         const std::string& touch_device)
    : fb_device_(fb_device), touch_device_(touch_device) {}

bool DisplayBackendFbdev::is_available() const {
    struct stat st;

    if (stat(fb_device_.c_str(), &st) != 0) {
        spdlog::debug("[Fbdev Backend] Framebuffer device {} not found", fb_device_);
        return false;
    }

    if (access(fb_device_.c_str(), R_OK | W_OK) != 0) {
        spdlog::debug("[Fbdev Backend] Framebuffer device {} not accessible", fb_device_);
        return false;
    }

    return true;
}

lv_display_t* DisplayBackendFbdev::create_display(int width, int height) {
    spdlog::info("[Fbdev Backend] Creating framebuffer display on {}", fb_device_);

    display_ = lv_linux_fbdev_create();
    if (display_ == nullptr) {
        spdlog::error("[Fbdev Backend] Failed to create framebuffer display");
        return nullptr;
    }

    // Opens and mmaps the device; resolution comes from the framebuffer itself
    lv_linux_fbdev_set_file(display_, fb_device_.c_str());

    int32_t actual_w = lv_display_get_horizontal_resolution(display_);
    int32_t actual_h = lv_display_get_vertical_resolution(display_);
    if (actual_w != width || actual_h != height) {
        spdlog::warn("[Fbdev Backend] Requested {}x{}, framebuffer is {}x{}", width, height,
                     actual_w, actual_h);
    }

    spdlog::info("[Fbdev Backend] Framebuffer display created: {}x{} on {}", actual_w, actual_h,
                 fb_device_);
    return display_;
}

lv_indev_t* DisplayBackendFbdev::create_input_pointer() {
    std::string touch_path = touch_device_;
    if (touch_path.empty()) {
        const char* env = std::getenv("PRINTDECK_TOUCH_DEVICE");
        touch_path = (env && env[0] != '\0') ? env : auto_detect_touch_device();
    }

    if (touch_path.empty()) {
        spdlog::warn("[Fbdev Backend] No touch device found - pointer input disabled");
        return nullptr;
    }

    spdlog::info("[Fbdev Backend] Creating evdev touch input on {}", touch_path);

    touch_ = lv_evdev_create(LV_INDEV_TYPE_POINTER, touch_path.c_str());
    if (touch_ == nullptr) {
        spdlog::error("[Fbdev Backend] Failed to create evdev touch input on {}", touch_path);
        return nullptr;
    }

    return touch_;
}

std::string DisplayBackendFbdev::auto_detect_touch_device() const {
    for (int i = 0; i < 16; i++) {
        std::string path = "/dev/input/event" + std::to_string(i);
        if (access(path.c_str(), R_OK) != 0) {
            continue;
        }

        if (has_touch_capabilities(i)) {
            std::string name =
                read_sysfs_file("/sys/class/input/event" + std::to_string(i) + "/device/name");
            spdlog::debug("[Fbdev Backend] Found touch device {} ('{}')", path, name);
            return path;
        }
    }

    return "";
}

} // namespace printdeck

#endif // PRINTDECK_DISPLAY_FBDEV
