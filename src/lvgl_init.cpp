// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_init.h"

#include <spdlog/spdlog.h>

#include <lvgl.h>

#include <ctime>

namespace printdeck {

static uint32_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>(ts.tv_sec * 1000 + ts.tv_nsec / 1000000);
}

bool init_lvgl(int width, int height, LvglContext& ctx) {
    lv_init();
    lv_tick_set_cb(monotonic_ms);

    ctx.backend = DisplayBackend::create_auto();
    if (!ctx.backend) {
        spdlog::error("[LVGL] No display backend available");
        lv_deinit();
        return false;
    }

    spdlog::info("[LVGL] Using display backend: {}", ctx.backend->name());

    ctx.display = ctx.backend->create_display(width, height);
    if (!ctx.display) {
        spdlog::error("[LVGL] Failed to create display");
        ctx.backend.reset();
        lv_deinit();
        return false;
    }

    ctx.pointer = ctx.backend->create_input_pointer();
    if (!ctx.pointer) {
        spdlog::warn("[LVGL] No pointer input device created - touch/mouse disabled");
    }

    lv_indev_t* indev_keyboard = ctx.backend->create_input_keyboard();
    if (indev_keyboard) {
        lv_group_t* input_group = lv_group_create();
        lv_group_set_default(input_group);
        lv_indev_set_group(indev_keyboard, input_group);
        spdlog::debug("[LVGL] Physical keyboard input enabled");
    }

    spdlog::debug("[LVGL] Initialized: {}x{}", width, height);
    return true;
}

void deinit_lvgl(LvglContext& ctx) {
    ctx.backend.reset();
    ctx.display = nullptr;
    ctx.pointer = nullptr;
    lv_deinit();
}

} // namespace printdeck
