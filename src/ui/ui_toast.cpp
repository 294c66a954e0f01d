// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_toast.h"

#include <spdlog/spdlog.h>

#include <lvgl.h>

#include <cstdint>

// Active toast state
static lv_obj_t* active_toast = nullptr;
static lv_timer_t* dismiss_timer = nullptr;
// Bumped for every toast shown; identifies the toast a deferred click belongs to
static uintptr_t toast_generation = 0;

static void toast_dismiss_timer_cb(lv_timer_t* timer);
static void toast_clicked(lv_event_t* e);

static const char* severity_to_string(ToastSeverity severity) {
    switch (severity) {
    case ToastSeverity::ERROR:
        return "error";
    case ToastSeverity::WARNING:
        return "warning";
    case ToastSeverity::SUCCESS:
        return "success";
    case ToastSeverity::INFO:
    default:
        return "info";
    }
}

static lv_color_t severity_color(ToastSeverity severity) {
    switch (severity) {
    case ToastSeverity::ERROR:
        return lv_palette_main(LV_PALETTE_RED);
    case ToastSeverity::WARNING:
        return lv_palette_main(LV_PALETTE_AMBER);
    case ToastSeverity::SUCCESS:
        return lv_palette_main(LV_PALETTE_GREEN);
    case ToastSeverity::INFO:
    default:
        return lv_palette_main(LV_PALETTE_BLUE);
    }
}

void ui_toast_show(ToastSeverity severity, const char* message, uint32_t duration_ms) {
    if (!message) {
        spdlog::warn("[Toast] Attempted to show toast with null message");
        return;
    }

    if (active_toast) {
        ui_toast_hide();
    }

    // Top layer keeps the toast above whatever panel is in the display slot
    active_toast = lv_obj_create(lv_layer_top());
    if (!active_toast) {
        spdlog::error("[Toast] Failed to create toast widget");
        return;
    }

    lv_obj_set_width(active_toast, LV_PCT(80));
    lv_obj_set_height(active_toast, LV_SIZE_CONTENT);
    lv_obj_align(active_toast, LV_ALIGN_BOTTOM_MID, 0, -16);
    lv_obj_set_style_border_side(active_toast, LV_BORDER_SIDE_LEFT, 0);
    lv_obj_set_style_border_width(active_toast, 6, 0);
    lv_obj_set_style_border_color(active_toast, severity_color(severity), 0);
    lv_obj_remove_flag(active_toast, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(active_toast, LV_OBJ_FLAG_CLICKABLE);
    toast_generation++;
    lv_obj_add_event_cb(active_toast, toast_clicked, LV_EVENT_CLICKED,
                        reinterpret_cast<void*>(toast_generation));

    lv_obj_t* label = lv_label_create(active_toast);
    lv_label_set_text(label, message);
    lv_label_set_long_mode(label, LV_LABEL_LONG_WRAP);
    lv_obj_set_width(label, LV_PCT(100));

    dismiss_timer = lv_timer_create(toast_dismiss_timer_cb, duration_ms, nullptr);
    lv_timer_set_repeat_count(dismiss_timer, 1); // Run once then stop

    spdlog::debug("[Toast] Shown: [{}] {} ({}ms)", severity_to_string(severity), message,
                  duration_ms);
}

void ui_toast_hide() {
    if (!active_toast) {
        return;
    }

    if (dismiss_timer) {
        lv_timer_delete(dismiss_timer);
        dismiss_timer = nullptr;
    }

    lv_obj_delete(active_toast);
    active_toast = nullptr;

    spdlog::debug("[Toast] Hidden");
}

bool ui_toast_is_visible() {
    return active_toast != nullptr;
}

static void toast_dismiss_timer_cb(lv_timer_t* timer) {
    (void)timer;
    // A repeat-count-1 timer deletes itself after this callback returns
    dismiss_timer = nullptr;
    ui_toast_hide();
}

static void toast_clicked(lv_event_t* e) {
    // Deleting the target inside its own event is not safe; defer it.
    // A toast shown in the meantime is left alone.
    lv_async_call(
        [](void* generation) {
            if (active_toast && reinterpret_cast<uintptr_t>(generation) == toast_generation) {
                ui_toast_hide();
            }
        },
        lv_event_get_user_data(e));
}
