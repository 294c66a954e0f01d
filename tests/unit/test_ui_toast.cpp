// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_toast.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_all.hpp>

#include <string>

namespace {

struct ToastFixture : LVGLTestFixture {
    ~ToastFixture() override {
        ui_toast_hide();
    }
};

} // namespace

TEST_CASE_METHOD(ToastFixture, "Toast: show places a toast on the top layer", "[ui][toast]") {
    uint32_t before = lv_obj_get_child_count(lv_layer_top());

    ui_toast_show(ToastSeverity::WARNING, "Could not read config");

    REQUIRE(ui_toast_is_visible());
    REQUIRE(lv_obj_get_child_count(lv_layer_top()) == before + 1);

    lv_obj_t* toast = lv_obj_get_child(lv_layer_top(), -1);
    lv_obj_t* label = lv_obj_get_child(toast, 0);
    REQUIRE(std::string(lv_label_get_text(label)) == "Could not read config");
}

TEST_CASE_METHOD(ToastFixture, "Toast: a new toast replaces the old one", "[ui][toast]") {
    uint32_t before = lv_obj_get_child_count(lv_layer_top());

    ui_toast_show(ToastSeverity::INFO, "first");
    ui_toast_show(ToastSeverity::ERROR, "second");

    REQUIRE(lv_obj_get_child_count(lv_layer_top()) == before + 1);
}

TEST_CASE_METHOD(ToastFixture, "Toast: hide removes the toast", "[ui][toast]") {
    ui_toast_show(ToastSeverity::SUCCESS, "done");
    ui_toast_hide();

    REQUIRE_FALSE(ui_toast_is_visible());

    // Hiding twice is harmless
    ui_toast_hide();
    REQUIRE_FALSE(ui_toast_is_visible());
}

TEST_CASE_METHOD(ToastFixture, "Toast: dismisses itself after the duration", "[ui][toast]") {
    ui_toast_show(ToastSeverity::INFO, "short", 100);
    REQUIRE(ui_toast_is_visible());

    process_lvgl(300);

    REQUIRE_FALSE(ui_toast_is_visible());
}

TEST_CASE_METHOD(ToastFixture, "Toast: null message is rejected", "[ui][toast]") {
    ui_toast_show(ToastSeverity::ERROR, nullptr);
    REQUIRE_FALSE(ui_toast_is_visible());
}

TEST_CASE_METHOD(ToastFixture, "Toast: click dismisses on the next cycle", "[ui][toast]") {
    ui_toast_show(ToastSeverity::INFO, "tap me");
    lv_obj_t* toast = lv_obj_get_child(lv_layer_top(), -1);

    lv_obj_send_event(toast, LV_EVENT_CLICKED, nullptr);
    REQUIRE(ui_toast_is_visible());

    process_lvgl(10);
    REQUIRE_FALSE(ui_toast_is_visible());
}

TEST_CASE_METHOD(ToastFixture, "Toast: pending click does not dismiss a newer toast",
                 "[ui][toast]") {
    ui_toast_show(ToastSeverity::INFO, "old");
    lv_obj_t* old_toast = lv_obj_get_child(lv_layer_top(), -1);
    lv_obj_send_event(old_toast, LV_EVENT_CLICKED, nullptr);

    ui_toast_show(ToastSeverity::ERROR, "new");
    process_lvgl(10);

    REQUIRE(ui_toast_is_visible());
    lv_obj_t* toast = lv_obj_get_child(lv_layer_top(), -1);
    lv_obj_t* label = lv_obj_get_child(toast, 0);
    REQUIRE(std::string(lv_label_get_text(label)) == "new");
}
