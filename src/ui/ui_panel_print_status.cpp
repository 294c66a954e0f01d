// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_print_status.h"

#include "ui_theme.h"

namespace printdeck {

static constexpr uint32_t REFRESH_PERIOD_MS = 1000;

PrintStatusPanel::PrintStatusPanel(lv_obj_t* parking, ConnectionStateProvider state)
    : PanelBase(parking), state_(std::move(state)) {
    create_title("Printing a job");

    lv_obj_t* bar = lv_bar_create(root_);
    lv_obj_set_width(bar, LV_PCT(70));
    lv_obj_set_height(bar, ui_theme_space(2));
    lv_bar_set_range(bar, 0, 100);
    lv_bar_set_value(bar, 100, LV_ANIM_OFF);

    state_label_ = create_text("Printing");
}

PrintStatusPanel::~PrintStatusPanel() {
    if (refresh_timer_) {
        lv_timer_delete(refresh_timer_);
        refresh_timer_ = nullptr;
    }
}

void PrintStatusPanel::refresh() {
    std::string label = state_ ? state_().label() : std::string();
    if (!label.empty()) {
        lv_label_set_text(state_label_, label.c_str());
    }
}

void PrintStatusPanel::on_activate() {
    refresh();
    if (!refresh_timer_) {
        refresh_timer_ = lv_timer_create(refresh_timer_cb, REFRESH_PERIOD_MS, this);
    }
}

void PrintStatusPanel::on_deactivate() {
    if (refresh_timer_) {
        lv_timer_delete(refresh_timer_);
        refresh_timer_ = nullptr;
    }
}

void PrintStatusPanel::refresh_timer_cb(lv_timer_t* timer) {
    auto* self = static_cast<PrintStatusPanel*>(lv_timer_get_user_data(timer));
    if (self) {
        self->refresh();
    }
}

} // namespace printdeck
