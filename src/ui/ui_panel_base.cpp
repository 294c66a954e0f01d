// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_base.h"

#include "ui_theme.h"

#include <spdlog/spdlog.h>

namespace printdeck {

PanelBase::PanelBase(lv_obj_t* parking, IPanel* parent) : parent_(parent) {
    root_ = lv_obj_create(parking);
    lv_obj_set_size(root_, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_radius(root_, 0, 0);
    lv_obj_set_style_border_width(root_, 0, 0);
    lv_obj_set_style_pad_all(root_, ui_theme_space(2), 0);
    lv_obj_set_style_pad_row(root_, ui_theme_space(), 0);
    lv_obj_set_flex_flow(root_, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_flex_align(root_, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER,
                          LV_FLEX_ALIGN_CENTER);
    lv_obj_add_flag(root_, LV_OBJ_FLAG_HIDDEN);
}

PanelBase::~PanelBase() {
    // The root may already be gone if its parent container was deleted first
    if (root_ && lv_obj_is_valid(root_)) {
        lv_obj_delete(root_);
    }
    root_ = nullptr;
}

void PanelBase::show() {
    lv_obj_remove_flag(root_, LV_OBJ_FLAG_HIDDEN);
    active_ = true;
    on_activate();
}

void PanelBase::hide() {
    if (active_) {
        on_deactivate();
    }
    active_ = false;
    lv_obj_add_flag(root_, LV_OBJ_FLAG_HIDDEN);
}

lv_obj_t* PanelBase::create_title(const char* text) {
    lv_obj_t* label = lv_label_create(root_);
    lv_label_set_text(label, text);
    lv_obj_set_style_text_color(label, UI_COLOR_PRIMARY, 0);
    return label;
}

lv_obj_t* PanelBase::create_text(const char* text) {
    lv_obj_t* label = lv_label_create(root_);
    lv_label_set_text(label, text);
    lv_label_set_long_mode(label, LV_LABEL_LONG_WRAP);
    lv_obj_set_width(label, LV_PCT(90));
    lv_obj_set_style_text_align(label, LV_TEXT_ALIGN_CENTER, 0);
    return label;
}

lv_obj_t* PanelBase::create_button(const char* text, lv_event_cb_t cb) {
    lv_obj_t* btn = lv_button_create(root_);
    lv_obj_set_style_pad_hor(btn, ui_theme_space(2), 0);
    lv_obj_set_style_pad_ver(btn, ui_theme_space(), 0);
    lv_obj_add_event_cb(btn, cb, LV_EVENT_CLICKED, this);

    lv_obj_t* label = lv_label_create(btn);
    lv_label_set_text(label, text);
    lv_obj_center(label);

    spdlog::trace("[{}] Created button '{}'", get_name(), text);
    return btn;
}

} // namespace printdeck
