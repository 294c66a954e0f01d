// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_display_slot.h"

#include <spdlog/spdlog.h>

namespace printdeck {

static lv_obj_t* create_bare_container(lv_obj_t* parent) {
    lv_obj_t* obj = lv_obj_create(parent);
    lv_obj_remove_style_all(obj);
    lv_obj_set_size(obj, LV_PCT(100), LV_PCT(100));
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    return obj;
}

LvglDisplaySlot::LvglDisplaySlot(lv_obj_t* screen) {
    slot_ = create_bare_container(screen);
    parking_ = create_bare_container(screen);
    lv_obj_add_flag(parking_, LV_OBJ_FLAG_HIDDEN);
}

LvglDisplaySlot::~LvglDisplaySlot() {
    // Panel roots are deleted by their panels; only the containers are ours
    if (lv_obj_is_valid(slot_)) {
        lv_obj_delete(slot_);
    }
    if (lv_obj_is_valid(parking_)) {
        lv_obj_delete(parking_);
    }
}

void LvglDisplaySlot::attach(lv_obj_t* node) {
    if (!node) {
        spdlog::warn("[DisplaySlot] attach() called with null object");
        return;
    }

    if (attached_ && attached_ != node) {
        spdlog::warn("[DisplaySlot] attach() while another root is attached, parking it");
        lv_obj_set_parent(attached_, parking_);
    }

    lv_obj_set_parent(node, slot_);
    attached_ = node;
}

void LvglDisplaySlot::detach(lv_obj_t* node) {
    if (!node) {
        return;
    }

    lv_obj_set_parent(node, parking_);
    if (attached_ == node) {
        attached_ = nullptr;
    }
}

} // namespace printdeck
