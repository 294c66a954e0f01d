// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_navigator.h"

#include "app_context.h"
#include "display_surface.h"
#include "ui_panel.h"

#include <spdlog/spdlog.h>

namespace printdeck {

Navigator::Navigator(AppContext& ctx) : surface_(ctx.surface) {}

void Navigator::show_panel(IPanel* panel) {
    if (!panel) {
        spdlog::error("[Navigator] show_panel called with null panel");
        return;
    }

    if (panel == current_) {
        spdlog::trace("[Navigator] {} already current", panel->get_name());
        return;
    }

    if (current_) {
        surface_.detach(current_->get_root());
        current_->hide();
    }

    current_ = panel;
    surface_.attach(current_->get_root());
    current_->show();

    spdlog::debug("[Navigator] Showing {}", current_->get_name());
}

bool Navigator::go_back() {
    if (!current_) {
        spdlog::warn("[Navigator] go_back with no current panel");
        return false;
    }

    IPanel* parent = current_->get_parent();
    if (!parent) {
        spdlog::error("[Navigator] {} has no parent, cannot go back", current_->get_name());
        return false;
    }

    spdlog::debug("[Navigator] Back from {} to {}", current_->get_name(), parent->get_name());
    show_panel(parent);
    return true;
}

} // namespace printdeck
