// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_splash.h"

#include "app_constants.h"
#include "ui_theme.h"

namespace printdeck {

SplashPanel::SplashPanel(lv_obj_t* parking) : PanelBase(parking) {
    create_title(AppConstants::Window::TITLE);

    lv_obj_t* spinner = lv_spinner_create(root_);
    int32_t size = ui_theme_space(6);
    lv_obj_set_size(spinner, size, size);

    message_label_ = create_text("Initializing...");
    message_ = "Initializing...";
}

void SplashPanel::set_message(const std::string& message) {
    message_ = message;
    lv_label_set_text(message_label_, message_.c_str());
}

} // namespace printdeck
