// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_idle_status.h"

#include "printer_status_source.h"
#include "ui_navigator.h"
#include "ui_panel_printer_info.h"
#include "ui_theme.h"

#include <spdlog/spdlog.h>

namespace printdeck {

IdleStatusPanel::IdleStatusPanel(lv_obj_t* parking, Navigator& nav,
                                 const IPrinterStatusSource& printer,
                                 ConnectionStateProvider state)
    : PanelBase(parking), parking_(parking), nav_(nav), printer_(printer),
      state_(std::move(state)) {
    create_title("Printer ready");
    state_label_ = create_text("");
    lv_obj_t* endpoint_label = create_text(printer_.endpoint().c_str());
    lv_obj_set_style_text_color(endpoint_label, UI_COLOR_TEXT_SECONDARY, 0);
    create_button("Info", on_info_clicked);
}

// Out of line so PrinterInfoPanel is complete where the unique_ptr is destroyed
IdleStatusPanel::~IdleStatusPanel() = default;

void IdleStatusPanel::on_activate() {
    std::string label = state_ ? state_().label() : std::string();
    lv_label_set_text(state_label_, label.empty() ? "Operational" : label.c_str());
}

void IdleStatusPanel::open_info() {
    if (!info_panel_) {
        info_panel_ = std::make_unique<PrinterInfoPanel>(parking_, this, nav_, printer_, state_);
        spdlog::debug("[{}] Created printer info panel", get_name());
    }
    nav_.show_panel(info_panel_.get());
}

void IdleStatusPanel::on_info_clicked(lv_event_t* e) {
    auto* self = static_cast<IdleStatusPanel*>(static_cast<PanelBase*>(lv_event_get_user_data(e)));
    if (self) {
        self->open_info();
    }
}

} // namespace printdeck
