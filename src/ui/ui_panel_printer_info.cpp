// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_printer_info.h"

#include "printer_status_source.h"
#include "ui_navigator.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace printdeck {

PrinterInfoPanel::PrinterInfoPanel(lv_obj_t* parking, IPanel* parent, Navigator& nav,
                                   const IPrinterStatusSource& printer,
                                   ConnectionStateProvider state)
    : PanelBase(parking, parent), nav_(nav), printer_(printer), state_(std::move(state)) {
    create_title("Printer");

    std::string endpoint = fmt::format("Endpoint: {}", printer_.endpoint());
    create_text(endpoint.c_str());

    std::string key = fmt::format("API key: {}", printer_.has_api_key() ? "set" : "not set");
    create_text(key.c_str());

    state_label_ = create_text("");
    create_button("Back", on_back_clicked);
}

void PrinterInfoPanel::on_activate() {
    std::string label = state_ ? state_().label() : std::string();
    std::string text = fmt::format("State: {}", label.empty() ? "unknown" : label);
    lv_label_set_text(state_label_, text.c_str());
}

void PrinterInfoPanel::go_back() {
    if (!nav_.go_back()) {
        spdlog::warn("[{}] Back navigation failed", get_name());
    }
}

void PrinterInfoPanel::on_back_clicked(lv_event_t* e) {
    auto* self =
        static_cast<PrinterInfoPanel*>(static_cast<PanelBase*>(lv_event_get_user_data(e)));
    if (self) {
        self->go_back();
    }
}

} // namespace printdeck
