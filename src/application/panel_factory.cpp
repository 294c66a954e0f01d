// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panel_factory.h"

#include "ui_panel_idle_status.h"
#include "ui_panel_print_status.h"

#include <spdlog/spdlog.h>

namespace printdeck {

PanelFactory::PanelFactory(lv_obj_t* parking, Navigator& nav, const IPrinterStatusSource& printer)
    : parking_(parking), nav_(nav), printer_(printer) {}

std::unique_ptr<IPanel> PanelFactory::create_panel(UiMode mode) {
    if (!parking_) {
        spdlog::error("[PanelFactory] No parking container, cannot build {} panel",
                      ui_mode_name(mode));
        return nullptr;
    }

    switch (mode) {
    case UiMode::IDLE:
        return std::make_unique<IdleStatusPanel>(parking_, nav_, printer_, state_);
    case UiMode::PRINTING:
        return std::make_unique<PrintStatusPanel>(parking_, state_);
    case UiMode::SPLASH:
    default:
        return nullptr;
    }
}

} // namespace printdeck
