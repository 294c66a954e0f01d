// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_state.h"
#include "ui_panel_base.h"

#include <memory>

namespace printdeck {

class IPrinterStatusSource;
class Navigator;
class PrinterInfoPanel;

/**
 * @file ui_panel_idle_status.h
 * @brief Home panel shown while the printer is operational and not printing
 *
 * Offers an "Info" button that opens PrinterInfoPanel as a child; the child
 * is built on first use and owned by this panel.
 */
class IdleStatusPanel : public PanelBase {
  public:
    IdleStatusPanel(lv_obj_t* parking, Navigator& nav, const IPrinterStatusSource& printer,
                    ConnectionStateProvider state);
    ~IdleStatusPanel() override;

    const char* get_name() const override {
        return "Idle Status";
    }

    /// Open the printer info child panel
    void open_info();

    /// Child panel, or nullptr before open_info()
    PrinterInfoPanel* info_panel() const {
        return info_panel_.get();
    }

  protected:
    void on_activate() override;

  private:
    static void on_info_clicked(lv_event_t* e);

    lv_obj_t* parking_;
    Navigator& nav_;
    const IPrinterStatusSource& printer_;
    ConnectionStateProvider state_;

    lv_obj_t* state_label_ = nullptr;
    std::unique_ptr<PrinterInfoPanel> info_panel_;
};

} // namespace printdeck
