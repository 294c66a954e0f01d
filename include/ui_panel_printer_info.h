// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_state.h"
#include "ui_panel_base.h"

namespace printdeck {

class IPrinterStatusSource;
class Navigator;

/**
 * @brief Read-only details about the configured print server
 *
 * Child panel: always has a parent and a Back button that returns to it.
 */
class PrinterInfoPanel : public PanelBase {
  public:
    PrinterInfoPanel(lv_obj_t* parking, IPanel* parent, Navigator& nav,
                     const IPrinterStatusSource& printer, ConnectionStateProvider state);

    const char* get_name() const override {
        return "Printer Info";
    }

    /// Back button handler
    void go_back();

  protected:
    void on_activate() override;

  private:
    static void on_back_clicked(lv_event_t* e);

    Navigator& nav_;
    const IPrinterStatusSource& printer_;
    ConnectionStateProvider state_;

    lv_obj_t* state_label_ = nullptr;
};

} // namespace printdeck
