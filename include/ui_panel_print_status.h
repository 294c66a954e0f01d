// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_state.h"
#include "ui_panel_base.h"

namespace printdeck {

/**
 * @file ui_panel_print_status.h
 * @brief Panel shown while a job is running
 *
 * The server's job label ("Printing", "Paused", "Cancelling", ...) can
 * change without leaving PRINTING mode, so while active the panel re-reads
 * the last observed state once per second.
 */
class PrintStatusPanel : public PanelBase {
  public:
    PrintStatusPanel(lv_obj_t* parking, ConnectionStateProvider state);
    ~PrintStatusPanel() override;

    const char* get_name() const override {
        return "Print Status";
    }

    /// Re-read the state label
    void refresh();

  protected:
    void on_activate() override;
    void on_deactivate() override;

  private:
    static void refresh_timer_cb(lv_timer_t* timer);

    ConnectionStateProvider state_;
    lv_obj_t* state_label_ = nullptr;
    lv_timer_t* refresh_timer_ = nullptr;
};

} // namespace printdeck
