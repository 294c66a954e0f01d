// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_panel_base.h"

#include <string>

namespace printdeck {

/**
 * @file ui_panel_splash.h
 * @brief Splash screen shown while the printer is not usable
 *
 * Shows the application name, a spinner and one line of status text that
 * the connection reconciler rewrites on every poll. There is exactly one
 * splash panel for the lifetime of the application.
 */
class SplashPanel : public PanelBase, public IMessagePanel {
  public:
    explicit SplashPanel(lv_obj_t* parking);

    const char* get_name() const override {
        return "Splash";
    }

    void set_message(const std::string& message) override;
    std::string get_message() const override {
        return message_;
    }

  private:
    lv_obj_t* message_label_ = nullptr;
    std::string message_;
};

} // namespace printdeck
