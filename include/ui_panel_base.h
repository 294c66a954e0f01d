// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_panel.h"

#include <lvgl.h>

namespace printdeck {

/**
 * @file ui_panel_base.h
 * @brief LVGL implementation of IPanel shared by all concrete panels
 *
 * The constructor builds an empty, hidden root container under the given
 * parking object; derived constructors add their widgets to root_. The
 * Navigator moves the root in and out of the display slot and calls
 * show()/hide(), which toggle visibility and run the optional hooks.
 *
 * ## Usage Pattern:
 *
 * @code
 * class MyPanel : public PanelBase {
 * public:
 *     explicit MyPanel(lv_obj_t* parking) : PanelBase(parking) {
 *         create_title("My Panel");
 *     }
 *     const char* get_name() const override { return "My Panel"; }
 * protected:
 *     void on_activate() override { refresh(); }
 * };
 * @endcode
 *
 * The destructor deletes the root object and everything below it.
 */
class PanelBase : public virtual IPanel {
  public:
    /**
     * @param parking Parent object for the root while off screen
     * @param parent Panel to go back to, or nullptr for a top-level panel
     */
    explicit PanelBase(lv_obj_t* parking, IPanel* parent = nullptr);
    ~PanelBase() override;

    PanelBase(const PanelBase&) = delete;
    PanelBase& operator=(const PanelBase&) = delete;

    void show() override;
    void hide() override;

    lv_obj_t* get_root() const override {
        return root_;
    }
    IPanel* get_parent() const override {
        return parent_;
    }

    bool is_active() const {
        return active_;
    }

  protected:
    /// Called after the root becomes visible
    virtual void on_activate() {}

    /// Called before the root is hidden
    virtual void on_deactivate() {}

    lv_obj_t* create_title(const char* text);
    lv_obj_t* create_text(const char* text);

    /**
     * @brief Add a button with a text label to the root
     *
     * @param cb Click handler; receives this panel as event user data
     */
    lv_obj_t* create_button(const char* text, lv_event_cb_t cb);

    lv_obj_t* root_ = nullptr;
    IPanel* parent_ = nullptr;
    bool active_ = false;
};

} // namespace printdeck
