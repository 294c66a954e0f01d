// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

typedef struct _lv_obj_t lv_obj_t;

namespace printdeck {

/**
 * @file ui_panel.h
 * @brief Capability interface shared by every full-screen panel
 *
 * The Navigator only talks to panels through this interface. The root
 * object is opaque to the navigation core; it is handed to the display
 * surface unchanged.
 *
 * ## Parent links:
 *
 * A panel that opens a child passes itself as the child's parent at
 * construction and owns the child. The parent pointer is non-owning and
 * nullptr for top-level panels, which cannot go back.
 */
class IPanel {
  public:
    virtual ~IPanel() = default;

    /// Called after the root object is attached to the display slot
    virtual void show() = 0;

    /// Called after the root object is detached from the display slot
    virtual void hide() = 0;

    /// Root layout object of the panel
    virtual lv_obj_t* get_root() const = 0;

    /// Panel to return to on back navigation, or nullptr
    virtual IPanel* get_parent() const = 0;

    /// Human-readable panel name for logging
    virtual const char* get_name() const = 0;
};

/**
 * @brief Panel with a user-visible status message (the splash screen)
 *
 * IPanel is a virtual base so a concrete panel can take its IPanel half
 * from a shared base class.
 */
class IMessagePanel : public virtual IPanel {
  public:
    virtual void set_message(const std::string& message) = 0;
    virtual std::string get_message() const = 0;
};

} // namespace printdeck
