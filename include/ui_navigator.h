// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace printdeck {

struct AppContext;
class IDisplaySurface;
class IPanel;

/**
 * @brief Panel stack for the single full-screen display slot
 *
 * Tracks the current panel and swaps panels in the display surface.
 * Back navigation follows the current panel's parent link; the Navigator
 * never owns or allocates panels.
 *
 * Swap order is always: detach old → hide old → attach new → show new, so
 * only one panel's root object is ever present in the slot.
 *
 * Threading: UI thread only.
 *
 * Usage:
 *   Navigator nav(ctx);
 *   nav.show_panel(&splash);
 *   nav.show_panel(&info);  // info was built with parent == &idle
 *   nav.go_back();          // back to idle
 */
class Navigator {
  public:
    explicit Navigator(AppContext& ctx);

    // Non-copyable, non-movable
    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;
    Navigator(Navigator&&) = delete;
    Navigator& operator=(Navigator&&) = delete;

    /**
     * @brief Make a panel current
     *
     * Detaches and hides the current panel (if any), then attaches and shows
     * the new one. Showing the panel that is already current does nothing.
     *
     * @param panel Panel to show (must outlive its time as current)
     */
    void show_panel(IPanel* panel);

    /**
     * @brief Return to the current panel's parent
     *
     * Only panels with a parent should offer back navigation. Without a
     * current panel or parent the call is logged and ignored.
     *
     * @return true if navigation occurred
     */
    bool go_back();

    /**
     * @brief Get current panel
     * @return Current panel, or nullptr before the first show_panel()
     */
    IPanel* current() const {
        return current_;
    }

  private:
    IDisplaySurface& surface_;
    IPanel* current_ = nullptr;
};

} // namespace printdeck
