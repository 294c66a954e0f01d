// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "display_surface.h"

#include <lvgl.h>

namespace printdeck {

/**
 * @brief Full-screen slot on an LVGL screen that shows one panel at a time
 *
 * Creates two children of the screen: the visible slot and a hidden
 * parking container. Panels build their root objects under the parking
 * container; attach() moves a root into the slot and detach() moves it back,
 * so a detached panel keeps all its widgets.
 *
 * Main (LVGL) thread only.
 */
class LvglDisplaySlot : public IDisplaySurface {
  public:
    explicit LvglDisplaySlot(lv_obj_t* screen);
    ~LvglDisplaySlot() override;

    LvglDisplaySlot(const LvglDisplaySlot&) = delete;
    LvglDisplaySlot& operator=(const LvglDisplaySlot&) = delete;

    void attach(lv_obj_t* node) override;
    void detach(lv_obj_t* node) override;

    /// Parent for panel roots that are not on screen
    lv_obj_t* parking() const {
        return parking_;
    }

    lv_obj_t* slot() const {
        return slot_;
    }

    /// Root currently in the slot, or nullptr
    lv_obj_t* attached() const {
        return attached_;
    }

  private:
    lv_obj_t* slot_ = nullptr;
    lv_obj_t* parking_ = nullptr;
    lv_obj_t* attached_ = nullptr;
};

} // namespace printdeck
