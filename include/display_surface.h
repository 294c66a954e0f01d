// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

typedef struct _lv_obj_t lv_obj_t;

namespace printdeck {

/**
 * @brief Single-slot container that hosts the active panel's root object
 *
 * detach() must not destroy the object: a detached panel can be attached
 * again later (back navigation, splash singleton).
 */
class IDisplaySurface {
  public:
    virtual ~IDisplaySurface() = default;

    virtual void attach(lv_obj_t* node) = 0;
    virtual void detach(lv_obj_t* node) = 0;
};

} // namespace printdeck
