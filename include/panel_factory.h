// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_state.h"
#include "mode_panel_factory.h"

// Forward declarations
struct _lv_obj_t;
typedef struct _lv_obj_t lv_obj_t;

namespace printdeck {

class IPrinterStatusSource;
class Navigator;

/**
 * @brief Builds the LVGL panels for the connected UI modes
 *
 * IDLE → IdleStatusPanel, PRINTING → PrintStatusPanel. Panels are built
 * under the display slot's parking object and read the last observed
 * connection state through the provider.
 *
 * Usage:
 *   PanelFactory factory(slot.parking(), nav, printer);
 *   ConnectionReconciler reconciler(ctx, nav, splash, factory);
 *   factory.set_state_provider([&reconciler] { return reconciler.last_state(); });
 */
class PanelFactory : public IModePanelFactory {
  public:
    PanelFactory(lv_obj_t* parking, Navigator& nav, const IPrinterStatusSource& printer);

    /// Must be set before the first panel is built
    void set_state_provider(ConnectionStateProvider provider) {
        state_ = std::move(provider);
    }

    std::unique_ptr<IPanel> create_panel(UiMode mode) override;

  private:
    lv_obj_t* parking_;
    Navigator& nav_;
    const IPrinterStatusSource& printer_;
    ConnectionStateProvider state_;
};

} // namespace printdeck
