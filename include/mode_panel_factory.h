// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_mode.h"

#include <memory>

namespace printdeck {

class IPanel;

/**
 * @brief Builds the full-screen panel for a connected UI mode
 *
 * A fresh panel is built on every transition into IDLE or PRINTING; the
 * splash panel is a long-lived singleton and is never built here.
 */
class IModePanelFactory {
  public:
    virtual ~IModePanelFactory() = default;

    /**
     * @brief Create the panel for IDLE or PRINTING
     * @return New panel, or nullptr for SPLASH / on failure
     */
    virtual std::unique_ptr<IPanel> create_panel(UiMode mode) = 0;
};

} // namespace printdeck
