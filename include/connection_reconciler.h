// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "app_context.h"
#include "connection_state.h"
#include "ui_mode.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace printdeck {

class IMessagePanel;
class IModePanelFactory;
class IPanel;
class Navigator;

/**
 * @brief Maps polled printer connection state onto the active full-screen panel
 *
 * Each tick():
 * 1. Sends WATCHDOG=1 to the liveness notifier (failures only logged)
 * 2. Queries the printer and classifies the result:
 *    - operational         → IDLE
 *    - printing            → PRINTING
 *    - error or offline    → SPLASH, sends a connect command; a failed
 *                            connect is shown on the splash immediately
 *    - connecting          → SPLASH, state label shown on the splash
 *    - query failed        → SPLASH, error shown only once the startup grace
 *                            period has elapsed
 * 3. Swaps panels only when the mode differs from the recorded one
 *
 * A successful connect command does not change the mode; the next tick
 * observes the new state.
 *
 * Threading: UI thread only (tick() is delivered through the UI dispatcher).
 */
class ConnectionReconciler {
  public:
    ConnectionReconciler(AppContext& ctx, Navigator& nav, IMessagePanel& splash,
                         IModePanelFactory& factory);
    ~ConnectionReconciler();

    // Non-copyable, non-movable
    ConnectionReconciler(const ConnectionReconciler&) = delete;
    ConnectionReconciler& operator=(const ConnectionReconciler&) = delete;
    ConnectionReconciler(ConnectionReconciler&&) = delete;
    ConnectionReconciler& operator=(ConnectionReconciler&&) = delete;

    /**
     * @brief Run one poll/classify/switch cycle
     */
    void tick();

    /**
     * @brief Get recorded UI mode
     * @return Mode of the installed panel (SPLASH before the first tick)
     */
    UiMode mode() const {
        return mode_.value_or(UiMode::SPLASH);
    }

    /**
     * @brief Get the last successfully queried connection state
     */
    const ConnectionState& last_state() const {
        return state_;
    }

  private:
    UiMode classify(const ConnectionState& state);
    void apply_mode(UiMode target);
    void send_liveness(const std::string& message);
    void set_splash_message(const std::string& message);

    AppContext& ctx_;
    Navigator& nav_;
    IMessagePanel& splash_;
    IModePanelFactory& factory_;

    std::chrono::steady_clock::time_point started_at_;
    std::optional<UiMode> mode_;
    ConnectionState state_;

    /// Panel built for the current IDLE/PRINTING mode (nullptr in SPLASH)
    std::unique_ptr<IPanel> mode_panel_;
};

} // namespace printdeck
