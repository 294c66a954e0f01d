// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "app_context.h"
#include "cli_args.h"
#include "lvgl_init.h"

#include <memory>

namespace printdeck {

class BackgroundTask;
class Config;
class ConnectionReconciler;
class ILivenessNotifier;
class IPrinterStatusSource;
class LvglDisplaySlot;
class Navigator;
class PanelFactory;
class SplashPanel;

/**
 * @brief Main application orchestrator
 *
 * Application coordinates all subsystems in the correct order:
 * 1. Parse CLI args
 * 2. Load config (file, then environment, then CLI overrides)
 * 3. Initialize logging
 * 4. Initialize display (LVGL, backend, input devices) and theme
 * 5. Build the display slot and splash panel, wire the connection core
 * 6. Tell the supervisor READY=1 and start polling once the loop runs
 * 7. Run the main loop until the window closes or a signal arrives
 * 8. Shutdown in reverse order
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @return Exit code (0 = success)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    bool init_config();
    bool init_logging();
    bool init_display();
    bool init_theme();
    bool init_printer();
    bool init_ui();

    // Main loop
    int main_loop();

    // Shutdown
    void shutdown();

    static void start_poller_cb(lv_timer_t* timer);

    CliArgs m_args;
    Config* m_config = nullptr; // Singleton, not owned
    bool m_config_load_failed = false;

    int m_screen_width = 0;
    int m_screen_height = 0;

    LvglContext m_lvgl;

    // Owned in initialization order; destroyed in reverse by shutdown()
    std::unique_ptr<IPrinterStatusSource> m_printer;
    std::unique_ptr<ILivenessNotifier> m_liveness;
    std::unique_ptr<LvglDisplaySlot> m_slot;
    std::unique_ptr<AppContext> m_context;
    std::unique_ptr<SplashPanel> m_splash;
    std::unique_ptr<Navigator> m_nav;
    std::unique_ptr<PanelFactory> m_panels;
    std::unique_ptr<ConnectionReconciler> m_reconciler;
    std::unique_ptr<BackgroundTask> m_poller;

    bool m_display_ready = false;
    bool m_shutdown_complete = false;
};

} // namespace printdeck
