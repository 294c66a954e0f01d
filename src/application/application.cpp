// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "ui_display_slot.h"
#include "ui_error_reporting.h"
#include "ui_navigator.h"
#include "ui_panel_splash.h"
#include "ui_scale.h"
#include "ui_theme.h"
#include "ui_update_queue.h"

#include "app_constants.h"
#include "background_task.h"
#include "config.h"
#include "connection_reconciler.h"
#include "liveness_notifier.h"
#include "logging_init.h"
#include "octoprint_client.h"
#include "panel_factory.h"
#include "printer_status_source_mock.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <signal.h>
#include <thread>

namespace printdeck {

namespace {

std::atomic<bool> g_quit_requested{false};

void handle_quit_signal(int) {
    g_quit_requested.store(true);
}

void install_signal_handlers() {
    struct sigaction sa = {};
    sa.sa_handler = handle_quit_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

spdlog::level::level_enum parse_level_name(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "error")
        return spdlog::level::err;
    return spdlog::level::warn;
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    // libhv logs to its own file at INFO by default; keep it quiet
    hlog_set_level(LOG_LEVEL_WARN);

    // Phase 1: Parse command line args
    if (!parse_args(argc, argv)) {
        return m_args.help_shown ? 0 : 1;
    }

    // Phase 2: Config file, environment, then CLI overrides
    if (!init_config()) {
        return 1;
    }

    // Phase 3: Logging
    if (!init_logging()) {
        return 1;
    }

    spdlog::info("[Application] Starting {}", AppConstants::Window::TITLE);
    spdlog::debug("[Application] Target: {}x{}", m_screen_width, m_screen_height);

    // Phase 4: Display and theme
    if (!init_display()) {
        return 1;
    }

    if (!init_theme()) {
        shutdown();
        return 1;
    }

    // Phase 5: Printer connection source and connection core
    if (!init_printer() || !init_ui()) {
        shutdown();
        return 1;
    }

    install_signal_handlers();

    int result = main_loop();
    shutdown();
    return result;
}

bool Application::parse_args(int argc, char** argv) {
    return parse_cli_args(argc, argv, m_args);
}

bool Application::init_config() {
    m_config = Config::get_instance();

    m_config_load_failed = !m_config->init(m_args.config_path);
    m_config->apply_env_overrides();

    if (!m_args.endpoint.empty()) {
        m_config->set_override<std::string>("/printer/endpoint", m_args.endpoint);
    }
    if (!m_args.api_key.empty()) {
        m_config->set_override<std::string>("/printer/api_key", m_args.api_key);
    }
    if (m_args.width > 0 && m_args.height > 0) {
        m_config->set_override<int>("/display/width", m_args.width);
        m_config->set_override<int>("/display/height", m_args.height);
    }

    m_screen_width = m_config->get_display_width();
    m_screen_height = m_config->get_display_height();
    return true;
}

bool Application::init_logging() {
    logging::LogConfig log_config;

    // CLI verbosity takes precedence over the config file
    if (m_args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(m_args.verbosity);
    } else {
        log_config.level = parse_level_name(m_config->get<std::string>("/log_level", "info"));
    }

    std::string log_dest = m_args.log_dest;
    if (log_dest.empty()) {
        log_dest = m_config->get<std::string>("/log_dest", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest);

    log_config.file_path = m_args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = m_config->get<std::string>("/log_file", "");
    }

    logging::init(log_config);
    spdlog::info("[Application] Using config: {}", m_config->get_path());
    return true;
}

bool Application::init_display() {
    if (!init_lvgl(m_screen_width, m_screen_height, m_lvgl)) {
        spdlog::error("[Application] Display initialization failed");
        return false;
    }
    m_display_ready = true;

    ui_update_queue_init();
    return true;
}

bool Application::init_theme() {
    bool dark_mode = m_config->get<bool>("/display/dark_mode", true);
    int scale = compute_scale_factor(m_screen_width);
    ui_theme_init(m_lvgl.display, dark_mode, scale);
    spdlog::debug("[Application] Scale factor {} for width {}", scale, m_screen_width);
    return true;
}

bool Application::init_printer() {
    if (m_args.test_mode) {
        spdlog::info("[Application] Test mode: using simulated printer");
        m_printer = std::make_unique<PrinterStatusSourceMock>();
    } else {
        std::string endpoint =
            m_config->get<std::string>("/printer/endpoint", "http://localhost");
        std::string api_key = m_config->get<std::string>("/printer/api_key", "");
        spdlog::info("[Application] Printer endpoint: {}", endpoint);
        m_printer = std::make_unique<OctoPrintClient>(endpoint, api_key);
    }

    m_liveness = std::make_unique<SystemdNotifier>();
    return true;
}

bool Application::init_ui() {
    lv_obj_t* screen = lv_screen_active();
    if (!screen) {
        LOG_ERROR_INTERNAL("No active screen");
        return false;
    }

    m_slot = std::make_unique<LvglDisplaySlot>(screen);

    m_context = std::make_unique<AppContext>(AppContext{
        *m_printer, *m_slot, *m_liveness,
        [](std::function<void()> fn) { ui_queue_update(std::move(fn)); }});

    m_splash = std::make_unique<SplashPanel>(m_slot->parking());
    m_nav = std::make_unique<Navigator>(*m_context);
    m_nav->show_panel(m_splash.get());

    m_panels = std::make_unique<PanelFactory>(m_slot->parking(), *m_nav, *m_printer);
    m_reconciler =
        std::make_unique<ConnectionReconciler>(*m_context, *m_nav, *m_splash, *m_panels);
    m_panels->set_state_provider([this] { return m_reconciler->last_state(); });

    ConnectionReconciler* reconciler = m_reconciler.get();
    m_poller = std::make_unique<BackgroundTask>(
        *m_context, AppConstants::Connection::POLL_INTERVAL, [reconciler] { reconciler->tick(); });

    std::string error;
    if (!m_liveness->notify("READY=1", error)) {
        spdlog::error("[Application] Error sending notification: {}", error);
    }

    // Polling starts from inside the loop, once the first frame is on screen
    lv_timer_t* start_timer = lv_timer_create(start_poller_cb, 0, this);
    lv_timer_set_repeat_count(start_timer, 1);

    if (m_config_load_failed) {
        NOTIFY_WARNING("Could not read {}, using defaults", m_config->get_path());
    }

    spdlog::debug("[Application] UI ready");
    return true;
}

void Application::start_poller_cb(lv_timer_t* timer) {
    auto* self = static_cast<Application*>(lv_timer_get_user_data(timer));
    if (self && self->m_poller) {
        self->m_poller->start();
    }
}

int Application::main_loop() {
    spdlog::info("[Application] Entering main loop");

    while (lv_display_get_next(nullptr) && !g_quit_requested.load()) {
        lv_timer_handler();
        std::this_thread::sleep_for(
            std::chrono::milliseconds(AppConstants::MainLoop::FRAME_DELAY_MS));
    }

    if (g_quit_requested.load()) {
        spdlog::info("[Application] Quit requested");
    }
    return 0;
}

void Application::shutdown() {
    // Guard against multiple calls (destructor + explicit shutdown)
    if (m_shutdown_complete) {
        return;
    }
    m_shutdown_complete = true;

    spdlog::info("[Application] Shutting down...");

    // Join the poller first so no new ticks are queued
    m_poller.reset();
    if (m_display_ready) {
        ui_update_queue_shutdown();
    }

    // The reconciler owns the mode panels; they must go before the slot
    m_reconciler.reset();
    m_panels.reset();
    m_nav.reset();
    m_splash.reset();
    m_slot.reset();
    m_context.reset();
    m_liveness.reset();
    m_printer.reset();

    if (m_display_ready) {
        ui_toast_hide();
        deinit_lvgl(m_lvgl);
        m_display_ready = false;
    }

    spdlog::info("[Application] Shutdown complete");
}

} // namespace printdeck
