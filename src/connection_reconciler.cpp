// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_reconciler.h"

#include "app_constants.h"
#include "liveness_notifier.h"
#include "mode_panel_factory.h"
#include "printer_error.h"
#include "printer_status_source.h"
#include "ui_navigator.h"
#include "ui_panel.h"

#include <spdlog/spdlog.h>

namespace printdeck {

ConnectionReconciler::ConnectionReconciler(AppContext& ctx, Navigator& nav, IMessagePanel& splash,
                                           IModePanelFactory& factory)
    : ctx_(ctx), nav_(nav), splash_(splash), factory_(factory), started_at_(ctx.now()) {}

ConnectionReconciler::~ConnectionReconciler() = default;

void ConnectionReconciler::tick() {
    send_liveness("WATCHDOG=1");

    UiMode target = UiMode::SPLASH;

    ConnectionState state;
    PrinterError err = ctx_.printer.get_connection_state(state);
    if (!err.has_error()) {
        state_ = state;
        target = classify(state_);
    } else {
        // Connection delays right after boot are normal, keep the splash quiet
        if (ctx_.now() - started_at_ >= AppConstants::Connection::ERROR_GRACE_PERIOD) {
            set_splash_message(format_user_error(err.message, ctx_.printer.endpoint(),
                                                 ctx_.printer.has_api_key()));
        }
        spdlog::debug("[Reconciler] Unexpected error: {}", err.message);
    }

    apply_mode(target);
}

UiMode ConnectionReconciler::classify(const ConnectionState& state) {
    if (state.is_operational()) {
        return UiMode::IDLE;
    }
    if (state.is_printing()) {
        return UiMode::PRINTING;
    }
    if (state.is_error() || state.is_offline()) {
        spdlog::debug("[Reconciler] Printer is '{}', requesting connect", state.label());
        PrinterError err = ctx_.printer.connect();
        if (err.has_error()) {
            spdlog::warn("[Reconciler] Connect request failed: {}", err.message);
            set_splash_message(format_user_error(err.message, ctx_.printer.endpoint(),
                                                 ctx_.printer.has_api_key()));
        }
        return UiMode::SPLASH;
    }
    if (state.is_connecting()) {
        set_splash_message(state.label());
    }
    return UiMode::SPLASH;
}

void ConnectionReconciler::apply_mode(UiMode target) {
    if (mode_ && *mode_ == target) {
        return;
    }

    switch (target) {
    case UiMode::IDLE:
    case UiMode::PRINTING: {
        std::unique_ptr<IPanel> panel = factory_.create_panel(target);
        if (!panel) {
            // Mode stays unrecorded so the next tick retries
            spdlog::error("[Reconciler] Failed to create {} panel", ui_mode_name(target));
            return;
        }
        nav_.show_panel(panel.get());
        // Old panel (and any child it owns) is released only after the swap
        mode_panel_ = std::move(panel);
        break;
    }
    case UiMode::SPLASH:
        nav_.show_panel(&splash_);
        mode_panel_.reset();
        break;
    }

    switch (target) {
    case UiMode::IDLE:
        spdlog::info("[Reconciler] Printer is ready");
        break;
    case UiMode::PRINTING:
        spdlog::info("[Reconciler] Printing a job");
        break;
    case UiMode::SPLASH:
        spdlog::info("[Reconciler] Waiting for printer connection");
        break;
    }

    spdlog::info("[Reconciler] Mode {} -> {}", mode_ ? ui_mode_name(*mode_) : "none",
                 ui_mode_name(target));
    mode_ = target;
}

void ConnectionReconciler::send_liveness(const std::string& message) {
    std::string error;
    if (!ctx_.liveness.notify(message, error)) {
        spdlog::error("[Reconciler] Error sending notification: {}", error);
    }
}

void ConnectionReconciler::set_splash_message(const std::string& message) {
    if (splash_.get_message() != message) {
        spdlog::debug("[Reconciler] Splash message: {}", message);
    }
    splash_.set_message(message);
}

} // namespace printdeck
