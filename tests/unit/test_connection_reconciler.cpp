// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_connection_reconciler.cpp
 * @brief Unit tests for the connection-to-mode reconciler
 *
 * Drives ConnectionReconciler::tick() against scripted printer states with a
 * fake clock and inline dispatch. Surface and panel doubles share one event
 * log so swap ordering can be asserted directly.
 */

#include "app_context.h"
#include "connection_reconciler.h"
#include "ui_navigator.h"

#include "mock_display_surface.h"
#include "mock_liveness_notifier.h"
#include "mock_mode_panel_factory.h"
#include "mock_panel.h"
#include "mock_printer_status_source.h"

#include <catch2/catch_all.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace printdeck;
using Events = std::vector<std::string>;

namespace {

const char* REFUSED_TEXT = "dial tcp 127.0.0.1:80: connect: connection refused";
const char* FRIENDLY_REFUSED = "Unable to connect to \"http://host:80\" (Key: false), \n"
                               "maybe OctoPrint not running?";

struct ReconcilerFixture {
    UiEventLog log;
    MockPrinterStatusSource printer{"http://host:80", false};
    MockDisplaySurface surface{log};
    MockLivenessNotifier liveness;
    std::chrono::steady_clock::time_point now{};
    AppContext ctx{printer, surface, liveness, [](std::function<void()> fn) { fn(); },
                   [this] { return now; }};
    MockMessagePanel splash{"splash", log};
    Navigator nav{ctx};
    MockModePanelFactory factory{log};
    ConnectionReconciler reconciler{ctx, nav, splash, factory};

    ReconcilerFixture() {
        // Startup shows the splash before the first tick
        nav.show_panel(&splash);
        log.clear();
    }

    void advance(std::chrono::seconds delta) {
        now += delta;
    }

    void tick_with(const std::string& label) {
        printer.set_label(label);
        reconciler.tick();
    }
};

} // namespace

// ============================================================================
// Mode selection
// ============================================================================

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: no mode recorded before the first tick",
                 "[reconciler]") {
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
    REQUIRE(printer.query_count == 0);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: operational printer installs idle panel once",
                 "[reconciler]") {
    tick_with("Operational");

    REQUIRE(reconciler.mode() == UiMode::IDLE);
    REQUIRE(log.events == Events{"detach:splash", "hide:splash", "attach:idle", "show:idle"});
    REQUIRE(factory.create_count == 1);

    log.clear();
    tick_with("Operational");

    REQUIRE(log.events.empty());
    REQUIRE(factory.create_count == 1);
    REQUIRE(nav.current() == factory.last_created);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: printing labels select the printing panel",
                 "[reconciler]") {
    SECTION("Printing") {
        tick_with("Printing");
    }
    SECTION("Paused") {
        tick_with("Paused");
    }
    SECTION("Finishing") {
        tick_with("Finishing");
    }
    SECTION("Sending file to SD") {
        tick_with("Sending file to SD");
    }

    REQUIRE(reconciler.mode() == UiMode::PRINTING);
    REQUIRE(nav.current() == factory.last_created);
    REQUIRE(std::string(nav.current()->get_name()) == "printing");
    REQUIRE(printer.connect_count == 0);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: operational wins over printing",
                 "[reconciler]") {
    printer.state = ConnectionState(
        "Operational",
        static_cast<uint8_t>(ConnectionState::OPERATIONAL | ConnectionState::PRINTING));
    reconciler.tick();

    REQUIRE(reconciler.mode() == UiMode::IDLE);
    REQUIRE(std::string(nav.current()->get_name()) == "idle");
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: unrecognized label stays on splash",
                 "[reconciler]") {
    tick_with("Something new");

    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
    REQUIRE(printer.connect_count == 0);
    REQUIRE(splash.set_count == 0);
    REQUIRE(log.events.empty());
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: last_state tracks successful queries",
                 "[reconciler]") {
    tick_with("Operational");
    REQUIRE(reconciler.last_state().label() == "Operational");

    printer.query_error = "timeout";
    reconciler.tick();
    REQUIRE(reconciler.last_state().label() == "Operational");
}

// ============================================================================
// Swap ordering and idempotence
// ============================================================================

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: repeated ticks in one mode never touch the UI",
                 "[reconciler][idempotence]") {
    SECTION("splash") {
        for (int i = 0; i < 5; ++i) {
            tick_with("Opening serial port");
        }
        REQUIRE(surface.max_attached == 1);
        REQUIRE(log.count("attach") == 0);
        REQUIRE(log.count("detach") == 0);
    }

    SECTION("idle") {
        tick_with("Operational");
        log.clear();
        for (int i = 0; i < 5; ++i) {
            tick_with("Operational");
        }
        REQUIRE(log.events.empty());
    }

    SECTION("printing") {
        tick_with("Printing");
        log.clear();
        for (int i = 0; i < 5; ++i) {
            tick_with("Printing");
        }
        REQUIRE(log.events.empty());
        REQUIRE(factory.create_count == 1);
    }
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: swap detaches and hides before attaching",
                 "[reconciler][ordering]") {
    tick_with("Operational");
    log.clear();

    tick_with("Printing");

    // Old panel is destroyed only after the new one is on screen
    REQUIRE(log.events == Events{"detach:idle", "hide:idle", "attach:printing", "show:printing",
                                 "destroy:idle"});
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: returning to splash releases the mode panel",
                 "[reconciler][ordering]") {
    tick_with("Printing");
    log.clear();

    tick_with("Offline");

    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
    REQUIRE(log.events == Events{"detach:printing", "hide:printing", "attach:splash",
                                 "show:splash", "destroy:printing"});
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: surface holds at most one root",
                 "[reconciler][ordering]") {
    const char* labels[] = {"Offline",  "Opening serial port", "Operational", "Printing",
                            "Paused",   "Operational",         "Error",       "Operational",
                            "Closed"};
    for (const char* label : labels) {
        tick_with(label);
        REQUIRE(surface.attached().size() == 1);
    }
    REQUIRE(surface.max_attached == 1);
}

// ============================================================================
// Offline / error recovery
// ============================================================================

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: offline printer triggers a connect request",
                 "[reconciler][connect]") {
    tick_with("Offline");

    REQUIRE(printer.connect_count == 1);
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(splash.set_count == 0);

    // Mode follows on the next poll, not the one that issued the connect
    tick_with("Operational");
    REQUIRE(reconciler.mode() == UiMode::IDLE);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: closed and error labels also reconnect",
                 "[reconciler][connect]") {
    tick_with("Closed");
    tick_with("Error: Too many consecutive timeouts");
    tick_with("Unknown State");

    REQUIRE(printer.connect_count == 3);
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: refused connect shows the friendly message",
                 "[reconciler][connect]") {
    printer.connect_error = REFUSED_TEXT;
    tick_with("Error");

    REQUIRE(printer.connect_count == 1);
    REQUIRE(splash.get_message() == FRIENDLY_REFUSED);
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: other connect failures are shown verbatim",
                 "[reconciler][connect]") {
    printer.connect_error = "HTTP 403 Forbidden";
    tick_with("Offline");

    REQUIRE(splash.get_message() == "Unexpected error: HTTP 403 Forbidden");
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: connecting label is shown on the splash",
                 "[reconciler][connect]") {
    tick_with("Opening serial port");
    REQUIRE(splash.get_message() == "Opening serial port");

    tick_with("Detecting baudrate");
    REQUIRE(splash.get_message() == "Detecting baudrate");

    REQUIRE(printer.connect_count == 0);
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
}

// ============================================================================
// Query failures and the startup grace window
// ============================================================================

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: query failures are silent during startup",
                 "[reconciler][grace]") {
    splash.set_message("Initializing...");
    splash.set_count = 0;
    printer.query_error = REFUSED_TEXT;

    reconciler.tick();
    advance(std::chrono::seconds(29));
    reconciler.tick();

    REQUIRE(splash.get_message() == "Initializing...");
    REQUIRE(splash.set_count == 0);
    REQUIRE(reconciler.mode() == UiMode::SPLASH);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: query failures surface after the grace window",
                 "[reconciler][grace]") {
    printer.query_error = REFUSED_TEXT;

    SECTION("exactly at the boundary") {
        advance(std::chrono::seconds(30));
        reconciler.tick();
        REQUIRE(splash.get_message() == FRIENDLY_REFUSED);
    }

    SECTION("non-refused errors use the generic form") {
        printer.query_error = "timeout";
        advance(std::chrono::seconds(45));
        reconciler.tick();
        REQUIRE(splash.get_message() == "Unexpected error: timeout");
    }

    SECTION("every failing tick refreshes the message") {
        advance(std::chrono::seconds(31));
        reconciler.tick();
        reconciler.tick();
        reconciler.tick();
        REQUIRE(splash.set_count == 3);
    }
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: query failure while idle returns to splash",
                 "[reconciler][grace]") {
    tick_with("Operational");
    REQUIRE(reconciler.mode() == UiMode::IDLE);

    printer.query_error = "connection reset by peer";
    reconciler.tick();

    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
    // Still inside the grace window, so no message yet
    REQUIRE(splash.set_count == 0);
}

// ============================================================================
// Liveness and factory failures
// ============================================================================

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: every tick reports liveness",
                 "[reconciler][liveness]") {
    tick_with("Operational");
    printer.query_error = "timeout";
    reconciler.tick();
    tick_with("Offline");

    REQUIRE(liveness.messages == Events{"WATCHDOG=1", "WATCHDOG=1", "WATCHDOG=1"});
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: liveness failure does not affect the UI",
                 "[reconciler][liveness]") {
    liveness.fail = true;
    tick_with("Operational");

    REQUIRE(liveness.messages.size() == 1);
    REQUIRE(reconciler.mode() == UiMode::IDLE);
}

TEST_CASE_METHOD(ReconcilerFixture, "Reconciler: panel creation failure is retried next tick",
                 "[reconciler][factory]") {
    factory.fail = true;
    tick_with("Operational");

    REQUIRE(reconciler.mode() == UiMode::SPLASH);
    REQUIRE(nav.current() == &splash);
    REQUIRE(log.events.empty());

    factory.fail = false;
    tick_with("Operational");

    REQUIRE(reconciler.mode() == UiMode::IDLE);
    REQUIRE(factory.create_count == 1);
}
