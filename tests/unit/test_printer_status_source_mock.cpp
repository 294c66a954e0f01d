// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_printer_status_source_mock.cpp
 * @brief Unit tests for the simulated printer used by --test
 */

#include "printer_status_source_mock.h"

#include <catch2/catch_all.hpp>

using namespace printdeck;

namespace {

std::string query_label(PrinterStatusSourceMock& printer) {
    ConnectionState state;
    PrinterError err = printer.get_connection_state(state);
    REQUIRE_FALSE(err.has_error());
    return state.label();
}

} // namespace

TEST_CASE("PrinterMock: starts offline without a key", "[printer_mock]") {
    PrinterStatusSourceMock printer;

    REQUIRE(query_label(printer) == "Offline");
    REQUIRE(printer.endpoint() == "http://mock-printer");
    REQUIRE_FALSE(printer.has_api_key());
}

TEST_CASE("PrinterMock: connect walks through connecting to operational", "[printer_mock]") {
    PrinterStatusSourceMock printer;

    REQUIRE_FALSE(printer.connect().has_error());
    REQUIRE(query_label(printer) == "Opening serial port");
    REQUIRE(query_label(printer) == "Operational");
    REQUIRE(query_label(printer) == "Operational");
}

TEST_CASE("PrinterMock: repeated connect does not restart the sequence", "[printer_mock]") {
    PrinterStatusSourceMock printer;

    REQUIRE_FALSE(printer.connect().has_error());
    REQUIRE(query_label(printer) == "Opening serial port");
    REQUIRE_FALSE(printer.connect().has_error());
    REQUIRE(query_label(printer) == "Operational");
}

TEST_CASE("PrinterMock: set_state overrides the label", "[printer_mock]") {
    PrinterStatusSourceMock printer;
    printer.set_state("Printing");

    ConnectionState state;
    REQUIRE_FALSE(printer.get_connection_state(state).has_error());
    REQUIRE(state.is_printing());
}

TEST_CASE("PrinterMock: scripted failures apply once", "[printer_mock]") {
    PrinterStatusSourceMock printer("http://sim");

    SECTION("query failure") {
        printer.fail_next_query("timeout");

        ConnectionState state;
        PrinterError err = printer.get_connection_state(state);
        REQUIRE(err.type == PrinterErrorType::CONNECTION_FAILED);
        REQUIRE(err.message == "timeout");
        REQUIRE(query_label(printer) == "Offline");
    }

    SECTION("refused connect") {
        printer.fail_next_connect("dial tcp: connection refused");

        PrinterError err = printer.connect();
        REQUIRE(err.type == PrinterErrorType::CONNECTION_REFUSED);
        REQUIRE(query_label(printer) == "Offline");
        REQUIRE_FALSE(printer.connect().has_error());
    }

    SECTION("other connect failure") {
        printer.fail_next_connect("HTTP 500");
        REQUIRE(printer.connect().type == PrinterErrorType::CONNECTION_FAILED);
    }
}
