// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_octoprint_client.cpp
 * @brief Unit tests for OctoPrintClient against a loopback HTTP server
 *
 * Response handling is exercised with MockOctoPrintServer on a fixed local
 * port; transport failures use a closed local port.
 */

#include "octoprint_client.h"
#include "printer_error.h"

#include "hv/json.hpp"
#include "mock_octoprint_server.h"

#include <catch2/catch_all.hpp>

using json = nlohmann::json;
using namespace printdeck;

namespace {

// Fixed port; ephemeral port lookup is not exposed by the server
constexpr int MOCK_SERVER_PORT = 18767;

class OctoPrintServerFixture {
  public:
    OctoPrintServerFixture() {
        REQUIRE(server.start(MOCK_SERVER_PORT) == MOCK_SERVER_PORT);
    }

  protected:
    MockOctoPrintServer server;
};

} // namespace

// ============================================================================
// Endpoint handling
// ============================================================================

TEST_CASE("OctoPrintClient: trailing slashes are stripped", "[octoprint]") {
    OctoPrintClient client("http://octopi.local//", "");

    REQUIRE(client.endpoint() == "http://octopi.local");
    REQUIRE(client.build_url("/api/connection") == "http://octopi.local/api/connection");
}

TEST_CASE("OctoPrintClient: build_url adds a missing slash", "[octoprint]") {
    OctoPrintClient client("http://10.0.0.5:5000", "");

    REQUIRE(client.build_url("api/connection") == "http://10.0.0.5:5000/api/connection");
    REQUIRE(client.build_url("") == "http://10.0.0.5:5000");
}

TEST_CASE("OctoPrintClient: has_api_key reflects configuration", "[octoprint]") {
    REQUIRE_FALSE(OctoPrintClient("http://h", "").has_api_key());
    REQUIRE(OctoPrintClient("http://h", "0123456789ABCDEF").has_api_key());
}

// ============================================================================
// Transport failures
// ============================================================================

TEST_CASE("OctoPrintClient: closed port reports connection refused", "[octoprint][network]") {
    // Port 1 (tcpmux) is essentially never open on a test machine
    OctoPrintClient client("http://127.0.0.1:1", "secret-key");

    ConnectionState state = ConnectionState::from_label("Operational");
    PrinterError err = client.get_connection_state(state);

    REQUIRE(err.type == PrinterErrorType::CONNECTION_REFUSED);
    REQUIRE_THAT(err.message,
                 Catch::Matchers::ContainsSubstring("http://127.0.0.1:1/api/connection"));
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring(
                                  "connection refused", Catch::CaseSensitive::No));
    REQUIRE_THAT(err.message, !Catch::Matchers::ContainsSubstring("secret-key"));

    // Output is untouched on failure
    REQUIRE(state.label() == "Operational");

    // The splash turns this into the friendly text
    REQUIRE(format_user_error(err.message, client.endpoint(), client.has_api_key()) ==
            "Unable to connect to \"http://127.0.0.1:1\" (Key: true), \n"
            "maybe OctoPrint not running?");
}

TEST_CASE("OctoPrintClient: connect to closed port fails", "[octoprint][network]") {
    OctoPrintClient client("http://127.0.0.1:1", "");

    PrinterError err = client.connect();

    REQUIRE(err.type == PrinterErrorType::CONNECTION_REFUSED);
    REQUIRE_THAT(err.message, Catch::Matchers::StartsWith("POST "));
}

// ============================================================================
// GET /api/connection
// ============================================================================

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: parses current.state",
                 "[octoprint][network]") {
    server.set_get_reply(200,
                         R"({"current": {"state": "Printing from SD", "port": "/dev/ttyACM0"}})");
    OctoPrintClient client(server.endpoint(), "");

    ConnectionState state;
    PrinterError err = client.get_connection_state(state);

    REQUIRE_FALSE(err.has_error());
    REQUIRE(state.label() == "Printing from SD");
    REQUIRE(state.is_printing());
    REQUIRE_FALSE(state.is_operational());
}

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: sends X-Api-Key only when configured",
                 "[octoprint][network]") {
    server.set_get_reply(200, R"({"current": {"state": "Operational"}})");

    SECTION("with key") {
        OctoPrintClient client(server.endpoint(), "ABCDEF0123");
        ConnectionState state;
        REQUIRE_FALSE(client.get_connection_state(state).has_error());

        auto received = server.received();
        REQUIRE(received.size() == 1);
        REQUIRE(received[0].method == "GET");
        REQUIRE(received[0].api_key == "ABCDEF0123");
    }

    SECTION("without key") {
        OctoPrintClient client(server.endpoint(), "");
        ConnectionState state;
        REQUIRE_FALSE(client.get_connection_state(state).has_error());

        auto received = server.received();
        REQUIRE(received.size() == 1);
        REQUIRE(received[0].api_key.empty());
    }
}

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: non-2xx reply is an HTTP error",
                 "[octoprint][network]") {
    server.set_get_reply(403, R"({"error": "Invalid API key"})");
    OctoPrintClient client(server.endpoint(), "wrong");

    ConnectionState state = ConnectionState::from_label("Operational");
    PrinterError err = client.get_connection_state(state);

    REQUIRE(err.type == PrinterErrorType::HTTP_ERROR);
    REQUIRE(err.status_code == 403);
    REQUIRE_THAT(err.message, Catch::Matchers::StartsWith("GET "));
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("Invalid API key"));
    REQUIRE(state.label() == "Operational");
}

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: unusable body is a parse error",
                 "[octoprint][network]") {
    std::string body;
    SECTION("not JSON") {
        body = "<html>OctoPrint</html>";
    }
    SECTION("missing current.state") {
        body = R"({"current": {"port": null}})";
    }
    server.set_get_reply(200, body);
    OctoPrintClient client(server.endpoint(), "");

    ConnectionState state = ConnectionState::from_label("Operational");
    PrinterError err = client.get_connection_state(state);

    REQUIRE(err.type == PrinterErrorType::PARSE_ERROR);
    REQUIRE(err.status_code == 200);
    REQUIRE(state.label() == "Operational");
}

// ============================================================================
// POST /api/connection
// ============================================================================

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: connect posts the connect command",
                 "[octoprint][network]") {
    OctoPrintClient client(server.endpoint(), "ABCDEF0123");

    PrinterError err = client.connect();

    REQUIRE_FALSE(err.has_error());
    auto received = server.received();
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].method == "POST");
    REQUIRE(received[0].api_key == "ABCDEF0123");
    REQUIRE_THAT(received[0].content_type, Catch::Matchers::StartsWith("application/json"));
    REQUIRE(json::parse(received[0].body) == json{{"command", "connect"}});
}

TEST_CASE_METHOD(OctoPrintServerFixture, "OctoPrintClient: connect rejected by server",
                 "[octoprint][network]") {
    server.set_post_reply(400, R"({"error": "Printer is not operational"})");
    OctoPrintClient client(server.endpoint(), "");

    PrinterError err = client.connect();

    REQUIRE(err.type == PrinterErrorType::HTTP_ERROR);
    REQUIRE(err.status_code == 400);
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("Printer is not operational"));
}
