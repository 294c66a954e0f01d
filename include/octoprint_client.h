// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_status_source.h"

#include <string>

namespace printdeck {

/**
 * @brief OctoPrint REST client for the connection endpoint
 *
 * - GET  /api/connection              → current.state
 * - POST /api/connection {"command":"connect"}
 *
 * Requests are synchronous (libhv requests API) with a short timeout so a
 * tick never outlives the poll interval. The API key is sent as X-Api-Key
 * and is never logged.
 */
class OctoPrintClient : public IPrinterStatusSource {
  public:
    /**
     * @param endpoint Base URL (e.g. "http://octopi.local"), trailing '/' allowed
     * @param api_key API key, empty for none
     */
    OctoPrintClient(std::string endpoint, std::string api_key);

    PrinterError get_connection_state(ConnectionState& state) override;
    PrinterError connect() override;

    const std::string& endpoint() const override {
        return endpoint_;
    }
    bool has_api_key() const override {
        return !api_key_.empty();
    }

    /**
     * @brief Build a request URL from the endpoint and an API path
     */
    std::string build_url(const std::string& path) const;

  private:
    std::string endpoint_;
    std::string api_key_;
};

} // namespace printdeck
