// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_state.h"
#include "printer_error.h"

#include <string>

namespace printdeck {

/**
 * @brief Abstract interface for the printer server connection API
 *
 * Both calls are synchronous request/reply and are made from the UI thread
 * once per poll. Allows dependency injection of mock implementations for
 * testing and --test mode.
 */
class IPrinterStatusSource {
  public:
    virtual ~IPrinterStatusSource() = default;

    /**
     * @brief Query the current connection state
     *
     * @param[out] state Filled on success, untouched on failure
     * @return Error (has_error() == false on success)
     */
    virtual PrinterError get_connection_state(ConnectionState& state) = 0;

    /**
     * @brief Ask the server to connect to the printer
     *
     * Success only means the command was accepted; the connection itself is
     * observed on a later get_connection_state().
     */
    virtual PrinterError connect() = 0;

    /// Configured server endpoint (e.g. "http://octopi.local")
    virtual const std::string& endpoint() const = 0;

    /// true if an API key is configured (the key itself is never exposed)
    virtual bool has_api_key() const = 0;
};

} // namespace printdeck
