// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_status_source.h"

#include <string>

namespace printdeck {

/**
 * @brief Simulated printer server for --test mode
 *
 * Starts "Offline". A connect() request moves it to "Opening serial port",
 * and after CONNECTING_POLLS further queries it reports "Operational".
 * Individual failures can be scripted for manual testing of the splash
 * error path.
 */
class PrinterStatusSourceMock : public IPrinterStatusSource {
  public:
    static constexpr int CONNECTING_POLLS = 2;

    explicit PrinterStatusSourceMock(std::string endpoint = "http://mock-printer");

    PrinterError get_connection_state(ConnectionState& state) override;
    PrinterError connect() override;

    const std::string& endpoint() const override {
        return endpoint_;
    }
    bool has_api_key() const override {
        return false;
    }

    /// Force the reported state label (resets the connect sequence)
    void set_state(const std::string& label);

    /// Make the next query fail with the given transport error text
    void fail_next_query(const std::string& message);

    /// Make the next connect() fail with the given transport error text
    void fail_next_connect(const std::string& message);

  private:
    std::string endpoint_;
    std::string label_ = "Offline";
    int connecting_polls_left_ = 0;
    std::string next_query_error_;
    std::string next_connect_error_;
};

} // namespace printdeck
