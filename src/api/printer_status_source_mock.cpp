// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_status_source_mock.h"

#include <spdlog/spdlog.h>

namespace printdeck {

PrinterStatusSourceMock::PrinterStatusSourceMock(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
    spdlog::info("[PrinterMock] Using simulated printer at {}", endpoint_);
}

PrinterError PrinterStatusSourceMock::get_connection_state(ConnectionState& state) {
    if (!next_query_error_.empty()) {
        std::string message = std::move(next_query_error_);
        next_query_error_.clear();
        return PrinterError::make(PrinterErrorType::CONNECTION_FAILED, message);
    }

    if (connecting_polls_left_ > 0 && --connecting_polls_left_ == 0) {
        label_ = "Operational";
        spdlog::debug("[PrinterMock] Connected");
    }

    state = ConnectionState::from_label(label_);
    return PrinterError{};
}

PrinterError PrinterStatusSourceMock::connect() {
    if (!next_connect_error_.empty()) {
        std::string message = std::move(next_connect_error_);
        next_connect_error_.clear();
        PrinterErrorType type = message.find("refused") != std::string::npos
                                    ? PrinterErrorType::CONNECTION_REFUSED
                                    : PrinterErrorType::CONNECTION_FAILED;
        return PrinterError::make(type, message);
    }

    if (connecting_polls_left_ == 0) {
        label_ = "Opening serial port";
        connecting_polls_left_ = CONNECTING_POLLS;
        spdlog::debug("[PrinterMock] Connect requested");
    }
    return PrinterError{};
}

void PrinterStatusSourceMock::set_state(const std::string& label) {
    label_ = label;
    connecting_polls_left_ = 0;
}

void PrinterStatusSourceMock::fail_next_query(const std::string& message) {
    next_query_error_ = message;
}

void PrinterStatusSourceMock::fail_next_connect(const std::string& message) {
    next_connect_error_ = message;
}

} // namespace printdeck
