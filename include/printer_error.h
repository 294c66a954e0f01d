// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <utility>

namespace printdeck {

/**
 * @brief Error types for printer server operations
 */
enum class PrinterErrorType {
    NONE,               // No error
    CONNECTION_REFUSED, // Server host reachable, nothing listening
    CONNECTION_FAILED,  // Other transport failure (DNS, unreachable, reset)
    TIMEOUT,            // Request timed out
    HTTP_ERROR,         // Server answered with a non-2xx status
    PARSE_ERROR,        // Response body could not be parsed
    UNKNOWN             // Unknown error
};

/**
 * @brief Error information for a single printer server request
 *
 * A default-constructed PrinterError means success.
 */
struct PrinterError {
    PrinterErrorType type = PrinterErrorType::NONE;
    int status_code = 0; // HTTP status if the server answered
    std::string message; // Diagnostic text (method, URL, cause)

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != PrinterErrorType::NONE;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        switch (type) {
        case PrinterErrorType::NONE:
            return "NONE";
        case PrinterErrorType::CONNECTION_REFUSED:
            return "CONNECTION_REFUSED";
        case PrinterErrorType::CONNECTION_FAILED:
            return "CONNECTION_FAILED";
        case PrinterErrorType::TIMEOUT:
            return "TIMEOUT";
        case PrinterErrorType::HTTP_ERROR:
            return "HTTP_ERROR";
        case PrinterErrorType::PARSE_ERROR:
            return "PARSE_ERROR";
        case PrinterErrorType::UNKNOWN:
        default:
            return "UNKNOWN";
        }
    }

    static PrinterError make(PrinterErrorType type, std::string message, int status_code = 0) {
        PrinterError err;
        err.type = type;
        err.message = std::move(message);
        err.status_code = status_code;
        return err;
    }
};

/**
 * @brief Build the message shown on the splash screen for a failure
 *
 * A refused connection is reported as "server not running" together with the
 * configured endpoint and whether an API key was supplied. The key itself is
 * never included. Anything else falls back to "Unexpected error: <text>".
 *
 * @param error_text Raw error text (matched case-insensitively)
 * @param endpoint Configured server endpoint
 * @param has_api_key true if a non-empty API key is configured
 * @return User-facing message
 */
std::string format_user_error(const std::string& error_text, const std::string& endpoint,
                              bool has_api_key);

} // namespace printdeck
