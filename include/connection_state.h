// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace printdeck {

/**
 * @brief Printer connection/job state as reported by the print server
 *
 * Wraps the server's state label (e.g. "Operational", "Printing",
 * "Opening serial port") together with the five classification flags the
 * reconciler asks about. from_label() derives the flags from an OctoPrint
 * label; sources that report flags directly can use the explicit constructor.
 */
class ConnectionState {
  public:
    enum Flag : uint8_t {
        OPERATIONAL = 1 << 0,
        PRINTING = 1 << 1,
        ERROR = 1 << 2,
        OFFLINE = 1 << 3,
        CONNECTING = 1 << 4,
    };

    ConnectionState() = default;
    ConnectionState(std::string label, uint8_t flags) : label_(std::move(label)), flags_(flags) {}

    /**
     * @brief Classify an OctoPrint state label by prefix
     *
     * Unknown labels produce a state with no flags set.
     *
     * @param label State string from /api/connection (current.state)
     */
    static ConnectionState from_label(const std::string& label);

    bool is_operational() const {
        return (flags_ & OPERATIONAL) != 0;
    }
    bool is_printing() const {
        return (flags_ & PRINTING) != 0;
    }
    bool is_error() const {
        return (flags_ & ERROR) != 0;
    }
    bool is_offline() const {
        return (flags_ & OFFLINE) != 0;
    }
    bool is_connecting() const {
        return (flags_ & CONNECTING) != 0;
    }

    /// Short label suitable for direct display
    const std::string& label() const {
        return label_;
    }

    uint8_t flags() const {
        return flags_;
    }

  private:
    std::string label_;
    uint8_t flags_ = 0;
};

/// Returns the most recently observed connection state
using ConnectionStateProvider = std::function<ConnectionState()>;

} // namespace printdeck
