// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace printdeck {

/**
 * @brief Fire-and-forget notifications to the host service supervisor
 *
 * Callers log failures and carry on; a failed notification never changes
 * UI state.
 */
class ILivenessNotifier {
  public:
    virtual ~ILivenessNotifier() = default;

    /**
     * @brief Send a supervisor message (e.g. "READY=1", "WATCHDOG=1")
     *
     * @param message Message in sd_notify() state format
     * @param[out] error Failure description when false is returned
     * @return true if the message was delivered (or no supervisor is listening)
     */
    virtual bool notify(const std::string& message, std::string& error) = 0;
};

/**
 * @brief systemd implementation using sd_notify()
 *
 * Not running under systemd (no NOTIFY_SOCKET) counts as success.
 */
class SystemdNotifier : public ILivenessNotifier {
  public:
    bool notify(const std::string& message, std::string& error) override;
};

} // namespace printdeck
