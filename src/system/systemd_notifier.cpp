// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "liveness_notifier.h"

#include <spdlog/spdlog.h>

#include <cstring>

#ifdef PRINTDECK_HAS_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace printdeck {

bool SystemdNotifier::notify(const std::string& message, std::string& error) {
#ifdef PRINTDECK_HAS_SYSTEMD
    int ret = sd_notify(0, message.c_str());
    if (ret < 0) {
        error = std::strerror(-ret);
        return false;
    }
    if (ret == 0) {
        spdlog::trace("[Systemd] Not running under systemd, dropped '{}'", message);
    }
    return true;
#else
    (void)error;
    spdlog::trace("[Systemd] Built without libsystemd, dropped '{}'", message);
    return true;
#endif
}

} // namespace printdeck
