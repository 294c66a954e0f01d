// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_state.h"

#include <initializer_list>

namespace printdeck {

namespace {

bool has_any_prefix(const std::string& label, std::initializer_list<const char*> prefixes) {
    for (const char* prefix : prefixes) {
        if (label.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

ConnectionState ConnectionState::from_label(const std::string& label) {
    uint8_t flags = 0;

    if (has_any_prefix(label, {"Operational"})) {
        flags |= OPERATIONAL;
    }
    // "Transfering" is OctoPrint's historical spelling, keep both
    if (has_any_prefix(label, {"Printing", "Starting", "Sending", "Paused", "Pausing", "Resuming",
                               "Cancelling", "Finishing", "Transferring", "Transfering"})) {
        flags |= PRINTING;
    }
    if (has_any_prefix(label, {"Error", "Unknown"})) {
        flags |= ERROR;
    }
    if (has_any_prefix(label, {"Offline", "Closed"})) {
        flags |= OFFLINE;
    }
    if (has_any_prefix(label, {"Opening", "Detecting", "Connecting"})) {
        flags |= CONNECTING;
    }

    return ConnectionState(label, flags);
}

} // namespace printdeck
