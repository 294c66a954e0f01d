// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <functional>

namespace printdeck {

class IPrinterStatusSource;
class IDisplaySurface;
class ILivenessNotifier;

/// Runs a callback on the UI thread (or inline, in tests)
using UiDispatcher = std::function<void(std::function<void()>)>;

/// Monotonic time source, injectable for tests
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Collaborators shared by the navigation and connection core
 *
 * Owned by Application and passed by reference to the Navigator,
 * BackgroundTask and ConnectionReconciler constructors. All referenced
 * objects must outlive the components that use them.
 */
struct AppContext {
    IPrinterStatusSource& printer;
    IDisplaySurface& surface;
    ILivenessNotifier& liveness;
    UiDispatcher dispatch;
    SteadyClock now = [] { return std::chrono::steady_clock::now(); };
};

} // namespace printdeck
