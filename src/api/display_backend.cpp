// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "display_backend.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>

namespace printdeck {

std::unique_ptr<DisplayBackend> DisplayBackend::create(DisplayBackendType type) {
    switch (type) {
#ifdef PRINTDECK_DISPLAY_SDL
    case DisplayBackendType::SDL:
        return std::make_unique<DisplayBackendSDL>();
#endif
#ifdef PRINTDECK_DISPLAY_FBDEV
    case DisplayBackendType::FBDEV:
        return std::make_unique<DisplayBackendFbdev>();
#endif
    case DisplayBackendType::AUTO:
        return create_auto();
    default:
        spdlog::error("[Display] Backend {} not compiled in",
                      display_backend_type_to_string(type));
        return nullptr;
    }
}

std::unique_ptr<DisplayBackend> DisplayBackend::create_auto() {
    const char* forced = std::getenv("PRINTDECK_DISPLAY_BACKEND");
    if (forced && forced[0] != '\0') {
        DisplayBackendType type = DisplayBackendType::AUTO;
        if (strcmp(forced, "sdl") == 0) {
            type = DisplayBackendType::SDL;
        } else if (strcmp(forced, "fbdev") == 0) {
            type = DisplayBackendType::FBDEV;
        } else {
            spdlog::warn("[Display] Unknown PRINTDECK_DISPLAY_BACKEND '{}', auto-detecting",
                         forced);
        }

        if (type != DisplayBackendType::AUTO) {
            auto backend = create(type);
            if (backend && backend->is_available()) {
                spdlog::info("[Display] Using {} backend (forced)", backend->name());
                return backend;
            }
            spdlog::warn("[Display] Forced backend '{}' unavailable, auto-detecting", forced);
        }
    }

#ifdef PRINTDECK_DISPLAY_FBDEV
    {
        auto fbdev = std::make_unique<DisplayBackendFbdev>();
        if (fbdev->is_available()) {
            return fbdev;
        }
        spdlog::debug("[Display] Framebuffer not available");
    }
#endif

#ifdef PRINTDECK_DISPLAY_SDL
    return std::make_unique<DisplayBackendSDL>();
#else
    spdlog::error("[Display] No display backend available");
    return nullptr;
#endif
}

} // namespace printdeck
