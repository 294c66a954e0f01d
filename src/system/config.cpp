// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "app_constants.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace printdeck {

Config* Config::instance{nullptr};

namespace {

json default_config() {
    return {{"printer", {{"endpoint", "http://localhost"}, {"api_key", ""}}},
            {"display",
             {{"width", AppConstants::Window::DEFAULT_WIDTH},
              {"height", AppConstants::Window::DEFAULT_HEIGHT},
              {"dark_mode", true}}},
            {"log_level", "info"},
            {"log_dest", "auto"},
            {"log_file", ""}};
}

/// Copy keys from defaults that are missing in target, recursively
bool fill_missing(json& target, const json& defaults) {
    bool changed = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key()) || target[it.key()].is_null()) {
            target[it.key()] = it.value();
            changed = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            changed |= fill_missing(target[it.key()], it.value());
        }
    }
    return changed;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    bool ok = true;
    bool needs_save = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::parse_error& e) {
            // Keep the broken file for the user to fix, run on defaults
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            data = default_config();
            return false;
        }
        if (!data.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, using defaults", config_path);
            data = default_config();
            return false;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = json::object();
        needs_save = true;
    }

    needs_save |= fill_missing(data, default_config());

    if (needs_save) {
        ok = save();
    }

    spdlog::debug("[Config] Initialized: endpoint={}, display={}x{}",
                  get<std::string>("/printer/endpoint", ""), get_display_width(),
                  get_display_height());
    return ok;
}

void Config::apply_env_overrides() {
    if (const char* endpoint = std::getenv("PRINTDECK_ENDPOINT")) {
        if (endpoint[0] != '\0') {
            set_override<std::string>("/printer/endpoint", endpoint);
            spdlog::debug("[Config] Endpoint from PRINTDECK_ENDPOINT: {}", endpoint);
        }
    }

    if (const char* key = std::getenv("PRINTDECK_API_KEY")) {
        if (key[0] != '\0') {
            set_override<std::string>("/printer/api_key", key);
            spdlog::debug("[Config] API key from PRINTDECK_API_KEY");
        }
    }

    if (const char* resolution = std::getenv("PRINTDECK_RESOLUTION")) {
        int w = 0, h = 0;
        if (parse_resolution(resolution, w, h)) {
            set_override("/display/width", w);
            set_override("/display/height", h);
            spdlog::debug("[Config] Resolution from PRINTDECK_RESOLUTION: {}x{}", w, h);
        } else {
            spdlog::warn("[Config] Ignoring malformed PRINTDECK_RESOLUTION '{}'", resolution);
        }
    }
}

bool Config::save() {
    spdlog::debug("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        spdlog::debug("[Config] Config saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

int Config::get_display_width() {
    int w = get<int>("/display/width", AppConstants::Window::DEFAULT_WIDTH);
    int h = get<int>("/display/height", AppConstants::Window::DEFAULT_HEIGHT);
    return (w <= 0 || h <= 0) ? AppConstants::Window::DEFAULT_WIDTH : w;
}

int Config::get_display_height() {
    int w = get<int>("/display/width", AppConstants::Window::DEFAULT_WIDTH);
    int h = get<int>("/display/height", AppConstants::Window::DEFAULT_HEIGHT);
    return (w <= 0 || h <= 0) ? AppConstants::Window::DEFAULT_HEIGHT : h;
}

bool parse_resolution(const std::string& text, int& width, int& height) {
    int w = 0, h = 0;
    char trailing = '\0';
    if (std::sscanf(text.c_str(), "%dx%d%c", &w, &h, &trailing) != 2 || w <= 0 || h <= 0) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

} // namespace printdeck
