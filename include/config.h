// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

#include "hv/json.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace printdeck {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Layout:
 * ```json
 * {
 *   "printer": {"endpoint": "http://localhost", "api_key": ""},
 *   "display": {"width": 800, "height": 480, "dark_mode": true},
 *   "log_level": "info", "log_dest": "auto", "log_file": ""
 * }
 * ```
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("printdeck.json");
 * cfg->apply_env_overrides();
 *
 * std::string endpoint = cfg->get<std::string>("/printer/endpoint", "http://localhost");
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file and fills in any missing keys with defaults.
     * Creates the file with defaults if it doesn't exist.
     *
     * @param config_path Path to JSON configuration file
     * @return false if an existing file could not be parsed (defaults are used)
     */
    bool init(const std::string& config_path);

    /**
     * @brief Apply PRINTDECK_ENDPOINT, PRINTDECK_API_KEY and PRINTDECK_RESOLUTION
     *
     * Overrides take precedence in get(path, default) and are never written
     * back by save().
     * An unparseable PRINTDECK_RESOLUTION is logged and ignored.
     */
    void apply_env_overrides();

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * @param json_ptr JSON pointer path (e.g., "/printer/endpoint")
     * @param default_value Fallback value if path not found or of the wrong type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        try {
            if (overrides.contains(ptr)) {
                return overrides[ptr].template get<T>();
            }
            if (data.contains(ptr) && !data[ptr].is_null()) {
                return data[ptr].template get<T>();
            }
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] {} has wrong type, using default: {}", json_ptr, e.what());
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Override a value for this run only (environment, CLI)
     *
     * Takes precedence over the file value in get(path, default).
     */
    template <typename T> void set_override(const std::string& json_ptr, T v) {
        overrides[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Overrides are not persisted.
     *
     * @return true on success (failures are logged)
     */
    bool save();

    std::string get_path() const {
        return path;
    }

    /**
     * @brief Window width, falling back to the default when unset or 0
     */
    int get_display_width();

    /**
     * @brief Window height, falling back to the default when unset or 0
     */
    int get_display_height();

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();

  private:
    /// Values from the environment, consulted before data and never saved
    json overrides;
};

/**
 * @brief Parse a "WxH" resolution string
 *
 * @return true if both dimensions parsed and are positive
 */
bool parse_resolution(const std::string& text, int& width, int& height);

} // namespace printdeck
