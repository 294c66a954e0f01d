// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace printdeck {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< journal if available, else syslog (Linux), else console only
    Journal, ///< systemd journal (needs libsystemd at build time)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Used with LogTarget::File, empty = auto-resolve
};

/**
 * @brief Install the default "printdeck" logger
 *
 * Safe to call again (e.g. after the config file is read); the previous
 * default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief Parse log target name ("auto", "journal", "syslog", "file", "console")
 * @return Parsed target, LogTarget::Auto for unrecognized names
 */
LogTarget parse_log_target(const std::string& str);

/**
 * @brief Convert LogTarget to string for logging
 */
const char* log_target_name(LogTarget target);

/**
 * @brief Map a -v count to a level (0=warn, 1=info, 2=debug, 3+=trace)
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace printdeck
