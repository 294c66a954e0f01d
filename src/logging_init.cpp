// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef PRINTDECK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace printdeck {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "printdeck";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;

const std::pair<LogTarget, const char*> TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},     {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"}, {LogTarget::File, "file"},
    {LogTarget::Console, "console"},
};

/**
 * @brief Default log file location when none is configured
 *
 * $XDG_STATE_HOME/printdeck/printdeck.log, falling back to
 * ~/.local/state and finally the working directory.
 */
std::string default_log_file() {
    namespace fs = std::filesystem;

    const char* state = std::getenv("XDG_STATE_HOME");
    const char* home = std::getenv("HOME");

    fs::path base;
    if (state && *state) {
        base = state;
    } else if (home && *home) {
        base = fs::path(home) / ".local" / "state";
    } else {
        return "printdeck.log";
    }

    fs::path dir = base / "printdeck";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return "printdeck.log";
    }
    return (dir / "printdeck.log").string();
}

LogTarget resolve_auto_target() {
#if defined(__linux__) && defined(PRINTDECK_HAS_SYSTEMD)
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/**
 * @brief Sink for the non-console target, or nullptr for console only
 *
 * Throws spdlog::spdlog_ex if the sink cannot be opened.
 */
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file() : file_path;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_MAX_BYTES,
                                                                      LOG_FILE_ROTATIONS);
    }
#ifdef __linux__
    case LogTarget::Journal:
#ifdef PRINTDECK_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME);
#else
        // Built without libsystemd: syslog still reaches the journal
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_USER,
                                                               false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    LogTarget target = config.target == LogTarget::Auto ? resolve_auto_target() : config.target;

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // No logger exists yet to report this
        std::fprintf(stderr, "printdeck: %s logging unavailable: %s\n", log_target_name(target),
                     e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(std::move(logger));

    spdlog::debug("[Logging] {} sink(s), target={}, level={}", sinks.size(),
                  log_target_name(target), spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.first == target) {
            return entry.second;
        }
    }
    return "unknown";
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    if (verbosity == 1) {
        return spdlog::level::info;
    }
    return verbosity == 2 ? spdlog::level::debug : spdlog::level::trace;
}

} // namespace logging
} // namespace printdeck
