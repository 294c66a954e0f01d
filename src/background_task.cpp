// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "background_task.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace printdeck {

BackgroundTask::BackgroundTask(AppContext& ctx, std::chrono::milliseconds interval, Action action)
    : dispatch_(ctx.dispatch), interval_(interval), action_(std::move(action)) {}

BackgroundTask::~BackgroundTask() {
    stop();
}

void BackgroundTask::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        spdlog::warn("[BackgroundTask] start() called twice, ignoring");
        return;
    }

    spdlog::debug("[BackgroundTask] Starting, interval={}ms", interval_.count());
    thread_ = std::thread([this]() { run(); });
}

void BackgroundTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void BackgroundTask::run() {
    auto next_tick = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        lock.unlock();

        // Exceptions are caught where the action actually runs (possibly on
        // the UI thread), so a bad tick never breaks the schedule
        Action action = action_;
        dispatch_([action]() {
            try {
                action();
            } catch (const std::exception& e) {
                spdlog::error("[BackgroundTask] Tick failed: {}", e.what());
            }
        });

        next_tick += interval_;
        lock.lock();
        cv_.wait_until(lock, next_tick, [this]() { return stopping_; });
    }

    spdlog::debug("[BackgroundTask] Stopped");
}

} // namespace printdeck
