// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "app_context.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace printdeck {

/**
 * @brief Fixed-rate periodic task driven by a dedicated timer thread
 *
 * The timer thread never runs the action itself: every tick is handed to the
 * context's UI dispatcher, so the action executes on the UI thread and a
 * slow frame does not shift the schedule (ticks are spaced on a fixed
 * wall-clock grid, not "interval after the previous one finished").
 *
 * The first tick fires immediately on start(). There is no pause or error
 * channel; exceptions escaping the action are logged and the schedule
 * continues. The thread is stopped and joined on destruction.
 */
class BackgroundTask {
  public:
    using Action = std::function<void()>;

    BackgroundTask(AppContext& ctx, std::chrono::milliseconds interval, Action action);
    ~BackgroundTask();

    // Non-copyable, non-movable (owns a thread capturing this)
    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;
    BackgroundTask(BackgroundTask&&) = delete;
    BackgroundTask& operator=(BackgroundTask&&) = delete;

    /**
     * @brief Start ticking
     *
     * Call once, when the UI is ready. Further calls are ignored.
     */
    void start();

    bool is_running() const {
        return started_.load();
    }

    std::chrono::milliseconds interval() const {
        return interval_;
    }

  private:
    void run();
    void stop();

    UiDispatcher dispatch_;
    std::chrono::milliseconds interval_;
    Action action_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> started_{false};
    bool stopping_ = false;
};

} // namespace printdeck
