// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC
/**
 * @file ui_update_queue.h
 * @brief Thread-safe hand-off of work onto the LVGL thread
 *
 * Any thread may queue a callback; callbacks run on the LVGL thread from a
 * highest-priority timer at the start of the next lv_timer_handler() cycle,
 * before rendering. The connection poller uses this to deliver its ticks.
 *
 * Usage:
 * @code
 * // From the poller thread:
 * ui_queue_update([&reconciler]() { reconciler.tick(); });
 * @endcode
 */

#pragma once

#include <lvgl.h>

#include <spdlog/spdlog.h>

#include <functional>
#include <mutex>
#include <queue>

namespace printdeck::ui {

/**
 * @brief Callback type for queued updates
 */
using UpdateCallback = std::function<void()>;

/**
 * @brief Thread-safe UI update queue (singleton)
 *
 * Call init() once after lv_init(). A 1 ms timer drains the queue every
 * lv_timer_handler() cycle, whether or not anything is being redrawn.
 */
class UpdateQueue {
  public:
    static UpdateQueue& instance() {
        static UpdateQueue instance;
        return instance;
    }

    void init() {
        if (initialized_)
            return;

        timer_ = lv_timer_create(timer_cb, 1, this);
        if (!timer_) {
            spdlog::error("[UpdateQueue] Failed to create timer!");
            return;
        }

        initialized_ = true;
        spdlog::debug("[UpdateQueue] Initialized");
    }

    /**
     * @brief Queue a callback for the LVGL thread (any thread)
     */
    void queue(UpdateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push(std::move(callback));
    }

    /**
     * @brief Delete the drain timer; pending callbacks are dropped
     */
    void shutdown() {
        if (timer_) {
            lv_timer_delete(timer_);
            timer_ = nullptr;
        }
        initialized_ = false;

        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<UpdateCallback>().swap(pending_);
    }

    /**
     * @brief Run pending callbacks now (unit tests)
     */
    void drain_queue_for_testing() {
        process_pending();
    }

  private:
    UpdateQueue() = default;
    ~UpdateQueue() {
        shutdown();
    }

    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    static void timer_cb(lv_timer_t* timer) {
        auto* self = static_cast<UpdateQueue*>(lv_timer_get_user_data(timer));
        if (self && self->initialized_) {
            self->process_pending();
        }
    }

    void process_pending() {
        // Swap out under the lock so callbacks may queue more work
        std::queue<UpdateCallback> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        while (!to_process.empty()) {
            to_process.front()();
            to_process.pop();
        }
    }

    std::mutex mutex_;
    std::queue<UpdateCallback> pending_;
    lv_timer_t* timer_ = nullptr;
    bool initialized_ = false;
};

} // namespace printdeck::ui

/**
 * @brief Queue a UI update for execution on the LVGL thread
 */
inline void ui_queue_update(printdeck::ui::UpdateCallback callback) {
    printdeck::ui::UpdateQueue::instance().queue(std::move(callback));
}

inline void ui_update_queue_init() {
    printdeck::ui::UpdateQueue::instance().init();
}

inline void ui_update_queue_shutdown() {
    printdeck::ui::UpdateQueue::instance().shutdown();
}
