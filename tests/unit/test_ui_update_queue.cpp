// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_update_queue.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_all.hpp>

#include <thread>
#include <vector>

using printdeck::ui::UpdateQueue;

TEST_CASE_METHOD(LVGLTestFixture, "UpdateQueue: callback runs on the next timer cycle",
                 "[ui][update_queue]") {
    int runs = 0;
    ui_queue_update([&runs] { runs++; });

    REQUIRE(runs == 0);

    process_lvgl(10);
    REQUIRE(runs == 1);

    process_lvgl(10);
    REQUIRE(runs == 1);
}

TEST_CASE_METHOD(LVGLTestFixture, "UpdateQueue: work queued off-thread runs on the LVGL thread",
                 "[ui][update_queue]") {
    std::thread::id ran_on;
    std::thread worker([&ran_on] {
        ui_queue_update([&ran_on] { ran_on = std::this_thread::get_id(); });
    });
    worker.join();

    process_lvgl(10);

    REQUIRE(ran_on == std::this_thread::get_id());
}

TEST_CASE_METHOD(LVGLTestFixture, "UpdateQueue: callbacks run in order and may queue more",
                 "[ui][update_queue]") {
    std::vector<int> order;
    ui_queue_update([&order] {
        order.push_back(1);
        ui_queue_update([&order] { order.push_back(3); });
    });
    ui_queue_update([&order] { order.push_back(2); });

    UpdateQueue::instance().drain_queue_for_testing();
    REQUIRE(order == std::vector<int>{1, 2});

    UpdateQueue::instance().drain_queue_for_testing();
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE_METHOD(LVGLTestFixture, "UpdateQueue: shutdown drops pending callbacks",
                 "[ui][update_queue]") {
    int runs = 0;
    ui_queue_update([&runs] { runs++; });

    ui_update_queue_shutdown();
    process_lvgl(10);

    REQUIRE(runs == 0);
}
