// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_scale.h"

#include <catch2/catch_all.hpp>

using namespace printdeck;

TEST_CASE("UI scale: factor follows screen width", "[ui_scale]") {
    REQUIRE(compute_scale_factor(320) == 1);
    REQUIRE(compute_scale_factor(480) == 1);
    REQUIRE(compute_scale_factor(481) == 2);
    REQUIRE(compute_scale_factor(800) == 2);
    REQUIRE(compute_scale_factor(1000) == 2);
    REQUIRE(compute_scale_factor(1001) == 3);
    REQUIRE(compute_scale_factor(1920) == 3);
}
