// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

namespace printdeck {

/**
 * @brief Integer UI scale for a screen width
 *
 * Wider than 1000 px scales by 3, wider than 480 px by 2, anything else
 * renders at 1:1. Padding, button sizes and line spacing are multiplied by
 * this factor.
 */
inline int compute_scale_factor(int width) {
    if (width > 1000)
        return 3;
    if (width > 480)
        return 2;
    return 1;
}

} // namespace printdeck
