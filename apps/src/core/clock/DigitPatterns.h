#pragma once

#include "ClockGeometry.h"
#include "ClockTime.h"
#include "core/Grid.h"

#include <array>

namespace WaterClock {

/**
 * @brief Digit bitmaps and their projection into the clock face.
 *
 * Each digit is a 3x5 grid where true = stroke. Strokes are carved out of the
 * wall so liquid can collect in the shape of the digit; every other block is
 * restored to wall.
 */
namespace DigitPatterns {

using Pattern = std::array<std::array<bool, ClockGeometry::kDigitColumns>, ClockGeometry::kDigitRows>;

// clang-format off
constexpr std::array<Pattern, 10> kStrokes = {{
    // 0
    {{
        {true,  true,  true },
        {true,  false, true },
        {true,  false, true },
        {true,  false, true },
        {true,  true,  true },
    }},
    // 1
    {{
        {false, false, true },
        {false, false, true },
        {false, false, true },
        {false, false, true },
        {false, false, true },
    }},
    // 2
    {{
        {true,  true,  true },
        {false, false, true },
        {true,  true,  true },
        {true,  false, false},
        {true,  true,  true },
    }},
    // 3
    {{
        {true,  true,  true },
        {false, false, true },
        {true,  true,  true },
        {false, false, true },
        {true,  true,  true },
    }},
    // 4
    {{
        {true,  false, true },
        {true,  false, true },
        {true,  true,  true },
        {false, false, true },
        {false, false, true },
    }},
    // 5
    {{
        {true,  true,  true },
        {true,  false, false},
        {true,  true,  true },
        {false, false, true },
        {true,  true,  true },
    }},
    // 6
    {{
        {true,  true,  true },
        {true,  false, false},
        {true,  true,  true },
        {true,  false, true },
        {true,  true,  true },
    }},
    // 7
    {{
        {true,  true,  true },
        {true,  false, true },
        {false, false, true },
        {false, false, true },
        {false, false, true },
    }},
    // 8
    {{
        {true,  true,  true },
        {true,  false, true },
        {true,  true,  true },
        {true,  false, true },
        {true,  true,  true },
    }},
    // 9
    {{
        {true,  true,  true },
        {true,  false, true },
        {true,  true,  true },
        {false, false, true },
        {true,  true,  true },
    }},
}};
// clang-format on

// True when block (dx, dy) of `digit` is carved open. Asserts on an invalid digit.
bool isStroke(int digit, int dx, int dy);

/**
 * Rebuilds the wall geometry of one slot for `digit`:
 * clears wall above the floor band, forces the floor band to wall, then
 * fills every non-stroke block with wall. Idempotent. Touches only cells in
 * the slot's column band. Asserts on an invalid slot or digit.
 */
void project(Grid& grid, const ClockGeometry& geometry, int slot, int digit);

/**
 * Builds a fresh clock face: open top rows, solid interior, open sentinel row,
 * open colon dots, and each slot projected with its digit.
 */
Grid createFace(const ClockGeometry& geometry, const DigitValues& digits);

// Opens (background) or closes (wall) both colon dots. Liquid in a dot is left alone.
void applyColon(Grid& grid, const ClockGeometry& geometry, bool open);

} // namespace DigitPatterns
} // namespace WaterClock
