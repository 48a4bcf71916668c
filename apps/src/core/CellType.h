#pragma once

#include <cstdint>

namespace WaterClock {

// Raw cell value: 0 = background, 16 = wall, anything else is a liquid color id.
using CellValue = uint8_t;

namespace Cell {

constexpr CellValue Background = 0;
constexpr CellValue Wall = 16;

enum class Kind : uint8_t { Background, Liquid, Wall };

constexpr Kind classify(CellValue value)
{
    if (value == Background) {
        return Kind::Background;
    }
    if (value == Wall) {
        return Kind::Wall;
    }
    return Kind::Liquid;
}

constexpr bool isBackground(CellValue value)
{
    return value == Background;
}

constexpr bool isWall(CellValue value)
{
    return value == Wall;
}

constexpr bool isLiquid(CellValue value)
{
    return classify(value) == Kind::Liquid;
}

const char* toString(Kind kind);

} // namespace Cell
} // namespace WaterClock
