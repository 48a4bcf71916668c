#pragma once

#include "core/CellType.h"

#include <cstdint>

// Display colors for cell values, packed as 0xRRGGBBAA.
namespace WaterClock::Palette {

uint32_t background();
uint32_t wall();
uint32_t unknown();

// Liquid ids without an entry of their own render as unknown().
uint32_t colorFor(CellValue value);

inline uint8_t getR(uint32_t color)
{
    return (color >> 24) & 0xFF;
}
inline uint8_t getG(uint32_t color)
{
    return (color >> 16) & 0xFF;
}
inline uint8_t getB(uint32_t color)
{
    return (color >> 8) & 0xFF;
}
inline uint8_t getA(uint32_t color)
{
    return color & 0xFF;
}

// Single letter used by text diagrams for a liquid id ('?' if unnamed).
char letterFor(CellValue value);

} // namespace WaterClock::Palette
