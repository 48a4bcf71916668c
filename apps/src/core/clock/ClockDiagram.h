#pragma once

#include <string>

namespace WaterClock {

class ClockSession;
class Grid;

class ClockDiagram {
public:
    // One character per visible cell: ' ' background, '#' wall, a letter per liquid color.
    static std::string generateAsciiDiagram(const Grid& grid);

    // True-color background blocks, two columns per cell, trail applied. Framed with a border.
    static std::string generateAnsiDiagram(const ClockSession& session);
};

} // namespace WaterClock
