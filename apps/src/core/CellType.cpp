#include "CellType.h"

namespace WaterClock {
namespace Cell {

const char* toString(Kind kind)
{
    switch (kind) {
        case Kind::Background:
            return "Background";
        case Kind::Liquid:
            return "Liquid";
        case Kind::Wall:
            return "Wall";
    }
    return "Unknown";
}

} // namespace Cell
} // namespace WaterClock
