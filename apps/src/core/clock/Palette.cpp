#include "Palette.h"

namespace WaterClock::Palette {

uint32_t background()
{
    return 0xC0C0C0FF;
}
uint32_t wall()
{
    return 0x202020FF;
}
uint32_t unknown()
{
    return 0xFFFFFFFF;
}

uint32_t colorFor(CellValue value)
{
    switch (value) {
        case Cell::Background:
            return background();
        case Cell::Wall:
            return wall();
        case 8:
            return 0x84C2DAFF;
        case 9:
            return 0x81B8CFFF;
        case 10:
            return 0x4CA4C4FF;
        case 11:
            return 0xF38C79FF;
        default:
            return unknown();
    }
}

char letterFor(CellValue value)
{
    switch (value) {
        case 8:
            return 'a';
        case 9:
            return 'b';
        case 10:
            return 'w';
        case 11:
            return 'r';
        default:
            return '?';
    }
}

} // namespace WaterClock::Palette
