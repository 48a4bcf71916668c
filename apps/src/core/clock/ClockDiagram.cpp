#include "ClockDiagram.h"
#include "ClockSession.h"
#include "Palette.h"
#include "core/Grid.h"

#include <sstream>

namespace WaterClock {

namespace {

const char* kAnsiReset = "\x1b[0m";

void appendBorder(std::ostringstream& out, int width)
{
    out << "+";
    for (int x = 0; x < width * 2; ++x) {
        out << "-";
    }
    out << "+\n";
}

} // namespace

std::string ClockDiagram::generateAsciiDiagram(const Grid& grid)
{
    std::ostringstream diagram;

    for (int y = 0; y < grid.getHeight(); ++y) {
        for (int x = 0; x < grid.getWidth(); ++x) {
            const CellValue value = grid.get(x, y);
            switch (Cell::classify(value)) {
                case Cell::Kind::Background:
                    diagram << ' ';
                    break;
                case Cell::Kind::Wall:
                    diagram << '#';
                    break;
                case Cell::Kind::Liquid:
                    diagram << Palette::letterFor(value);
                    break;
            }
        }
        diagram << '\n';
    }

    return diagram.str();
}

std::string ClockDiagram::generateAnsiDiagram(const ClockSession& session)
{
    std::ostringstream ansiDiagram;

    const Grid& grid = session.getGrid();
    const int width = grid.getWidth();
    const int height = grid.getHeight();

    ansiDiagram << kAnsiReset;
    appendBorder(ansiDiagram, width);

    for (int y = 0; y < height; ++y) {
        ansiDiagram << "|";

        for (int x = 0; x < width; ++x) {
            const uint32_t rgba = Palette::colorFor(session.displayValueAt(x, y));
            ansiDiagram << "\x1b[48;2;" << static_cast<int>(Palette::getR(rgba)) << ";"
                        << static_cast<int>(Palette::getG(rgba)) << ";"
                        << static_cast<int>(Palette::getB(rgba)) << "m  ";
        }

        ansiDiagram << kAnsiReset << "|\n";
    }

    appendBorder(ansiDiagram, width);
    return ansiDiagram.str();
}

} // namespace WaterClock
