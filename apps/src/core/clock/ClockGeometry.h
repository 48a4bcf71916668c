#pragma once

#include "core/GridBuffer.h"

namespace WaterClock {

/**
 * Layout of the clock face for a digit zoom factor Z.
 *
 * The face is 17 digit-cells wide (a 1-cell margin, then four slots of
 * 3 digit columns plus a 1-column gap) and 7 digit-cells tall (1 open row on
 * top, 5 digit rows, 1 floor row). Every digit-cell is Z x Z grid cells.
 */
struct ClockGeometry {
    static constexpr int kSlotCount = 4;
    static constexpr int kSlotPitch = 4;
    static constexpr int kDigitColumns = 3;
    static constexpr int kDigitRows = 5;
    static constexpr int kFaceColumns = 1 + kSlotPitch * kSlotCount;
    static constexpr int kFaceRows = 7;

    // Largest zoom whose face, sentinel row included, fits a GridBuffer.
    static constexpr int kMaxZoom = GridBuffer<uint8_t>::kMaxExtent / kFaceColumns;
    static_assert(kFaceRows * kMaxZoom + 1 <= GridBuffer<uint8_t>::kMaxExtent);

    int zoom = 3;
    int width = kFaceColumns * 3;
    int height = kFaceRows * 3;

    ClockGeometry() = default;
    explicit ClockGeometry(int digitZoom);

    // Horizontal span of a slot's digit band, [slotLeft, slotRight).
    int slotLeft(int slot) const { return (1 + slot * kSlotPitch) * zoom; }
    int slotRight(int slot) const { return (1 + slot * kSlotPitch + kDigitColumns) * zoom; }

    // Left edge of digit column `dx` inside a slot.
    int digitColumnLeft(int slot, int dx) const { return (1 + slot * kSlotPitch + dx) * zoom; }

    // Top edge of digit row `dy` (row 0 sits one digit-cell below the top).
    int digitRowTop(int dy) const { return (1 + dy) * zoom; }

    // Rows [floorTop, floorBottom) form the floor band under every slot.
    int floorTop() const { return 6 * zoom; }
    int floorBottom() const { return 7 * zoom; }

    // Top rows that stay open across the whole face.
    int openTopRows() const { return zoom; }

    int colonX() const { return 2 * kSlotPitch * zoom + zoom / 2; }
    int colonUpperY() const { return 2 * zoom + zoom / 2; }
    int colonLowerY() const { return 4 * zoom + zoom / 2; }

    // Column of the narrow drain carved below digit column `dx`.
    int sinkholeColumn(int slot, int dx) const { return digitColumnLeft(slot, dx) + zoom / 2; }
};

} // namespace WaterClock
