#pragma once

#include "ClockConfig.h"
#include "core/CellType.h"

#include <cstddef>
#include <random>
#include <vector>

namespace WaterClock {

/**
 * Weighted liquid color sequence, shuffled once at construction and then
 * walked cyclically for the life of the session.
 */
class ColorQueue {
public:
    ColorQueue(const std::vector<Config::ColorWeight>& population, std::mt19937& rng);

    CellValue current() const { return entries_[index_]; }

    // Steps to the next entry (wrapping) and returns it.
    CellValue advance();

    size_t getIndex() const { return index_; }
    size_t size() const { return entries_.size(); }
    const std::vector<CellValue>& getEntries() const { return entries_; }

private:
    std::vector<CellValue> entries_;
    size_t index_ = 0;
};

} // namespace WaterClock
