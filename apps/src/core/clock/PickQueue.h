#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace WaterClock {

/**
 * Shuffled supply of residues 0..interval-1.
 *
 * Each fill holds every residue `repeats` times in random order. next() pops
 * one value per call and rebuilds the queue when it runs dry, so over a full
 * fill every residue class gets its turn while the order stays unpredictable.
 */
class PickQueue {
public:
    PickQueue(const char* name, int interval, int repeats);

    int next(std::mt19937& rng);

    int getInterval() const { return interval_; }
    size_t remaining() const { return picks_.size(); }
    size_t fillSize() const { return static_cast<size_t>(interval_) * repeats_; }

private:
    void refill(std::mt19937& rng);

    const char* name_;
    int interval_;
    int repeats_;
    std::vector<int> picks_;
};

} // namespace WaterClock
