#pragma once

#include "core/CellType.h"
#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace WaterClock::Config {

// One entry of the weighted liquid color population.
// Color is kept as read so validate() can reject ids that do not fit a CellValue.
struct ColorWeight {
    int color = 0;
    int weight = 0;

    bool operator==(const ColorWeight& other) const = default;
};

/**
 * Simulation tuning for one clock session. Built once at startup, validated,
 * and then handed by const reference to every component.
 */
struct Clock {
    bool colonBlink = false;
    bool spawnEnabled = true;
    int digitZoom = 3;
    int dropAcceleration = 0;
    int liquidDropInterval = 14;
    int liquidDropSize = 2;
    int liquidMoveInterval = 4;
    int liquidSepInterval = 120;
    int pickRepeats = 1;
    int sinkholeOpeningPeriod = 30;
    int trailDepth = 2;
    std::optional<uint32_t> seed;
    std::vector<ColorWeight> liquidColorPopulation = {
        { 8, 150 },
        { 10, 850 },
        { 11, 1 },
    };

    int dropCycleLength() const { return liquidDropSize * (liquidDropInterval - dropAcceleration); }

    Result<std::monostate, std::string> validate() const;
};

inline constexpr int kMaxColorWeight = 100000;

inline constexpr const char* kClockConfigFile = "waterclock.json";

/**
 * Reads waterclock.json through ConfigLoader's search path (defaults when no
 * file exists), applies a command-line seed override and validates the result.
 */
Result<Clock, std::string> loadClock(std::optional<uint32_t> seedOverride = std::nullopt);

void from_json(const nlohmann::json& j, ColorWeight& entry);
void to_json(nlohmann::json& j, const ColorWeight& entry);

void from_json(const nlohmann::json& j, Clock& config);
void to_json(nlohmann::json& j, const Clock& config);

} // namespace WaterClock::Config
