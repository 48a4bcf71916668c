#include "ClockConfig.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/clock/ClockGeometry.h"

#include <nlohmann/json.hpp>
#include <limits>
#include <set>

namespace WaterClock::Config {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) {
        out = j[key].get<T>();
    }
}

} // namespace

Result<std::monostate, std::string> Clock::validate() const
{
    using R = Result<std::monostate, std::string>;

    if (digitZoom < 1 || digitZoom > ClockGeometry::kMaxZoom) {
        return R::error(
            "digitZoom must be in [1, " + std::to_string(ClockGeometry::kMaxZoom) + "]");
    }
    if (sinkholeOpeningPeriod < 1) {
        return R::error("sinkholeOpeningPeriod must be at least 1");
    }
    if (liquidMoveInterval < 1 || liquidSepInterval < 1) {
        return R::error("liquidMoveInterval and liquidSepInterval must be at least 1");
    }
    if (liquidDropSize < 1 || liquidDropInterval < 1) {
        return R::error("liquidDropSize and liquidDropInterval must be at least 1");
    }
    if (dropAcceleration < 0 || dropAcceleration >= liquidDropInterval) {
        return R::error("dropAcceleration must be in [0, liquidDropInterval)");
    }
    if (pickRepeats < 1) {
        return R::error("pickRepeats must be at least 1");
    }
    if (trailDepth < 0) {
        return R::error("trailDepth must not be negative");
    }
    if (liquidColorPopulation.empty()) {
        return R::error("liquidColorPopulation must not be empty");
    }

    std::set<int> seen;
    for (const auto& entry : liquidColorPopulation) {
        if (entry.color < 0 || entry.color > std::numeric_limits<CellValue>::max()) {
            return R::error(
                "liquid color " + std::to_string(entry.color) + " is outside [1, 255]");
        }
        if (!Cell::isLiquid(static_cast<CellValue>(entry.color))) {
            return R::error(
                "liquid color " + std::to_string(entry.color)
                + " collides with the background or wall value");
        }
        if (entry.weight < 1 || entry.weight > kMaxColorWeight) {
            return R::error(
                "liquid color " + std::to_string(entry.color) + " needs a weight in [1, "
                + std::to_string(kMaxColorWeight) + "]");
        }
        if (!seen.insert(entry.color).second) {
            return R::error("liquid color " + std::to_string(entry.color) + " listed twice");
        }
    }

    return R::okay(std::monostate{});
}

Result<Clock, std::string> loadClock(std::optional<uint32_t> seedOverride)
{
    auto loaded = ConfigLoader::loadOrDefault<Clock>(kClockConfigFile, Clock{});
    if (loaded.isError()) {
        return loaded;
    }

    Clock config = loaded.value();
    if (seedOverride) {
        config.seed = seedOverride;
    }

    auto valid = config.validate();
    if (valid.isError()) {
        LOG_ERROR(Config, "Invalid {}: {}", kClockConfigFile, valid.errorValue());
        return Result<Clock, std::string>::error(
            std::string("Invalid ") + kClockConfigFile + ": " + valid.errorValue());
    }

    LOG_INFO(
        Config,
        "Clock config: zoom {}, drop {}x{}, accel {}, spawn {}, colon blink {}",
        config.digitZoom,
        config.liquidDropSize,
        config.liquidDropInterval,
        config.dropAcceleration,
        config.spawnEnabled,
        config.colonBlink);
    return Result<Clock, std::string>::okay(config);
}

void from_json(const nlohmann::json& j, ColorWeight& entry)
{
    entry.color = j.at("color").get<int>();
    entry.weight = j.at("weight").get<int>();
}

void to_json(nlohmann::json& j, const ColorWeight& entry)
{
    j = nlohmann::json{ { "color", entry.color }, { "weight", entry.weight } };
}

void from_json(const nlohmann::json& j, Clock& config)
{
    readIfPresent(j, "colonBlink", config.colonBlink);
    readIfPresent(j, "spawnEnabled", config.spawnEnabled);
    readIfPresent(j, "digitZoom", config.digitZoom);
    readIfPresent(j, "dropAcceleration", config.dropAcceleration);
    readIfPresent(j, "liquidDropInterval", config.liquidDropInterval);
    readIfPresent(j, "liquidDropSize", config.liquidDropSize);
    readIfPresent(j, "liquidMoveInterval", config.liquidMoveInterval);
    readIfPresent(j, "liquidSepInterval", config.liquidSepInterval);
    readIfPresent(j, "pickRepeats", config.pickRepeats);
    readIfPresent(j, "sinkholeOpeningPeriod", config.sinkholeOpeningPeriod);
    readIfPresent(j, "trailDepth", config.trailDepth);
    readIfPresent(j, "liquidColorPopulation", config.liquidColorPopulation);

    if (j.contains("seed") && !j["seed"].is_null()) {
        config.seed = j["seed"].get<uint32_t>();
    }
}

void to_json(nlohmann::json& j, const Clock& config)
{
    j = nlohmann::json{
        { "colonBlink", config.colonBlink },
        { "spawnEnabled", config.spawnEnabled },
        { "digitZoom", config.digitZoom },
        { "dropAcceleration", config.dropAcceleration },
        { "liquidDropInterval", config.liquidDropInterval },
        { "liquidDropSize", config.liquidDropSize },
        { "liquidMoveInterval", config.liquidMoveInterval },
        { "liquidSepInterval", config.liquidSepInterval },
        { "pickRepeats", config.pickRepeats },
        { "sinkholeOpeningPeriod", config.sinkholeOpeningPeriod },
        { "trailDepth", config.trailDepth },
        { "liquidColorPopulation", config.liquidColorPopulation },
    };
    j["seed"] = config.seed ? nlohmann::json(*config.seed) : nlohmann::json(nullptr);
}

} // namespace WaterClock::Config
