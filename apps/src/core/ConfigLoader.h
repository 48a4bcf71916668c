#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace WaterClock {

/**
 * @brief Finds and parses JSON configuration files.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir, e.g. --config-dir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/waterclock/ (user overrides)
 * 4. /etc/waterclock/ (system defaults)
 *
 * At each location the .local version (e.g. waterclock.json.local) wins over the
 * base file. The .local file is a complete replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Error if the file is missing or cannot be parsed into T.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // A missing file yields `fallback`; a file that exists but is broken is still an error.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename, const T& fallback);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> parseFile(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> convert(const nlohmann::json& json, const std::string& source);
};

template <typename T>
Result<T, std::string> ConfigLoader::convert(const nlohmann::json& json, const std::string& source)
{
    try {
        T config;
        // Unqualified call so ADL finds the type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }

    auto jsonResult = parseFile(path.value());
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return convert<T>(jsonResult.value(), path->string());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename, const T& fallback)
{
    if (!findConfigFile(filename).has_value()) {
        return Result<T, std::string>::okay(fallback);
    }
    return load<T>(filename);
}

} // namespace WaterClock
