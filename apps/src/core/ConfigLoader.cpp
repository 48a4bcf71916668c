#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace WaterClock {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "waterclock");
    }

    paths.push_back(fs::path("/etc/waterclock"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        std::error_code ec;
        fs::path localPath = dir / (filename + ".local");
        if (fs::is_regular_file(localPath, ec)) {
            return localPath;
        }

        fs::path basePath = dir / filename;
        if (fs::is_regular_file(basePath, ec)) {
            return basePath;
        }
    }

    LOG_DEBUG(Config, "{} not found in any search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::parseFile(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    LOG_INFO(Config, "Loading config from {}", path.string());

    std::error_code ec;
    if (fs::file_size(path, ec) == 0 || ec) {
        std::string error = "Empty config file: " + path.string();
        LOG_WARN(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::string error = "Cannot open config file: " + path.string();
        LOG_WARN(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    try {
        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "{}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

} // namespace WaterClock
