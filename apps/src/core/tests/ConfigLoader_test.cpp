#include "core/ConfigLoader.h"
#include "core/clock/ClockConfig.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace WaterClock;

struct ProbeConfig {
    std::string origin = "default";
    int level = 0;
};

void from_json(const nlohmann::json& j, ProbeConfig& c)
{
    if (j.contains("origin")) {
        c.origin = j["origin"].get<std::string>();
    }
    if (j.contains("level")) {
        c.level = j["level"].get<int>();
    }
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        rootDir_ = std::filesystem::temp_directory_path() / "waterclock_config_loader_test";
        explicitDir_ = rootDir_ / "explicit";
        std::filesystem::create_directories(explicitDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(rootDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeFile(const std::filesystem::path& path, const std::string& content)
    {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path rootDir_;
    std::filesystem::path explicitDir_;
};

TEST_F(ConfigLoaderTest, ExplicitDirectoryIsSearchedFirst)
{
    ConfigLoader::setConfigDir(explicitDir_.string());

    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_GE(paths.size(), 3u);
    EXPECT_EQ(paths.front(), explicitDir_);
    EXPECT_EQ(paths[1], std::filesystem::current_path() / "config");
    EXPECT_EQ(paths.back(), std::filesystem::path("/etc/waterclock"));
}

TEST_F(ConfigLoaderTest, SearchPathsWithoutExplicitDirectoryStartAtWorkingDirectory)
{
    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), std::filesystem::current_path() / "config");
}

TEST_F(ConfigLoaderTest, LoadReportsMissingFile)
{
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("waterclock_probe_missing.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadOrDefaultFallsBackOnlyWhenFileIsMissing)
{
    ConfigLoader::setConfigDir(explicitDir_.string());

    ProbeConfig fallback;
    fallback.origin = "fallback";
    auto missing = ConfigLoader::loadOrDefault<ProbeConfig>("waterclock_probe_missing.json", fallback);
    ASSERT_TRUE(missing.isValue());
    EXPECT_EQ(missing.value().origin, "fallback");

    writeFile(explicitDir_ / "broken.json", "{ not json");
    auto broken = ConfigLoader::loadOrDefault<ProbeConfig>("broken.json", fallback);
    ASSERT_TRUE(broken.isError());
    EXPECT_NE(broken.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LocalFileReplacesBaseFile)
{
    writeFile(explicitDir_ / "probe.json", R"({"origin": "base", "level": 1})");
    writeFile(explicitDir_ / "probe.json.local", R"({"origin": "local"})");
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("probe.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().origin, "local");
    // Not merged: the base file's level is not picked up.
    EXPECT_EQ(result.value().level, 0);
}

TEST_F(ConfigLoaderTest, EmptyFileIsAnError)
{
    writeFile(explicitDir_ / "empty.json", "");
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("empty.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, TypeMismatchIsAnError)
{
    writeFile(explicitDir_ / "probe.json", R"({"level": "high"})");
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto result = ConfigLoader::load<ProbeConfig>("probe.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Failed to parse"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadClockAppliesFileAndSeedOverride)
{
    writeFile(
        explicitDir_ / Config::kClockConfigFile,
        R"({"digitZoom": 2, "colonBlink": true, "seed": 5})");
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto fromFile = Config::loadClock();
    ASSERT_TRUE(fromFile.isValue());
    EXPECT_EQ(fromFile.value().digitZoom, 2);
    EXPECT_TRUE(fromFile.value().colonBlink);
    EXPECT_EQ(fromFile.value().seed, std::optional<uint32_t>(5));

    auto overridden = Config::loadClock(99u);
    ASSERT_TRUE(overridden.isValue());
    EXPECT_EQ(overridden.value().seed, std::optional<uint32_t>(99));
}

TEST_F(ConfigLoaderTest, LoadClockRejectsInvalidValues)
{
    writeFile(explicitDir_ / Config::kClockConfigFile, R"({"liquidDropInterval": 4, "dropAcceleration": 4})");
    ConfigLoader::setConfigDir(explicitDir_.string());

    auto result = Config::loadClock();
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("dropAcceleration"), std::string::npos);
}
