#include "LoggingChannels.h"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace WaterClock {

namespace {
constexpr const char* kLogFile = "waterclock.log";
constexpr const char* kChannelPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

std::string injectComponent(const std::string& pattern, const std::string& componentName)
{
    if (componentName == "default") {
        return pattern;
    }

    // Component name goes right after the timestamp.
    size_t pos = pattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + pattern;
    }
    return pattern.substr(0, pos + 2) + "[" + componentName + "] " + pattern.substr(pos + 2);
}
} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

spdlog::sink_ptr LoggingChannels::createConsoleSink(bool toStderr)
{
    if (toStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = createConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);
    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = injectComponent(kChannelPattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);

    // Default logger gets its own sinks so its pattern can omit the channel name.
    auto defaultConsole = createConsoleSink(consoleToStderr);
    defaultConsole->set_level(consoleLevel);
    auto defaultFile = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    defaultFile->set_level(fileLevel);

    const std::string defaultPattern =
        injectComponent("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName);
    defaultConsole->set_pattern(defaultPattern);
    defaultFile->set_pattern(defaultPattern);

    std::vector<spdlog::sink_ptr> defaultSinks = { defaultConsole, defaultFile };
    auto defaultLogger = std::make_shared<spdlog::logger>(
        componentName.empty() ? "default" : componentName,
        defaultSinks.begin(),
        defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);
        channel.erase(0, channel.find_first_not_of(" \t"));
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));
        levelStr.erase(levelStr.find_last_not_of(" \t") + 1);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}', ignoring", channel);
        return;
    }
    logger->set_level(level);
    spdlog::info("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (LogChannel channel :
         { LogChannel::Config,
           LogChannel::Input,
           LogChannel::Render,
           LogChannel::Simulation,
           LogChannel::Sinkhole,
           LogChannel::Spawner,
           LogChannel::State }) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    // Drop any stale logger of the same name so re-registration does not throw.
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName, bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    applyConfig(config, componentName, consoleToStderr);

    initialized_ = true;
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return nlohmann::json{
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kChannelPattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "config", "info" },
            { "input", "info" },
            { "render", "info" },
            { "simulation", "info" },
            { "sinkhole", "info" },
            { "spawner", "info" },
            { "state", "debug" } } }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
        spdlog::info("Using default config: {}", configPath);
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create config file, using built-in defaults");
        }
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("FATAL: Cannot open config file: {}", pathToUse);
            spdlog::error("Check file permissions or delete the file to regenerate defaults.");
            std::exit(1);
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", pathToUse);
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("FATAL: Failed to parse config file {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        std::exit(1);
    }
}

void LoggingChannels::applyConfig(
    const nlohmann::json& config, const std::string& componentName, bool consoleToStderr)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = kChannelPattern;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            if (defaults.contains("console_level")) {
                consoleLevel = parseLevelString(defaults["console_level"].get<std::string>());
            }
            if (defaults.contains("file_level")) {
                fileLevel = parseLevelString(defaults["file_level"].get<std::string>());
            }
            if (defaults.contains("pattern")) {
                pattern = defaults["pattern"].get<std::string>();
            }
            if (defaults.contains("flush_interval_ms")) {
                flushIntervalMs = defaults["flush_interval_ms"].get<int>();
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }
    pattern = injectComponent(pattern, componentName);

    std::vector<spdlog::sink_ptr> sinks;
    std::string filePath = kLogFile;

    try {
        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto consoleSink = createConsoleSink(consoleToStderr);
                    consoleSink->set_level(parseLevelString(
                        consoleCfg.value("level", spdlog::level::to_string_view(consoleLevel)
                                                      .data())));
                    sinks.push_back(consoleSink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    filePath = fileCfg.value("path", std::string(kLogFile));
                    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        filePath, fileCfg.value("truncate", true));
                    fileSink->set_level(parseLevelString(fileCfg.value(
                        "level", spdlog::level::to_string_view(fileLevel).data())));
                    sinks.push_back(fileSink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto consoleSink = createConsoleSink(consoleToStderr);
        consoleSink->set_level(consoleLevel);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    // Separate sinks for the default logger (so its pattern doesn't affect channel loggers).
    std::vector<spdlog::sink_ptr> defaultSinks;
    for (const auto& sharedSink : sharedSinks_) {
        if (dynamic_cast<spdlog::sinks::basic_file_sink_mt*>(sharedSink.get())) {
            auto defaultFile = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
            defaultFile->set_level(sharedSink->level());
            defaultSinks.push_back(defaultFile);
        }
        else {
            auto defaultConsole = createConsoleSink(consoleToStderr);
            defaultConsole->set_level(sharedSink->level());
            defaultSinks.push_back(defaultConsole);
        }
    }

    const std::string defaultPattern =
        injectComponent("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName);
    for (auto& sink : defaultSinks) {
        sink->set_pattern(defaultPattern);
    }

    auto defaultLogger = std::make_shared<spdlog::logger>(
        componentName.empty() ? "default" : componentName,
        defaultSinks.begin(),
        defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_INFO("LoggingChannels initialized from config successfully");
}

} // namespace WaterClock
