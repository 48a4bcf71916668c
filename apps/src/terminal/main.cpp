#include "core/ClockSource.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/TickScheduler.h"
#include "core/clock/ClockConfig.h"
#include "core/clock/ClockDiagram.h"
#include "core/clock/ClockSession.h"

#include <args.hxx>
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

using namespace WaterClock;

namespace {

std::atomic<bool> g_exitRequested{ false };

void signalHandler(int /*signum*/)
{
    g_exitRequested = true;
}

const char* kClearScreen = "\x1b[2J";
const char* kCursorHome = "\x1b[H";
const char* kHideCursor = "\x1b[?25l";
const char* kShowCursor = "\x1b[?25h";

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Water Clock (terminal)", "Falling-liquid clock drawn with ANSI true color.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<int> accelerationArg(
        parser,
        "acceleration",
        "Run simulated time N times faster (1 to 3600, default: 1)",
        { "acceleration" });
    args::ValueFlag<uint32_t> seedArg(
        parser, "seed", "Random seed (default: from config or random)", { "seed" });
    args::ValueFlag<std::string> configDirArg(
        parser, "config-dir", "Directory searched first for waterclock.json", { "config-dir" });
    args::ValueFlag<uint64_t> ticksArg(
        parser, "ticks", "Exit after N ticks (default: run until interrupted)", { "ticks" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., sinkhole:debug,*:warn)",
        { 'C', "channels" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Console logging goes to stderr so stdout carries only the drawing.
    LoggingChannels::initializeFromConfig(args::get(logConfig), "term", true);
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDirArg) {
        ConfigLoader::setConfigDir(args::get(configDirArg));
    }

    std::optional<uint32_t> seedOverride;
    if (seedArg) {
        seedOverride = args::get(seedArg);
    }
    auto configResult = Config::loadClock(seedOverride);
    if (configResult.isError()) {
        SLOG_ERROR("{}", configResult.errorValue());
        return 1;
    }

    const int acceleration = accelerationArg ? args::get(accelerationArg) : 1;
    ClockSource clockSource(acceleration);
    ClockSession session(configResult.value(), clockSource.now());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << kClearScreen << kHideCursor << std::flush;

    TickScheduler scheduler(TickScheduler::kBaseTicksPerSecond * clockSource.getAcceleration());
    const std::optional<uint64_t> tickLimit =
        ticksArg ? std::optional<uint64_t>(args::get(ticksArg)) : std::nullopt;

    while (!g_exitRequested) {
        if (tickLimit && session.getTickCount() >= *tickLimit) {
            break;
        }

        if (scheduler.poll() > 0) {
            session.step(clockSource.now());
            std::cout << kCursorHome << ClockDiagram::generateAnsiDiagram(session) << std::flush;
        }
        std::this_thread::sleep_until(scheduler.nextDue());
    }

    std::cout << kShowCursor << std::flush;
    SLOG_INFO("waterclock-term shut down after {} ticks", session.getTickCount());
    return 0;
}
