#include "SdlRenderer.h"
#include "core/ClockSource.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/TickScheduler.h"
#include "core/clock/ClockConfig.h"
#include "core/clock/ClockSession.h"

#include <SDL2/SDL.h>
#include <args.hxx>
#include <iostream>
#include <optional>

using namespace WaterClock;

namespace {

std::optional<EditIntent> intentForButton(uint8_t button)
{
    if (button == SDL_BUTTON_LEFT) {
        return EditIntent::Wall;
    }
    if (button == SDL_BUTTON_RIGHT) {
        return EditIntent::Background;
    }
    return std::nullopt;
}

void applyEdit(ClockSession& session, const SdlRenderer& renderer, int px, int py, EditIntent intent)
{
    auto cell = renderer.windowViewport().toGrid(px, py);
    if (cell) {
        session.editCell(cell->x, cell->y, intent);
    }
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Water Clock", "Falling-liquid clock rendered in an SDL window.");
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

    LoggingChannels::initializeFromConfig(args::get(logConfig), "sdl");
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

    SdlRenderer renderer;
    auto startResult =
        renderer.start(session.getGeometry().width, session.getGeometry().height);
    if (startResult.isError()) {
        SLOG_ERROR("Failed to start renderer: {}", startResult.errorValue());
        return 1;
    }

    TickScheduler scheduler(TickScheduler::kBaseTicksPerSecond * clockSource.getAcceleration());
    std::optional<EditIntent> dragIntent;
    bool running = true;
    bool needsRedraw = true;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_QUIT:
                    running = false;
                    break;
                case SDL_MOUSEBUTTONDOWN:
                    dragIntent = intentForButton(event.button.button);
                    if (dragIntent) {
                        applyEdit(session, renderer, event.button.x, event.button.y, *dragIntent);
                        needsRedraw = true;
                    }
                    break;
                case SDL_MOUSEBUTTONUP:
                    if (intentForButton(event.button.button) == dragIntent) {
                        dragIntent.reset();
                    }
                    break;
                case SDL_MOUSEMOTION:
                    if (dragIntent) {
                        applyEdit(session, renderer, event.motion.x, event.motion.y, *dragIntent);
                        needsRedraw = true;
                    }
                    break;
                case SDL_WINDOWEVENT:
                    if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED
                        || event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                        needsRedraw = true;
                    }
                    break;
                default:
                    break;
            }
        }

        const int64_t due = scheduler.poll();
        if (due > 0) {
            if (due > 1) {
                LOG_DEBUG(Simulation, "Running behind, skipped {} ticks", due - 1);
            }
            session.step(clockSource.now());
            needsRedraw = true;
        }

        if (needsRedraw) {
            renderer.render(session);
            needsRedraw = false;
        }
        else {
            SDL_Delay(1);
        }
    }

    renderer.stop();
    SLOG_INFO("waterclock-sdl shut down after {} ticks", session.getTickCount());
    return 0;
}
