#pragma once

#include "core/Result.h"
#include "core/Viewport.h"

#include <SDL2/SDL.h>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace WaterClock {

class ClockSession;

/**
 * Window, renderer and streaming texture for the SDL front-end.
 *
 * The grid is uploaded one pixel per cell and stretched into a letterboxed
 * rectangle on a black backdrop.
 */
class SdlRenderer {
public:
    SdlRenderer() = default;
    ~SdlRenderer();

    SdlRenderer(const SdlRenderer&) = delete;
    SdlRenderer& operator=(const SdlRenderer&) = delete;

    Result<std::monostate, std::string> start(int gridWidth, int gridHeight, int initialScale = 10);
    void stop();

    void render(const ClockSession& session);

    // Placement in window coordinates, used to map mouse events onto cells.
    Viewport windowViewport() const;

private:
    Viewport outputViewport() const;

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    bool sdlInitialized_ = false;
    int gridWidth_ = 0;
    int gridHeight_ = 0;
    std::vector<uint32_t> pixels_;
};

} // namespace WaterClock
