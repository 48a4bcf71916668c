#include "SdlRenderer.h"
#include "core/LoggingChannels.h"
#include "core/clock/ClockSession.h"
#include "core/clock/Palette.h"

namespace WaterClock {

SdlRenderer::~SdlRenderer()
{
    stop();
}

Result<std::monostate, std::string> SdlRenderer::start(
    int gridWidth, int gridHeight, int initialScale)
{
    using R = Result<std::monostate, std::string>;

    if (!SDL_WasInit(SDL_INIT_VIDEO)) {
        if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
            return R::error(std::string("SDL video init failed: ") + SDL_GetError());
        }
        sdlInitialized_ = true;
    }

    gridWidth_ = gridWidth;
    gridHeight_ = gridHeight;
    pixels_.assign(static_cast<size_t>(gridWidth) * gridHeight, Palette::background());

    window_ = SDL_CreateWindow(
        "Water Clock",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        gridWidth * initialScale,
        gridHeight * initialScale,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window_) {
        std::string error = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
        stop();
        return R::error(error);
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_) {
        std::string error = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
        stop();
        return R::error(error);
    }

    texture_ = SDL_CreateTexture(
        renderer_, SDL_PIXELFORMAT_RGBA8888, SDL_TEXTUREACCESS_STREAMING, gridWidth, gridHeight);
    if (!texture_) {
        std::string error = std::string("SDL_CreateTexture failed: ") + SDL_GetError();
        stop();
        return R::error(error);
    }

    LOG_INFO(
        Render,
        "SDL window {}x{} for a {}x{} grid",
        gridWidth * initialScale,
        gridHeight * initialScale,
        gridWidth,
        gridHeight);
    return R::okay(std::monostate{});
}

void SdlRenderer::stop()
{
    if (texture_) {
        SDL_DestroyTexture(texture_);
        texture_ = nullptr;
    }
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        LOG_INFO(Render, "SDL window closed");
    }
    if (sdlInitialized_) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        sdlInitialized_ = false;
    }
}

void SdlRenderer::render(const ClockSession& session)
{
    if (!renderer_ || !texture_) {
        return;
    }

    for (int y = 0; y < gridHeight_; ++y) {
        for (int x = 0; x < gridWidth_; ++x) {
            pixels_[static_cast<size_t>(y) * gridWidth_ + x] =
                Palette::colorFor(session.displayValueAt(x, y));
        }
    }

    if (SDL_UpdateTexture(
            texture_, nullptr, pixels_.data(), gridWidth_ * static_cast<int>(sizeof(uint32_t)))
        != 0) {
        LOG_WARN(Render, "SDL_UpdateTexture failed: {}", SDL_GetError());
        return;
    }

    const Viewport viewport = outputViewport();
    const SDL_Rect dest{ viewport.destX, viewport.destY, viewport.destWidth, viewport.destHeight };

    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    SDL_RenderCopy(renderer_, texture_, nullptr, &dest);
    SDL_RenderPresent(renderer_);
}

Viewport SdlRenderer::windowViewport() const
{
    int width = 0;
    int height = 0;
    if (window_) {
        SDL_GetWindowSize(window_, &width, &height);
    }
    return Viewport::fit(gridWidth_, gridHeight_, width, height);
}

Viewport SdlRenderer::outputViewport() const
{
    int width = 0;
    int height = 0;
    if (renderer_ && SDL_GetRendererOutputSize(renderer_, &width, &height) != 0) {
        LOG_WARN(Render, "SDL_GetRendererOutputSize failed: {}", SDL_GetError());
        return windowViewport();
    }
    return Viewport::fit(gridWidth_, gridHeight_, width, height);
}

} // namespace WaterClock
