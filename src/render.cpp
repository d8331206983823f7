#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>

namespace {

struct TileColor {
    Uint8 r;
    Uint8 g;
    Uint8 b;
};

TileColor tileColor(TileType t) {
    switch (t) {
        case TileType::Void:          return {12, 12, 16};
        case TileType::Floor:         return {150, 140, 120};
        case TileType::Wall:          return {70, 62, 58};
        case TileType::CorridorFloor: return {110, 100, 84};
    }
    return {255, 0, 255};
}

} // namespace

LevelRenderer::LevelRenderer(int windowW, int windowH, bool vsync)
    : winW(windowW), winH(windowH), vsyncEnabled(vsync) {}

LevelRenderer::~LevelRenderer() {
    shutdown();
}

bool LevelRenderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(DELVEGEN_APPNAME) + " v" + DELVEGEN_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed virtual resolution; SDL scales it to the window.
    SDL_RenderSetLogicalSize(renderer, winW, winH);

    initialized = true;
    return true;
}

void LevelRenderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void LevelRenderer::setTitle(const std::string& title) {
    if (window) SDL_SetWindowTitle(window, title.c_str());
}

void LevelRenderer::render(const Level& level) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    if (level.width() > 0 && level.height() > 0) {
        const int tile = std::max(1, std::min(winW / level.width(), winH / level.height()));
        const int offX = (winW - tile * level.width()) / 2;
        const int offY = (winH - tile * level.height()) / 2;

        for (int y = 0; y < level.height(); ++y) {
            for (int x = 0; x < level.width(); ++x) {
                const TileColor c = tileColor(level.at(x, y));
                SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, 255);
                SDL_Rect rect{offX + x * tile, offY + y * tile, tile, tile};
                SDL_RenderFillRect(renderer, &rect);
            }
        }

        // Room outlines make push-adjacent rooms readable.
        SDL_SetRenderDrawColor(renderer, 200, 180, 90, 255);
        for (const Room& r : level.rooms()) {
            SDL_Rect rect{offX + r.rect.x * tile, offY + r.rect.y * tile, r.rect.w * tile, r.rect.h * tile};
            SDL_RenderDrawRect(renderer, &rect);
        }
    }

    SDL_RenderPresent(renderer);
}
