#pragma once
#include "sdl.hpp"

#include "level.hpp"

#include <string>

// Minimal SDL2 view of a generated level: one filled square per tile.
class LevelRenderer {
public:
    LevelRenderer(int windowW, int windowH, bool vsync);
    ~LevelRenderer();

    LevelRenderer(const LevelRenderer&) = delete;
    LevelRenderer& operator=(const LevelRenderer&) = delete;

    bool init();
    void shutdown();

    void render(const Level& level);

    void setTitle(const std::string& title);

private:
    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = false;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};
