#pragma once

// Centralized SDL include.
// SDL_MAIN_HANDLED keeps SDL from redefining main() as SDL_main, so the viewer
// needs no SDLmain library and its entrypoint stays explicit.
//
// With SDL_MAIN_HANDLED, call SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
