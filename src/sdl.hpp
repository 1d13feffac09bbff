#pragma once

// Centralized SDL include.
// The generator only uses SDL's filesystem helpers (SDL_GetBasePath), which
// work without SDL_Init. SDL_MAIN_HANDLED keeps SDL from renaming main() to
// SDL_main so no SDLmain library is needed.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
