#pragma once

#include <SDL.h>

namespace sheet {

struct DragStartDetails {
    SDL_FPoint position{0.0f, 0.0f};
    Uint32 timestamp = 0;
};

struct DragUpdateDetails {
    // Vertical movement since the previous update, positive downward.
    float primary_delta = 0.0f;
    SDL_FPoint position{0.0f, 0.0f};
    Uint32 timestamp = 0;
};

struct DragEndDetails {
    // Release velocity in px/s, positive downward. Zero when the release was not a fling.
    float velocity_y = 0.0f;
    SDL_FPoint position{0.0f, 0.0f};
};

}
