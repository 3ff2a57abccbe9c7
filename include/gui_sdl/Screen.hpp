#pragma once

#include <SDL.h>

namespace game2048::gui_sdl {

class Application;

// Base interface for screens (Start, Game)
class Screen {
public:
    virtual ~Screen() = default;

    // Handle SDL events (keyboard/mouse/window)
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Update animation/UI state
    virtual void update(Application& app, float dtSeconds) = 0;

    // Render ImGui + any SDL rendering
    virtual void render(Application& app) = 0;
};

} // namespace game2048::gui_sdl
