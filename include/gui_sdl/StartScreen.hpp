#pragma once

#include "gui_sdl/Screen.hpp"

namespace game2048::gui_sdl {

class StartScreen final : public Screen {
public:
    explicit StartScreen(Application& app);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    int targetIndex_{0}; // index into core::kTargetOptions

    void startGame(Application& app);
};

} // namespace game2048::gui_sdl
