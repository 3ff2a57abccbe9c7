#pragma once

#include <vector>

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "controller/GameController.hpp"

namespace game2048::gui_sdl {

class GameScreen final : public Screen {
public:
    explicit GameScreen(const core::GameConfig& config);
    ~GameScreen() override;

    GameScreen(const GameScreen&) = delete;
    GameScreen& operator=(const GameScreen&) = delete;

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    struct Layout {
        int cell = 100;
        int gap = 10;

        int boardX = 0;
        int boardY = 0;
        int boardPx = 0;

        int hudH = 70;
        int controlsY = 0;
    };

    // White blink on a freshly merged tile
    struct Flash {
        core::Position pos;
        float elapsedSec{0.0f};
    };

private:
    // Rendering helpers
    void renderBoard(SDL_Renderer* renderer, const core::GameSnapshot& snap, const Layout& L) const;
    void renderTileLabels(const core::GameSnapshot& snap, const Layout& L) const;
    void renderOverlay(const core::GameSnapshot& snap, const Layout& L) const;
    void renderHUD(int windowW, const core::GameSnapshot& snap, const Layout& L);
    void renderControls(Application& app, int windowW, int windowH,
                        const core::GameSnapshot& snap, const Layout& L);
    void renderConfirmDialogs(Application& app);

    // Input helpers
    void dispatchAction(controller::InputAction action);
    void startNewGame(Application& app);

    bool isFlashing(core::Position pos) const;

    Layout computeLayout(int windowW, int windowH) const;

private:
    core::GameState gameState_;
    controller::GameController controller_;

    std::vector<Flash> flashes_;
    const float flashPhaseSec_{0.08f};
    const int flashPhases_{4};

    int targetIndex_{0};

    bool requestNewGameConfirm_{false};
    bool requestResetBestConfirm_{false};
    bool modalOpen_{false};
};

} // namespace game2048::gui_sdl
