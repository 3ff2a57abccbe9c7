#include "gui_sdl/StartScreen.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/GameScreen.hpp"

#include <memory>
#include <string>

#include <SDL.h>
#include <imgui.h>

#include "core/Types.hpp"

namespace game2048::gui_sdl {

StartScreen::StartScreen(Application& app)
{
    // Preselect whatever target the command line (or the last game) chose
    for (int i = 0; i < static_cast<int>(core::kTargetOptions.size()); ++i) {
        if (core::kTargetOptions[i] == app.config().target) {
            targetIndex_ = i;
        }
    }
}

void StartScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type == SDL_KEYDOWN && e.key.repeat == 0) {
        switch (e.key.keysym.sym) {
            case SDLK_RETURN:
            case SDLK_KP_ENTER:
                startGame(app);
                break;
            case SDLK_ESCAPE:
                app.requestQuit();
                break;
            default:
                break;
        }
    }
}

void StartScreen::update(Application&, float) {
    // Nothing animates here.
}

void StartScreen::render(Application& app)
{
    int w = 0, h = 0;
    app.getWindowSize(w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(360, 240), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("2048", nullptr, flags);
    ImGui::TextUnformatted("Join the tiles, get to the target!");
    ImGui::Separator();

    ImGui::TextUnformatted("Target tile:");
    for (int i = 0; i < static_cast<int>(core::kTargetOptions.size()); ++i) {
        const std::string label = std::to_string(core::kTargetOptions[i]);
        if (i > 0) ImGui::SameLine();
        ImGui::RadioButton(label.c_str(), &targetIndex_, i);
    }

    ImGui::Spacing();

    if (ImGui::Button("Play", ImVec2(-1, 44))) {
        startGame(app);
        ImGui::End();
        return;
    }

    if (ImGui::Button("Quit", ImVec2(-1, 40))) {
        app.requestQuit();
        ImGui::End();
        return;
    }

    ImGui::TextDisabled("Best score is kept in %s", app.config().bestScorePath.c_str());

    ImGui::End();
}

void StartScreen::startGame(Application& app)
{
    app.config().target = core::kTargetOptions[targetIndex_];
    app.setScreen(std::make_unique<GameScreen>(app.config()));
}

} // namespace game2048::gui_sdl
