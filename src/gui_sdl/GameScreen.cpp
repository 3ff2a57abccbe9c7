#include "gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>
#include <memory>
#include <string>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "gui_sdl/TileTheme.hpp"
#include "controller/InputAction.hpp"
#include "persistence/FileBestScoreStore.hpp"

namespace game2048::gui_sdl {

using controller::InputAction;

GameScreen::GameScreen(const core::GameConfig& config)
    : gameState_(config, std::make_shared<persistence::FileBestScoreStore>(config.bestScorePath))
    , controller_(gameState_)
{
    for (int i = 0; i < static_cast<int>(core::kTargetOptions.size()); ++i) {
        if (core::kTargetOptions[i] == gameState_.target()) {
            targetIndex_ = i;
        }
    }
}

GameScreen::~GameScreen()
{
    controller_.shutdown();
}

void GameScreen::dispatchAction(InputAction action)
{
    const core::CommandStatus status = controller_.handleAction(action);

    if (directionFor(action)) {
        if (status == core::CommandStatus::Ok) {
            flashes_.clear();
            for (const auto& pos : gameState_.snapshot().mergedCells) {
                flashes_.push_back(Flash{pos, 0.0f});
            }
        }
        return;
    }
    flashes_.clear();
}

void GameScreen::startNewGame(Application& app)
{
    const core::TileValue target = core::kTargetOptions[targetIndex_];
    app.config().target = target;
    controller_.newGame(target);
    flashes_.clear();
}

bool GameScreen::isFlashing(core::Position pos) const
{
    for (const auto& f : flashes_) {
        if (f.pos == pos) {
            // on during even phases: white, original, white, original
            return static_cast<int>(f.elapsedSec / flashPhaseSec_) % 2 == 0;
        }
    }
    return false;
}

GameScreen::Layout GameScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int n = gameState_.board().size();

    const int margin = 16;
    const int bottomReserve = 270; // buttons, keypad, status line

    const int usableW = windowW - margin * 2;
    const int usableH = windowH - L.hudH - bottomReserve - margin * 2;
    const int avail = std::max(0, std::min(usableW, usableH));

    L.gap = std::clamp(avail / 40, 4, 12);
    L.cell = std::clamp((avail - L.gap * (n + 1)) / n, 24, 140);
    L.boardPx = n * L.cell + (n + 1) * L.gap;

    L.boardX = (windowW - L.boardPx) / 2;
    L.boardY = L.hudH + margin;
    L.controlsY = L.boardY + L.boardPx + margin;
    return L;
}

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN || e.key.repeat != 0 || modalOpen_) {
        return;
    }

    const bool ctrl = (e.key.keysym.mod & KMOD_CTRL) != 0;

    switch (e.key.keysym.sym) {
        case SDLK_UP:
        case SDLK_w:
            dispatchAction(InputAction::MoveUp);
            break;
        case SDLK_DOWN:
        case SDLK_s:
            dispatchAction(InputAction::MoveDown);
            break;
        case SDLK_LEFT:
        case SDLK_a:
            dispatchAction(InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
        case SDLK_d:
            dispatchAction(InputAction::MoveRight);
            break;
        case SDLK_u:
            dispatchAction(InputAction::Undo);
            break;
        case SDLK_z:
            if (ctrl) dispatchAction(InputAction::Undo);
            break;
        case SDLK_n:
            requestNewGameConfirm_ = true;
            break;
        case SDLK_BACKSPACE:
            app.setScreen(std::make_unique<StartScreen>(app));
            break;
        default:
            break;
    }
}

void GameScreen::update(Application&, float dtSeconds)
{
    const float total = flashPhaseSec_ * static_cast<float>(flashPhases_);
    for (auto& f : flashes_) {
        f.elapsedSec += dtSeconds;
    }
    flashes_.erase(std::remove_if(flashes_.begin(), flashes_.end(),
                                  [total](const Flash& f) { return f.elapsedSec >= total; }),
                   flashes_.end());
}

void GameScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const Layout L = computeLayout(winW, winH);
    const core::GameSnapshot snap = gameState_.snapshot();

    renderBoard(app.renderer(), snap, L);
    renderTileLabels(snap, L);
    renderOverlay(snap, L);

    renderHUD(winW, snap, L);
    renderControls(app, winW, winH, snap, L);
}

void GameScreen::renderBoard(SDL_Renderer* renderer, const core::GameSnapshot& snap, const Layout& L) const
{
    const auto& board = snap.board;
    const int n = board.size();

    std::uint8_t rr, gg, bb, aa;

    unpackImU32(TileTheme::boardBackground(), rr, gg, bb, aa);
    SDL_SetRenderDrawColor(renderer, rr, gg, bb, aa);
    SDL_Rect boardRect{L.boardX, L.boardY, L.boardPx, L.boardPx};
    SDL_RenderFillRect(renderer, &boardRect);

    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            const core::TileValue v = board.cell(r, c);

            ImU32 col = (v == 0) ? TileTheme::emptyCell() : TileTheme::tileBackground(v);
            if (v != 0 && isFlashing(core::Position{r, c})) {
                col = TileTheme::flash();
            }

            unpackImU32(col, rr, gg, bb, aa);
            SDL_SetRenderDrawColor(renderer, rr, gg, bb, aa);

            SDL_Rect cell{L.boardX + L.gap + c * (L.cell + L.gap),
                          L.boardY + L.gap + r * (L.cell + L.gap),
                          L.cell, L.cell};
            SDL_RenderFillRect(renderer, &cell);
        }
    }
}

void GameScreen::renderTileLabels(const core::GameSnapshot& snap, const Layout& L) const
{
    // Background list: drawn after the SDL rects, below every ImGui window
    ImDrawList* dl = ImGui::GetBackgroundDrawList();
    ImFont* font = ImGui::GetFont();

    const auto& board = snap.board;
    const int n = board.size();

    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            const core::TileValue v = board.cell(r, c);
            if (v == 0) continue;

            const std::string label = std::to_string(v);
            const float digits = static_cast<float>(label.size());
            const float size = L.cell * (digits <= 2 ? 0.45f : digits == 3 ? 0.38f : 0.30f);

            const float x0 = static_cast<float>(L.boardX + L.gap + c * (L.cell + L.gap));
            const float y0 = static_cast<float>(L.boardY + L.gap + r * (L.cell + L.gap));

            const ImVec2 t = font->CalcTextSizeA(size, FLT_MAX, 0.0f, label.c_str());
            dl->AddText(font, size,
                        ImVec2(x0 + (L.cell - t.x) * 0.5f, y0 + (L.cell - t.y) * 0.5f),
                        TileTheme::tileText(v),
                        label.c_str());
        }
    }
}

void GameScreen::renderOverlay(const core::GameSnapshot& snap, const Layout& L) const
{
    using core::GameStatus;
    if (snap.status == GameStatus::Ongoing) return;

    const std::string msg = (snap.status == GameStatus::Won)
        ? "You reached " + std::to_string(snap.target) + "!"
        : std::string("Game Over");
    const char* hint = "N: new game    U: undo last move";

    ImDrawList* dl = ImGui::GetBackgroundDrawList();
    ImFont* font = ImGui::GetFont();

    const ImVec2 p0(static_cast<float>(L.boardX), static_cast<float>(L.boardY));
    const ImVec2 p1(p0.x + L.boardPx, p0.y + L.boardPx);
    dl->AddRectFilled(p0, p1, TileTheme::overlayBackground());

    const float cx = p0.x + L.boardPx * 0.5f;
    const float cy = p0.y + L.boardPx * 0.5f;
    const float bigSize = std::clamp(L.boardPx / 9.0f, 18.0f, 56.0f);

    const ImVec2 tSize = font->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg.c_str());
    dl->AddText(font, bigSize, ImVec2(cx - tSize.x * 0.5f, cy - tSize.y),
                TileTheme::overlayText(), msg.c_str());

    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 12.0f), TileTheme::overlayText(), hint);
}

void GameScreen::renderHUD(int windowW, const core::GameSnapshot& snap, const Layout& L)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(static_cast<float>(windowW), static_cast<float>(L.hudH)), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoScrollbar;

    ImGui::Begin("Stats", nullptr, flags);

    ImGui::Text("2048");
    ImGui::SameLine(80.0f);
    ImGui::Text("Score: %llu", static_cast<unsigned long long>(snap.score));
    ImGui::SameLine();
    ImGui::Text("   Best: %llu", static_cast<unsigned long long>(snap.bestScore));
    ImGui::SameLine();
    ImGui::Text("   Moves: %llu", static_cast<unsigned long long>(snap.moveCount));

    ImGui::Text("Target: %u", static_cast<unsigned>(snap.target));
    if (!snap.bestScorePersisted) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(0.85f, 0.25f, 0.2f, 1.0f),
                           "   Best score not saved this session");
    }

    ImGui::End();
}

void GameScreen::renderControls(Application& app, int windowW, int windowH,
                                const core::GameSnapshot& snap, const Layout& L)
{
    const float ctrlW = std::min(static_cast<float>(windowW) - 32.0f, 460.0f);
    const float ctrlH = std::max(120.0f, static_cast<float>(windowH - L.controlsY - 8));

    ImGui::SetNextWindowPos(ImVec2((windowW - ctrlW) * 0.5f, static_cast<float>(L.controlsY)), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(ctrlW, ctrlH), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse;

    ImGui::Begin("Controls", nullptr, flags);

    // --- command row ---
    const ImVec2 btn(100.0f, 0.0f);
    if (ImGui::Button("New Game", btn)) {
        requestNewGameConfirm_ = true;
    }
    ImGui::SameLine();

    ImGui::BeginDisabled(!snap.canUndo);
    if (ImGui::Button("Undo", btn)) {
        dispatchAction(InputAction::Undo);
    }
    ImGui::EndDisabled();
    ImGui::SameLine();

    if (ImGui::Button("Reset Best", btn)) {
        requestResetBestConfirm_ = true;
    }
    ImGui::SameLine();

    const char* targets[] = { "2048", "4096", "8192" };
    ImGui::SetNextItemWidth(90.0f);
    if (ImGui::Combo("##target", &targetIndex_, targets, IM_ARRAYSIZE(targets))) {
        const core::TileValue target = core::kTargetOptions[targetIndex_];
        app.config().target = target;
        controller_.setTarget(target);
    }

    ImGui::Separator();

    // --- arrow keypad ---
    const bool terminal = snap.status != core::GameStatus::Ongoing;
    const ImVec2 key(64.0f, 40.0f);
    const float padX = (ImGui::GetContentRegionAvail().x - key.x * 3.0f - 16.0f) * 0.5f;
    const float rowX = ImGui::GetCursorPosX() + std::max(0.0f, padX);

    ImGui::BeginDisabled(terminal);

    ImGui::SetCursorPosX(rowX + key.x + 8.0f);
    if (ImGui::Button("Up", key)) dispatchAction(InputAction::MoveUp);

    ImGui::SetCursorPosX(rowX);
    if (ImGui::Button("Left", key)) dispatchAction(InputAction::MoveLeft);
    ImGui::SameLine(0.0f, key.x + 16.0f);
    if (ImGui::Button("Right", key)) dispatchAction(InputAction::MoveRight);

    ImGui::SetCursorPosX(rowX + key.x + 8.0f);
    if (ImGui::Button("Down", key)) dispatchAction(InputAction::MoveDown);

    ImGui::EndDisabled();

    ImGui::Separator();

    // --- status line ---
    const std::string feedback = controller_.lastFeedback();
    switch (snap.status) {
        case core::GameStatus::Won:
            ImGui::TextColored(ImVec4(0.2f, 0.6f, 0.2f, 1.0f), "%s", feedback.c_str());
            break;
        case core::GameStatus::Lost:
            ImGui::TextColored(ImVec4(0.85f, 0.25f, 0.2f, 1.0f), "%s", feedback.c_str());
            break;
        default:
            ImGui::TextDisabled("%s", feedback.c_str());
            break;
    }

    if (ImGui::Button("Back to Menu")) {
        app.setScreen(std::make_unique<StartScreen>(app));
    }

    renderConfirmDialogs(app);

    ImGui::End();
}

void GameScreen::renderConfirmDialogs(Application& app)
{
    if (requestNewGameConfirm_) {
        ImGui::OpenPopup("New Game");
        requestNewGameConfirm_ = false;
    }
    if (requestResetBestConfirm_) {
        ImGui::OpenPopup("Reset Best");
        requestResetBestConfirm_ = false;
    }

    modalOpen_ = false;

    if (ImGui::BeginPopupModal("New Game", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        modalOpen_ = true;
        ImGui::TextUnformatted("Start a new game? Current progress will be lost.");
        if (ImGui::Button("Yes", ImVec2(120, 0))) {
            startNewGame(app);
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("No", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }

    if (ImGui::BeginPopupModal("Reset Best", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        modalOpen_ = true;
        ImGui::TextUnformatted("Reset best score to 0?");
        if (ImGui::Button("Yes", ImVec2(120, 0))) {
            dispatchAction(InputAction::ResetBest);
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("No", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace game2048::gui_sdl
