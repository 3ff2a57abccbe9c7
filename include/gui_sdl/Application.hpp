#pragma once

#include <memory>
#include <string>

#include <SDL.h>

#include "core/GameConfig.hpp"
#include "gui_sdl/Screen.hpp"

namespace game2048::gui_sdl {

class Application {
public:
    explicit Application(core::GameConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title);
    int run();

    void requestQuit() { m_running = false; }

    // Screen management. The new screen takes over at the end of the frame,
    // so the caller may keep running until it returns.
    void setScreen(std::unique_ptr<Screen> screen);

    // Shared settings (target chosen on the start screen, store path, seed)
    core::GameConfig& config() { return m_config; }
    const core::GameConfig& config() const { return m_config; }

    // SDL accessors
    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    // Simple utility: window size
    void getWindowSize(int& w, int& h) const;

private:
    bool createWindow(const char* title);
    void initImGui();
    void shutdown();

    // One frame: input, then SDL + ImGui drawing
    void pumpEvents();
    void drawFrame();
    void applyPendingScreen();

private:
    bool m_running{false};
    core::GameConfig m_config;

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};
    bool m_imguiReady{false};

    std::unique_ptr<Screen> m_screen;
    std::unique_ptr<Screen> m_pendingScreen;
};

} // namespace game2048::gui_sdl
