#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "app/CommandLine.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    using game2048::app::ParseOutcome;

    const auto cmd = game2048::app::parseCommandLine(argc, argv);
    const std::string program = argc > 0 ? argv[0] : "game2048_sdl";

    switch (cmd.outcome) {
    case ParseOutcome::ShowHelp:
        std::cout << game2048::app::usage(program);
        return 0;
    case ParseOutcome::Error:
        std::cerr << game2048::app::usage(program);
        return 1;
    case ParseOutcome::Run:
        break;
    }

    game2048::gui_sdl::Application app{cmd.config};
    if (!app.init("2048 (SDL2 + ImGui)")) {
        return 1;
    }

    app.setScreen(std::make_unique<game2048::gui_sdl::StartScreen>(app));
    return app.run();
}
