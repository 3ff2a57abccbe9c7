#pragma once

#include <string>

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"

namespace game2048::controller {

class GameController {
public:
    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(game2048::core::GameState& game);

    /// Handle a single discrete player action (key press, button click).
    core::CommandStatus handleAction(InputAction action);

    /// Start over with the given target.
    core::CommandStatus newGame(core::TileValue target);

    core::CommandStatus setTarget(core::TileValue target);

    /// Write the best score before the shell goes away.
    core::CommandStatus shutdown();

    core::CommandStatus lastStatus() const noexcept { return lastStatus_; }

    /// Text for the status line describing the last command's outcome.
    std::string lastFeedback() const;

    /// User-facing text for an outcome; empty for Ok.
    static std::string feedbackFor(core::CommandStatus status);

private:
    game2048::core::GameState& game_;
    core::CommandStatus lastStatus_{core::CommandStatus::Ok};

    core::CommandStatus record(core::CommandStatus status);
};

} // namespace game2048::controller
