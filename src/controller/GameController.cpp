#include "controller/GameController.hpp"

namespace game2048::controller {

GameController::GameController(game2048::core::GameState& game)
    : game_{game}
{
}

core::CommandStatus GameController::handleAction(InputAction action) {
    using core::CommandStatus;

    if (const auto dir = directionFor(action)) {
        return record(game_.applyMove(*dir));
    }

    switch (action) {
    case InputAction::Undo:
        return record(game_.undo());
    case InputAction::NewGame:
        game_.newGame();
        return record(CommandStatus::Ok);
    case InputAction::ResetBest:
        // Allowed in any status, including Won / Lost
        return record(game_.resetBest());
    default:
        break;
    }
    return record(CommandStatus::Ok);
}

core::CommandStatus GameController::newGame(core::TileValue target) {
    // Shell only offers the valid targets; anything else is rejected here
    // rather than letting GameState throw.
    if (!core::isValidTarget(target)) {
        return record(core::CommandStatus::InvalidOperation);
    }
    game_.newGame(target);
    return record(core::CommandStatus::Ok);
}

core::CommandStatus GameController::setTarget(core::TileValue target) {
    if (!core::isValidTarget(target)) {
        return record(core::CommandStatus::InvalidOperation);
    }
    game_.setTarget(target);
    return record(core::CommandStatus::Ok);
}

core::CommandStatus GameController::shutdown() {
    return record(game_.flushBestScore());
}

std::string GameController::lastFeedback() const {
    if (lastStatus_ != core::CommandStatus::Ok) {
        return feedbackFor(lastStatus_);
    }

    switch (game_.status()) {
    case core::GameStatus::Won:
        return "Reached target " + std::to_string(game_.target()) + "!";
    case core::GameStatus::Lost:
        return "No more moves. Game Over.";
    case core::GameStatus::Ongoing:
        break;
    }
    return game_.moveCount() == 0 ? "Use arrow keys or buttons to play."
                                  : "Playing...";
}

std::string GameController::feedbackFor(core::CommandStatus status) {
    using core::CommandStatus;
    switch (status) {
    case CommandStatus::Ok:                     return {};
    case CommandStatus::IllegalMove:            return "Nothing moves that way.";
    case CommandStatus::InvalidOperation:       return "Game is over. Start a new game or undo.";
    case CommandStatus::NothingToUndo:          return "Nothing to undo.";
    case CommandStatus::PersistenceUnavailable: return "Best score could not be saved.";
    }
    return {};
}

core::CommandStatus GameController::record(core::CommandStatus status) {
    lastStatus_ = status;
    return status;
}

} // namespace game2048::controller
