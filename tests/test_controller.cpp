// tests/test_controller.cpp

#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "FakeBestScoreStore.hpp"

using game2048::core::Board;
using game2048::core::CommandStatus;
using game2048::core::Direction;
using game2048::core::GameConfig;
using game2048::core::GameState;
using game2048::core::GameStatus;
using game2048::controller::GameController;
using game2048::controller::InputAction;
using game2048::controller::directionFor;

namespace {

GameConfig smallConfig()
{
    GameConfig cfg;
    cfg.boardSize = 2;
    cfg.fourProbability = 0.0;
    cfg.seed = 7u;
    return cfg;
}

} // namespace

TEST_CASE("Move actions map to directions", "[controller]")
{
    REQUIRE(directionFor(InputAction::MoveUp) == Direction::Up);
    REQUIRE(directionFor(InputAction::MoveDown) == Direction::Down);
    REQUIRE(directionFor(InputAction::MoveLeft) == Direction::Left);
    REQUIRE(directionFor(InputAction::MoveRight) == Direction::Right);

    REQUIRE_FALSE(directionFor(InputAction::Undo).has_value());
    REQUIRE_FALSE(directionFor(InputAction::NewGame).has_value());
    REQUIRE_FALSE(directionFor(InputAction::ResetBest).has_value());
}

TEST_CASE("GameController forwards moves and undo to GameState", "[controller]")
{
    auto store = std::make_shared<FakeBestScoreStore>();
    GameState game{smallConfig(), store};
    GameController controller{game};

    const auto start = Board::fromRows({
        {2, 2},
        {4, 8},
    });
    game.setPosition(start, 0, 0);

    REQUIRE(controller.lastFeedback() == "Use arrow keys or buttons to play.");

    REQUIRE(controller.handleAction(InputAction::MoveDown) == CommandStatus::IllegalMove);
    REQUIRE(controller.lastStatus() == CommandStatus::IllegalMove);
    REQUIRE(controller.lastFeedback() == "Nothing moves that way.");

    REQUIRE(controller.handleAction(InputAction::MoveLeft) == CommandStatus::Ok);
    REQUIRE(game.score() == 4);
    REQUIRE(controller.lastFeedback() == "Playing...");

    REQUIRE(controller.handleAction(InputAction::Undo) == CommandStatus::Ok);
    REQUIRE(game.board() == start);

    REQUIRE(controller.handleAction(InputAction::Undo) == CommandStatus::NothingToUndo);
    REQUIRE(controller.lastFeedback() == "Nothing to undo.");
}

TEST_CASE("GameController reports the end of the game", "[controller]")
{
    GameState game{smallConfig(), std::make_shared<FakeBestScoreStore>()};
    GameController controller{game};

    SECTION("lost") {
        game.setPosition(Board::fromRows({
            {2, 4},
            {4, 2},
        }), 0, 0);
        REQUIRE(controller.lastFeedback() == "No more moves. Game Over.");

        REQUIRE(controller.handleAction(InputAction::MoveLeft) == CommandStatus::InvalidOperation);
        REQUIRE(controller.lastFeedback() == "Game is over. Start a new game or undo.");
    }

    SECTION("won") {
        game.setPosition(Board::fromRows({
            {1024, 1024},
            {0,    0},
        }), 0, 0);
        REQUIRE(controller.handleAction(InputAction::MoveRight) == CommandStatus::Ok);
        REQUIRE(game.status() == GameStatus::Won);
        REQUIRE(controller.lastFeedback() == "Reached target 2048!");
    }

    // Restart always works from a finished game
    REQUIRE(controller.handleAction(InputAction::NewGame) == CommandStatus::Ok);
    REQUIRE(game.status() == GameStatus::Ongoing);
    REQUIRE(game.board().tileCount() == 2);
}

TEST_CASE("GameController rejects invalid targets", "[controller]")
{
    GameState game{smallConfig(), std::make_shared<FakeBestScoreStore>()};
    GameController controller{game};

    REQUIRE(controller.newGame(1000) == CommandStatus::InvalidOperation);
    REQUIRE(controller.setTarget(0) == CommandStatus::InvalidOperation);
    REQUIRE(game.target() == 2048);

    REQUIRE(controller.newGame(8192) == CommandStatus::Ok);
    REQUIRE(game.target() == 8192);
    REQUIRE(game.moveCount() == 0);

    REQUIRE(controller.setTarget(4096) == CommandStatus::Ok);
    REQUIRE(game.target() == 4096);
}

TEST_CASE("GameController feedback follows a target change after a win", "[controller]")
{
    GameState game{smallConfig(), std::make_shared<FakeBestScoreStore>()};
    GameController controller{game};

    game.setPosition(Board::fromRows({
        {1024, 1024},
        {0,    0},
    }), 0, 0);
    REQUIRE(controller.handleAction(InputAction::MoveLeft) == CommandStatus::Ok);
    REQUIRE(controller.lastFeedback() == "Reached target 2048!");

    REQUIRE(controller.setTarget(8192) == CommandStatus::Ok);
    REQUIRE(game.status() == GameStatus::Ongoing);
    REQUIRE(controller.lastFeedback() == "Playing...");

    // One spawn leaves two empty cells, so some direction still moves
    bool moved = false;
    for (InputAction a : {InputAction::MoveUp, InputAction::MoveDown,
                          InputAction::MoveLeft, InputAction::MoveRight}) {
        if (controller.handleAction(a) == CommandStatus::Ok) {
            moved = true;
            break;
        }
    }
    REQUIRE(moved);
    REQUIRE(game.moveCount() == 2);
}

TEST_CASE("GameController resets and flushes the best score", "[controller]")
{
    auto store = std::make_shared<FakeBestScoreStore>(300);
    GameState game{smallConfig(), store};
    GameController controller{game};

    REQUIRE(controller.handleAction(InputAction::ResetBest) == CommandStatus::Ok);
    REQUIRE(game.bestScore() == 0);
    REQUIRE(store->stored == 0);

    store->failWrites = true;
    REQUIRE(controller.shutdown() == CommandStatus::PersistenceUnavailable);
    REQUIRE(controller.lastFeedback() == "Best score could not be saved.");

    store->failWrites = false;
    REQUIRE(controller.shutdown() == CommandStatus::Ok);
    REQUIRE(store->savedValues.back() == 0);
}

TEST_CASE("Every command outcome has feedback text", "[controller]")
{
    REQUIRE(GameController::feedbackFor(CommandStatus::Ok).empty());
    REQUIRE_FALSE(GameController::feedbackFor(CommandStatus::IllegalMove).empty());
    REQUIRE_FALSE(GameController::feedbackFor(CommandStatus::InvalidOperation).empty());
    REQUIRE_FALSE(GameController::feedbackFor(CommandStatus::NothingToUndo).empty());
    REQUIRE_FALSE(GameController::feedbackFor(CommandStatus::PersistenceUnavailable).empty());
}
