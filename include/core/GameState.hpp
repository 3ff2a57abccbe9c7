#pragma once

#include "Board.hpp"
#include "GameConfig.hpp"
#include "MoveEngine.hpp"
#include "TileSpawner.hpp"
#include "Types.hpp"
#include "persistence/IBestScoreStore.hpp"
#include <optional>
#include <vector>

namespace game2048::core {

// Immutable view handed to the presentation layer after every command.
struct GameSnapshot {
    Board board;
    Score score{0};
    Score bestScore{0};
    Score moveCount{0};
    GameStatus status{GameStatus::Ongoing};
    TileValue target{kDefaultTarget};
    bool canUndo{false};

    // Results of the last successful move (empty after undo / new game)
    std::vector<Position> mergedCells;
    std::optional<Position> spawnedCell;

    // False once a write to the best-score store has failed
    bool bestScorePersisted{true};
};

class GameState {
public:
    /// The store is read once here. A null store keeps the best score
    /// in memory only.
    GameState(const GameConfig& config, persistence::IBestScoreStorePtr store);

    const Board& board() const noexcept { return board_; }

    Score score() const noexcept { return score_; }
    Score bestScore() const noexcept { return bestScore_; }
    Score moveCount() const noexcept { return moveCount_; }
    GameStatus status() const noexcept { return status_; }
    TileValue target() const noexcept { return target_; }
    bool canUndo() const noexcept { return undo_.has_value(); }
    bool isTerminal() const noexcept { return status_ != GameStatus::Ongoing; }
    bool bestScorePersisted() const noexcept { return bestScorePersisted_; }

    GameSnapshot snapshot() const;

    // Player commands
    CommandStatus applyMove(Direction direction);
    CommandStatus undo();

    // Throws std::invalid_argument if target is not one of kTargetOptions.
    void newGame(TileValue target);
    void newGame() { newGame(target_); }

    // Applies to the running game and to the next ones. An Ongoing game
    // picks it up on the next move; a Won game whose board falls short of
    // the new target goes back to Ongoing (or Lost) right away.
    // Throws std::invalid_argument if target is not one of kTargetOptions.
    void setTarget(TileValue target);

    // best score := 0, written immediately
    CommandStatus resetBest();

    // Write the current best score (e.g. on shutdown)
    CommandStatus flushBestScore();

    /// Replace the current position; clears undo and recomputes status.
    /// Board size must match the configured size.
    void setPosition(const Board& board, Score score, Score moveCount);

private:
    struct UndoRecord {
        Board board;
        Score score;
        Score moveCount;
    };

    Board board_;
    TileSpawner spawner_;
    persistence::IBestScoreStorePtr store_;

    Score score_{0};
    Score bestScore_{0};
    Score moveCount_{0};
    TileValue target_{kDefaultTarget};
    GameStatus status_{GameStatus::Ongoing};

    std::optional<UndoRecord> undo_;

    std::vector<Position> lastMerged_;
    std::optional<Position> lastSpawn_;

    bool bestScorePersisted_{true};

    GameStatus evaluateStatus() const;
    void updateBestScore();
    bool persistBest();
};

} // namespace game2048::core
