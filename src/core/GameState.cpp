#include "core/GameState.hpp"

#include <stdexcept>
#include <utility>

namespace game2048::core {

namespace {
    TileSpawner makeSpawner(const GameConfig& config) {
        if (config.seed) {
            return TileSpawner{*config.seed, config.fourProbability};
        }
        return TileSpawner{config.fourProbability};
    }

    void requireValidTarget(TileValue target) {
        if (!isValidTarget(target)) {
            throw std::invalid_argument("Target must be 2048, 4096 or 8192");
        }
    }
}

GameState::GameState(const GameConfig& config, persistence::IBestScoreStorePtr store)
    : board_{config.boardSize}
    , spawner_{makeSpawner(config)}
    , store_{std::move(store)}
    , score_{0}
    , bestScore_{0}
    , moveCount_{0}
    , target_{config.target}
    , status_{GameStatus::Ongoing}
    , undo_{}
    , bestScorePersisted_{store_ != nullptr}
{
    requireValidTarget(config.target);

    if (store_) {
        bestScore_ = store_->loadBest();
    }

    newGame(config.target);
}

GameSnapshot GameState::snapshot() const {
    GameSnapshot s{board_};
    s.score = score_;
    s.bestScore = bestScore_;
    s.moveCount = moveCount_;
    s.status = status_;
    s.target = target_;
    s.canUndo = undo_.has_value();
    s.mergedCells = lastMerged_;
    s.spawnedCell = lastSpawn_;
    s.bestScorePersisted = bestScorePersisted_;
    return s;
}

CommandStatus GameState::applyMove(Direction direction) {
    if (isTerminal()) {
        return CommandStatus::InvalidOperation;
    }

    // Take the undo record first; put the old one back if nothing moves.
    std::optional<UndoRecord> previousUndo = std::move(undo_);
    undo_ = UndoRecord{board_, score_, moveCount_};

    MoveResult result = core::applyMove(board_, direction);
    if (!result.changed) {
        undo_ = std::move(previousUndo);
        return CommandStatus::IllegalMove;
    }

    board_ = std::move(result.board);
    score_ += result.scoreDelta;
    ++moveCount_;

    lastMerged_ = std::move(result.mergedCells);
    lastSpawn_ = board_.spawnRandomTile(spawner_);

    updateBestScore();
    status_ = evaluateStatus();
    return CommandStatus::Ok;
}

CommandStatus GameState::undo() {
    if (!undo_) {
        return CommandStatus::NothingToUndo;
    }

    board_ = std::move(undo_->board);
    score_ = undo_->score;
    moveCount_ = undo_->moveCount;
    undo_.reset();

    lastMerged_.clear();
    lastSpawn_.reset();

    // The record was taken before a move, which requires Ongoing
    status_ = GameStatus::Ongoing;
    return CommandStatus::Ok;
}

void GameState::newGame(TileValue target) {
    requireValidTarget(target);

    board_.clear();
    board_.spawnRandomTile(spawner_);
    board_.spawnRandomTile(spawner_);

    score_ = 0;
    moveCount_ = 0;
    target_ = target;
    status_ = GameStatus::Ongoing;
    undo_.reset();

    lastMerged_.clear();
    lastSpawn_.reset();
}

void GameState::setTarget(TileValue target) {
    requireValidTarget(target);
    target_ = target;

    // A win no longer backed by the board reopens the game
    if (status_ == GameStatus::Won && !board_.containsAtLeast(target_)) {
        status_ = evaluateStatus();
    }
}

CommandStatus GameState::resetBest() {
    bestScore_ = 0;
    return persistBest() ? CommandStatus::Ok : CommandStatus::PersistenceUnavailable;
}

CommandStatus GameState::flushBestScore() {
    return persistBest() ? CommandStatus::Ok : CommandStatus::PersistenceUnavailable;
}

void GameState::setPosition(const Board& board, Score score, Score moveCount) {
    if (board.size() != board_.size()) {
        throw std::invalid_argument("GameState::setPosition board size mismatch");
    }

    board_ = board;
    score_ = score;
    moveCount_ = moveCount;
    undo_.reset();

    lastMerged_.clear();
    lastSpawn_.reset();

    updateBestScore();
    status_ = evaluateStatus();
}

GameStatus GameState::evaluateStatus() const {
    if (board_.containsAtLeast(target_)) {
        return GameStatus::Won;
    }
    if (!hasAnyMove(board_)) {
        return GameStatus::Lost;
    }
    return GameStatus::Ongoing;
}

void GameState::updateBestScore() {
    if (score_ > bestScore_) {
        bestScore_ = score_;
        persistBest();
    }
}

bool GameState::persistBest() {
    bestScorePersisted_ = store_ && store_->saveBest(bestScore_);
    return bestScorePersisted_;
}

} // namespace game2048::core
