#pragma once

#include "Board.hpp"
#include "Types.hpp"
#include <vector>

namespace game2048::core {

// One row or column, read in the direction tiles slide towards index 0.
using Line = std::vector<TileValue>;

struct MoveResult {
    Board board;
    Score scoreDelta{0};
    bool changed{false};
    // Cells (in result coordinates) holding a tile created by a merge
    std::vector<Position> mergedCells;
};

struct LineResult {
    Line line;
    Score scoreDelta{0};
    // Indices in `line` holding a merged tile
    std::vector<int> mergedAt;
};

// Stateless grid transformations. Nothing here touches GameState
// or randomness; tile spawning is the caller's business.

// Move non-zero values to the front, keep their order, pad with zeros.
Line compressLine(const Line& line);

// Combine equal neighbours left to right, each tile at most once.
// The merged value lands at i, i+1 becomes zero. Returns the score gained;
// merged indices are appended to `mergedAt` when given.
Score mergeLine(Line& line, std::vector<int>* mergedAt = nullptr);

Line reverseLine(const Line& line);

// compress -> merge -> compress
LineResult slideLine(const Line& line);

Board transpose(const Board& board);

MoveResult applyMove(const Board& board, Direction direction);

bool canMove(const Board& board, Direction direction);

// False only when the board is full and no direction changes it
bool hasAnyMove(const Board& board);

} // namespace game2048::core
