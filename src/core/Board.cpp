#include "core/Board.hpp"
#include "core/TileSpawner.hpp"
#include <algorithm>
#include <stdexcept>

namespace game2048::core {

Board::Board(int size)
    : size_{size}
    , grid_()
{
    if (size < kMinBoardSize || size > kMaxBoardSize) {
        throw std::invalid_argument("Board size must be between 2 and 8");
    }
    grid_.assign(static_cast<std::size_t>(size * size), 0U);
}

Board Board::fromRows(const std::vector<std::vector<TileValue>>& rows) {
    Board board{static_cast<int>(rows.size())};
    for (int r = 0; r < board.size_; ++r) {
        if (static_cast<int>(rows[r].size()) != board.size_) {
            throw std::invalid_argument("Board::fromRows requires a square grid");
        }
        for (int c = 0; c < board.size_; ++c) {
            board.setCell(r, c, rows[r][c]);
        }
    }
    return board;
}

TileValue Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, TileValue value) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    if (!isValidTileValue(value)) {
        throw std::invalid_argument("Board::setCell value must be 0 or a power of two >= 2");
    }
    grid_[index(row, col)] = value;
}

bool Board::isFull() const noexcept {
    return std::none_of(grid_.begin(), grid_.end(),
                        [](TileValue v) { return v == 0; });
}

std::vector<Position> Board::emptyCells() const {
    std::vector<Position> cells;
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            if (grid_[index(r, c)] == 0) {
                cells.push_back(Position{r, c});
            }
        }
    }
    return cells;
}

int Board::tileCount() const noexcept {
    return static_cast<int>(std::count_if(grid_.begin(), grid_.end(),
                                          [](TileValue v) { return v != 0; }));
}

TileValue Board::maxTile() const noexcept {
    return *std::max_element(grid_.begin(), grid_.end());
}

bool Board::containsAtLeast(TileValue value) const noexcept {
    return maxTile() >= value;
}

std::optional<Position> Board::spawnRandomTile(TileSpawner& spawner) {
    const auto cells = emptyCells();
    if (cells.empty()) {
        return std::nullopt;
    }

    const Position pos = cells[spawner.pickIndex(cells.size())];
    grid_[index(pos.row, pos.col)] = spawner.pickValue();
    return pos;
}

void Board::restore(const Snapshot& snapshot) {
    if (snapshot.size() != grid_.size()) {
        throw std::invalid_argument("Board::restore snapshot size mismatch");
    }
    if (!std::all_of(snapshot.begin(), snapshot.end(), isValidTileValue)) {
        throw std::invalid_argument("Board::restore snapshot holds an invalid tile");
    }
    grid_ = snapshot;
}

void Board::clear() noexcept {
    std::fill(grid_.begin(), grid_.end(), 0U);
}

} // namespace game2048::core
