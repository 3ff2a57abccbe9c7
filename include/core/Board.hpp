#pragma once

#include "Types.hpp"
#include <optional>
#include <vector>

namespace game2048::core {

class TileSpawner;

class Board {
public:
    // Deep copy of all cells, row-major
    using Snapshot = std::vector<TileValue>;

    explicit Board(int size = kDefaultBoardSize);

    // Build from explicit rows (tests, tools). Rows must form a square.
    static Board fromRows(const std::vector<std::vector<TileValue>>& rows);

    int size() const noexcept { return size_; }

    TileValue cell(int row, int col) const;
    void setCell(int row, int col, TileValue value);

    bool isFull() const noexcept;
    bool hasEmptyCell() const noexcept { return !isFull(); }
    std::vector<Position> emptyCells() const;

    int tileCount() const noexcept;
    TileValue maxTile() const noexcept;
    bool containsAtLeast(TileValue value) const noexcept;

    // Place a 2 (or sometimes a 4) on a uniformly chosen empty cell.
    // Returns where it was placed, or std::nullopt if the board is full.
    std::optional<Position> spawnRandomTile(TileSpawner& spawner);

    Snapshot snapshot() const { return grid_; }
    void restore(const Snapshot& snapshot);

    void clear() noexcept;

    friend bool operator==(const Board& a, const Board& b) {
        return a.size_ == b.size_ && a.grid_ == b.grid_;
    }
    friend bool operator!=(const Board& a, const Board& b) {
        return !(a == b);
    }

private:
    int size_;
    std::vector<TileValue> grid_; // size_ * size_

    int index(int row, int col) const noexcept {
        return row * size_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < size_ && col >= 0 && col < size_;
    }
};

} // namespace game2048::core
