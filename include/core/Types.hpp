#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array>   // For std::array

// Namespace for 2048 core types
namespace game2048::core {

// Value stored in a board cell: 0 = empty, otherwise a power of two >= 2
using TileValue = std::uint32_t;

// Score, best score and move counters
using Score = std::uint64_t;

// Position structure representing a cell in the grid
struct Position {
    int row{};
    int col{};
};

inline bool operator==(const Position& a, const Position& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) {
    return !(a == b);
}

// Move directions
enum class Direction : std::uint8_t {
    Up,
    Down,
    Left,
    Right
};

inline constexpr std::array<Direction, 4> kAllDirections{
    Direction::Up, Direction::Down, Direction::Left, Direction::Right
};

enum class GameStatus : std::uint8_t {
    Ongoing,
    Won,
    Lost
};

// Outcome of a command sent to GameState.
// Every non-Ok value is recoverable; the shell only reports it.
enum class CommandStatus : std::uint8_t {
    Ok,
    IllegalMove,            // move had no effect on the board
    InvalidOperation,       // move attempted after Won/Lost
    NothingToUndo,          // no buffered snapshot
    PersistenceUnavailable  // best score could not be written
};

inline constexpr int kDefaultBoardSize = 4;
inline constexpr int kMinBoardSize = 2;
inline constexpr int kMaxBoardSize = 8;

inline constexpr std::array<TileValue, 3> kTargetOptions{2048, 4096, 8192};
inline constexpr TileValue kDefaultTarget = 2048;

inline constexpr bool isPowerOfTwo(TileValue v) noexcept {
    return v != 0 && (v & (v - 1)) == 0;
}

// A cell may hold 0 (empty) or any power of two >= 2
inline constexpr bool isValidTileValue(TileValue v) noexcept {
    return v == 0 || (v >= 2 && isPowerOfTwo(v));
}

inline bool isValidTarget(TileValue target) noexcept {
    for (TileValue t : kTargetOptions) {
        if (t == target) return true;
    }
    return false;
}

} // namespace game2048::core
