#pragma once

#include <optional>

#include "core/Types.hpp"

namespace game2048::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, on-screen buttons, etc.
// Commands that carry a value (new game with a target, set target)
// go through GameController methods instead.
enum class InputAction {
    MoveUp,
    MoveDown,
    MoveLeft,
    MoveRight,
    Undo,
    NewGame,   // restart with the current target
    ResetBest
};

inline std::optional<core::Direction> directionFor(InputAction action) {
    switch (action) {
    case InputAction::MoveUp:    return core::Direction::Up;
    case InputAction::MoveDown:  return core::Direction::Down;
    case InputAction::MoveLeft:  return core::Direction::Left;
    case InputAction::MoveRight: return core::Direction::Right;
    default:                     return std::nullopt;
    }
}

} // namespace game2048::controller
