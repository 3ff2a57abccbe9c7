#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/Types.hpp"

namespace game2048::core {

struct GameConfig {
    int boardSize{kDefaultBoardSize};
    TileValue target{kDefaultTarget};       // one of kTargetOptions
    double fourProbability{0.1};            // chance a spawned tile is a 4

    std::string bestScorePath{"best_score.dat"};

    std::optional<std::uint32_t> seed;      // fixed RNG seed (nullopt = random)

    int windowWidth{560};
    int windowHeight{760};
};

} // namespace game2048::core
