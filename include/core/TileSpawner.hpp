#pragma once

#include "Types.hpp"
#include <cstddef>
#include <cstdint>
#include <random>

namespace game2048::core {

// Source of randomness for new tiles: which empty cell, and 2 or 4.
class TileSpawner {
public:
    // Seeded from std::random_device
    explicit TileSpawner(double fourProbability = 0.1);

    // Deterministic sequence, used by tests and --seed
    TileSpawner(std::uint32_t seed, double fourProbability);

    // Uniform index in [0, count). count must be > 0.
    std::size_t pickIndex(std::size_t count);

    // 4 with the configured probability, 2 otherwise
    TileValue pickValue();

private:
    std::mt19937 rng_;
    double fourProbability_;
};

} // namespace game2048::core
