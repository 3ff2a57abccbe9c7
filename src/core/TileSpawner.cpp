#include "core/TileSpawner.hpp"
#include <stdexcept>

namespace game2048::core {

namespace {
    double checkedProbability(double p) {
        if (p < 0.0 || p > 1.0) {
            throw std::invalid_argument("TileSpawner: probability must be in [0, 1]");
        }
        return p;
    }
}

TileSpawner::TileSpawner(double fourProbability)
    : rng_{std::random_device{}()}
    , fourProbability_{checkedProbability(fourProbability)}
{
}

TileSpawner::TileSpawner(std::uint32_t seed, double fourProbability)
    : rng_{seed}
    , fourProbability_{checkedProbability(fourProbability)}
{
}

std::size_t TileSpawner::pickIndex(std::size_t count) {
    if (count == 0) {
        throw std::invalid_argument("TileSpawner::pickIndex with empty range");
    }
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

TileValue TileSpawner::pickValue() {
    std::bernoulli_distribution four(fourProbability_);
    return four(rng_) ? 4U : 2U;
}

} // namespace game2048::core
