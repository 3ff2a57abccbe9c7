#pragma once

#include <memory>
#include "core/Types.hpp"

namespace game2048::persistence {

// Durable home of the single, global best score.
class IBestScoreStore {
public:
    virtual ~IBestScoreStore() = default;

    // Stored best score, or 0 if there is no record or it cannot be read.
    virtual core::Score loadBest() = 0;

    // Write the best score. Returns false on failure; never throws.
    virtual bool saveBest(core::Score value) = 0;
};

using IBestScoreStorePtr = std::shared_ptr<IBestScoreStore>;

} // namespace game2048::persistence
