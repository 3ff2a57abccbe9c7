#pragma once

#include <vector>

#include "persistence/IBestScoreStore.hpp"

class FakeBestScoreStore : public game2048::persistence::IBestScoreStore {
public:
    using Score = game2048::core::Score;

    explicit FakeBestScoreStore(Score stored = 0)
        : stored{stored}
    {
    }

    Score loadBest() override {
        ++loadCount;
        return stored;
    }

    bool saveBest(Score value) override {
        savedValues.push_back(value);
        if (failWrites) {
            return false;
        }
        stored = value;
        return true;
    }

    Score stored;
    bool failWrites{false};
    int loadCount{0};
    std::vector<Score> savedValues;
};
