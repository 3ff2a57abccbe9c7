#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "core/Board.hpp"
#include "core/TileSpawner.hpp"
#include "core/Types.hpp"

using namespace game2048::core;

TEST_CASE("Board basic cell operations", "[board]") {
    Board b{4};

    REQUIRE(b.size() == 4);

    for (int r = 0; r < b.size(); ++r) {
        for (int c = 0; c < b.size(); ++c) {
            REQUIRE(b.cell(r, c) == 0);
        }
    }
    REQUIRE(b.hasEmptyCell());
    REQUIRE_FALSE(b.isFull());

    b.setCell(1, 1, 8);
    REQUIRE(b.cell(1, 1) == 8);
    REQUIRE(b.tileCount() == 1);
    REQUIRE(b.maxTile() == 8);
}

TEST_CASE("Board rejects bad sizes, coordinates and values", "[board]") {
    REQUIRE_THROWS_AS(Board{1}, std::invalid_argument);
    REQUIRE_THROWS_AS(Board{9}, std::invalid_argument);

    Board b{4};
    REQUIRE_THROWS_AS(b.cell(4, 0), std::out_of_range);
    REQUIRE_THROWS_AS(b.setCell(-1, 0, 2), std::out_of_range);

    // Only 0 or powers of two >= 2 are tiles
    REQUIRE_THROWS_AS(b.setCell(0, 0, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(b.setCell(0, 0, 1), std::invalid_argument);
    REQUIRE_THROWS_AS((Board::fromRows({{2, 0}, {0, 0, 0}})), std::invalid_argument);
}

TEST_CASE("Board reports full only when no cell is empty", "[board]") {
    auto b = Board::fromRows({
        {2, 4},
        {8, 16},
    });
    REQUIRE(b.isFull());
    REQUIRE(b.emptyCells().empty());

    b.setCell(0, 1, 0);
    REQUIRE_FALSE(b.isFull());
    REQUIRE(b.emptyCells().size() == 1);
    REQUIRE(b.emptyCells().front() == Position{0, 1});
}

TEST_CASE("Board spawns 2 or 4 on an empty cell", "[board]") {
    Board b{4};
    TileSpawner spawner{1234u, 0.1};

    for (int i = 0; i < 16; ++i) {
        auto pos = b.spawnRandomTile(spawner);
        REQUIRE(pos.has_value());
        const TileValue v = b.cell(pos->row, pos->col);
        REQUIRE((v == 2 || v == 4));
        REQUIRE(b.tileCount() == i + 1);
    }

    REQUIRE(b.isFull());

    // Full board: no-op, reported through the empty optional
    const auto before = b.snapshot();
    REQUIRE_FALSE(b.spawnRandomTile(spawner).has_value());
    REQUIRE(b.snapshot() == before);
}

TEST_CASE("Board spawn respects the 4-tile probability extremes", "[board]") {
    SECTION("never a 4") {
        Board b{4};
        TileSpawner spawner{7u, 0.0};
        for (int i = 0; i < 16; ++i) {
            auto pos = b.spawnRandomTile(spawner);
            REQUIRE(b.cell(pos->row, pos->col) == 2);
        }
    }

    SECTION("always a 4") {
        Board b{4};
        TileSpawner spawner{7u, 1.0};
        for (int i = 0; i < 16; ++i) {
            auto pos = b.spawnRandomTile(spawner);
            REQUIRE(b.cell(pos->row, pos->col) == 4);
        }
    }

    REQUIRE_THROWS_AS(TileSpawner(1u, 1.5), std::invalid_argument);
}

TEST_CASE("Board snapshot is a deep copy", "[board]") {
    auto b = Board::fromRows({
        {2, 0, 0, 0},
        {0, 4, 0, 0},
        {0, 0, 8, 0},
        {0, 0, 0, 16},
    });

    const auto snap = b.snapshot();

    b.setCell(0, 0, 0);
    b.setCell(3, 3, 32);
    REQUIRE(snap[0] == 2);
    REQUIRE(snap[15] == 16);

    b.restore(snap);
    REQUIRE(b.cell(0, 0) == 2);
    REQUIRE(b.cell(3, 3) == 16);

    Board small{2};
    REQUIRE_THROWS_AS(small.restore(snap), std::invalid_argument);
}
