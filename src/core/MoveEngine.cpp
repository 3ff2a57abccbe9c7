#include "core/MoveEngine.hpp"
#include <algorithm>
#include <utility>

namespace game2048::core {

namespace {

// Left (reversed == false) or Right (reversed == true) applied to every row.
MoveResult moveRows(const Board& board, bool reversed) {
    const int n = board.size();
    MoveResult result{board, 0, false, {}};

    for (int r = 0; r < n; ++r) {
        Line in(static_cast<std::size_t>(n), 0U);
        for (int c = 0; c < n; ++c) {
            in[c] = board.cell(r, c);
        }

        const LineResult slid = slideLine(reversed ? reverseLine(in) : in);
        const Line out = reversed ? reverseLine(slid.line) : slid.line;

        if (out != in) {
            result.changed = true;
        }
        result.scoreDelta += slid.scoreDelta;

        for (int c = 0; c < n; ++c) {
            result.board.setCell(r, c, out[c]);
        }
        for (int k : slid.mergedAt) {
            result.mergedCells.push_back(Position{r, reversed ? n - 1 - k : k});
        }
    }

    return result;
}

} // namespace

Line compressLine(const Line& line) {
    Line out(line.size(), 0U);
    std::size_t cnt = 0;
    for (TileValue v : line) {
        if (v != 0) {
            out[cnt++] = v;
        }
    }
    return out;
}

Score mergeLine(Line& line, std::vector<int>* mergedAt) {
    Score gained = 0;
    std::vector<bool> merged(line.size(), false);

    for (std::size_t i = 0; i + 1 < line.size(); ++i) {
        if (line[i] == 0 || line[i] != line[i + 1]) continue;
        if (merged[i] || merged[i + 1]) continue;

        line[i] *= 2;
        line[i + 1] = 0;
        merged[i] = true;
        gained += line[i];

        if (mergedAt) {
            mergedAt->push_back(static_cast<int>(i));
        }
    }
    return gained;
}

Line reverseLine(const Line& line) {
    return Line(line.rbegin(), line.rend());
}

LineResult slideLine(const Line& line) {
    LineResult result;
    result.line = compressLine(line);

    std::vector<int> mergedAt;
    result.scoreDelta = mergeLine(result.line, &mergedAt);

    // Second compress shifts merged tiles left; track where they end up
    // by counting the non-zero cells in front of each.
    for (int idx : mergedAt) {
        const auto before = std::count_if(result.line.begin(), result.line.begin() + idx,
                                          [](TileValue v) { return v != 0; });
        result.mergedAt.push_back(static_cast<int>(before));
    }

    result.line = compressLine(result.line);
    return result;
}

Board transpose(const Board& board) {
    const int n = board.size();
    Board out{n};
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            out.setCell(c, r, board.cell(r, c));
        }
    }
    return out;
}

MoveResult applyMove(const Board& board, Direction direction) {
    switch (direction) {
    case Direction::Left:
        return moveRows(board, false);
    case Direction::Right:
        return moveRows(board, true);
    case Direction::Up:
    case Direction::Down:
        break;
    }

    // Columns become rows: Up slides like Left, Down like Right
    MoveResult result = moveRows(transpose(board), direction == Direction::Down);
    result.board = transpose(result.board);
    for (auto& p : result.mergedCells) {
        std::swap(p.row, p.col);
    }
    return result;
}

bool canMove(const Board& board, Direction direction) {
    return applyMove(board, direction).changed;
}

bool hasAnyMove(const Board& board) {
    if (board.hasEmptyCell()) {
        return true;
    }
    return std::any_of(kAllDirections.begin(), kAllDirections.end(),
                       [&board](Direction d) { return canMove(board, d); });
}

} // namespace game2048::core
