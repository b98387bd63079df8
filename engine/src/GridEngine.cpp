#include "mg/game/GridEngine.hpp"
#include "mg/game/Errors.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace mg::game;

namespace {

constexpr Direction kAllDirections[] = {Direction::Left, Direction::Right, Direction::Up, Direction::Down};

// Every direction is handled as a left slide over "lines". Maps position `c`
// of line `r` back to the real (row, col) of the grid.
std::pair<std::size_t, std::size_t> linePos(Direction d, std::size_t n, std::size_t r, std::size_t c) {
    switch (d) {
    case Direction::Left:  return {r, c};
    case Direction::Right: return {r, n - 1 - c};
    case Direction::Up:    return {c, r};
    case Direction::Down:  return {n - 1 - c, r};
    }
    return {r, c};
}

// Equal numbers below the cap and marker pairs join
bool joins(const Cell& a, const Cell& b) {
    if (a.isNumber()) return a == b && a.value < kMaxTileValue;
    return a.isMarker() && b.isMarker();
}

} // namespace

const char* mg::game::directionName(Direction d) {
    switch (d) {
    case Direction::Left:  return "left";
    case Direction::Right: return "right";
    case Direction::Up:    return "up";
    case Direction::Down:  return "down";
    }
    return "?";
}

std::optional<Direction> mg::game::directionFromByte(std::uint8_t raw) {
    if (raw > static_cast<std::uint8_t>(Direction::Down)) return std::nullopt;
    return static_cast<Direction>(raw);
}

GridEngine::GridEngine() : rng_(std::random_device{}()) {}

GridEngine::GridEngine(std::uint32_t seed) : rng_(seed) {}

GameState GridEngine::newGame(std::size_t size) {
    if (size < kMinGridSize) {
        throw InvalidConfiguration("grid size " + std::to_string(size) + " is below the minimum of " +
                                   std::to_string(kMinGridSize));
    }
    GameState s;
    s.size = size;
    s.grid = Grid(size);
    spawnTile(s);
    spawnTile(s);
    rescore(s);
    return s;
}

MoveResult GridEngine::move(GameState& state, Direction dir) {
    validateState(state);
    MoveResult res = slide(state, dir);
    if (!res.moved) return res;

    state.moves++;
    if (!spawnTile(state)) {
        // a changed grid always has a hole: a merge, a shift or a marker clear freed one
        throw StateCorruption("grid changed but no empty cell is left for the spawn");
    }
    rescore(state);
    return res;
}

bool GridEngine::spawnTile(GameState& state) {
    std::vector<std::size_t> empties;
    auto& cells = state.grid.cells();
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].isEmpty()) empties.push_back(i);
    }
    if (empties.empty()) {
        state.gameOver = isTerminal(state);
        return false;
    }
    std::uniform_int_distribution<std::size_t> pick(0, empties.size() - 1);
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    const std::size_t idx = empties[pick(rng_)];
    cells[idx] = Cell::number(roll(rng_) < 1.0 - kFourProbability ? 2u : 4u);
    state.gameOver = isTerminal(state);
    return true;
}

MoveResult GridEngine::slide(GameState& state, Direction dir) {
    MoveResult res;
    const std::size_t n = state.grid.size();
    Grid out(n);
    std::vector<std::pair<std::size_t, std::size_t>> clearCenters;

    std::vector<Cell> packed;
    std::vector<std::size_t> origin; // line position each packed cell came from
    std::vector<Cell> merged;
    packed.reserve(n);
    origin.reserve(n);
    merged.reserve(n);

    for (std::size_t r = 0; r < n; ++r) {
        packed.clear();
        origin.clear();
        merged.clear();
        for (std::size_t c = 0; c < n; ++c) {
            auto [gr, gc] = linePos(dir, n, r, c);
            const Cell& cell = state.grid.at(gr, gc);
            if (!cell.isEmpty()) {
                packed.push_back(cell);
                origin.push_back(c);
            }
        }

        for (std::size_t i = 0; i < packed.size();) {
            const bool hasNext = i + 1 < packed.size();
            if (hasNext && packed[i].isNumber() && joins(packed[i], packed[i + 1])) {
                const std::uint32_t v = packed[i].value * 2;
                merged.push_back(Cell::number(v));
                if (v == kWinningTile && !state.won) {
                    state.won = true;
                    res.reachedWin = true;
                }
                i += 2;
            } else if (hasNext && packed[i].isMarker() && packed[i + 1].isMarker()) {
                // both markers vanish; their old spots become blast centers
                clearCenters.push_back(linePos(dir, n, r, origin[i]));
                clearCenters.push_back(linePos(dir, n, r, origin[i + 1]));
                res.markerMerges++;
                i += 2;
            } else {
                merged.push_back(packed[i]);
                i += 1;
            }
        }

        for (std::size_t c = 0; c < n; ++c) {
            auto [gr, gc] = linePos(dir, n, r, c);
            const Cell next = c < merged.size() ? merged[c] : Cell::empty();
            out.at(gr, gc) = next;
            if (next != state.grid.at(gr, gc)) res.moved = true;
        }
    }

    for (const auto& [cr, cc] : clearCenters) {
        const std::size_t r0 = cr > 0 ? cr - 1 : 0;
        const std::size_t c0 = cc > 0 ? cc - 1 : 0;
        const std::size_t r1 = std::min(cr + 1, n - 1);
        const std::size_t c1 = std::min(cc + 1, n - 1);
        for (std::size_t r = r0; r <= r1; ++r) {
            for (std::size_t c = c0; c <= c1; ++c) {
                res.clearedPoints += out.at(r, c).points();
                out.at(r, c) = Cell::empty();
            }
        }
    }
    if (res.markerMerges > 0) res.moved = true;

    if (res.moved) state.grid = std::move(out);
    return res;
}

bool GridEngine::isTerminal(const GameState& state) {
    const Grid& g = state.grid;
    const std::size_t n = g.size();
    for (std::size_t r = 0; r < n; ++r) {
        for (std::size_t c = 0; c < n; ++c) {
            const Cell& cell = g.at(r, c);
            if (cell.isEmpty()) return false;
            if (c + 1 < n && joins(cell, g.at(r, c + 1))) return false;
            if (r + 1 < n && joins(cell, g.at(r + 1, c))) return false;
        }
    }
    return true;
}

bool GridEngine::canMove(const GameState& state) {
    for (Direction d : kAllDirections) {
        GameState trial = state;
        if (slide(trial, d).moved) return true;
    }
    return false;
}

void GridEngine::rescore(GameState& state) {
    state.score = sumOfTiles(state.grid);
    state.highScore = std::max(state.highScore, state.score);
}

void GridEngine::importState(GameState& current, const GameState& incoming) {
    validateState(incoming);
    GameState next = incoming;
    next.highScore = std::max(current.highScore, incoming.highScore);
    next.won = current.won || incoming.won;
    next.gameOver = isTerminal(next);
    rescore(next);
    current = std::move(next);
}
