#include "mg/game/GameState.hpp"
#include "mg/game/Errors.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <string>

using namespace mg::game;

Grid Grid::fromRows(const std::vector<std::vector<Cell>>& rows) {
    Grid g(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != rows.size()) {
            throw StateCorruption("grid row " + std::to_string(r) + " has " +
                                  std::to_string(rows[r].size()) + " cells, expected " +
                                  std::to_string(rows.size()));
        }
        std::copy(rows[r].begin(), rows[r].end(), g.cells_.begin() + static_cast<std::ptrdiff_t>(r * g.n_));
    }
    return g;
}

std::uint32_t GameState::maxTile() const {
    std::uint32_t best = 0;
    for (const auto& c : grid.cells())
        best = std::max(best, c.points());
    return best;
}

std::uint32_t mg::game::sumOfTiles(const Grid& grid) {
    std::uint32_t total = 0;
    for (const auto& c : grid.cells())
        total += c.points();
    return total;
}

std::size_t mg::game::countEmpty(const Grid& grid) {
    return static_cast<std::size_t>(
        std::count_if(grid.cells().begin(), grid.cells().end(), [](const Cell& c) { return c.isEmpty(); }));
}

bool mg::game::isPowerOfTwoTile(std::uint32_t value) {
    return value >= 2 && value <= kMaxTileValue && (value & (value - 1)) == 0;
}

void mg::game::validateState(const GameState& state) {
    if (state.size < 2)
        throw StateCorruption("grid size " + std::to_string(state.size) + " is below 2");
    if (state.grid.size() != state.size)
        throw StateCorruption("grid is " + std::to_string(state.grid.size()) + "x" +
                              std::to_string(state.grid.size()) + " but size says " +
                              std::to_string(state.size));
    if (state.grid.cells().size() != state.size * state.size)
        throw StateCorruption("grid storage does not match its dimensions");
    std::uint64_t total = 0;
    for (std::size_t r = 0; r < state.size; ++r) {
        for (std::size_t c = 0; c < state.size; ++c) {
            const Cell& cell = state.grid.at(r, c);
            switch (cell.kind) {
            case Cell::Kind::Empty:
            case Cell::Kind::Marker:
                break;
            case Cell::Kind::Number:
                if (!isPowerOfTwoTile(cell.value))
                    throw StateCorruption("cell (" + std::to_string(r) + "," + std::to_string(c) +
                                          ") holds " + std::to_string(cell.value) +
                                          ", not a power of two in 2.." + std::to_string(kMaxTileValue));
                total += cell.value;
                break;
            default:
                throw StateCorruption("cell (" + std::to_string(r) + "," + std::to_string(c) +
                                      ") has an unknown kind");
            }
        }
    }
    if (total > UINT32_MAX)
        throw StateCorruption("tiles add up to " + std::to_string(total) + ", beyond the score range");
}

std::ostream& mg::game::operator<<(std::ostream& os, const Grid& grid) {
    for (std::size_t r = 0; r < grid.size(); ++r) {
        for (std::size_t c = 0; c < grid.size(); ++c) {
            const Cell& cell = grid.at(r, c);
            if (c) os << ' ';
            if (cell.isNumber()) os << std::setw(4) << cell.value;
            else os << std::setw(4) << (cell.isMarker() ? "M" : ".");
        }
        os << '\n';
    }
    return os;
}

std::ostream& mg::game::operator<<(std::ostream& os, const GameState& state) {
    os << "size=" << state.size << " score=" << state.score << " high=" << state.highScore
       << " moves=" << state.moves << " over=" << state.gameOver << " won=" << state.won << '\n'
       << state.grid;
    return os;
}
