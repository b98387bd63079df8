#pragma once
#include "mg/game/Cell.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace mg::game {

// Square matrix of cells stored row-major. Always n x n.
class Grid {
public:
    Grid() = default;
    explicit Grid(std::size_t n) : n_(n), cells_(n * n) {}

    // Builds a grid from explicit rows; throws StateCorruption unless square.
    static Grid fromRows(const std::vector<std::vector<Cell>>& rows);

    std::size_t size() const { return n_; }

    Cell& at(std::size_t row, std::size_t col) { return cells_[row * n_ + col]; }
    const Cell& at(std::size_t row, std::size_t col) const { return cells_[row * n_ + col]; }

    std::vector<Cell>& cells() { return cells_; }
    const std::vector<Cell>& cells() const { return cells_; }

    friend bool operator==(const Grid& a, const Grid& b) { return a.n_ == b.n_ && a.cells_ == b.cells_; }
    friend bool operator!=(const Grid& a, const Grid& b) { return !(a == b); }

private:
    std::size_t n_ = 0;
    std::vector<Cell> cells_;
};

struct GameState {
    Grid grid;
    std::uint32_t score = 0;     // always the sum of numeric cells
    std::uint32_t highScore = 0; // never decreases for one instance
    std::uint32_t moves = 0;
    bool gameOver = false;
    bool won = false;
    std::size_t size = 0;

    // Largest numeric tile, 0 when the grid holds no number
    std::uint32_t maxTile() const;

    friend bool operator==(const GameState& a, const GameState& b) {
        return a.grid == b.grid && a.score == b.score && a.highScore == b.highScore &&
               a.moves == b.moves && a.gameOver == b.gameOver && a.won == b.won &&
               a.size == b.size;
    }
    friend bool operator!=(const GameState& a, const GameState& b) { return !(a == b); }
};

// Largest tile a state may hold. Two of them never merge, so no tile overflows.
inline constexpr std::uint32_t kMaxTileValue = 1u << 30;

std::uint32_t sumOfTiles(const Grid& grid);
std::size_t countEmpty(const Grid& grid);
bool isPowerOfTwoTile(std::uint32_t value);

// Throws StateCorruption when the state cannot be fed to the engine:
// size below 2, size field disagreeing with the grid, a number cell that is
// not a power of two in [2, kMaxTileValue], or tiles summing past 32 bits.
void validateState(const GameState& state);

// Text rendering used by logs and test failure messages ("." for empty, "M" for marker)
std::ostream& operator<<(std::ostream& os, const Grid& grid);
std::ostream& operator<<(std::ostream& os, const GameState& state);

} // namespace mg::game
