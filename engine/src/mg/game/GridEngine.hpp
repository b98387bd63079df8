#pragma once
#include "mg/game/GameState.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace mg::game {

enum class Direction : std::uint8_t { Left = 0, Right = 1, Up = 2, Down = 3 };

const char* directionName(Direction d);
std::optional<Direction> directionFromByte(std::uint8_t raw);

// Outcome of one slide/move. `moved` also covers marker merges that only
// cleared cells.
struct MoveResult {
    bool moved = false;
    bool reachedWin = false;        // this move produced the first 2048
    unsigned markerMerges = 0;      // marker pairs consumed
    std::uint32_t clearedPoints = 0; // numeric value wiped by marker clears
};

/**
 * @brief Single-grid 2048 rules: slide, merge, spawn, terminal detection.
 *
 * Knows nothing about threads or keys; the owner serializes access. The only
 * mutable member is the random generator used for spawning.
 */
class GridEngine {
public:
    static constexpr std::size_t kMinGridSize = 2;
    static constexpr std::uint32_t kWinningTile = 2048;
    static constexpr double kFourProbability = 0.1;

    GridEngine();
    explicit GridEngine(std::uint32_t seed);

    // Empty size x size grid with two spawned tiles. Throws InvalidConfiguration.
    GameState newGame(std::size_t size);

    // Full turn: slide, and when something moved bump the move counter, spawn
    // one tile, rescore and re-evaluate game over. A move that changes nothing
    // leaves the state untouched. Throws StateCorruption on a malformed state.
    MoveResult move(GameState& state, Direction dir);

    // Places a 2 (90%) or 4 (10%) on a uniformly chosen empty cell and
    // refreshes gameOver. Returns false when the grid is full.
    bool spawnTile(GameState& state);

    // Compaction, merge and marker clearing only; no spawn, no counters.
    static MoveResult slide(GameState& state, Direction dir);

    static bool isTerminal(const GameState& state);

    // True if any of the four directions would change the grid.
    static bool canMove(const GameState& state);

    // score = sum of tiles, highScore = max(highScore, score)
    static void rescore(GameState& state);

    // Replaces `current` with a validated imported state. The high score is
    // the max of both sides and a won game stays won.
    static void importState(GameState& current, const GameState& incoming);

private:
    std::mt19937 rng_;
};

} // namespace mg::game
