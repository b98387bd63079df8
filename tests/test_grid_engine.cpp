#include <gtest/gtest.h>

#include "mg/game/Errors.hpp"
#include "mg/game/GridEngine.hpp"

#include <random>
#include <vector>

using namespace mg::game;

namespace {

constexpr int M = -1; // marker in the literal grids below

GameState stateFrom(const std::vector<std::vector<int>>& rows) {
  std::vector<std::vector<Cell>> cells;
  for (const auto& row : rows) {
    std::vector<Cell> line;
    for (int v : row)
      line.push_back(v == M ? Cell::marker() : v == 0 ? Cell::empty() : Cell::number(static_cast<std::uint32_t>(v)));
    cells.push_back(line);
  }
  GameState s;
  s.grid = Grid::fromRows(cells);
  s.size = s.grid.size();
  GridEngine::rescore(s);
  return s;
}

std::vector<int> rowOf(const GameState& s, std::size_t r) {
  std::vector<int> out;
  for (std::size_t c = 0; c < s.size; ++c) {
    const Cell& cell = s.grid.at(r, c);
    out.push_back(cell.isMarker() ? M : static_cast<int>(cell.points()));
  }
  return out;
}

std::vector<int> columnOf(const GameState& s, std::size_t c) {
  std::vector<int> out;
  for (std::size_t r = 0; r < s.size; ++r) {
    const Cell& cell = s.grid.at(r, c);
    out.push_back(cell.isMarker() ? M : static_cast<int>(cell.points()));
  }
  return out;
}

std::size_t countOccupied(const GameState& s) {
  return s.size * s.size - countEmpty(s.grid);
}

// Independent restatement of the terminal rule
bool referenceTerminal(const GameState& s) {
  const auto& g = s.grid;
  for (std::size_t r = 0; r < s.size; ++r) {
    for (std::size_t c = 0; c < s.size; ++c) {
      const Cell& a = g.at(r, c);
      if (a.isEmpty()) return false;
      const Cell* neighbours[2] = {c + 1 < s.size ? &g.at(r, c + 1) : nullptr,
                                   r + 1 < s.size ? &g.at(r + 1, c) : nullptr};
      for (const Cell* b : neighbours) {
        if (!b) continue;
        if (a.isNumber() && b->isNumber() && a.value == b->value) return false;
        if (a.isMarker() && b->isMarker()) return false;
      }
    }
  }
  return true;
}

GameState randomGrid(std::mt19937& rng, std::size_t n, double emptyChance) {
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  std::uniform_int_distribution<int> kind(0, 9);
  GameState s;
  s.size = n;
  s.grid = Grid(n);
  for (auto& cell : s.grid.cells()) {
    if (roll(rng) < emptyChance) continue;
    const int k = kind(rng);
    if (k == 0) cell = Cell::marker();
    else cell = Cell::number(1u << (1 + (k % 5))); // 4..64 and 2
  }
  GridEngine::rescore(s);
  return s;
}

const Direction kDirections[] = {Direction::Left, Direction::Right, Direction::Up, Direction::Down};

} // namespace

TEST(GridEngineTest, NewGameStartsWithTwoTiles) {
  GridEngine engine(42);
  GameState s = engine.newGame(4);
  EXPECT_EQ(4u, s.size);
  EXPECT_EQ(4u, s.grid.size());
  EXPECT_EQ(2u, countOccupied(s));
  for (const auto& c : s.grid.cells()) {
    if (!c.isEmpty()) {
      EXPECT_TRUE(c.isNumber());
      EXPECT_TRUE(c.value == 2 || c.value == 4) << c.value;
    }
  }
  EXPECT_EQ(sumOfTiles(s.grid), s.score);
  EXPECT_EQ(s.score, s.highScore);
  EXPECT_EQ(0u, s.moves);
  EXPECT_FALSE(s.gameOver);
  EXPECT_FALSE(s.won);
}

TEST(GridEngineTest, NewGameRejectsSizesBelowTwo) {
  GridEngine engine(1);
  EXPECT_THROW(engine.newGame(0), InvalidConfiguration);
  EXPECT_THROW(engine.newGame(1), InvalidConfiguration);
  GameState tiny = engine.newGame(2);
  EXPECT_EQ(2u, countOccupied(tiny));
  GameState big = engine.newGame(11);
  EXPECT_EQ(121u, big.grid.cells().size());
}

TEST(GridEngineTest, PairMergesAndOneTileSpawns) {
  GridEngine engine(7);
  GameState s = stateFrom({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  MoveResult r = engine.move(s, Direction::Left);
  ASSERT_TRUE(r.moved);
  EXPECT_EQ(4u, s.grid.at(0, 0).points());
  EXPECT_EQ(2u, countOccupied(s));
  std::uint32_t spawned = 0;
  for (std::size_t i = 1; i < s.grid.cells().size(); ++i) spawned += s.grid.cells()[i].points();
  EXPECT_TRUE(spawned == 2 || spawned == 4) << s;
  EXPECT_EQ(4u + spawned, s.score);
  EXPECT_EQ(1u, s.moves);
}

TEST(GridEngineTest, FourEqualTilesMergeInPairs) {
  GameState s = stateFrom({{2, 2, 2, 2}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  ASSERT_TRUE(GridEngine::slide(s, Direction::Left).moved);
  EXPECT_EQ((std::vector<int>{4, 4, 0, 0}), rowOf(s, 0));
}

TEST(GridEngineTest, MergedTileDoesNotMergeAgain) {
  GameState s = stateFrom({{2, 2, 4, 0}, {4, 4, 8, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  GridEngine::slide(s, Direction::Left);
  EXPECT_EQ((std::vector<int>{4, 4, 0, 0}), rowOf(s, 0));
  EXPECT_EQ((std::vector<int>{8, 8, 0, 0}), rowOf(s, 1));
}

TEST(GridEngineTest, RightMergesFromTheRightEdge) {
  GameState s = stateFrom({{2, 2, 2, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  GridEngine::slide(s, Direction::Right);
  EXPECT_EQ((std::vector<int>{0, 0, 2, 4}), rowOf(s, 0));
}

TEST(GridEngineTest, VerticalMovesWorkOnColumns) {
  GameState up = stateFrom({{2, 0, 0, 0}, {0, 0, 0, 0}, {2, 0, 0, 0}, {4, 0, 0, 0}});
  GameState down = up;
  GridEngine::slide(up, Direction::Up);
  EXPECT_EQ((std::vector<int>{4, 4, 0, 0}), columnOf(up, 0));
  GridEngine::slide(down, Direction::Down);
  EXPECT_EQ((std::vector<int>{0, 0, 4, 4}), columnOf(down, 0));
}

TEST(GridEngineTest, MarkerPairClearsItsNeighbourhood) {
  GameState s = stateFrom({{M, M, 4, 0}, {2, 0, 0, 8}, {0, 0, 0, 16}, {0, 0, 0, 0}});
  MoveResult r = GridEngine::slide(s, Direction::Left);
  EXPECT_TRUE(r.moved);
  EXPECT_EQ(1u, r.markerMerges);
  // 4 slid into the blast, row 1 compacted to [2,8] inside it too
  EXPECT_EQ(14u, r.clearedPoints);
  EXPECT_EQ((std::vector<int>{0, 0, 0, 0}), rowOf(s, 0));
  EXPECT_EQ((std::vector<int>{0, 0, 0, 0}), rowOf(s, 1));
  EXPECT_EQ((std::vector<int>{16, 0, 0, 0}), rowOf(s, 2));
}

TEST(GridEngineTest, MarkerMergeThenSpawnKeepsScoreEqualToTiles) {
  GridEngine engine(3);
  GameState s = stateFrom({{M, M, 4, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  const std::uint32_t highBefore = s.highScore;
  MoveResult r = engine.move(s, Direction::Left);
  EXPECT_TRUE(r.moved);
  EXPECT_EQ(4u, r.clearedPoints);
  EXPECT_EQ(1u, countOccupied(s));
  EXPECT_EQ(sumOfTiles(s.grid), s.score);
  EXPECT_GE(s.highScore, highBefore);
}

TEST(GridEngineTest, NumbersAndMarkersNeverCombine) {
  GameState blocked = stateFrom({{2, M, 2, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  EXPECT_FALSE(GridEngine::slide(blocked, Direction::Left).moved);
  EXPECT_EQ((std::vector<int>{2, M, 2, 0}), rowOf(blocked, 0));

  GameState passing = stateFrom({{0, M, 2, 2}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  EXPECT_TRUE(GridEngine::slide(passing, Direction::Left).moved);
  EXPECT_EQ((std::vector<int>{M, 4, 0, 0}), rowOf(passing, 0));
}

TEST(GridEngineTest, WinIsReportedOnce) {
  GridEngine engine(5);
  GameState s = stateFrom({{1024, 1024, 0, 0}, {1024, 1024, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  MoveResult first = GridEngine::slide(s, Direction::Left);
  EXPECT_TRUE(first.reachedWin);
  EXPECT_TRUE(s.won);

  GameState again = stateFrom({{1024, 1024, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  again.won = true;
  MoveResult second = engine.move(again, Direction::Left);
  EXPECT_TRUE(second.moved);
  EXPECT_FALSE(second.reachedWin);
  EXPECT_TRUE(again.won);
}

TEST(GridEngineTest, NoOpMoveLeavesStateUntouched) {
  GridEngine engine(9);
  GameState s = stateFrom({{2, 4, 0, 0}, {8, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  s.moves = 17;
  const GameState before = s;
  MoveResult r = engine.move(s, Direction::Left);
  EXPECT_FALSE(r.moved);
  EXPECT_EQ(before, s);
}

TEST(GridEngineTest, LockedGridIsTerminalAndRefusesSpawn) {
  GridEngine engine(11);
  GameState s = stateFrom({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, M, 4}, {4, 2, 4, 2}});
  EXPECT_TRUE(GridEngine::isTerminal(s));
  EXPECT_FALSE(GridEngine::canMove(s));
  const Grid before = s.grid;
  EXPECT_FALSE(engine.spawnTile(s));
  EXPECT_TRUE(s.gameOver);
  EXPECT_EQ(before, s.grid);
  for (Direction d : kDirections) EXPECT_FALSE(engine.move(s, d).moved) << directionName(d);
}

TEST(GridEngineTest, AdjacentMarkersOrEqualNumbersKeepGameAlive) {
  GameState markers = stateFrom({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, M, M, 4}, {4, 2, 4, 2}});
  EXPECT_FALSE(GridEngine::isTerminal(markers));
  EXPECT_TRUE(GridEngine::canMove(markers));

  GameState vertical = stateFrom({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 8, 4}, {4, 2, 8, 2}});
  EXPECT_FALSE(GridEngine::isTerminal(vertical));
  EXPECT_TRUE(GridEngine::canMove(vertical));
}

TEST(GridEngineTest, CanMoveWorksOnACopy) {
  GameState s = stateFrom({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  const GameState before = s;
  EXPECT_TRUE(GridEngine::canMove(s));
  EXPECT_EQ(before, s);
}

TEST(GridEngineTest, MoveRejectsCorruptStates) {
  GridEngine engine(13);
  GameState wrongSize = stateFrom({{2, 0}, {0, 0}});
  wrongSize.size = 3;
  EXPECT_THROW(engine.move(wrongSize, Direction::Left), StateCorruption);

  GameState oddValue = stateFrom({{2, 0}, {0, 0}});
  oddValue.grid.at(0, 1) = Cell::number(3);
  EXPECT_THROW(engine.move(oddValue, Direction::Left), StateCorruption);

  EXPECT_THROW(Grid::fromRows({{Cell::empty(), Cell::empty()}, {Cell::empty()}}), StateCorruption);
}

TEST(GridEngineTest, LargestTilesDoNotMerge) {
  const int top = static_cast<int>(kMaxTileValue);
  GridEngine engine(17);
  GameState s = stateFrom({{top, top}, {2, 4}});
  ASSERT_NO_THROW(validateState(s));
  EXPECT_TRUE(GridEngine::isTerminal(s));
  EXPECT_FALSE(GridEngine::canMove(s));

  const GameState before = s;
  EXPECT_FALSE(engine.move(s, Direction::Left).moved);
  EXPECT_EQ(before, s);

  GameState open = stateFrom({{top, top}, {0, 2}});
  EXPECT_TRUE(engine.move(open, Direction::Left).moved);
  EXPECT_EQ(kMaxTileValue, open.grid.at(0, 0).points());
  EXPECT_EQ(kMaxTileValue, open.grid.at(0, 1).points());
  EXPECT_NO_THROW(validateState(open));
}

TEST(GridEngineTest, TilesBeyondTheCapAreCorrupt) {
  EXPECT_FALSE(isPowerOfTwoTile(kMaxTileValue * 2u));
  GameState s = stateFrom({{2, 0}, {0, 0}});
  s.grid.at(0, 1) = Cell::number(kMaxTileValue * 2u);
  EXPECT_THROW(validateState(s), StateCorruption);

  GameState heavy;
  heavy.size = 3;
  heavy.grid = Grid(3);
  for (auto& cell : heavy.grid.cells()) cell = Cell::number(kMaxTileValue);
  EXPECT_THROW(validateState(heavy), StateCorruption); // 9 * 2^30 overflows the score
}

TEST(GridEngineTest, SpawnFavoursTwos) {
  GridEngine engine(2024);
  int fours = 0;
  const int rounds = 4000;
  for (int i = 0; i < rounds; ++i) {
    GameState s = stateFrom({{0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    ASSERT_TRUE(engine.spawnTile(s));
    if (sumOfTiles(s.grid) == 4) fours++;
  }
  const double ratio = static_cast<double>(fours) / rounds;
  EXPECT_GT(ratio, 0.07);
  EXPECT_LT(ratio, 0.13);
}

TEST(GridEngineTest, TerminalFlagMatchesRuleOnRandomGrids) {
  std::mt19937 rng(99);
  GridEngine engine(100);
  for (int i = 0; i < 500; ++i) {
    const std::size_t n = 2 + static_cast<std::size_t>(i % 5);
    GameState s = randomGrid(rng, n, i % 3 == 0 ? 0.0 : 0.15);
    ASSERT_EQ(referenceTerminal(s), GridEngine::isTerminal(s)) << s;

    for (Direction d : kDirections) {
      GameState trial = s;
      const GameState before = trial;
      MoveResult r = engine.move(trial, d);
      if (r.moved) {
        EXPECT_EQ(referenceTerminal(trial), trial.gameOver) << trial;
        EXPECT_EQ(before.moves + 1, trial.moves);
      } else {
        EXPECT_EQ(before, trial);
      }
      EXPECT_EQ(sumOfTiles(trial.grid), trial.score);
      EXPECT_GE(trial.highScore, before.highScore);
    }
  }
}

TEST(GridEngineTest, LongGameKeepsInvariants) {
  GridEngine engine(31337);
  std::mt19937 rng(4);
  std::uniform_int_distribution<int> pick(0, 3);
  GameState s = engine.newGame(4);
  std::uint32_t lastHigh = s.highScore;
  int winTransitions = 0;
  for (int step = 0; step < 3000 && !s.gameOver; ++step) {
    const bool wasWon = s.won;
    MoveResult r = engine.move(s, kDirections[pick(rng)]);
    ASSERT_EQ(sumOfTiles(s.grid), s.score);
    ASSERT_GE(s.highScore, lastHigh);
    ASSERT_GE(s.highScore, s.score);
    lastHigh = s.highScore;
    if (!wasWon && s.won) winTransitions++;
    ASSERT_FALSE(wasWon && !s.won);
    ASSERT_EQ(r.reachedWin, !wasWon && s.won);
  }
  EXPECT_LE(winTransitions, 1);
  if (s.gameOver) EXPECT_FALSE(GridEngine::canMove(s));
}

TEST(GridEngineTest, ImportKeepsBestHighScoreAndWin) {
  GameState current = stateFrom({{2, 0}, {0, 0}});
  current.highScore = 500;
  current.won = true;
  GameState incoming = stateFrom({{4, 8}, {0, 0}});
  incoming.highScore = 40;
  incoming.moves = 12;
  GridEngine::importState(current, incoming);
  EXPECT_EQ(500u, current.highScore);
  EXPECT_TRUE(current.won);
  EXPECT_EQ(12u, current.moves);
  EXPECT_EQ(12u, current.score);
  EXPECT_EQ(incoming.grid, current.grid);

  GameState bad = incoming;
  bad.size = 5;
  const GameState kept = current;
  EXPECT_THROW(GridEngine::importState(current, bad), StateCorruption);
  EXPECT_EQ(kept, current);
}
