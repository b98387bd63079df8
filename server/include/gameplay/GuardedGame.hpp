#pragma once

#include "mg/game/GridEngine.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mergegrid::server::gameplay {

enum class ChangeKind : std::uint8_t { Move, Reset, Import };

struct Snapshot {
  mg::game::GameState state;
  std::uint64_t revision = 0;
};

using SubscriptionId = std::uint64_t;
using ChangeFn = std::function<void(const std::string &key, ChangeKind kind,
                                    const Snapshot &snapshot)>;

// Everything owned by one session/room key.
struct GameSlot {
  mg::game::GridEngine engine;
  mg::game::GameState state;
  std::uint64_t revision = 0;
  std::vector<std::pair<SubscriptionId, ChangeFn>> subscribers;
};

/**
 * @brief One game guarded by its own mutex.
 *
 * All accesses to the engine and state go through withLock(). Each key owns
 * one of these, so moves on different keys never contend.
 */
class GuardedGame {
public:
  GuardedGame(mg::game::GridEngine engine, mg::game::GameState state) {
    slot_.engine = std::move(engine);
    slot_.state = std::move(state);
  }
  ~GuardedGame() = default;

  // Delete copy/move to prevent races on the mutex
  GuardedGame(const GuardedGame &) = delete;
  GuardedGame &operator=(const GuardedGame &) = delete;
  GuardedGame(GuardedGame &&) = delete;
  GuardedGame &operator=(GuardedGame &&) = delete;

  /**
   * @brief Execute a function with exclusive access to the game.
   *
   * @tparam F Function type (callable)
   * @param func logic to execute, receiving GameSlot& as argument
   * @return The return value of func
   */
  template <typename F> auto withLock(F &&func) {
    std::lock_guard<std::mutex> lock(mutex_);
    return func(slot_);
  }

private:
  GameSlot slot_;
  std::mutex mutex_;
};

} // namespace mergegrid::server::gameplay
