#pragma once
#include "gameplay/GuardedGame.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mergegrid::server::gameplay {

enum class HighScorePolicy : std::uint8_t { Keep, Discard };

struct MoveOutcome {
  bool moved = false;
  mg::game::MoveResult result;
  Snapshot snapshot;
};

// A subscription together with the state it starts from.
struct Attachment {
  SubscriptionId id = 0;
  Snapshot snapshot;
};

struct RegistryStats {
  std::size_t active = 0;
  std::uint64_t created = 0;
  std::uint64_t removed = 0;
  std::uint64_t acceptedMoves = 0;
};

/**
 * @brief Owns every live game, keyed by an opaque session/room identifier.
 *
 * The key table is behind a reader/writer lock that is only held to look up,
 * insert or erase entries. Game mutations take the per-entry lock of
 * GuardedGame, so two keys never wait on each other. Every returned Snapshot
 * is a copy made under the entry lock.
 *
 * Lock ordering: table lock before entry lock, never the other way round.
 * Subscribers are invoked after the entry lock is released.
 */
class SessionRegistry {
public:
  SessionRegistry();
  // Deterministic spawns for tests: entry N gets an engine seeded with seed+N
  explicit SessionRegistry(std::uint32_t seed);

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // Creates the game on first reference; concurrent first callers share one
  // instance. Throws InvalidConfiguration when a new game needs a bad size.
  Snapshot getOrCreate(const std::string &key, std::size_t defaultSize);

  // Throws KeyNotFound. Subscribers hear about it only when the grid moved.
  MoveOutcome applyMove(const std::string &key, mg::game::Direction dir);

  // Fresh game on the same key; no size keeps the current one.
  Snapshot reset(const std::string &key,
                 std::optional<std::size_t> size = std::nullopt,
                 HighScorePolicy policy = HighScorePolicy::Keep);

  // Loads a persisted state; the high score never goes down.
  Snapshot importState(const std::string &key,
                       const mg::game::GameState &incoming);

  Snapshot snapshot(const std::string &key) const;

  // Idempotent; returns whether something was erased.
  bool remove(const std::string &key);
  // Erases the entry only when nobody is subscribed to it.
  bool removeIfUnwatched(const std::string &key);

  SubscriptionId subscribe(const std::string &key, ChangeFn fn);
  // getOrCreate and subscribe as one step: a concurrent removeIfUnwatched
  // either runs before (and the game is recreated) or sees the subscriber.
  Attachment attach(const std::string &key, std::size_t defaultSize,
                    ChangeFn fn);
  // Idempotent; unknown key or id is not an error.
  void unsubscribe(const std::string &key, SubscriptionId id);
  std::size_t subscriberCount(const std::string &key) const;

  bool contains(const std::string &key) const;
  std::size_t size() const;
  RegistryStats stats() const;

private:
  using GamePtr = std::shared_ptr<GuardedGame>;
  using Listeners = std::vector<ChangeFn>;

  GamePtr find(const std::string &key) const;
  GamePtr require(const std::string &key) const;
  // Caller holds tableMutex_ exclusively.
  GamePtr findOrCreateLocked(const std::string &key, std::size_t defaultSize);
  mg::game::GridEngine makeEngine();
  static Listeners listenersOf(const GameSlot &slot);
  static void notify(const std::string &key, ChangeKind kind,
                     const Listeners &listeners, const Snapshot &snap);

private:
  mutable std::shared_mutex tableMutex_;
  std::unordered_map<std::string, GamePtr> games_;

  std::optional<std::uint32_t> seed_;
  std::atomic<std::uint64_t> nextSubscription_{1};
  std::atomic<std::uint64_t> created_{0};
  std::atomic<std::uint64_t> removed_{0};
  std::atomic<std::uint64_t> acceptedMoves_{0};
};

} // namespace mergegrid::server::gameplay
