#include "gameplay/SessionRegistry.hpp"
#include "mg/game/Errors.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <mutex>

using namespace mergegrid::server::gameplay;
using mg::game::GameState;
using mg::game::GridEngine;

SessionRegistry::SessionRegistry() = default;

SessionRegistry::SessionRegistry(std::uint32_t seed) : seed_(seed) {}

SessionRegistry::GamePtr SessionRegistry::find(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(tableMutex_);
  auto it = games_.find(key);
  return it == games_.end() ? nullptr : it->second;
}

SessionRegistry::GamePtr
SessionRegistry::require(const std::string &key) const {
  auto game = find(key);
  if (!game)
    throw mg::game::KeyNotFound(key);
  return game;
}

GridEngine SessionRegistry::makeEngine() {
  if (seed_)
    return GridEngine(*seed_ + static_cast<std::uint32_t>(created_.load()));
  return GridEngine();
}

SessionRegistry::Listeners SessionRegistry::listenersOf(const GameSlot &slot) {
  Listeners out;
  out.reserve(slot.subscribers.size());
  for (const auto &sub : slot.subscribers)
    out.push_back(sub.second);
  return out;
}

void SessionRegistry::notify(const std::string &key, ChangeKind kind,
                             const Listeners &listeners, const Snapshot &snap) {
  // the change is committed; one failing listener must not starve the rest
  for (const auto &fn : listeners) {
    try {
      fn(key, kind, snap);
    } catch (const std::exception &e) {
      std::cerr << "[registry] Listener on '" << key
                << "' failed: " << e.what() << "\n";
    }
  }
}

SessionRegistry::GamePtr
SessionRegistry::findOrCreateLocked(const std::string &key,
                                    std::size_t defaultSize) {
  auto it = games_.find(key);
  if (it != games_.end())
    return it->second;
  // Built under the table lock so racing creators cannot both win
  GridEngine engine = makeEngine();
  GameState state = engine.newGame(defaultSize);
  it = games_
           .emplace(key, std::make_shared<GuardedGame>(std::move(engine),
                                                       std::move(state)))
           .first;
  created_++;
  std::cout << "[registry] Created game '" << key << "' (" << defaultSize
            << "x" << defaultSize << ")\n";
  return it->second;
}

Snapshot SessionRegistry::getOrCreate(const std::string &key,
                                      std::size_t defaultSize) {
  auto game = find(key);
  if (!game) {
    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    game = findOrCreateLocked(key, defaultSize);
  }
  return game->withLock(
      [](GameSlot &slot) { return Snapshot{slot.state, slot.revision}; });
}

MoveOutcome SessionRegistry::applyMove(const std::string &key,
                                       mg::game::Direction dir) {
  auto game = require(key);
  MoveOutcome out;
  Listeners listeners;
  game->withLock([&](GameSlot &slot) {
    out.result = slot.engine.move(slot.state, dir);
    out.moved = out.result.moved;
    if (out.moved) {
      slot.revision++;
      listeners = listenersOf(slot);
    }
    out.snapshot = Snapshot{slot.state, slot.revision};
  });
  if (out.moved) {
    acceptedMoves_++;
    notify(key, ChangeKind::Move, listeners, out.snapshot);
  }
  return out;
}

Snapshot SessionRegistry::reset(const std::string &key,
                                std::optional<std::size_t> size,
                                HighScorePolicy policy) {
  auto game = require(key);
  Listeners listeners;
  Snapshot snap = game->withLock([&](GameSlot &slot) {
    GameState fresh = slot.engine.newGame(size.value_or(slot.state.size));
    if (policy == HighScorePolicy::Keep)
      fresh.highScore = std::max(fresh.highScore, slot.state.highScore);
    slot.state = std::move(fresh);
    slot.revision++;
    listeners = listenersOf(slot);
    return Snapshot{slot.state, slot.revision};
  });
  notify(key, ChangeKind::Reset, listeners, snap);
  return snap;
}

Snapshot SessionRegistry::importState(const std::string &key,
                                      const GameState &incoming) {
  auto game = require(key);
  Listeners listeners;
  Snapshot snap = game->withLock([&](GameSlot &slot) {
    GridEngine::importState(slot.state, incoming);
    slot.revision++;
    listeners = listenersOf(slot);
    return Snapshot{slot.state, slot.revision};
  });
  notify(key, ChangeKind::Import, listeners, snap);
  return snap;
}

Snapshot SessionRegistry::snapshot(const std::string &key) const {
  auto game = require(key);
  return game->withLock(
      [](GameSlot &slot) { return Snapshot{slot.state, slot.revision}; });
}

bool SessionRegistry::remove(const std::string &key) {
  std::size_t erased = 0;
  {
    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    erased = games_.erase(key);
  }
  if (erased) {
    removed_++;
    std::cout << "[registry] Removed game '" << key << "'\n";
  }
  return erased > 0;
}

bool SessionRegistry::removeIfUnwatched(const std::string &key) {
  {
    std::unique_lock<std::shared_mutex> lock(tableMutex_);
    auto it = games_.find(key);
    if (it == games_.end())
      return false;
    bool watched = it->second->withLock(
        [](GameSlot &slot) { return !slot.subscribers.empty(); });
    if (watched)
      return false;
    games_.erase(it);
  }
  removed_++;
  std::cout << "[registry] Removed unwatched game '" << key << "'\n";
  return true;
}

SubscriptionId SessionRegistry::subscribe(const std::string &key, ChangeFn fn) {
  auto game = require(key);
  const SubscriptionId id = nextSubscription_++;
  game->withLock(
      [&](GameSlot &slot) { slot.subscribers.emplace_back(id, std::move(fn)); });
  return id;
}

Attachment SessionRegistry::attach(const std::string &key,
                                   std::size_t defaultSize, ChangeFn fn) {
  const SubscriptionId id = nextSubscription_++;
  // Same lock order as removeIfUnwatched: table, then entry
  std::unique_lock<std::shared_mutex> lock(tableMutex_);
  auto game = findOrCreateLocked(key, defaultSize);
  return game->withLock([&](GameSlot &slot) {
    slot.subscribers.emplace_back(id, std::move(fn));
    return Attachment{id, Snapshot{slot.state, slot.revision}};
  });
}

void SessionRegistry::unsubscribe(const std::string &key, SubscriptionId id) {
  auto game = find(key);
  if (!game)
    return;
  game->withLock([id](GameSlot &slot) {
    auto &subs = slot.subscribers;
    subs.erase(std::remove_if(subs.begin(), subs.end(),
                              [id](const auto &s) { return s.first == id; }),
               subs.end());
  });
}

std::size_t SessionRegistry::subscriberCount(const std::string &key) const {
  auto game = require(key);
  return game->withLock(
      [](GameSlot &slot) { return slot.subscribers.size(); });
}

bool SessionRegistry::contains(const std::string &key) const {
  return find(key) != nullptr;
}

std::size_t SessionRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(tableMutex_);
  return games_.size();
}

RegistryStats SessionRegistry::stats() const {
  RegistryStats s;
  s.active = size();
  s.created = created_.load();
  s.removed = removed_.load();
  s.acceptedMoves = acceptedMoves_.load();
  return s;
}
