#pragma once
#include <stdexcept>
#include <string>

namespace mg::game {

// Base of every failure the engine and the registries report.
class GameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Grid size out of the supported range; raised before any state exists.
class InvalidConfiguration : public GameError {
public:
    using GameError::GameError;
};

// A session/room key that was never registered (or already removed).
class KeyNotFound : public GameError {
public:
    explicit KeyNotFound(const std::string& key)
        : GameError("unknown game key '" + key + "'"), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

// A GameState that fails structural validation (dimensions, cell values).
class StateCorruption : public GameError {
public:
    using GameError::GameError;
};

} // namespace mg::game
