#pragma once
#include "mg/game/GameState.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace mg::game {

inline constexpr const char* kSaveFormatVersion = "2.1.0";

// Storage record exchanged with the persistence side:
// {timestamp, date, game_state, version}
struct SaveRecord {
    std::string timestamp; // ISO-8601 local time
    std::string date;      // "%Y-%m-%d %H:%M:%S"
    GameState state;
    std::string version = kSaveFormatVersion;
};

// Stamps the record with the current local time.
SaveRecord makeSaveRecord(const GameState& state);

nlohmann::json toJson(const GameState& state);
nlohmann::json toJson(const SaveRecord& record);

// Both throw StateCorruption on missing fields, wrong types or a grid that
// fails validateState().
GameState gameStateFromJson(const nlohmann::json& j);
SaveRecord saveRecordFromJson(const nlohmann::json& j);

std::string encodeSaveRecord(const SaveRecord& record, int indent = 2);
SaveRecord decodeSaveRecord(const std::string& text);

// Autosave checkpoints: every multiple of 2048 reached by the largest tile
bool shouldAutoSave(std::uint32_t maxTile);

} // namespace mg::game
