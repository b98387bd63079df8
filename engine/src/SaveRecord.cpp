#include "mg/game/SaveRecord.hpp"
#include "mg/game/Errors.hpp"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace mg::game;
using json = nlohmann::json;

namespace {

constexpr const char* kMarkerText = "M";

std::tm localNow(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

const json& requireField(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) throw StateCorruption(std::string("missing field '") + name + "'");
    return *it;
}

std::uint32_t requireCount(const json& j, const char* name) {
    const json& v = requireField(j, name);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0))
        throw StateCorruption(std::string("field '") + name + "' must be a non-negative integer");
    const auto n = v.get<std::uint64_t>();
    if (n > UINT32_MAX)
        throw StateCorruption(std::string("field '") + name + "' value " + std::to_string(n) + " out of range");
    return static_cast<std::uint32_t>(n);
}

bool requireFlag(const json& j, const char* name) {
    const json& v = requireField(j, name);
    if (!v.is_boolean()) throw StateCorruption(std::string("field '") + name + "' must be a boolean");
    return v.get<bool>();
}

Cell cellFromJson(const json& v) {
    if (v.is_string()) {
        if (v.get<std::string>() == kMarkerText) return Cell::marker();
        throw StateCorruption("unknown cell text '" + v.get<std::string>() + "'");
    }
    if (v.is_number_integer()) {
        const auto n = v.get<std::int64_t>();
        if (n == 0) return Cell::empty();
        if (n < 0 || n > static_cast<std::int64_t>(UINT32_MAX))
            throw StateCorruption("cell value " + std::to_string(n) + " out of range");
        return Cell::number(static_cast<std::uint32_t>(n));
    }
    throw StateCorruption("cell must be an integer or \"M\"");
}

json cellToJson(const Cell& c) {
    if (c.isMarker()) return kMarkerText;
    return c.points();
}

} // namespace

SaveRecord mg::game::makeSaveRecord(const GameState& state) {
    const auto now = std::chrono::system_clock::now();
    const std::tm tm = localNow(now);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    SaveRecord rec;
    std::ostringstream iso;
    iso << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    rec.timestamp = iso.str();
    std::ostringstream date;
    date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    rec.date = date.str();
    rec.state = state;
    return rec;
}

json mg::game::toJson(const GameState& state) {
    json grid = json::array();
    for (std::size_t r = 0; r < state.grid.size(); ++r) {
        json row = json::array();
        for (std::size_t c = 0; c < state.grid.size(); ++c)
            row.push_back(cellToJson(state.grid.at(r, c)));
        grid.push_back(std::move(row));
    }
    return json{{"grid", std::move(grid)},
                {"score", state.score},
                {"high_score", state.highScore},
                {"moves", state.moves},
                {"game_over", state.gameOver},
                {"won", state.won},
                {"size", state.size},
                {"max_tile", state.maxTile()}};
}

json mg::game::toJson(const SaveRecord& record) {
    return json{{"timestamp", record.timestamp},
                {"date", record.date},
                {"game_state", toJson(record.state)},
                {"version", record.version}};
}

GameState mg::game::gameStateFromJson(const json& j) {
    if (!j.is_object()) throw StateCorruption("game_state must be an object");

    const json& rows = requireField(j, "grid");
    if (!rows.is_array()) throw StateCorruption("grid must be an array of rows");
    std::vector<std::vector<Cell>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_array()) throw StateCorruption("grid row must be an array");
        std::vector<Cell> line;
        line.reserve(row.size());
        for (const auto& v : row)
            line.push_back(cellFromJson(v));
        cells.push_back(std::move(line));
    }

    GameState s;
    s.grid = Grid::fromRows(cells);
    s.size = j.contains("size") ? requireCount(j, "size") : s.grid.size();
    s.score = requireCount(j, "score");
    s.highScore = j.contains("high_score") ? requireCount(j, "high_score") : 0u;
    s.moves = requireCount(j, "moves");
    s.gameOver = requireFlag(j, "game_over");
    s.won = requireFlag(j, "won");
    validateState(s);
    return s;
}

SaveRecord mg::game::saveRecordFromJson(const json& j) {
    if (!j.is_object()) throw StateCorruption("save record must be an object");
    SaveRecord rec;
    rec.timestamp = j.value("timestamp", std::string{});
    rec.date = j.value("date", std::string{});
    rec.version = j.value("version", std::string{});
    rec.state = gameStateFromJson(requireField(j, "game_state"));
    return rec;
}

std::string mg::game::encodeSaveRecord(const SaveRecord& record, int indent) {
    return toJson(record).dump(indent);
}

SaveRecord mg::game::decodeSaveRecord(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) throw StateCorruption("save record is not valid JSON");
    return saveRecordFromJson(j);
}

bool mg::game::shouldAutoSave(std::uint32_t maxTile) {
    return maxTile >= 2048 && maxTile % 2048 == 0;
}
