#pragma once
#include "common/Protocol.hpp"
#include "mg/game/GameState.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mergegrid::net {

static constexpr std::size_t MaxPayloadSize = 0xFFFF;

// Header + payload in one buffer. Throws std::length_error above MaxPayloadSize.
std::vector<char> makePacket(MsgType type, const void* payload = nullptr, std::size_t size = 0);
std::vector<char> makeTextPacket(MsgType type, const std::string& text);

std::vector<char> makeStatePacket(const mg::game::GameState& state, std::uint64_t revision, bool moved);
std::vector<char> makeErrorPacket(ErrorCode code, const std::string& message);

// Cell value on the wire: 0 empty, number as is, MarkerCell for the marker
std::uint32_t encodeCell(const mg::game::Cell& cell);

}
