#include "protocol/Packets.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace mergegrid::net {

std::vector<char> makePacket(MsgType type, const void* payload, std::size_t size) {
    if (size > MaxPayloadSize) throw std::length_error("payload of " + std::to_string(size) + " bytes does not fit a frame");
    Header hdr{static_cast<std::uint16_t>(size), type, ProtocolVersion};
    std::vector<char> out(sizeof(hdr) + size);
    std::memcpy(out.data(), &hdr, sizeof(hdr));
    if (size) std::memcpy(out.data() + sizeof(hdr), payload, size);
    return out;
}

std::vector<char> makeTextPacket(MsgType type, const std::string& text) {
    return makePacket(type, text.data(), text.size());
}

std::uint32_t encodeCell(const mg::game::Cell& cell) {
    if (cell.isMarker()) return MarkerCell;
    return cell.points();
}

std::vector<char> makeStatePacket(const mg::game::GameState& state, std::uint64_t revision, bool moved) {
    StateHeader sh{};
    sh.size = static_cast<std::uint8_t>(state.size);
    sh.flags = static_cast<std::uint8_t>((moved ? StateMoved : 0) | (state.gameOver ? StateGameOver : 0) |
                                         (state.won ? StateWon : 0));
    sh.score = state.score;
    sh.highScore = state.highScore;
    sh.moves = state.moves;
    sh.maxTile = state.maxTile();
    sh.revision = revision;

    const auto& cells = state.grid.cells();
    std::vector<char> payload(sizeof(sh) + cells.size() * sizeof(std::uint32_t));
    std::memcpy(payload.data(), &sh, sizeof(sh));
    char* p = payload.data() + sizeof(sh);
    for (const auto& c : cells) {
        std::uint32_t v = encodeCell(c);
        std::memcpy(p, &v, sizeof(v));
        p += sizeof(v);
    }
    return makePacket(MsgType::State, payload.data(), payload.size());
}

std::vector<char> makeErrorPacket(ErrorCode code, const std::string& message) {
    ErrorPayload ep{code};
    // keep the frame valid even for a runaway message
    const std::size_t textSize = std::min(message.size(), MaxPayloadSize - sizeof(ep));
    std::vector<char> payload(sizeof(ep) + textSize);
    std::memcpy(payload.data(), &ep, sizeof(ep));
    std::memcpy(payload.data() + sizeof(ep), message.data(), textSize);
    return makePacket(MsgType::Error, payload.data(), payload.size());
}

}
