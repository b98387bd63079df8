#pragma once
#include <cstdint>
#include <cstddef>

namespace mergegrid::net {

enum class MsgType : std::uint8_t {
    Hello = 1,   // client -> server: optional session key text (empty = issue one)
    HelloAck,    // server -> client: session key text
    Move,        // client -> server: MovePayload
    NewGame,     // client -> server: NewGamePayload
    State,       // server -> client: StateHeader + size*size cells
    JoinRoom,    // client -> server: room id text (empty = "default")
    RoomJoined,  // server -> client: RoomJoinedPayload
    LeaveRoom,   // client -> server: go back to the own session
    GetState,    // client -> server: ask for a State of the attached game
    SaveState,   // client -> server: ask for a SaveData record
    SaveData,    // server -> client: JSON save record text
    LoadState,   // client -> server: JSON save record text to import
    Error,       // server -> client: ErrorPayload + message text
    Disconnect,  // client -> server: explicit disconnect notice

    TcpWelcome = 100
};

struct Header {
    std::uint16_t size;   // payload size excluding header
    MsgType type;
    std::uint8_t version;
};

static constexpr std::uint8_t ProtocolVersion = 2;
static constexpr std::size_t HeaderSize = sizeof(Header);
static constexpr std::size_t MaxKeyLength = 32;

// Cell encoding inside a State payload
static constexpr std::uint32_t EmptyCell = 0;
static constexpr std::uint32_t MarkerCell = 0xFFFFFFFFu;

enum class ErrorCode : std::uint8_t {
    InvalidConfiguration = 1, // grid size outside the accepted range
    KeyNotFound = 2,          // the attached game no longer exists
    StateCorruption = 3,      // LoadState carried a malformed record
    BadRequest = 4,           // protocol misuse (no Hello, bad direction, ...)
};

// StateHeader::flags bits
enum : std::uint8_t {
    StateMoved    = 1 << 0, // produced by an accepted move
    StateGameOver = 1 << 1,
    StateWon      = 1 << 2,
};

#pragma pack(push, 1)
struct MovePayload {
    std::uint8_t direction; // 0=left 1=right 2=up 3=down
};

struct NewGamePayload {
    std::uint8_t size; // 0 keeps the current size
};

// The State payload is: StateHeader + size*size std::uint32_t cells, row-major
struct StateHeader {
    std::uint8_t size;
    std::uint8_t flags;     // State* bits
    std::uint16_t reserved{0};
    std::uint32_t score;
    std::uint32_t highScore;
    std::uint32_t moves;
    std::uint32_t maxTile;
    std::uint64_t revision; // per game change counter, newer wins
};

struct RoomJoinedPayload {
    std::uint16_t players; // connections attached to the room, joiner included
};

// Followed by a UTF-8 message (payload size - sizeof(ErrorPayload) bytes)
struct ErrorPayload {
    ErrorCode code;
};
#pragma pack(pop)

}
