#include "protocol/ClientConnection.hpp"
#include "protocol/Packets.hpp"
#include "mg/game/Errors.hpp"
#include "mg/game/SaveRecord.hpp"
#include <cstring>
#include <iostream>
#include <random>
#include <sstream>
#include <iomanip>

using namespace mergegrid::server;
using mergegrid::net::ErrorCode;
using mergegrid::net::MsgType;

namespace {

constexpr const char* kSessionPrefix = "session:";
constexpr const char* kRoomPrefix = "room:";
constexpr const char* kDefaultRoom = "default";

// Hello and JoinRoom text: trailing NULs/spaces are padding
std::string payloadText(const std::vector<char>& payload) {
    std::string text(payload.begin(), payload.end());
    while (!text.empty() && (text.back() == '\0' || text.back() == ' ')) text.pop_back();
    return text;
}

bool isValidKey(const std::string& key) {
    if (key.empty() || key.size() > mergegrid::net::MaxKeyLength) return false;
    for (char ch : key) {
        const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                        ch == '-' || ch == '_';
        if (!ok) return false;
    }
    return true;
}

// 16 hex digits, like the tokens handed out to anonymous browsers
std::string issueSessionKey() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0') << rng();
    return os.str();
}

bool isRoomKey(const std::string& key) {
    return key.rfind(kRoomPrefix, 0) == 0;
}

} // namespace

ClientConnection::ClientConnection(asio::ip::tcp::socket socket, const ServerConfig& config,
                                   gameplay::SessionRegistry& registry, ClosedFn onClosed)
: socket_(std::move(socket)), config_(config), registry_(registry), onClosed_(std::move(onClosed)) {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void ClientConnection::start() {
    auto self = shared_from_this();
    asio::dispatch(socket_.get_executor(), [this, self] {
        std::cout << "[server] Client connected: " << peer_ << "\n";
        enqueue(net::makePacket(MsgType::TcpWelcome));
        readHeader();
    });
}

void ClientConnection::send(std::vector<char> packet) {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self, packet = std::move(packet)]() mutable {
        enqueue(std::move(packet));
    });
}

void ClientConnection::close() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self] { shutdown(); });
}

void ClientConnection::readHeader() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(headerBuf_), [this, self](std::error_code ec, std::size_t) {
        if (ec) {
            shutdown();
            return;
        }
        std::memcpy(&header_, headerBuf_.data(), sizeof(header_));
        if (header_.version != net::ProtocolVersion) {
            std::cerr << "[server] " << peer_ << " speaks protocol v" << int(header_.version)
                      << ", expected v" << int(net::ProtocolVersion) << "; closing\n";
            shutdown();
            return;
        }
        payload_.resize(header_.size);
        if (header_.size == 0) {
            handleFrame();
            return;
        }
        readPayload();
    });
}

void ClientConnection::readPayload() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload_), [this, self](std::error_code ec, std::size_t) {
        if (ec) {
            shutdown();
            return;
        }
        handleFrame();
    });
}

void ClientConnection::handleFrame() {
    dispatch(header_, payload_);
    if (!closed_) readHeader();
}

void ClientConnection::dispatch(const net::Header& hdr, const std::vector<char>& payload) {
    if (hdr.type == MsgType::Disconnect) {
        shutdown();
        return;
    }
    if (hdr.type != MsgType::Hello && sessionKey_.empty()) {
        sendError(ErrorCode::BadRequest, "send Hello first");
        return;
    }

    try {
        switch (hdr.type) {
        case MsgType::Hello:     onHello(payload); break;
        case MsgType::Move:      onMove(payload); break;
        case MsgType::NewGame:   onNewGame(payload); break;
        case MsgType::JoinRoom:  onJoinRoom(payload); break;
        case MsgType::LeaveRoom: onLeaveRoom(); break;
        case MsgType::GetState:  sendState(registry_.snapshot(attachedKey_), false); break;
        case MsgType::SaveState: onSaveState(); break;
        case MsgType::LoadState: onLoadState(payload); break;
        default:
            sendError(ErrorCode::BadRequest, "unexpected message type " + std::to_string(int(hdr.type)));
            break;
        }
    } catch (const mg::game::InvalidConfiguration& e) {
        sendError(ErrorCode::InvalidConfiguration, e.what());
    } catch (const mg::game::KeyNotFound& e) {
        sendError(ErrorCode::KeyNotFound, e.what());
    } catch (const mg::game::StateCorruption& e) {
        std::cerr << "[server] Rejected state from " << peer_ << ": " << e.what() << "\n";
        sendError(ErrorCode::StateCorruption, e.what());
    }
}

void ClientConnection::onHello(const std::vector<char>& payload) {
    if (!sessionKey_.empty()) {
        sendError(ErrorCode::BadRequest, "already greeted as '" + sessionKey_ + "'");
        return;
    }
    std::string key = payloadText(payload);
    if (key.empty()) key = issueSessionKey();
    if (!isValidKey(key)) {
        sendError(ErrorCode::BadRequest, "session key must be 1-32 characters of [A-Za-z0-9_-]");
        return;
    }
    sessionKey_ = kSessionPrefix + key;
    enqueue(net::makeTextPacket(MsgType::HelloAck, key));
    sendState(attach(sessionKey_), false);
}

void ClientConnection::onMove(const std::vector<char>& payload) {
    if (payload.size() < sizeof(net::MovePayload)) {
        sendError(ErrorCode::BadRequest, "Move payload too short");
        return;
    }
    net::MovePayload mp{};
    std::memcpy(&mp, payload.data(), sizeof(mp));
    auto dir = mg::game::directionFromByte(mp.direction);
    if (!dir) {
        sendError(ErrorCode::BadRequest, "unknown direction " + std::to_string(int(mp.direction)));
        return;
    }
    auto outcome = registry_.applyMove(attachedKey_, *dir);
    // accepted moves reach us through the subscription like everyone else
    if (!outcome.moved) sendState(outcome.snapshot, false);
}

void ClientConnection::onNewGame(const std::vector<char>& payload) {
    std::optional<std::size_t> size;
    if (payload.size() >= sizeof(net::NewGamePayload)) {
        net::NewGamePayload np{};
        std::memcpy(&np, payload.data(), sizeof(np));
        if (np.size != 0) size = np.size;
    }
    if (size && (*size < mg::game::GridEngine::kMinGridSize || *size > config_.maxSize)) {
        throw mg::game::InvalidConfiguration("grid size " + std::to_string(*size) + " outside " +
                                             std::to_string(mg::game::GridEngine::kMinGridSize) + ".." +
                                             std::to_string(config_.maxSize));
    }
    registry_.reset(attachedKey_, size);
}

void ClientConnection::onJoinRoom(const std::vector<char>& payload) {
    std::string room = payloadText(payload);
    if (room.empty()) room = kDefaultRoom;
    if (!isValidKey(room)) {
        sendError(ErrorCode::BadRequest, "room id must be 1-32 characters of [A-Za-z0-9_-]");
        return;
    }
    const std::string key = kRoomPrefix + room;
    if (key == attachedKey_) {
        sendState(registry_.snapshot(key), false);
        return;
    }
    auto snap = attach(key);
    net::RoomJoinedPayload rp{static_cast<std::uint16_t>(registry_.subscriberCount(key))};
    std::cout << "[server] " << peer_ << " joined room '" << room << "' (" << rp.players << " players)\n";
    enqueue(net::makePacket(MsgType::RoomJoined, &rp, sizeof(rp)));
    sendState(snap, false);
}

void ClientConnection::onLeaveRoom() {
    if (!isRoomKey(attachedKey_)) {
        sendError(ErrorCode::BadRequest, "not in a room");
        return;
    }
    std::cout << "[server] " << peer_ << " left " << attachedKey_ << "\n";
    sendState(attach(sessionKey_), false);
}

void ClientConnection::onSaveState() {
    auto snap = registry_.snapshot(attachedKey_);
    auto record = mg::game::makeSaveRecord(snap.state);
    std::string text = mg::game::encodeSaveRecord(record, -1);
    if (text.size() > net::MaxPayloadSize) {
        sendError(ErrorCode::BadRequest, "save record too large for one frame");
        return;
    }
    enqueue(net::makeTextPacket(MsgType::SaveData, text));
}

void ClientConnection::onLoadState(const std::vector<char>& payload) {
    auto record = mg::game::decodeSaveRecord(std::string(payload.begin(), payload.end()));
    if (record.state.size > config_.maxSize) {
        throw mg::game::InvalidConfiguration("saved grid size " + std::to_string(record.state.size) +
                                             " exceeds the server maximum of " + std::to_string(config_.maxSize));
    }
    registry_.importState(attachedKey_, record.state);
}

gameplay::Snapshot ClientConnection::attach(const std::string& key) {
    std::weak_ptr<ClientConnection> weak = weak_from_this();
    // subscribe to the new key first so a failure leaves the old attachment intact
    auto joined = registry_.attach(
        key, config_.defaultSize,
        [weak](const std::string&, gameplay::ChangeKind kind, const gameplay::Snapshot& s) {
            if (auto self = weak.lock())
                self->send(net::makeStatePacket(s.state, s.revision, kind == gameplay::ChangeKind::Move));
        });
    detach();
    attachedKey_ = key;
    subscription_ = joined.id;
    return joined.snapshot;
}

void ClientConnection::detach() {
    if (attachedKey_.empty()) return;
    registry_.unsubscribe(attachedKey_, subscription_);
    // an empty room is discarded; the session outlives room visits
    if (attachedKey_ != sessionKey_) registry_.removeIfUnwatched(attachedKey_);
    attachedKey_.clear();
    subscription_ = 0;
}

void ClientConnection::shutdown() {
    if (closed_) return;
    closed_ = true;
    detach();
    if (!sessionKey_.empty()) registry_.removeIfUnwatched(sessionKey_);
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    std::cout << "[server] Client disconnected: " << peer_ << "\n";
    if (onClosed_) onClosed_(shared_from_this());
}

void ClientConnection::enqueue(std::vector<char> packet) {
    if (closed_) return;
    outbox_.push_back(std::move(packet));
    if (outbox_.size() == 1) doWrite();
}

void ClientConnection::doWrite() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()), [this, self](std::error_code ec, std::size_t) {
        if (ec) {
            shutdown();
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) doWrite();
    });
}

void ClientConnection::sendState(const gameplay::Snapshot& snap, bool moved) {
    enqueue(net::makeStatePacket(snap.state, snap.revision, moved));
}

void ClientConnection::sendError(net::ErrorCode code, const std::string& message) {
    enqueue(net::makeErrorPacket(code, message));
}
