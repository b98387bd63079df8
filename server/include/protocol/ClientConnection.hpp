#pragma once
#include <asio.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/Protocol.hpp"
#include "config/ServerConfig.hpp"
#include "gameplay/SessionRegistry.hpp"

namespace mergegrid::server {

/**
 * @brief One TCP client: frame reader, request dispatcher and write queue.
 *
 * The socket lives on its own strand; every member below is only touched
 * from handlers running on that strand. send() and close() may be called
 * from any thread, they post onto the strand.
 *
 * A connection is attached to exactly one game key at a time (its session
 * after Hello, or a room) and is subscribed to that key's changes.
 */
class ClientConnection : public std::enable_shared_from_this<ClientConnection> {
public:
    using ClosedFn = std::function<void(const std::shared_ptr<ClientConnection>&)>;

    ClientConnection(asio::ip::tcp::socket socket, const ServerConfig& config,
                     gameplay::SessionRegistry& registry, ClosedFn onClosed);

    void start();
    void send(std::vector<char> packet);
    void close();

    const std::string& peer() const { return peer_; }

private:
    void readHeader();
    void readPayload();
    void handleFrame();
    void dispatch(const net::Header& hdr, const std::vector<char>& payload);

    void onHello(const std::vector<char>& payload);
    void onMove(const std::vector<char>& payload);
    void onNewGame(const std::vector<char>& payload);
    void onJoinRoom(const std::vector<char>& payload);
    void onLeaveRoom();
    void onSaveState();
    void onLoadState(const std::vector<char>& payload);

    gameplay::Snapshot attach(const std::string& key);
    void detach();
    void shutdown();

    void enqueue(std::vector<char> packet);
    void doWrite();
    void sendState(const gameplay::Snapshot& snap, bool moved);
    void sendError(net::ErrorCode code, const std::string& message);

private:
    asio::ip::tcp::socket socket_;
    const ServerConfig config_;
    gameplay::SessionRegistry& registry_;
    ClosedFn onClosed_;
    std::string peer_;

    std::array<char, sizeof(net::Header)> headerBuf_{};
    net::Header header_{};
    std::vector<char> payload_;
    std::deque<std::vector<char>> outbox_;

    std::string sessionKey_;   // "session:<key>", set by Hello
    std::string attachedKey_;  // game receiving this client's requests
    gameplay::SubscriptionId subscription_ = 0;
    bool closed_ = false;
};

} // namespace mergegrid::server
