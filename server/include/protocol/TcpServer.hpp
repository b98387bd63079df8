#pragma once
#include <asio.hpp>
#include <atomic>
#include <unordered_set>
#include <memory>
#include <mutex>
#include "config/ServerConfig.hpp"
#include "gameplay/SessionRegistry.hpp"

namespace mergegrid::server {

class ClientConnection;

class TcpServer : public std::enable_shared_from_this<TcpServer> {
public:
    TcpServer(asio::io_context& io, const ServerConfig& config, gameplay::SessionRegistry& registry);

    void start();
    void stop();

    // Bound port, useful when the config asked for port 0
    unsigned short port() const { return port_; }
    std::size_t clientCount() const;

private:
    using ConnectionPtr = std::shared_ptr<ClientConnection>;

    void doAccept();
    void forget(const ConnectionPtr& conn);

private:
    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    unsigned short port_{0};
    const ServerConfig config_;
    gameplay::SessionRegistry& registry_;

    std::unordered_set<ConnectionPtr> clients_;
    mutable std::mutex clientsMutex_;  // Protects clients_ from concurrent access
    std::atomic<bool> running_{false};
};

} // namespace mergegrid::server
