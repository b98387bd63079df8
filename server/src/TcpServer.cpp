#include "protocol/TcpServer.hpp"
#include "protocol/ClientConnection.hpp"
#include <iostream>
#include <vector>

using namespace mergegrid::server;

TcpServer::TcpServer(asio::io_context& io, const ServerConfig& config, gameplay::SessionRegistry& registry)
: io_(io)
, acceptor_(asio::make_strand(io), asio::ip::tcp::endpoint(asio::ip::make_address(config.host), config.port))
, config_(config)
, registry_(registry) {
    port_ = acceptor_.local_endpoint().port();
}

void TcpServer::start() {
    running_ = true;
    std::cout << "[server] Listening TCP on " << config_.host << ":" << port_ << "\n";
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] { self->doAccept(); });
}

void TcpServer::stop() {
    running_ = false;
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        asio::error_code ec;
        self->acceptor_.close(ec);
    });

    // Copy under the lock: closing a client calls back into forget()
    std::vector<ConnectionPtr> clients;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clients.assign(clients_.begin(), clients_.end());
        clients_.clear();
    }
    for (auto& c : clients) c->close();
}

std::size_t TcpServer::clientCount() const {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    return clients_.size();
}

void TcpServer::doAccept() {
    // every client socket gets its own strand
    acceptor_.async_accept(asio::make_strand(io_), [self = shared_from_this()](std::error_code ec,
                                                                               asio::ip::tcp::socket sock) {
        if (!ec && self->running_) {
            std::weak_ptr<TcpServer> weak = self;
            auto conn = std::make_shared<ClientConnection>(
                std::move(sock), self->config_, self->registry_, [weak](const ConnectionPtr& c) {
                    if (auto server = weak.lock()) server->forget(c);
                });
            {
                std::lock_guard<std::mutex> lock(self->clientsMutex_);
                self->clients_.insert(conn);
            }
            conn->start();
        } else if (ec && ec != asio::error::operation_aborted) {
            std::cerr << "[server] Accept failed: " << ec.message() << "\n";
        }
        if (self->running_) self->doAccept();
    });
}

void TcpServer::forget(const ConnectionPtr& conn) {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    clients_.erase(conn);
}
