#include "config/ServerConfig.hpp"
#include "gameplay/SessionRegistry.hpp"
#include "protocol/TcpServer.hpp"
#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace mergegrid::server;

int main(int argc, char** argv) {
    auto parsed = parseServerConfig(argc, argv);
    const std::string program = argc > 0 ? argv[0] : "mergegrid_server";
    if (parsed.showHelp) {
        std::cout << usageText(program);
        return parsed.errors.empty() ? 0 : 2;
    }
    if (!parsed.errors.empty()) {
        for (const auto& e : parsed.errors) std::cerr << "[server] " << e << "\n";
        std::cerr << usageText(program);
        return 2;
    }
    const ServerConfig& cfg = parsed.config;

    try {
        // outlives the io_context so no pending handler sees a dead registry
        gameplay::SessionRegistry registry;
        asio::io_context io;
        auto server = std::make_shared<TcpServer>(io, cfg, registry);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code ec, int sig) {
            if (ec) return;
            std::cout << "[server] Signal " << sig << " received, shutting down\n";
            server->stop();
        });

        server->start();

        std::atomic<bool> crashed{false};
        std::vector<std::thread> workers;
        workers.reserve(cfg.threads);
        for (unsigned i = 0; i < cfg.threads; ++i)
            workers.emplace_back([&io, &crashed] {
                try {
                    io.run();
                } catch (const std::exception& e) {
                    std::cerr << "[server] Worker stopped by error: " << e.what() << "\n";
                    crashed = true;
                    io.stop();
                }
            });
        for (auto& t : workers) t.join();

        auto stats = registry.stats();
        std::cout << "[server] Stopped. games created=" << stats.created << " removed=" << stats.removed
                  << " still active=" << stats.active << " accepted moves=" << stats.acceptedMoves << "\n";
        if (crashed) return 1;
    } catch (const std::exception& e) {
        std::cerr << "[server] Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
