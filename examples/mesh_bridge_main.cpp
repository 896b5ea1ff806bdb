/**
 * @file mesh_bridge_main.cpp
 * @brief Local bridge daemon multiplexing application clients onto one swarm
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Applications on this host connect over loopback TCP and speak the
 * newline-delimited JSON client protocol.
 *
 * Environment:
 *   NIGHTJAR_BRIDGE_PORT  loopback listen port (default 8081)
 *   NIGHTJAR_DATA_DIR     data directory holding the bridge identity
 *   NIGHTJAR_LOG_LEVEL    debug | info | warn | error
 *
 * Signals:
 *   SIGUSR1  suspend (drop direct peer sockets and LAN discovery)
 *   SIGUSR2  resume
 */

#include "nightjar/mesh_bridge.hpp"
#include "nightjar/swarm_manager.hpp"
#include "nightjar/topic_discovery.hpp"
#include "nightjar/lan_discovery.hpp"
#include "nightjar/line_connection.hpp"
#include "nightjar/peer_identity.hpp"
#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <asio.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <atomic>
#include <thread>

using namespace nightjar;
using namespace nightjar::utilities;

static std::atomic<bool> g_shutdown(false);
static std::atomic<int> g_lifecycle_request(0);

void signal_handler(int signal) {
    if (signal == SIGUSR1 || signal == SIGUSR2) {
        g_lifecycle_request = signal;
        return;
    }
    g_shutdown = true;
}

/**
 * @brief Accept loopback clients and hand each to the bridge
 */
void accept_clients(asio::ip::tcp::acceptor& acceptor, MeshBridge& bridge) {
    acceptor.async_accept([&acceptor, &bridge](const asio::error_code& error, asio::ip::tcp::socket socket) {
        if (!error) {
            auto line = std::make_shared<LineConnection>(std::move(socket), config::MAX_WIRE_MESSAGE_SIZE);
            auto client_id = bridge.add_client(std::make_shared<LineClient>(line));

            if (client_id) {
                std::string id = *client_id;
                line->start(
                    [&bridge, id](const std::string& message) { bridge.handle_client_message(id, message); },
                    [&bridge, id](const std::string& /*reason*/) { bridge.remove_client(id); }
                );
            }
        } else if (error != asio::error::operation_aborted) {
            log_warn("Bridge: Accept failed: " + error.message());
        }

        if (acceptor.is_open()) {
            accept_clients(acceptor, bridge);
        }
    });
}

int main(int argc, char* argv[]) {
    std::vector<std::string> bootstrap;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [bootstrap host:port ...]\n";
            return 0;
        }
        bootstrap.push_back(arg);
    }

    initialize_logging(
        (config::get_log_directory() / "bridge.log").string(),
        parse_log_level(get_env("NIGHTJAR_LOG_LEVEL", "info"))
    );

    try {
        auto identity = PeerIdentity::load_or_create("bridge", config::get_keys_directory(), "Nightjar");
        if (!identity) {
            log_critical("Bridge: Cannot load or create identity");
            return 1;
        }

        auto discovery = std::make_shared<BootstrapTopicDiscovery>(
            BootstrapTopicDiscovery::parse_endpoints(bootstrap));

        MeshBridge bridge(
            [discovery](std::shared_ptr<const PeerIdentity> swarm_identity) -> std::shared_ptr<Swarm> {
                return std::make_shared<SwarmManager>(std::move(swarm_identity), discovery);
            },
            [](const std::string& local_peer_id, uint16_t swarm_port) -> std::unique_ptr<LanDiscovery> {
                return std::make_unique<UdpLanDiscovery>(local_peer_id, swarm_port);
            }
        );

        if (!bridge.initialize(std::make_shared<const PeerIdentity>(*identity))) {
            log_critical("Bridge: Failed to initialize swarm");
            return 1;
        }

        asio::io_context io_context;
        asio::ip::tcp::acceptor acceptor(
            io_context,
            asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), config::get_bridge_port())
        );
        accept_clients(acceptor, bridge);

        std::thread io_thread([&io_context]() {
            try {
                io_context.run();
            } catch (const std::exception& e) {
                log_error("Bridge: I/O thread error: " + std::string(e.what()));
            }
        });

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGUSR1, signal_handler);
        std::signal(SIGUSR2, signal_handler);

        log_info("Bridge: Accepting clients on 127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) +
                 " as " + short_id(identity->get_public_key_hex()));

        while (!g_shutdown) {
            int request = g_lifecycle_request.exchange(0);
            if (request == SIGUSR1 && !bridge.suspend()) {
                log_warn("Bridge: Suspend ignored");
            } else if (request == SIGUSR2 && !bridge.resume()) {
                log_warn("Bridge: Resume failed, still suspended");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        asio::post(io_context, [&acceptor]() {
            asio::error_code ec;
            acceptor.close(ec);
        });
        bridge.shutdown();

        // run() returns once closing clients have flushed
        io_thread.join();

        log_info("Bridge: Stopped");

    } catch (const std::exception& e) {
        log_critical("Bridge: Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
