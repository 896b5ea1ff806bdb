/**
 * @file relay_server_main.cpp
 * @brief Standalone relay server for clients without direct swarm access
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Environment:
 *   NIGHTJAR_RELAY_PORT   listen port (default 8082)
 *   NIGHTJAR_DATA_DIR     data directory holding the relay identity
 *   NIGHTJAR_LOG_LEVEL    debug | info | warn | error
 *
 * Arguments are bootstrap swarm peers given as host:port.
 */

#include "nightjar/relay_server.hpp"
#include "nightjar/swarm_manager.hpp"
#include "nightjar/topic_discovery.hpp"
#include "nightjar/peer_identity.hpp"
#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <atomic>
#include <thread>

using namespace nightjar;
using namespace nightjar::utilities;

static std::atomic<bool> g_shutdown(false);

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down...\n";
    g_shutdown = true;
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
        (config::get_log_directory() / "relay.log").string(),
        parse_log_level(get_env("NIGHTJAR_LOG_LEVEL", "info"))
    );

    try {
        auto identity = PeerIdentity::load_or_create("relay", config::get_keys_directory(), "Relay");
        if (!identity) {
            log_critical("Relay: Cannot load or create relay identity");
            return 1;
        }

        auto discovery = std::make_shared<BootstrapTopicDiscovery>(
            BootstrapTopicDiscovery::parse_endpoints(bootstrap));
        auto swarm = std::make_shared<SwarmManager>(
            std::make_shared<const PeerIdentity>(*identity), discovery);

        RelayOptions options;
        options.port = config::get_relay_port();

        RelayServer relay(swarm, options);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (!relay.start()) {
            log_critical("Relay: Failed to start on port " + std::to_string(options.port));
            return 1;
        }

        log_info("Relay: Serving clients on port " + std::to_string(relay.get_port()) +
                 ", swarm port " + std::to_string(swarm->get_listen_port()) +
                 ", identity " + short_id(identity->get_public_key_hex()));

        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        relay.stop();
        log_info("Relay: Stopped");

    } catch (const std::exception& e) {
        log_critical("Relay: Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
