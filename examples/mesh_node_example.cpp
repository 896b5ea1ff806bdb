/**
 * @file mesh_node_example.cpp
 * @brief Example CLI application using MeshNode
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic MeshNode usage:
 * - Start a node with a persistent identity
 * - Join workspaces and add files
 * - Share a workspace link and open one from another node
 * - Fetch files from peers and watch replication
 */

#include "nightjar/mesh_node.hpp"
#include "nightjar/utilities.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <csignal>
#include <atomic>

using namespace nightjar;
using namespace nightjar::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    std::cout << "\n\nReceived signal " << signal << ", shutting down...\n";
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <name> [data_dir] [bootstrap host:port ...]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  name        Key file name for this node (alphanumeric, max 64 chars)\n";
    std::cout << "  data_dir    Data directory (optional, default: $NIGHTJAR_DATA_DIR)\n";
    std::cout << "  bootstrap   Peers to dial for topic discovery\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " alice /tmp/alice\n";
    std::cout << "  " << program_name << " bob /tmp/bob 127.0.0.1:40123\n\n";
}

void print_help() {
    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|                   Nightjar Node Commands                       |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| help                       - Show this help menu               |\n";
    std::cout << "| status                     - Show node status                  |\n";
    std::cout << "| workspaces                 - List joined workspaces            |\n";
    std::cout << "| join <workspace> [target]  - Join a workspace                  |\n";
    std::cout << "| leave <workspace>          - Leave a workspace                 |\n";
    std::cout << "| add <workspace> <path>     - Encrypt and store a file          |\n";
    std::cout << "| fetch <file> <key> <out>   - Download a file to <out>          |\n";
    std::cout << "| share <workspace> <key>    - Print a workspace share link      |\n";
    std::cout << "| open <link>                - Join the workspace of a link      |\n";
    std::cout << "| connect <host> <port>      - Dial a peer                       |\n";
    std::cout << "| seed                       - Run a seeding pass now            |\n";
    std::cout << "| quit / exit                - Shutdown node                     |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";
}

std::optional<ChunkKey> parse_key(const std::string& hex) {
    auto bytes = MeshCrypto::hex_to_bytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return ChunkCodec::key_from_bytes(*bytes);
}

bool handle_command(MeshNode& node, const std::string& command_line) {
    if (command_line.empty()) {
        return true;
    }

    std::istringstream iss(command_line);
    std::string cmd;
    iss >> cmd;

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
    }
    else if (cmd == "status") {
        node.print_status();
    }
    else if (cmd == "workspaces") {
        auto workspaces = node.get_workspaces();
        if (workspaces.empty()) {
            std::cout << "No workspaces joined.\n";
        }
        for (const auto& workspace_id : workspaces) {
            std::cout << "  " << workspace_id << "\n";
        }
    }
    else if (cmd == "join") {
        std::string workspace_id;
        size_t target = config::DEFAULT_REDUNDANCY_TARGET;
        iss >> workspace_id;
        if (!(iss >> target)) {
            target = config::DEFAULT_REDUNDANCY_TARGET;
        }

        if (workspace_id.empty()) {
            std::cout << "Usage: join <workspace> [target]\n";
        } else if (node.join_workspace(workspace_id, target)) {
            std::cout << "[OK] Joined " << workspace_id << "\n";
        } else {
            std::cout << "[FAIL] Could not join " << workspace_id << "\n";
        }
    }
    else if (cmd == "leave") {
        std::string workspace_id;
        iss >> workspace_id;

        if (node.leave_workspace(workspace_id)) {
            std::cout << "[OK] Left " << workspace_id << "\n";
        } else {
            std::cout << "[FAIL] Not a member of " << workspace_id << "\n";
        }
    }
    else if (cmd == "add") {
        std::string workspace_id, path;
        iss >> workspace_id >> path;

        if (workspace_id.empty() || path.empty()) {
            std::cout << "Usage: add <workspace> <path>\n";
        } else if (auto stored = node.add_file_from_path(workspace_id, path)) {
            std::cout << "[OK] File id: " << stored->record.id << "\n";
            std::cout << "     Key:     "
                      << MeshCrypto::bytes_to_hex(std::vector<uint8_t>(stored->key.begin(), stored->key.end())) << "\n";
        } else {
            std::cout << "[FAIL] Could not add " << path << "\n";
        }
    }
    else if (cmd == "fetch") {
        std::string file_id, key_hex, out_path;
        iss >> file_id >> key_hex >> out_path;

        auto key = parse_key(key_hex);
        if (file_id.empty() || !key || out_path.empty()) {
            std::cout << "Usage: fetch <file> <key_hex> <out>\n";
        } else {
            auto result = node.fetch_file(file_id, *key);
            if (result.success && write_file_binary(out_path, result.data)) {
                std::cout << "[OK] Wrote " << format_file_size(result.data.size()) << " to " << out_path << "\n";
            } else {
                std::cout << "[FAIL] Download incomplete (" << result.unavailable_chunks.size()
                          << " unavailable, " << result.decrypt_failures.size() << " undecryptable, "
                          << result.integrity_errors.size() << " corrupt)\n";
            }
        }
    }
    else if (cmd == "share") {
        std::string workspace_id, key_hex;
        iss >> workspace_id >> key_hex;

        auto key = parse_key(key_hex);
        auto link = key ? node.share_workspace(workspace_id, *key) : std::nullopt;
        if (link) {
            std::cout << *link << "\n";
        } else {
            std::cout << "Usage: share <workspace_hex32> <key_hex>\n";
        }
    }
    else if (cmd == "open") {
        std::string link;
        iss >> link;

        if (auto parsed = node.join_from_link(link)) {
            std::cout << "[OK] Joined " << share_link::entity_type_name(parsed->entity_type) << " "
                      << parsed->entity_id << " as " << share_link::permission_name(parsed->permission) << "\n";
        } else {
            std::cout << "[FAIL] Invalid link\n";
        }
    }
    else if (cmd == "connect") {
        std::string host;
        uint16_t port = 0;
        iss >> host >> port;

        if (host.empty() || port == 0) {
            std::cout << "Usage: connect <host> <port>\n";
        } else if (node.connect_to_peer(host, port)) {
            std::cout << "[OK] Dialing " << host << ":" << port << "\n";
        } else {
            std::cout << "[FAIL] Could not dial " << host << ":" << port << "\n";
        }
    }
    else if (cmd == "seed") {
        std::cout << "[OK] Seeded " << node.seed_now() << " workspaces\n";
    }
    else if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    else {
        std::cout << "Unknown command: " << cmd << "\n";
        std::cout << "Type 'help' for available commands\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string name = argv[1];
    MeshNodeOptions options;
    if (argc >= 3) {
        options.data_dir = argv[2];
    }

    std::vector<std::string> bootstrap;
    for (int i = 3; i < argc; ++i) {
        bootstrap.push_back(argv[i]);
    }

    initialize_logging("", parse_log_level(get_env("NIGHTJAR_LOG_LEVEL", "info")));

    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|              Nightjar Mesh Node - CLI Example                  |\n";
    std::cout << "|            Copyright © 2025 Fortified Solutions Inc.           |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";

    try {
        auto discovery = std::make_shared<BootstrapTopicDiscovery>(
            BootstrapTopicDiscovery::parse_endpoints(bootstrap));

        MeshNode node(name, discovery, options);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (!node.start()) {
            std::cerr << "Failed to start mesh node\n";
            return 1;
        }

        print_help();

        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            if (!handle_command(node, line)) {
                break;
            }
        }

        std::cout << "\nShutting down mesh node...\n";
        node.stop();
        std::cout << "Mesh node stopped successfully\n";

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
