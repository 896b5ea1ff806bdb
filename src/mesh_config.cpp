/**
 * @file mesh_config.cpp
 * @brief Data directory resolution and input validation
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace nightjar {
namespace config {

namespace {
    std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }

    bool is_hex_string(const std::string& value) {
        return std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    uint16_t port_from_env(const char* name, uint16_t fallback) {
        std::string value = utilities::get_env(name);
        if (value.empty()) {
            return fallback;
        }

        try {
            int port = std::stoi(value);
            if (port > 0 && port <= 65535) {
                return static_cast<uint16_t>(port);
            }
        } catch (const std::exception&) {
            // fall through to the warning below
        }

        utilities::log_warn("Config: Ignoring invalid " + std::string(name) + " '" + value + "'");
        return fallback;
    }
}

// ============================================================================
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("NIGHTJAR_DATA_DIR");

    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        return ensure_directory(std::filesystem::path(env_data_dir));
    }

#ifdef _WIN32
    std::filesystem::path default_dir = "C:\\ProgramData\\FSI\\Nightjar";
#else
    std::filesystem::path default_dir = "/opt/fsi/var/nightjar";
#endif

    return ensure_directory(default_dir);
}

std::filesystem::path get_keys_directory() {
    return ensure_directory(get_data_directory() / "keys");
}

std::filesystem::path get_database_directory() {
    return ensure_directory(get_data_directory() / "db");
}

std::filesystem::path get_log_directory() {
    return ensure_directory(get_data_directory() / "logs");
}

uint16_t get_relay_port() {
    return port_from_env("NIGHTJAR_RELAY_PORT", DEFAULT_RELAY_PORT);
}

uint16_t get_bridge_port() {
    return port_from_env("NIGHTJAR_BRIDGE_PORT", DEFAULT_BRIDGE_PORT);
}

// ============================================================================
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // alphanumeric + underscore + hyphen only
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

bool validate_topic(const std::string& topic) {
    return topic.length() == TOPIC_HEX_LENGTH && is_hex_string(topic);
}

bool validate_public_key_hex(const std::string& key) {
    return key.length() == 64 && is_hex_string(key);
}

} // namespace config
} // namespace nightjar
