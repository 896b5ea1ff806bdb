/**
 * @file mesh_config.hpp
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>
#include <filesystem>

namespace nightjar {
namespace config {

// ============================================================================
// Chunking and Storage
// ============================================================================

/// Plaintext chunk size (1 MiB)
constexpr size_t CHUNK_SIZE = 1024 * 1024;

/// Maximum file size accepted for chunking (100 MiB)
constexpr size_t MAX_FILE_SIZE = 100 * 1024 * 1024;

/// Symmetric chunk key size (ChaCha20-Poly1305)
constexpr size_t CHUNK_KEY_SIZE = 32;

/// ChaCha20-Poly1305 IETF nonce size
constexpr size_t CHUNK_NONCE_SIZE = 12;

/// ChaCha20-Poly1305 tag size
constexpr size_t CHUNK_TAG_SIZE = 16;

// ============================================================================
// Transfer and Seeding
// ============================================================================

/// Per-candidate wait for a chunk-response
constexpr auto CHUNK_REQUEST_TIMEOUT = std::chrono::milliseconds(15000);

/// Download attempts per chunk before giving up
constexpr int MAX_CHUNK_RETRIES = 3;

/// Default replication target per storage scope
constexpr size_t DEFAULT_REDUNDANCY_TARGET = 3;

/// Interval between seeding cycles
constexpr auto SEED_INTERVAL = std::chrono::seconds(60);

/// Delay before the first seeding cycle after start
constexpr auto INITIAL_SEED_DELAY = std::chrono::seconds(5);

/// Seed pushes issued per batch within a cycle
constexpr size_t MAX_CONCURRENT_SEEDS = 3;

/// Bandwidth sampling interval
constexpr auto BANDWIDTH_SAMPLE_INTERVAL = std::chrono::seconds(30);

/// Bandwidth history length (24h of 30s samples)
constexpr size_t MAX_BANDWIDTH_SAMPLES = 2880;

// ============================================================================
// Swarm
// ============================================================================

/// Maximum size of one framed wire message (sync limit plus envelope headroom)
constexpr size_t MAX_WIRE_MESSAGE_SIZE = 16 * 1024 * 1024;

/// Outbound bytes a connection may have queued before it is dropped
constexpr size_t MAX_SEND_QUEUE_BYTES = 64 * 1024 * 1024;

/// How long close() waits for queued lines to flush
constexpr auto CLOSE_LINGER = std::chrono::seconds(2);

/// TCP connection establishment timeout
constexpr auto CONNECTION_TIMEOUT = std::chrono::seconds(5);

/// Topic string length on the wire (hex SHA-256)
constexpr size_t TOPIC_HEX_LENGTH = 64;

/// Mesh coordination topic string
constexpr const char* MESH_TOPIC_V1 = "nightjar-mesh-v1";

/// Prefix for workspace topic derivation
constexpr const char* WORKSPACE_TOPIC_PREFIX = "nightjar-workspace:";

// ============================================================================
// Bridge
// ============================================================================

/// Maximum concurrent local clients on one bridge
constexpr size_t MAX_LOCAL_CLIENTS = 100;

/// Default bridge listen port (loopback only)
constexpr uint16_t DEFAULT_BRIDGE_PORT = 8081;

/// UDP port for LAN discovery broadcasts
constexpr uint16_t LAN_DISCOVERY_PORT = 10001;

/// LAN announce interval
constexpr auto LAN_ANNOUNCE_INTERVAL = std::chrono::seconds(10);

/// Maximum UDP packet size (to avoid fragmentation)
constexpr size_t MAX_UDP_PACKET_SIZE = 65000;

// ============================================================================
// Relay Server
// ============================================================================

/// Default relay listen port
constexpr uint16_t DEFAULT_RELAY_PORT = 8082;

/// Time a relay client has to send its identity
constexpr auto RELAY_AUTH_TIMEOUT = std::chrono::seconds(30);

/// Maximum topics joined per relay client
constexpr size_t MAX_TOPICS_PER_CLIENT = 50;

/// Maximum topic string length accepted by the relay
constexpr size_t MAX_TOPIC_LENGTH = 128;

/// Maximum relayed sync payload (10 MB)
constexpr size_t MAX_SYNC_SIZE = 10 * 1024 * 1024;

/// Maximum relayed awareness state (1 MB)
constexpr size_t MAX_AWARENESS_SIZE = 1 * 1024 * 1024;

/// Interval between relay pings
constexpr auto HEARTBEAT_INTERVAL = std::chrono::seconds(30);

/// Relay clients silent for longer than this are terminated
constexpr auto HEARTBEAT_TIMEOUT = std::chrono::seconds(60);

/// Messages per second per relay client (sustained rate)
constexpr double RELAY_RATE_PER_SECOND = 100.0;

/// Burst capacity per relay client
constexpr double RELAY_RATE_BURST = 200.0;

// ============================================================================
// Identity
// ============================================================================

/// Maximum display name length
constexpr size_t MAX_DISPLAY_NAME_LENGTH = 64;

/// Maximum identifier length (key file names, file ids)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

// ============================================================================
// Share Links
// ============================================================================

/// Share link URI scheme
constexpr const char* SHARE_LINK_SCHEME = "nightjar://";

/// Payload version written into generated links
constexpr uint8_t SHARE_LINK_VERSION = 4;

/// Entity id length in a link payload (bytes)
constexpr size_t SHARE_LINK_ENTITY_ID_SIZE = 16;

/// Full link payload: entity id, version, flags, CRC16
constexpr size_t SHARE_LINK_PAYLOAD_SIZE = SHARE_LINK_ENTITY_ID_SIZE + 4;

/// Bootstrap addresses embedded per link
constexpr size_t MAX_EMBEDDED_PEERS = 5;

/// Swarm peer keys embedded per link
constexpr size_t MAX_EMBEDDED_SWARM_PEERS = 3;

/// Relay URLs embedded per link
constexpr size_t MAX_EMBEDDED_RELAYS = 5;

/// Upper bound on signed invite lifetime
constexpr auto MAX_INVITE_LIFETIME = std::chrono::hours(24);

// ============================================================================
// ============================================================================

/**
 * @brief Get Nightjar data directory from NIGHTJAR_DATA_DIR or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get key storage directory under the data directory
 */
std::filesystem::path get_keys_directory();

/**
 * @brief Get database directory under the data directory
 */
std::filesystem::path get_database_directory();

/**
 * @brief Get log directory under the data directory
 */
std::filesystem::path get_log_directory();

/**
 * @brief Relay listen port from NIGHTJAR_RELAY_PORT or DEFAULT_RELAY_PORT
 */
uint16_t get_relay_port();

/**
 * @brief Bridge listen port from NIGHTJAR_BRIDGE_PORT or DEFAULT_BRIDGE_PORT
 */
uint16_t get_bridge_port();

// ============================================================================
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Validate a swarm topic (exactly 64 lowercase or uppercase hex chars)
 */
bool validate_topic(const std::string& topic);

/**
 * @brief Validate a hex-encoded Ed25519 public key (64 hex chars)
 */
bool validate_public_key_hex(const std::string& key);

} // namespace config
} // namespace nightjar
