/**
 * @file message_types.hpp
 * @brief Wire message definitions and serialization for Nightjar
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every message is a JSON object with a "type" discriminator:
 * - Swarm messages (identity, topic membership, sync, awareness, peer lists)
 * - Chunk transfer messages (point-to-point, addressed by peer identity)
 * - Client messages exchanged between the bridge/relay and local clients
 */

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>

namespace nightjar {

// ============================================================================
// Type discriminators
// ============================================================================

namespace message_type {
    constexpr const char* IDENTITY = "identity";
    constexpr const char* JOIN_TOPIC = "join-topic";
    constexpr const char* LEAVE_TOPIC = "leave-topic";
    constexpr const char* SYNC = "sync";
    constexpr const char* AWARENESS = "awareness";
    constexpr const char* PEER_LIST = "peer-list";

    constexpr const char* CHUNK_REQUEST = "chunk-request";
    constexpr const char* CHUNK_RESPONSE = "chunk-response";
    constexpr const char* CHUNK_SEED = "chunk-seed";
    constexpr const char* CHUNK_SEED_ACK = "chunk-seed-ack";

    constexpr const char* PEERS_LIST = "peers-list";
    constexpr const char* PEER_JOINED = "peer-joined";
    constexpr const char* PEER_LEFT = "peer-left";
    constexpr const char* ERROR = "error";
    constexpr const char* PING = "ping";
    constexpr const char* PONG = "pong";
    constexpr const char* SEND = "send";
}

// ============================================================================
// Swarm messages
// ============================================================================

/**
 * @brief Signed identity assertion sent immediately after connecting
 */
struct IdentityMessage {
    std::string public_key;     ///< Ed25519 public key (hex), doubles as peer id
    std::string display_name;   ///< Human-readable name
    std::string color;          ///< Presence color (may be empty)
    uint64_t timestamp = 0;     ///< Assertion time (ms since epoch)
    std::string signature;      ///< Ed25519 signature (hex) over signed_payload()

    /**
     * @brief Canonical bytes covered by the signature
     *
     * Sorted-key JSON of {type, publicKey, displayName, color, timestamp}.
     */
    std::string signed_payload() const;

    std::string to_json() const;
    static std::optional<IdentityMessage> from_json(const std::string& json);
};

struct JoinTopicMessage {
    std::string topic;

    std::string to_json() const;
    static std::optional<JoinTopicMessage> from_json(const std::string& json);
};

struct LeaveTopicMessage {
    std::string topic;

    std::string to_json() const;
    static std::optional<LeaveTopicMessage> from_json(const std::string& json);
};

/**
 * @brief Document update relayed to every member of a topic
 */
struct SyncMessage {
    std::string topic;
    std::string data_json;      ///< Opaque update payload as serialized JSON value
    std::string from;           ///< Originating peer (filled in by the relaying side)

    std::string to_json() const;
    static std::optional<SyncMessage> from_json(const std::string& json);
};

/**
 * @brief Ephemeral presence state relayed to every member of a topic
 */
struct AwarenessMessage {
    std::string topic;
    std::string state_json;     ///< Presence state as serialized JSON value
    std::string from;

    std::string to_json() const;
    static std::optional<AwarenessMessage> from_json(const std::string& json);
};

/**
 * @brief Known peer public keys on a topic (mesh sharing)
 */
struct PeerListMessage {
    std::string topic;
    std::vector<std::string> peers;

    std::string to_json() const;
    static std::optional<PeerListMessage> from_json(const std::string& json);
};

/**
 * @brief Any message whose type the receiver does not interpret itself
 */
struct UnrecognizedMessage {
    std::string type;           ///< Type discriminator as received
    std::string raw;            ///< Complete message as received
};

/// Closed set of messages the swarm layer dispatches on
using SwarmMessage = std::variant<
    IdentityMessage,
    JoinTopicMessage,
    LeaveTopicMessage,
    SyncMessage,
    AwarenessMessage,
    PeerListMessage,
    UnrecognizedMessage
>;

/**
 * @brief Parse a swarm wire message
 * @return Parsed message, or std::nullopt if not a JSON object with a string "type"
 *         or if a known type has malformed fields
 */
std::optional<SwarmMessage> parse_swarm_message(const std::string& json);

// ============================================================================
// Chunk transfer messages
// ============================================================================

struct ChunkRequest {
    std::string file_id;
    uint32_t chunk_index = 0;
    std::string request_id;

    std::string to_json() const;
    static std::optional<ChunkRequest> from_json(const std::string& json);
};

struct ChunkResponse {
    std::string request_id;
    std::string file_id;
    uint32_t chunk_index = 0;
    std::vector<uint8_t> encrypted;     ///< Ciphertext (base64 on the wire)
    std::vector<uint8_t> nonce;         ///< Nonce (base64 on the wire)
    uint64_t timestamp = 0;

    std::string to_json() const;
    static std::optional<ChunkResponse> from_json(const std::string& json);
};

/**
 * @brief Unsolicited chunk push used by seeding
 */
struct ChunkSeed {
    std::string file_id;
    uint32_t chunk_index = 0;
    std::vector<uint8_t> encrypted;
    std::vector<uint8_t> nonce;
    uint64_t timestamp = 0;

    std::string to_json() const;
    static std::optional<ChunkSeed> from_json(const std::string& json);
};

/**
 * @brief Receipt for a chunk-seed, sent only once the chunk is stored
 */
struct ChunkSeedAck {
    std::string file_id;
    uint32_t chunk_index = 0;
    uint64_t timestamp = 0;

    std::string to_json() const;
    static std::optional<ChunkSeedAck> from_json(const std::string& json);
};

using TransferMessage = std::variant<ChunkRequest, ChunkResponse, ChunkSeed, ChunkSeedAck>;

/**
 * @brief Parse a chunk transfer message
 * @return Parsed message, or std::nullopt for other types or malformed fields
 */
std::optional<TransferMessage> parse_transfer_message(const std::string& json);

// ============================================================================
// Client messages (bridge / relay <-> local client)
// ============================================================================

/**
 * @brief Peer roster entry sent to clients
 */
struct PeerInfo {
    std::string peer_id;
    std::string display_name;
    std::string color;
};

struct PeersListMessage {
    std::string topic;
    std::vector<PeerInfo> peers;

    std::string to_json() const;
    static std::optional<PeersListMessage> from_json(const std::string& json);
};

struct PeerJoinedMessage {
    std::string topic;
    PeerInfo peer;

    std::string to_json() const;
    static std::optional<PeerJoinedMessage> from_json(const std::string& json);
};

struct PeerLeftMessage {
    std::string topic;
    std::string peer_id;

    std::string to_json() const;
    static std::optional<PeerLeftMessage> from_json(const std::string& json);
};

/**
 * @brief Typed rejection sent to a client
 */
struct ErrorMessage {
    std::string error;          ///< Machine-readable reason (e.g. "invalid_topic")
    std::string message;        ///< Optional human-readable detail

    std::string to_json() const;
    static std::optional<ErrorMessage> from_json(const std::string& json);
};

struct PingMessage {
    uint64_t timestamp = 0;

    std::string to_json() const;
};

struct PongMessage {
    uint64_t timestamp = 0;
};

/**
 * @brief Point-to-point payload from a local client to one peer
 */
struct SendMessage {
    std::string to;             ///< Destination peer id
    std::string payload_json;   ///< Complete message to deliver

    std::string to_json() const;
    static std::optional<SendMessage> from_json(const std::string& json);
};

/// Messages a local client may send to the bridge or relay
using ClientMessage = std::variant<
    IdentityMessage,
    JoinTopicMessage,
    LeaveTopicMessage,
    SyncMessage,
    AwarenessMessage,
    PongMessage,
    SendMessage,
    UnrecognizedMessage
>;

/**
 * @brief Parse a message received from a local client
 * @return Parsed message, or std::nullopt if malformed
 */
std::optional<ClientMessage> parse_client_message(const std::string& json);

/**
 * @brief Read the "type" field of a JSON message
 * @return Type string, or std::nullopt if absent or not JSON
 */
std::optional<std::string> peek_message_type(const std::string& json);

/**
 * @brief Copy of a JSON object message with its "from" field set
 * @return Stamped message, or std::nullopt if not a JSON object
 */
std::optional<std::string> stamp_sender(const std::string& json, const std::string& from);

} // namespace nightjar
