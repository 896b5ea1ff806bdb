/**
 * @file message_types.cpp
 * @brief Implementation of wire message serialization
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/message_types.hpp"
#include "nightjar/mesh_crypto.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nightjar {

namespace {
    /**
     * @brief Parse and require an object with the expected type tag
     */
    std::optional<json> parse_typed(const std::string& json_str, const char* expected_type) {
        json j = json::parse(json_str);
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string() ||
            j["type"].get<std::string>() != expected_type) {
            return std::nullopt;
        }
        return j;
    }

    /**
     * @brief Embed a serialized JSON value, falling back to a string
     */
    json embed_value(const std::string& value_json) {
        if (value_json.empty()) {
            return nullptr;
        }
        json parsed = json::parse(value_json, nullptr, false);
        if (parsed.is_discarded()) {
            return value_json;
        }
        return parsed;
    }

    json peer_info_to_json(const PeerInfo& peer) {
        json p;
        p["peerId"] = peer.peer_id;
        if (!peer.display_name.empty() || !peer.color.empty()) {
            p["identity"] = {
                {"displayName", peer.display_name},
                {"color", peer.color}
            };
        }
        return p;
    }

    PeerInfo peer_info_from_json(const json& p) {
        PeerInfo peer;
        peer.peer_id = p.at("peerId").get<std::string>();
        if (p.contains("identity") && p["identity"].is_object()) {
            peer.display_name = p["identity"].value("displayName", "");
            peer.color = p["identity"].value("color", "");
        }
        return peer;
    }

    std::optional<std::vector<uint8_t>> decode_b64_field(const json& j, const char* field) {
        if (!j.contains(field) || !j[field].is_string()) {
            return std::nullopt;
        }
        return MeshCrypto::base64_to_bytes(j[field].get<std::string>());
    }
}

// ============================================================================
// IdentityMessage
// ============================================================================

std::string IdentityMessage::signed_payload() const {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    json j;
    j["type"] = message_type::IDENTITY;
    j["publicKey"] = public_key;
    j["displayName"] = display_name;
    j["color"] = color;
    j["timestamp"] = timestamp;
    return j.dump();
}

std::string IdentityMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::IDENTITY;
        j["publicKey"] = public_key;
        j["displayName"] = display_name;
        j["color"] = color;
        j["timestamp"] = timestamp;
        if (!signature.empty()) {
            j["signature"] = signature;
        }
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<IdentityMessage> IdentityMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::IDENTITY);
        if (!j) {
            return std::nullopt;
        }

        IdentityMessage msg;
        msg.public_key = j->at("publicKey").get<std::string>();
        msg.display_name = j->value("displayName", "");
        msg.color = j->value("color", "");
        msg.timestamp = j->value("timestamp", static_cast<uint64_t>(0));
        // Missing signature is representable; verification rejects it
        msg.signature = j->value("signature", "");

        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Topic membership
// ============================================================================

std::string JoinTopicMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::JOIN_TOPIC;
        j["topic"] = topic;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<JoinTopicMessage> JoinTopicMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::JOIN_TOPIC);
        if (!j) {
            return std::nullopt;
        }

        JoinTopicMessage msg;
        // Absent or non-string topics become empty and are rejected downstream
        if (j->contains("topic") && (*j)["topic"].is_string()) {
            msg.topic = (*j)["topic"].get<std::string>();
        }
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string LeaveTopicMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::LEAVE_TOPIC;
        j["topic"] = topic;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<LeaveTopicMessage> LeaveTopicMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::LEAVE_TOPIC);
        if (!j) {
            return std::nullopt;
        }

        LeaveTopicMessage msg;
        if (j->contains("topic") && (*j)["topic"].is_string()) {
            msg.topic = (*j)["topic"].get<std::string>();
        }
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Sync / Awareness
// ============================================================================

std::string SyncMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::SYNC;
        j["topic"] = topic;
        j["data"] = embed_value(data_json);
        if (!from.empty()) {
            j["from"] = from;
        }
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<SyncMessage> SyncMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::SYNC);
        if (!j) {
            return std::nullopt;
        }

        SyncMessage msg;
        msg.topic = j->value("topic", "");
        msg.data_json = j->contains("data") ? (*j)["data"].dump() : "null";
        msg.from = j->value("from", "");
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string AwarenessMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::AWARENESS;
        j["topic"] = topic;
        j["state"] = embed_value(state_json);
        if (!from.empty()) {
            j["from"] = from;
        }
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<AwarenessMessage> AwarenessMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::AWARENESS);
        if (!j) {
            return std::nullopt;
        }

        AwarenessMessage msg;
        msg.topic = j->value("topic", "");
        msg.state_json = j->contains("state") ? (*j)["state"].dump() : "null";
        msg.from = j->value("from", "");
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// PeerListMessage
// ============================================================================

std::string PeerListMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::PEER_LIST;
        j["topic"] = topic;
        j["peers"] = peers;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<PeerListMessage> PeerListMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::PEER_LIST);
        if (!j) {
            return std::nullopt;
        }

        PeerListMessage msg;
        msg.topic = j->at("topic").get<std::string>();
        msg.peers = j->at("peers").get<std::vector<std::string>>();
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Swarm dispatch parsing
// ============================================================================

std::optional<std::string> peek_message_type(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }
    return j["type"].get<std::string>();
}

std::optional<std::string> stamp_sender(const std::string& json_str, const std::string& from) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    j["from"] = from;
    return j.dump();
}

std::optional<SwarmMessage> parse_swarm_message(const std::string& json_str) {
    auto type = peek_message_type(json_str);
    if (!type) {
        return std::nullopt;
    }

    if (*type == message_type::IDENTITY) {
        auto msg = IdentityMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::JOIN_TOPIC) {
        auto msg = JoinTopicMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::LEAVE_TOPIC) {
        auto msg = LeaveTopicMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::SYNC) {
        auto msg = SyncMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::AWARENESS) {
        auto msg = AwarenessMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::PEER_LIST) {
        auto msg = PeerListMessage::from_json(json_str);
        if (msg) return SwarmMessage(std::move(*msg));
        return std::nullopt;
    }

    return SwarmMessage(UnrecognizedMessage{*type, json_str});
}

// ============================================================================
// Chunk transfer
// ============================================================================

std::string ChunkRequest::to_json() const {
    try {
        json j;
        j["type"] = message_type::CHUNK_REQUEST;
        j["fileId"] = file_id;
        j["chunkIndex"] = chunk_index;
        j["requestId"] = request_id;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ChunkRequest> ChunkRequest::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::CHUNK_REQUEST);
        if (!j) {
            return std::nullopt;
        }

        ChunkRequest msg;
        msg.file_id = j->at("fileId").get<std::string>();
        msg.chunk_index = j->at("chunkIndex").get<uint32_t>();
        msg.request_id = j->at("requestId").get<std::string>();
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string ChunkResponse::to_json() const {
    try {
        json j;
        j["type"] = message_type::CHUNK_RESPONSE;
        j["requestId"] = request_id;
        j["fileId"] = file_id;
        j["chunkIndex"] = chunk_index;
        j["encrypted"] = MeshCrypto::bytes_to_base64(encrypted);
        j["nonce"] = MeshCrypto::bytes_to_base64(nonce);
        j["timestamp"] = timestamp;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ChunkResponse> ChunkResponse::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::CHUNK_RESPONSE);
        if (!j) {
            return std::nullopt;
        }

        ChunkResponse msg;
        msg.request_id = j->at("requestId").get<std::string>();
        msg.file_id = j->at("fileId").get<std::string>();
        msg.chunk_index = j->at("chunkIndex").get<uint32_t>();
        msg.timestamp = j->value("timestamp", static_cast<uint64_t>(0));

        auto encrypted = decode_b64_field(*j, "encrypted");
        auto nonce = decode_b64_field(*j, "nonce");
        if (!encrypted || !nonce) {
            return std::nullopt;
        }
        msg.encrypted = std::move(*encrypted);
        msg.nonce = std::move(*nonce);

        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string ChunkSeed::to_json() const {
    try {
        json j;
        j["type"] = message_type::CHUNK_SEED;
        j["fileId"] = file_id;
        j["chunkIndex"] = chunk_index;
        j["encrypted"] = MeshCrypto::bytes_to_base64(encrypted);
        j["nonce"] = MeshCrypto::bytes_to_base64(nonce);
        j["timestamp"] = timestamp;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ChunkSeed> ChunkSeed::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::CHUNK_SEED);
        if (!j) {
            return std::nullopt;
        }

        ChunkSeed msg;
        msg.file_id = j->at("fileId").get<std::string>();
        msg.chunk_index = j->at("chunkIndex").get<uint32_t>();
        msg.timestamp = j->value("timestamp", static_cast<uint64_t>(0));

        auto encrypted = decode_b64_field(*j, "encrypted");
        auto nonce = decode_b64_field(*j, "nonce");
        if (!encrypted || !nonce) {
            return std::nullopt;
        }
        msg.encrypted = std::move(*encrypted);
        msg.nonce = std::move(*nonce);

        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string ChunkSeedAck::to_json() const {
    try {
        json j;
        j["type"] = message_type::CHUNK_SEED_ACK;
        j["fileId"] = file_id;
        j["chunkIndex"] = chunk_index;
        j["timestamp"] = timestamp;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ChunkSeedAck> ChunkSeedAck::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::CHUNK_SEED_ACK);
        if (!j) {
            return std::nullopt;
        }

        ChunkSeedAck msg;
        msg.file_id = j->at("fileId").get<std::string>();
        msg.chunk_index = j->at("chunkIndex").get<uint32_t>();
        msg.timestamp = j->value("timestamp", static_cast<uint64_t>(0));
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<TransferMessage> parse_transfer_message(const std::string& json_str) {
    auto type = peek_message_type(json_str);
    if (!type) {
        return std::nullopt;
    }

    if (*type == message_type::CHUNK_REQUEST) {
        auto msg = ChunkRequest::from_json(json_str);
        if (msg) return TransferMessage(std::move(*msg));
    } else if (*type == message_type::CHUNK_RESPONSE) {
        auto msg = ChunkResponse::from_json(json_str);
        if (msg) return TransferMessage(std::move(*msg));
    } else if (*type == message_type::CHUNK_SEED) {
        auto msg = ChunkSeed::from_json(json_str);
        if (msg) return TransferMessage(std::move(*msg));
    } else if (*type == message_type::CHUNK_SEED_ACK) {
        auto msg = ChunkSeedAck::from_json(json_str);
        if (msg) return TransferMessage(std::move(*msg));
    }

    return std::nullopt;
}

// ============================================================================
// Client messages
// ============================================================================

std::string PeersListMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::PEERS_LIST;
        j["topic"] = topic;
        j["peers"] = json::array();
        for (const auto& peer : peers) {
            j["peers"].push_back(peer_info_to_json(peer));
        }
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<PeersListMessage> PeersListMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::PEERS_LIST);
        if (!j) {
            return std::nullopt;
        }

        PeersListMessage msg;
        msg.topic = j->at("topic").get<std::string>();
        for (const auto& p : j->at("peers")) {
            msg.peers.push_back(peer_info_from_json(p));
        }
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string PeerJoinedMessage::to_json() const {
    try {
        json j = peer_info_to_json(peer);
        j["type"] = message_type::PEER_JOINED;
        j["topic"] = topic;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<PeerJoinedMessage> PeerJoinedMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::PEER_JOINED);
        if (!j) {
            return std::nullopt;
        }

        PeerJoinedMessage msg;
        msg.topic = j->at("topic").get<std::string>();
        msg.peer = peer_info_from_json(*j);
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string PeerLeftMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::PEER_LEFT;
        j["topic"] = topic;
        j["peerId"] = peer_id;
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<PeerLeftMessage> PeerLeftMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::PEER_LEFT);
        if (!j) {
            return std::nullopt;
        }

        PeerLeftMessage msg;
        msg.topic = j->at("topic").get<std::string>();
        msg.peer_id = j->at("peerId").get<std::string>();
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string ErrorMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::ERROR;
        j["error"] = error;
        if (!message.empty()) {
            j["message"] = message;
        }
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ErrorMessage> ErrorMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::ERROR);
        if (!j) {
            return std::nullopt;
        }

        ErrorMessage msg;
        msg.error = j->at("error").get<std::string>();
        msg.message = j->value("message", "");
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string PingMessage::to_json() const {
    json j;
    j["type"] = message_type::PING;
    j["timestamp"] = timestamp;
    return j.dump();
}

std::string SendMessage::to_json() const {
    try {
        json j;
        j["type"] = message_type::SEND;
        j["to"] = to;
        j["payload"] = embed_value(payload_json);
        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<SendMessage> SendMessage::from_json(const std::string& json_str) {
    try {
        auto j = parse_typed(json_str, message_type::SEND);
        if (!j) {
            return std::nullopt;
        }

        SendMessage msg;
        msg.to = j->at("to").get<std::string>();
        const auto& payload = j->at("payload");
        if (!payload.is_object()) {
            return std::nullopt;
        }
        msg.payload_json = payload.dump();
        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<ClientMessage> parse_client_message(const std::string& json_str) {
    auto type = peek_message_type(json_str);
    if (!type) {
        return std::nullopt;
    }

    if (*type == message_type::IDENTITY) {
        auto msg = IdentityMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::JOIN_TOPIC) {
        auto msg = JoinTopicMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::LEAVE_TOPIC) {
        auto msg = LeaveTopicMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::SYNC) {
        auto msg = SyncMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::AWARENESS) {
        auto msg = AwarenessMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }
    if (*type == message_type::PONG) {
        json j = json::parse(json_str, nullptr, false);
        PongMessage pong;
        if (!j.is_discarded() && j.contains("timestamp") && j["timestamp"].is_number_unsigned()) {
            pong.timestamp = j["timestamp"].get<uint64_t>();
        }
        return ClientMessage(pong);
    }
    if (*type == message_type::SEND) {
        auto msg = SendMessage::from_json(json_str);
        if (msg) return ClientMessage(std::move(*msg));
        return std::nullopt;
    }

    return ClientMessage(UnrecognizedMessage{*type, json_str});
}

} // namespace nightjar
