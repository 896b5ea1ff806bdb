/**
 * @file share_link.hpp
 * @brief nightjar:// share links and topic derivation
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Link format:
 *   nightjar://{w|f|d}/{base62(payload)}#k:..&p:..&perm:..&addr:..&peers:..
 *
 * The 20-byte payload carries the entity id, link version, a flags byte and
 * a CRC16-CCITT checksum over the first 18 bytes. Key material, bootstrap
 * hints and permissions travel in the fragment, which is never sent to a
 * server by URL handlers.
 */

#pragma once

#include "nightjar/peer_identity.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>

namespace nightjar {

enum class EntityType {
    WORKSPACE,
    FOLDER,
    DOCUMENT
};

enum class Permission {
    OWNER,
    EDITOR,
    VIEWER
};

/// Payload flag bits
namespace link_flags {
    constexpr uint8_t HAS_PASSWORD = 0x01;
    constexpr uint8_t READ_ONLY = 0x02;       ///< Legacy; implies viewer without perm:
    constexpr uint8_t EMBEDDED_KEY = 0x04;
}

/**
 * @brief Inputs for link generation
 */
struct ShareLinkOptions {
    EntityType entity_type = EntityType::DOCUMENT;
    std::string entity_id;                        ///< 32 hex chars
    Permission permission = Permission::EDITOR;
    bool has_password = true;
    std::string password;                         ///< Embedded as p: when has_password
    std::vector<uint8_t> encryption_key;          ///< Embedded as k: when !has_password
    bool read_only = false;
    std::vector<std::string> bootstrap_peers;     ///< host:port
    std::vector<std::string> swarm_peers;         ///< 64-hex public keys
    std::vector<std::string> mesh_relays;         ///< ws/wss URLs
    std::string topic_hash;                       ///< Workspace links fall back to the entity id
    std::string direct_address;
    std::string server_url;
};

/**
 * @brief Decoded share link
 */
struct ShareLink {
    EntityType entity_type = EntityType::DOCUMENT;
    std::string entity_id;
    uint8_t version = 0;
    uint8_t flags = 0;
    Permission permission = Permission::EDITOR;

    std::optional<std::vector<uint8_t>> encryption_key;
    std::optional<std::string> password;

    std::vector<std::string> bootstrap_peers;
    std::vector<std::string> swarm_peers;
    std::vector<std::string> mesh_relays;
    std::optional<std::string> direct_address;
    std::optional<std::string> server_url;
    std::optional<std::string> topic;

    // Signed invite fields
    std::optional<uint64_t> expiry;               ///< ms since epoch
    std::optional<std::string> signature;         ///< base62
    std::optional<std::string> signed_by;         ///< hex public key

    bool has_password() const { return (flags & link_flags::HAS_PASSWORD) != 0; }
    bool is_read_only() const { return (flags & link_flags::READ_ONLY) != 0; }
    bool has_embedded_key() const { return (flags & link_flags::EMBEDDED_KEY) != 0; }
};

struct SignedInvite {
    std::string link;
    uint64_t expiry = 0;
    std::string signature;
    std::string owner_public_key;
};

struct InviteValidation {
    bool valid = false;
    bool legacy = false;                          ///< No exp:/sig:, not time limited
    std::string error;
    std::optional<ShareLink> link;
};

namespace share_link {

// ============================================================================
// Encoding Helpers
// ============================================================================

/**
 * @brief Base62 encode, one leading '0' per leading zero byte
 */
std::string base62_encode(const std::vector<uint8_t>& bytes);

/**
 * @return Decoded bytes, or std::nullopt on a character outside [0-9A-Za-z]
 */
std::optional<std::vector<uint8_t>> base62_decode(const std::string& text);

/**
 * @brief CRC16-CCITT (init 0xFFFF, polynomial 0x1021)
 */
uint16_t crc16(const uint8_t* data, size_t length);

std::string encode_peer_list(const std::vector<std::string>& peers);
std::vector<std::string> decode_peer_list(const std::string& encoded);

// ============================================================================
// Links
// ============================================================================

/**
 * @return Link, or std::nullopt if the entity id is not 16 bytes of hex
 */
std::optional<std::string> generate(const ShareLinkOptions& options);

/**
 * @brief Parse a full link or a bare base62 payload
 * @return std::nullopt on short payload, bad encoding or checksum mismatch
 */
std::optional<ShareLink> parse(const std::string& link);

/**
 * @brief Workspace invite signed over "entityId|expiry|permission"
 *
 * Lifetime is capped at 24 hours.
 * @return std::nullopt if the entity id or encryption key is missing
 */
std::optional<SignedInvite> generate_signed_invite(
    const ShareLinkOptions& options,
    const PeerIdentity& owner,
    std::chrono::minutes lifetime,
    uint64_t now_ms
);

/**
 * @brief Check expiry and owner signature of an invite
 *
 * Links without exp:/sig: are valid legacy links.
 */
InviteValidation validate_signed_invite(const std::string& link, uint64_t now_ms);

// ============================================================================
// Topics
// ============================================================================

/**
 * @brief sha256(entityId) or sha256(entityId ":" password), hex
 */
std::string derive_topic(const std::string& entity_id, const std::string& password = "");

/**
 * @brief sha256("nightjar-workspace:" + workspaceId), hex
 */
std::string workspace_topic(const std::string& workspace_id);

/**
 * @brief Workspaces use workspace_topic; folders and documents a typed prefix
 */
std::string entity_topic(EntityType type, const std::string& entity_id);

/**
 * @brief Well-known mesh coordination topic
 */
std::string mesh_topic();

// ============================================================================
// Names
// ============================================================================

const char* entity_type_name(EntityType type);
const char* permission_name(Permission permission);
std::optional<Permission> parse_permission(const std::string& name);

} // namespace share_link
} // namespace nightjar
