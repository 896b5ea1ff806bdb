/**
 * @file share_link.cpp
 * @brief Implementation of share link encoding and topic derivation
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/share_link.hpp"
#include "nightjar/mesh_crypto.hpp"
#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace nightjar {
namespace share_link {

using utilities::log_debug;
using utilities::log_warn;

namespace {

const char BASE62_ALPHABET[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

/**
 * @brief Re-express a big-endian digit string in another base
 */
std::vector<uint8_t> convert_base(const std::vector<uint8_t>& digits, uint32_t from_base, uint32_t to_base) {
    std::vector<uint8_t> number(digits);
    std::vector<uint8_t> result;

    size_t start = 0;
    while (start < number.size() && number[start] == 0) {
        ++start;
    }

    while (start < number.size()) {
        uint32_t remainder = 0;
        for (size_t i = start; i < number.size(); ++i) {
            uint32_t accumulator = remainder * from_base + number[i];
            number[i] = static_cast<uint8_t>(accumulator / to_base);
            remainder = accumulator % to_base;
        }
        result.push_back(static_cast<uint8_t>(remainder));

        while (start < number.size() && number[start] == 0) {
            ++start;
        }
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string to_base64url(const std::vector<uint8_t>& bytes) {
    const int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::vector<char> encoded(sodium_base64_encoded_len(bytes.size(), variant));

    sodium_bin2base64(encoded.data(), encoded.size(), bytes.data(), bytes.size(), variant);
    return std::string(encoded.data());
}

std::optional<std::vector<uint8_t>> from_base64url(const std::string& text) {
    std::string trimmed = text;
    while (!trimmed.empty() && trimmed.back() == '=') {
        trimmed.pop_back();
    }

    std::vector<uint8_t> bytes(trimmed.size() + 1);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(), bytes.size(),
        trimmed.c_str(), trimmed.size(),
        nullptr, &decoded_len, &end_ptr,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    if (result != 0 || end_ptr != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

char entity_code(EntityType type) {
    switch (type) {
        case EntityType::WORKSPACE: return 'w';
        case EntityType::FOLDER: return 'f';
        case EntityType::DOCUMENT: return 'd';
    }
    return 'd';
}

std::optional<EntityType> entity_from_code(const std::string& code) {
    if (code == "w") return EntityType::WORKSPACE;
    if (code == "f") return EntityType::FOLDER;
    if (code == "d") return EntityType::DOCUMENT;
    return std::nullopt;
}

char permission_code(Permission permission) {
    switch (permission) {
        case Permission::OWNER: return 'o';
        case Permission::EDITOR: return 'e';
        case Permission::VIEWER: return 'v';
    }
    return 'e';
}

std::optional<Permission> permission_from_code(const std::string& code) {
    if (code == "o") return Permission::OWNER;
    if (code == "e") return Permission::EDITOR;
    if (code == "v") return Permission::VIEWER;
    return std::nullopt;
}

bool is_allowed_server_scheme(const std::string& url) {
    std::string lower = utilities::to_lowercase(url);
    return utilities::starts_with(lower, "ws:") ||
           utilities::starts_with(lower, "wss:") ||
           utilities::starts_with(lower, "http:") ||
           utilities::starts_with(lower, "https:");
}

std::string invite_message(const std::string& entity_id, uint64_t expiry, Permission permission) {
    return entity_id + "|" + std::to_string(expiry) + "|" + permission_name(permission);
}

} // anonymous namespace

// ============================================================================
// Encoding Helpers
// ============================================================================

std::string base62_encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return "0";
    }

    std::string result;
    for (uint8_t byte : bytes) {
        if (byte != 0) {
            break;
        }
        result += '0';
    }

    for (uint8_t digit : convert_base(bytes, 256, 62)) {
        result += BASE62_ALPHABET[digit];
    }

    return result.empty() ? "0" : result;
}

std::optional<std::vector<uint8_t>> base62_decode(const std::string& text) {
    if (text.empty() || text == "0") {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> digits;
    digits.reserve(text.size());
    for (char c : text) {
        const char* position = std::strchr(BASE62_ALPHABET, c);
        if (c == '\0' || position == nullptr) {
            return std::nullopt;
        }
        digits.push_back(static_cast<uint8_t>(position - BASE62_ALPHABET));
    }

    size_t leading_zeros = 0;
    while (leading_zeros < text.size() && text[leading_zeros] == '0') {
        ++leading_zeros;
    }

    std::vector<uint8_t> result(leading_zeros, 0);
    auto value = convert_base(digits, 62, 256);
    result.insert(result.end(), value.begin(), value.end());
    return result;
}

uint16_t crc16(const uint8_t* data, size_t length) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

std::string encode_peer_list(const std::vector<std::string>& peers) {
    if (peers.empty()) {
        return "";
    }

    std::string joined;
    for (size_t i = 0; i < peers.size(); ++i) {
        if (i > 0) {
            joined += ';';
        }
        joined += peers[i];
    }

    return base62_encode(std::vector<uint8_t>(joined.begin(), joined.end()));
}

std::vector<std::string> decode_peer_list(const std::string& encoded) {
    std::vector<std::string> peers;
    if (encoded.empty()) {
        return peers;
    }

    auto bytes = base62_decode(encoded);
    if (!bytes) {
        log_debug("ShareLink: Undecodable peer list");
        return peers;
    }

    for (auto& peer : utilities::split_string(std::string(bytes->begin(), bytes->end()), ';')) {
        if (!peer.empty()) {
            peers.push_back(std::move(peer));
        }
    }
    return peers;
}

// ============================================================================
// Links
// ============================================================================

std::optional<std::string> generate(const ShareLinkOptions& options) {
    auto id_bytes = MeshCrypto::hex_to_bytes(options.entity_id);
    if (!id_bytes || id_bytes->size() != config::SHARE_LINK_ENTITY_ID_SIZE) {
        log_warn("ShareLink: Entity id must be 16 bytes of hex");
        return std::nullopt;
    }

    const bool embed_key = !options.encryption_key.empty() && !options.has_password;

    std::vector<uint8_t> payload(config::SHARE_LINK_PAYLOAD_SIZE, 0);
    std::copy(id_bytes->begin(), id_bytes->end(), payload.begin());
    payload[16] = config::SHARE_LINK_VERSION;

    uint8_t flags = 0;
    if (options.has_password) flags |= link_flags::HAS_PASSWORD;
    if (options.read_only) flags |= link_flags::READ_ONLY;
    if (embed_key) flags |= link_flags::EMBEDDED_KEY;
    payload[17] = flags;

    uint16_t checksum = crc16(payload.data(), 18);
    payload[18] = static_cast<uint8_t>((checksum >> 8) & 0xFF);
    payload[19] = static_cast<uint8_t>(checksum & 0xFF);

    std::string link = std::string(config::SHARE_LINK_SCHEME) + entity_code(options.entity_type) +
                       "/" + base62_encode(payload);

    std::vector<std::string> fragment;

    if (embed_key) {
        fragment.push_back("k:" + to_base64url(options.encryption_key));
    } else if (options.has_password && !options.password.empty()) {
        fragment.push_back("p:" + utilities::url_encode(options.password));
    }

    fragment.push_back(std::string("perm:") + permission_code(options.permission));

    if (!options.direct_address.empty()) {
        fragment.push_back("addr:" + utilities::url_encode(options.direct_address));
    }

    if (!options.bootstrap_peers.empty()) {
        size_t count = std::min(options.bootstrap_peers.size(), config::MAX_EMBEDDED_PEERS);
        std::vector<std::string> peers(options.bootstrap_peers.begin(), options.bootstrap_peers.begin() + count);
        fragment.push_back("peers:" + encode_peer_list(peers));
    }

    if (!options.swarm_peers.empty()) {
        size_t count = std::min(options.swarm_peers.size(), config::MAX_EMBEDDED_SWARM_PEERS);
        std::string joined;
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) joined += ',';
            joined += options.swarm_peers[i];
        }
        fragment.push_back("hpeer:" + joined);
    }

    if (!options.mesh_relays.empty()) {
        size_t count = std::min(options.mesh_relays.size(), config::MAX_EMBEDDED_RELAYS);
        std::string joined;
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) joined += ',';
            joined += utilities::url_encode(options.mesh_relays[i]);
        }
        fragment.push_back("nodes:" + joined);
    }

    if (!options.server_url.empty()) {
        fragment.push_back("srv:" + utilities::url_encode(options.server_url));
    }

    if (options.entity_type == EntityType::WORKSPACE) {
        fragment.push_back("topic:" + (options.topic_hash.empty() ? options.entity_id : options.topic_hash));
    }

    link += '#';
    for (size_t i = 0; i < fragment.size(); ++i) {
        if (i > 0) link += '&';
        link += fragment[i];
    }

    return link;
}

std::optional<ShareLink> parse(const std::string& link) {
    std::string encoded = utilities::trim_string(link);
    std::string fragment;
    ShareLink result;

    auto hash_pos = encoded.find('#');
    if (hash_pos != std::string::npos) {
        fragment = encoded.substr(hash_pos + 1);
        encoded = encoded.substr(0, hash_pos);
    }

    const std::string scheme = config::SHARE_LINK_SCHEME;
    if (utilities::starts_with(utilities::to_lowercase(encoded), scheme)) {
        std::string after_scheme = encoded.substr(scheme.size());
        auto slash_pos = after_scheme.find('/');
        if (slash_pos == std::string::npos) {
            encoded = after_scheme;
        } else {
            std::string code = after_scheme.substr(0, slash_pos);
            if (code == "c") {
                log_debug("ShareLink: Compressed links are not supported");
                return std::nullopt;
            }
            auto type = entity_from_code(code);
            if (type) {
                result.entity_type = *type;
                encoded = after_scheme.substr(slash_pos + 1);
            } else {
                encoded = after_scheme;
            }
        }
    }

    // Drop any trailing path or query
    encoded = encoded.substr(0, encoded.find_first_of("/?"));

    auto payload = base62_decode(encoded);
    if (!payload) {
        log_debug("ShareLink: Payload is not base62");
        return std::nullopt;
    }
    if (payload->size() < config::SHARE_LINK_PAYLOAD_SIZE) {
        log_debug("ShareLink: Payload too short");
        return std::nullopt;
    }

    uint16_t expected = crc16(payload->data(), 18);
    uint16_t actual = static_cast<uint16_t>(((*payload)[18] << 8) | (*payload)[19]);
    if (expected != actual) {
        log_debug("ShareLink: Checksum mismatch");
        return std::nullopt;
    }

    result.entity_id = MeshCrypto::bytes_to_hex(
        std::vector<uint8_t>(payload->begin(), payload->begin() + config::SHARE_LINK_ENTITY_ID_SIZE));
    result.version = (*payload)[16];
    result.flags = (*payload)[17];

    if (result.version > config::SHARE_LINK_VERSION) {
        log_warn("ShareLink: Link version " + std::to_string(result.version) +
                 " is newer than " + std::to_string(config::SHARE_LINK_VERSION));
    }

    bool has_permission = false;

    for (const auto& param : utilities::split_string(fragment, '&')) {
        if (utilities::starts_with(param, "k:")) {
            result.encryption_key = from_base64url(param.substr(2));
            if (!result.encryption_key) {
                log_debug("ShareLink: Ignoring malformed embedded key");
            }
        } else if (utilities::starts_with(param, "p:")) {
            result.password = utilities::url_decode(param.substr(2));
        } else if (utilities::starts_with(param, "perm:")) {
            has_permission = true;
            auto permission = permission_from_code(param.substr(5));
            if (permission) {
                result.permission = *permission;
            }
        } else if (utilities::starts_with(param, "addr:")) {
            result.direct_address = utilities::url_decode(param.substr(5));
        } else if (utilities::starts_with(param, "peers:")) {
            result.bootstrap_peers = decode_peer_list(param.substr(6));
        } else if (utilities::starts_with(param, "hpeer:")) {
            for (auto& key : utilities::split_string(param.substr(6), ',')) {
                if (key.size() == config::TOPIC_HEX_LENGTH) {
                    result.swarm_peers.push_back(std::move(key));
                }
            }
        } else if (utilities::starts_with(param, "nodes:")) {
            for (const auto& relay : utilities::split_string(param.substr(6), ',')) {
                std::string decoded = utilities::url_decode(relay);
                if (!decoded.empty()) {
                    result.mesh_relays.push_back(std::move(decoded));
                }
            }
        } else if (utilities::starts_with(param, "srv:")) {
            std::string url = utilities::url_decode(param.substr(4));
            if (is_allowed_server_scheme(url)) {
                result.server_url = url;
            } else {
                log_warn("ShareLink: Ignoring server URL with unsupported scheme");
            }
        } else if (utilities::starts_with(param, "topic:")) {
            result.topic = param.substr(6);
        } else if (utilities::starts_with(param, "exp:")) {
            try {
                result.expiry = std::stoull(param.substr(4));
            } catch (const std::exception&) {
                log_debug("ShareLink: Ignoring malformed expiry");
            }
        } else if (utilities::starts_with(param, "sig:")) {
            result.signature = param.substr(4);
        } else if (utilities::starts_with(param, "by:")) {
            result.signed_by = param.substr(3);
        }
    }

    if (result.is_read_only() && !has_permission) {
        result.permission = Permission::VIEWER;
    }

    return result;
}

std::optional<SignedInvite> generate_signed_invite(
    const ShareLinkOptions& options,
    const PeerIdentity& owner,
    std::chrono::minutes lifetime,
    uint64_t now_ms
) {
    if (options.entity_id.empty() || options.encryption_key.empty()) {
        log_warn("ShareLink: Invites need an entity id and an encryption key");
        return std::nullopt;
    }

    auto capped = std::min<std::chrono::minutes>(lifetime, config::MAX_INVITE_LIFETIME);
    uint64_t expiry = now_ms + static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(capped).count());

    ShareLinkOptions invite_options = options;
    invite_options.entity_type = EntityType::WORKSPACE;
    invite_options.has_password = false;
    invite_options.password.clear();
    invite_options.read_only = false;

    auto base_link = generate(invite_options);
    if (!base_link) {
        return std::nullopt;
    }

    std::string message = invite_message(options.entity_id, expiry, options.permission);
    auto signature = owner.sign(std::vector<uint8_t>(message.begin(), message.end()));

    SignedInvite invite;
    invite.expiry = expiry;
    invite.signature = base62_encode(signature);
    invite.owner_public_key = owner.get_public_key_hex();
    invite.link = *base_link +
                  "&exp:" + std::to_string(expiry) +
                  "&sig:" + invite.signature +
                  "&by:" + invite.owner_public_key;

    return invite;
}

InviteValidation validate_signed_invite(const std::string& link, uint64_t now_ms) {
    InviteValidation validation;

    auto parsed = parse(link);
    if (!parsed) {
        validation.error = "Invalid link format";
        return validation;
    }

    if (!parsed->expiry || !parsed->signature) {
        validation.valid = true;
        validation.legacy = true;
        validation.link = std::move(parsed);
        return validation;
    }

    if (now_ms > *parsed->expiry) {
        validation.error = "Invite link has expired";
        return validation;
    }

    if (parsed->signed_by) {
        auto public_key = MeshCrypto::public_key_from_hex(*parsed->signed_by);
        auto signature = base62_decode(*parsed->signature);
        if (!public_key || !signature) {
            validation.error = "Malformed invite signature";
            return validation;
        }

        // Leading zero bytes of a signature may be elided by the encoding
        if (signature->size() < crypto_sign_BYTES) {
            signature->insert(signature->begin(), crypto_sign_BYTES - signature->size(), 0);
        }

        std::string message = invite_message(parsed->entity_id, *parsed->expiry, parsed->permission);
        if (!PeerIdentity::verify(std::vector<uint8_t>(message.begin(), message.end()), *signature, *public_key)) {
            validation.error = "Invalid signature";
            return validation;
        }
    }

    validation.valid = true;
    validation.link = std::move(parsed);
    return validation;
}

// ============================================================================
// Topics
// ============================================================================

std::string derive_topic(const std::string& entity_id, const std::string& password) {
    return utilities::sha256_hex(password.empty() ? entity_id : entity_id + ":" + password);
}

std::string workspace_topic(const std::string& workspace_id) {
    return utilities::sha256_hex(std::string(config::WORKSPACE_TOPIC_PREFIX) + workspace_id);
}

std::string entity_topic(EntityType type, const std::string& entity_id) {
    if (type == EntityType::WORKSPACE) {
        return workspace_topic(entity_id);
    }
    return utilities::sha256_hex("nightjar-" + std::string(entity_type_name(type)) + ":" + entity_id);
}

std::string mesh_topic() {
    return utilities::sha256_hex(std::string(config::MESH_TOPIC_V1));
}

// ============================================================================
// Names
// ============================================================================

const char* entity_type_name(EntityType type) {
    switch (type) {
        case EntityType::WORKSPACE: return "workspace";
        case EntityType::FOLDER: return "folder";
        case EntityType::DOCUMENT: return "document";
    }
    return "document";
}

const char* permission_name(Permission permission) {
    switch (permission) {
        case Permission::OWNER: return "owner";
        case Permission::EDITOR: return "editor";
        case Permission::VIEWER: return "viewer";
    }
    return "editor";
}

std::optional<Permission> parse_permission(const std::string& name) {
    if (name == "owner") return Permission::OWNER;
    if (name == "editor") return Permission::EDITOR;
    if (name == "viewer") return Permission::VIEWER;
    return std::nullopt;
}

} // namespace share_link
} // namespace nightjar
