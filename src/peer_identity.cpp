/**
 * @file peer_identity.cpp
 * @brief Implementation of peer identity management
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/peer_identity.hpp"
#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <fstream>

namespace nightjar {

using utilities::log_warn;
using utilities::log_error;

// ============================================================================
// Constructors
// ============================================================================

PeerIdentity::PeerIdentity(const std::string& display_name, const std::string& color)
    : display_name_(display_name.substr(0, config::MAX_DISPLAY_NAME_LENGTH))
    , color_(color)
    , signature_keypair_(MeshCrypto::generate_signature_keypair())
{
}

PeerIdentity::PeerIdentity(
    const std::string& display_name,
    const SignatureKeyPair& keypair
)
    : display_name_(display_name.substr(0, config::MAX_DISPLAY_NAME_LENGTH))
    , signature_keypair_(keypair)
{
}

PeerIdentity::~PeerIdentity() {
    MeshCrypto::secure_zero(signature_keypair_.secret_key.data(), signature_keypair_.secret_key.size());
}

// ============================================================================
// Persistent Storage
// ============================================================================

std::optional<PeerIdentity> PeerIdentity::load(
    const std::string& name,
    const std::filesystem::path& storage_dir,
    const std::string& display_name
) {
    if (!config::validate_identifier(name)) {
        log_warn("PeerIdentity: Invalid key name '" + name + "'");
        return std::nullopt;
    }

    try {
        auto sig_path = get_signature_key_path(name, storage_dir);
        if (!std::filesystem::exists(sig_path)) {
            return std::nullopt;
        }

        std::ifstream sig_file(sig_path, std::ios::binary);
        if (!sig_file) {
            return std::nullopt;
        }

        SignatureKeyPair keypair;
        sig_file.read(reinterpret_cast<char*>(keypair.public_key.data()),
                      keypair.public_key.size());
        sig_file.read(reinterpret_cast<char*>(keypair.secret_key.data()),
                      keypair.secret_key.size());

        if (!sig_file) {
            MeshCrypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
            log_error("PeerIdentity: Truncated key file " + sig_path.string());
            return std::nullopt;
        }

        PeerIdentity identity(display_name, keypair);
        MeshCrypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
        return identity;

    } catch (const std::exception& e) {
        log_error("PeerIdentity: Failed to load keys: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<PeerIdentity> PeerIdentity::load_or_create(
    const std::string& name,
    const std::filesystem::path& storage_dir,
    const std::string& display_name
) {
    auto existing = load(name, storage_dir, display_name);
    if (existing) {
        return existing;
    }

    if (!config::validate_identifier(name)) {
        return std::nullopt;
    }

    PeerIdentity identity(display_name);
    if (!identity.save(name, storage_dir)) {
        return std::nullopt;
    }
    return identity;
}

bool PeerIdentity::save(const std::string& name, const std::filesystem::path& storage_dir) const {
    if (!config::validate_identifier(name)) {
        return false;
    }

    try {
        if (!std::filesystem::exists(storage_dir)) {
            std::filesystem::create_directories(storage_dir);
        }

        auto sig_path = get_signature_key_path(name, storage_dir);

        std::ofstream sig_file(sig_path, std::ios::binary | std::ios::trunc);
        if (!sig_file) {
            log_error("PeerIdentity: Cannot write key file " + sig_path.string());
            return false;
        }

        sig_file.write(reinterpret_cast<const char*>(signature_keypair_.public_key.data()),
                       signature_keypair_.public_key.size());
        sig_file.write(reinterpret_cast<const char*>(signature_keypair_.secret_key.data()),
                       signature_keypair_.secret_key.size());
        sig_file.close();

#ifndef _WIN32
        std::filesystem::permissions(sig_path,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace);
#endif

        return true;

    } catch (const std::exception& e) {
        log_error("PeerIdentity: Failed to save keys: " + std::string(e.what()));
        return false;
    }
}

// ============================================================================
// Identity Information
// ============================================================================

PublicKey PeerIdentity::get_public_key() const {
    return signature_keypair_.public_key;
}

std::string PeerIdentity::get_public_key_hex() const {
    return MeshCrypto::bytes_to_hex(std::vector<uint8_t>(
        signature_keypair_.public_key.begin(),
        signature_keypair_.public_key.end()
    ));
}

// ============================================================================
// Cryptographic Operations
// ============================================================================

std::vector<uint8_t> PeerIdentity::sign(const std::vector<uint8_t>& message) const {
    return MeshCrypto::sign_message(message, signature_keypair_.secret_key);
}

bool PeerIdentity::verify(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    return MeshCrypto::verify_signature(message, signature, public_key);
}

IdentityMessage PeerIdentity::create_identity_message(uint64_t timestamp) const {
    IdentityMessage msg;
    msg.public_key = get_public_key_hex();
    msg.display_name = display_name_;
    msg.color = color_;
    msg.timestamp = timestamp;

    std::string payload = msg.signed_payload();
    auto signature = sign(std::vector<uint8_t>(payload.begin(), payload.end()));
    msg.signature = MeshCrypto::bytes_to_hex(signature);

    return msg;
}

bool PeerIdentity::verify_identity_message(const IdentityMessage& message) {
    if (message.signature.empty()) {
        return false;
    }

    if (!config::validate_public_key_hex(message.public_key)) {
        return false;
    }

    auto public_key = MeshCrypto::public_key_from_hex(message.public_key);
    auto signature = MeshCrypto::hex_to_bytes(message.signature);
    if (!public_key || !signature) {
        return false;
    }

    std::string payload = message.signed_payload();
    return verify(std::vector<uint8_t>(payload.begin(), payload.end()), *signature, *public_key);
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::filesystem::path PeerIdentity::get_signature_key_path(
    const std::string& name,
    const std::filesystem::path& storage_dir
) {
    return storage_dir / (name + "_signature.key");
}

} // namespace nightjar
