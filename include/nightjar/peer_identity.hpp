/**
 * @file peer_identity.hpp
 * @brief Peer identity management with signing keys
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Manages peer identity including:
 * - Ed25519 signature keys (the public key is the peer's swarm address)
 * - Display name and presence color
 * - Persistent key storage
 * - Signed identity assertions for the connection handshake
 */

#pragma once

#include "nightjar/mesh_crypto.hpp"
#include "nightjar/message_types.hpp"
#include <string>
#include <filesystem>
#include <optional>
#include <vector>

namespace nightjar {

/**
 * @brief PeerIdentity - Cryptographic identity of one Nightjar peer
 *
 * Created once per process/user and reused across swarm restarts so a
 * resumed swarm presents the same public key.
 */
class PeerIdentity {
public:
    /**
     * @brief Create new identity with a generated keypair
     * @param display_name Human-readable name
     * @param color Presence color (optional)
     */
    explicit PeerIdentity(const std::string& display_name, const std::string& color = "");

    /**
     * @brief Wipes the secret signing key
     */
    ~PeerIdentity();

    PeerIdentity(const PeerIdentity&) = default;
    PeerIdentity& operator=(const PeerIdentity&) = default;
    PeerIdentity(PeerIdentity&&) = default;
    PeerIdentity& operator=(PeerIdentity&&) = default;

    /**
     * @brief Load existing identity keys from storage
     * @param name Key file name (validated identifier)
     * @param storage_dir Directory containing key files
     * @param display_name Display name to attach
     * @return PeerIdentity if successful, std::nullopt if not found or corrupt
     */
    static std::optional<PeerIdentity> load(
        const std::string& name,
        const std::filesystem::path& storage_dir,
        const std::string& display_name
    );

    /**
     * @brief Load identity, or create and save a new one if absent
     */
    static std::optional<PeerIdentity> load_or_create(
        const std::string& name,
        const std::filesystem::path& storage_dir,
        const std::string& display_name
    );

    /**
     * @brief Save signing keys to persistent storage (owner read/write only)
     * @return true if successful, false otherwise
     */
    bool save(const std::string& name, const std::filesystem::path& storage_dir) const;

    // ========================================================================
    // Identity Information
    // ========================================================================

    const std::string& get_display_name() const { return display_name_; }
    const std::string& get_color() const { return color_; }
    void set_color(const std::string& color) { color_ = color; }

    PublicKey get_public_key() const;

    /**
     * @brief Public key as lowercase hex (the peer id used on the wire)
     */
    std::string get_public_key_hex() const;

    // ========================================================================
    // Cryptographic Operations
    // ========================================================================

    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    static bool verify(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    /**
     * @brief Build a signed identity assertion
     * @param timestamp Assertion time in ms (carried for replay-window checks)
     */
    IdentityMessage create_identity_message(uint64_t timestamp) const;

    /**
     * @brief Verify an identity assertion against its claimed public key
     *
     * Rejects a missing signature, a malformed key or signature, and any
     * signature that does not cover the exact asserted fields.
     */
    static bool verify_identity_message(const IdentityMessage& message);

private:
    std::string display_name_;
    std::string color_;
    SignatureKeyPair signature_keypair_;

    PeerIdentity(
        const std::string& display_name,
        const SignatureKeyPair& keypair
    );

    static std::filesystem::path get_signature_key_path(
        const std::string& name,
        const std::filesystem::path& storage_dir
    );
};

} // namespace nightjar
