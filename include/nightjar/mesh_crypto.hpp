/**
 * @file mesh_crypto.hpp
 * @brief Cryptographic operations for Nightjar peers
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, ChaCha20-Poly1305 chunk encryption and SHA-256.
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace nightjar {

/**
 * @brief Ed25519 signature key pair
 */
struct SignatureKeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/// Ed25519 public key
using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;

/// Symmetric chunk key
using ChunkKey = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES>;

/// Per-chunk nonce
using ChunkNonce = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES>;

/**
 * @brief MeshCrypto - Cryptographic primitives for the mesh
 *
 * Thread-safe cryptographic primitives using libsodium.
 * All methods are static and stateless.
 */
class MeshCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair
     */
    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Generate a random symmetric chunk key
     */
    static ChunkKey generate_chunk_key();

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Detached signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 detached signature
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    // ========================================================================
    // Encryption (ChaCha20-Poly1305 AEAD)
    // ========================================================================

    /**
     * @brief Encrypt with ChaCha20-Poly1305
     * @param plaintext Data to encrypt
     * @param key Symmetric key
     * @param nonce Unique nonce (12 bytes) - must never be reused with same key
     * @return Ciphertext with authentication tag appended
     */
    static std::optional<std::vector<uint8_t>> encrypt(
        const std::vector<uint8_t>& plaintext,
        const ChunkKey& key,
        const ChunkNonce& nonce
    );

    /**
     * @brief Decrypt with ChaCha20-Poly1305
     * @return Decrypted plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const ChunkKey& key,
        const ChunkNonce& nonce
    );

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 digest
     */
    static std::array<uint8_t, crypto_hash_sha256_BYTES> sha256(const std::vector<uint8_t>& data);

    /**
     * @brief SHA-256 digest as lowercase hex
     */
    static std::string sha256_hex(const std::vector<uint8_t>& data);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random nonce
     */
    static ChunkNonce generate_nonce();

    /**
     * @brief Generate cryptographically secure random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Decode a hex Ed25519 public key
     * @return Key, or std::nullopt if not 32 bytes of valid hex
     */
    static std::optional<PublicKey> public_key_from_hex(const std::string& hex);

    /**
     * @brief Securely zero memory holding key material
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace nightjar
