/**
 * @file mesh_crypto.cpp
 * @brief Implementation of cryptographic operations for Nightjar peers
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: identity assertions
 * - ChaCha20-Poly1305 (IETF): chunk encryption
 * - SHA-256: chunk integrity hashes
 */

#include "nightjar/mesh_crypto.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace nightjar {

// ============================================================================
// Initialization
// ============================================================================

bool MeshCrypto::initialize() {
    // safe to call multiple times
    return sodium_init() >= 0;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair MeshCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;
    crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

ChunkKey MeshCrypto::generate_chunk_key() {
    ChunkKey key;
    crypto_aead_chacha20poly1305_ietf_keygen(key.data());
    return key;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> MeshCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len = 0;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);
    return signature;
}

bool MeshCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

// ============================================================================
// Encryption (ChaCha20-Poly1305 AEAD)
// ============================================================================

std::optional<std::vector<uint8_t>> MeshCrypto::encrypt(
    const std::vector<uint8_t>& plaintext,
    const ChunkKey& key,
    const ChunkNonce& nonce
) {
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long ciphertext_len = 0;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        nullptr,  // No additional data
        0,
        nullptr,  // No secret nonce
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::optional<std::vector<uint8_t>> MeshCrypto::decrypt(
    const std::vector<uint8_t>& ciphertext,
    const ChunkKey& key,
    const ChunkNonce& nonce
) {
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long plaintext_len = 0;

    // Fails if the tag doesn't match (wrong key, wrong nonce or tampering)
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,
        ciphertext.data(),
        ciphertext.size(),
        nullptr,
        0,
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    plaintext.resize(plaintext_len);
    return plaintext;
}

// ============================================================================
// Hashing
// ============================================================================

std::array<uint8_t, crypto_hash_sha256_BYTES> MeshCrypto::sha256(const std::vector<uint8_t>& data) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::string MeshCrypto::sha256_hex(const std::vector<uint8_t>& data) {
    auto digest = sha256(data);
    return bytes_to_hex(std::vector<uint8_t>(digest.begin(), digest.end()));
}

// ============================================================================
// Utility Functions
// ============================================================================

ChunkNonce MeshCrypto::generate_nonce() {
    ChunkNonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::vector<uint8_t> MeshCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

std::string MeshCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string MeshCrypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> MeshCrypto::hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }

    return bytes;
}

std::optional<std::vector<uint8_t>> MeshCrypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length() + 1);

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    // Reject trailing garbage
    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::optional<PublicKey> MeshCrypto::public_key_from_hex(const std::string& hex) {
    auto bytes = hex_to_bytes(hex);
    if (!bytes || bytes->size() != crypto_sign_PUBLICKEYBYTES) {
        return std::nullopt;
    }

    PublicKey key;
    std::copy(bytes->begin(), bytes->end(), key.begin());
    return key;
}

void MeshCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace nightjar
