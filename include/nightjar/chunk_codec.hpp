/**
 * @file chunk_codec.hpp
 * @brief File chunking, chunk encryption and verified reassembly
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Pure functions with no network or persistent state.
 */

#pragma once

#include "nightjar/mesh_config.hpp"
#include "nightjar/mesh_crypto.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace nightjar {

/**
 * @brief Ciphertext and nonce of one chunk
 */
struct EncryptedChunk {
    std::vector<uint8_t> ciphertext;    ///< ChaCha20-Poly1305 output (tag appended)
    std::vector<uint8_t> nonce;         ///< Fresh random nonce
};

/**
 * @brief Decrypted chunk awaiting reassembly
 */
struct DecryptedChunk {
    uint32_t index = 0;
    std::vector<uint8_t> data;
};

/**
 * @brief Problem found with one chunk during reassembly
 */
struct ChunkError {
    uint32_t index = 0;
    std::string reason;
};

struct ReassemblyResult {
    std::vector<uint8_t> data;
    bool valid = false;                 ///< No errors and size matches
    std::vector<ChunkError> errors;
};

/**
 * @brief Output of encoding a whole file
 */
struct EncodedFile {
    std::vector<EncryptedChunk> chunks;
    std::vector<std::string> chunk_hashes;  ///< Hex SHA-256 of each plaintext chunk
    std::string file_hash;                  ///< SHA-256 over the concatenated chunk hashes
    uint64_t size_bytes = 0;
};

/**
 * @brief File metadata record owned by the external replicated layer
 */
struct FileRecord {
    std::string id;
    std::string name;
    uint32_t chunk_count = 0;
    std::vector<std::string> chunk_hashes;
    std::string file_hash;
    uint64_t size_bytes = 0;
    std::optional<uint64_t> deleted_at;     ///< Set when trashed (ms since epoch)

    bool is_deleted() const { return deleted_at.has_value(); }
};

/**
 * @brief ChunkCodec - split / hash / encrypt / decrypt / reassemble
 */
class ChunkCodec {
public:
    /**
     * @brief Split data into fixed-size chunks
     *
     * The final chunk may be shorter. Empty input yields zero chunks.
     */
    static std::vector<std::vector<uint8_t>> split(
        const std::vector<uint8_t>& data,
        size_t chunk_size = config::CHUNK_SIZE
    );

    /**
     * @brief Number of chunks a file of the given size splits into
     */
    static uint32_t chunk_count_for(uint64_t size_bytes, size_t chunk_size = config::CHUNK_SIZE);

    /**
     * @brief Hex SHA-256 of a plaintext chunk
     */
    static std::string hash(const std::vector<uint8_t>& chunk);

    /**
     * @brief Encrypt a chunk with a fresh random nonce
     * @return Ciphertext and nonce, or std::nullopt if encryption fails
     */
    static std::optional<EncryptedChunk> encrypt(
        const std::vector<uint8_t>& chunk,
        const ChunkKey& key
    );

    /**
     * @brief Decrypt a chunk
     * @return Plaintext, or std::nullopt on authentication failure or bad nonce length
     */
    static std::optional<std::vector<uint8_t>> decrypt(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& nonce,
        const ChunkKey& key
    );

    /**
     * @brief Sort, verify and concatenate decrypted chunks
     *
     * Every chunk is checked against expected_hashes[index]; a mismatch is
     * recorded and verification continues with the remaining chunks.
     */
    static ReassemblyResult reassemble(
        std::vector<DecryptedChunk> chunks,
        const std::vector<std::string>& expected_hashes,
        uint64_t expected_size
    );

    /**
     * @brief Split, hash and encrypt an entire file
     * @return Encoded file, or std::nullopt if above MAX_FILE_SIZE or encryption fails
     */
    static std::optional<EncodedFile> encode_file(
        const std::vector<uint8_t>& data,
        const ChunkKey& key,
        size_t chunk_size = config::CHUNK_SIZE
    );

    /**
     * @brief File hash over ordered chunk hashes
     */
    static std::string compute_file_hash(const std::vector<std::string>& chunk_hashes);

    static ChunkKey generate_key();

    /**
     * @brief Build a key from raw bytes
     * @return Key, or std::nullopt unless exactly CHUNK_KEY_SIZE bytes
     */
    static std::optional<ChunkKey> key_from_bytes(const std::vector<uint8_t>& bytes);
};

} // namespace nightjar
