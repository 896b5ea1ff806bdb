/**
 * @file chunk_codec.cpp
 * @brief Implementation of file chunking and chunk encryption
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/chunk_codec.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>
#include <set>

namespace nightjar {

using utilities::log_warn;

// ============================================================================
// Splitting and Hashing
// ============================================================================

std::vector<std::vector<uint8_t>> ChunkCodec::split(
    const std::vector<uint8_t>& data,
    size_t chunk_size
) {
    std::vector<std::vector<uint8_t>> chunks;
    if (data.empty() || chunk_size == 0) {
        return chunks;
    }

    chunks.reserve(chunk_count_for(data.size(), chunk_size));

    for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
        size_t end = std::min(offset + chunk_size, data.size());
        chunks.emplace_back(data.begin() + offset, data.begin() + end);
    }

    return chunks;
}

uint32_t ChunkCodec::chunk_count_for(uint64_t size_bytes, size_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>((size_bytes + chunk_size - 1) / chunk_size);
}

std::string ChunkCodec::hash(const std::vector<uint8_t>& chunk) {
    return MeshCrypto::sha256_hex(chunk);
}

std::string ChunkCodec::compute_file_hash(const std::vector<std::string>& chunk_hashes) {
    std::string joined;
    for (const auto& h : chunk_hashes) {
        joined += h;
    }
    return MeshCrypto::sha256_hex(std::vector<uint8_t>(joined.begin(), joined.end()));
}

// ============================================================================
// Encryption
// ============================================================================

std::optional<EncryptedChunk> ChunkCodec::encrypt(
    const std::vector<uint8_t>& chunk,
    const ChunkKey& key
) {
    ChunkNonce nonce = MeshCrypto::generate_nonce();

    auto ciphertext = MeshCrypto::encrypt(chunk, key, nonce);
    if (!ciphertext) {
        return std::nullopt;
    }

    EncryptedChunk result;
    result.ciphertext = std::move(*ciphertext);
    result.nonce.assign(nonce.begin(), nonce.end());
    return result;
}

std::optional<std::vector<uint8_t>> ChunkCodec::decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& nonce,
    const ChunkKey& key
) {
    if (nonce.size() != config::CHUNK_NONCE_SIZE) {
        return std::nullopt;
    }

    ChunkNonce nonce_array;
    std::copy(nonce.begin(), nonce.end(), nonce_array.begin());

    return MeshCrypto::decrypt(ciphertext, key, nonce_array);
}

// ============================================================================
// Reassembly
// ============================================================================

ReassemblyResult ChunkCodec::reassemble(
    std::vector<DecryptedChunk> chunks,
    const std::vector<std::string>& expected_hashes,
    uint64_t expected_size
) {
    ReassemblyResult result;

    std::stable_sort(chunks.begin(), chunks.end(),
        [](const DecryptedChunk& a, const DecryptedChunk& b) { return a.index < b.index; });

    std::set<uint32_t> seen;
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.data.size();
    }
    result.data.reserve(static_cast<size_t>(total));

    for (const auto& chunk : chunks) {
        if (!seen.insert(chunk.index).second) {
            result.errors.push_back({chunk.index, "duplicate chunk"});
            continue;
        }

        if (chunk.index >= expected_hashes.size()) {
            result.errors.push_back({chunk.index, "no expected hash for chunk"});
            continue;
        }

        if (hash(chunk.data) != expected_hashes[chunk.index]) {
            result.errors.push_back({chunk.index, "hash mismatch"});
        }

        result.data.insert(result.data.end(), chunk.data.begin(), chunk.data.end());
    }

    for (uint32_t i = 0; i < expected_hashes.size(); ++i) {
        if (seen.count(i) == 0) {
            result.errors.push_back({i, "missing chunk"});
        }
    }

    if (result.data.size() != expected_size) {
        log_warn("ChunkCodec: Reassembled " + std::to_string(result.data.size()) +
                 " bytes, expected " + std::to_string(expected_size));
    }

    result.valid = result.errors.empty() && result.data.size() == expected_size;
    return result;
}

// ============================================================================
// Whole-file Encoding
// ============================================================================

std::optional<EncodedFile> ChunkCodec::encode_file(
    const std::vector<uint8_t>& data,
    const ChunkKey& key,
    size_t chunk_size
) {
    if (data.size() > config::MAX_FILE_SIZE) {
        log_warn("ChunkCodec: File of " + utilities::format_file_size(data.size()) +
                 " exceeds maximum of " + utilities::format_file_size(config::MAX_FILE_SIZE));
        return std::nullopt;
    }

    EncodedFile encoded;
    encoded.size_bytes = data.size();

    for (const auto& chunk : split(data, chunk_size)) {
        encoded.chunk_hashes.push_back(hash(chunk));

        auto encrypted = encrypt(chunk, key);
        if (!encrypted) {
            return std::nullopt;
        }
        encoded.chunks.push_back(std::move(*encrypted));
    }

    encoded.file_hash = compute_file_hash(encoded.chunk_hashes);
    return encoded;
}

// ============================================================================
// Keys
// ============================================================================

ChunkKey ChunkCodec::generate_key() {
    return MeshCrypto::generate_chunk_key();
}

std::optional<ChunkKey> ChunkCodec::key_from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != config::CHUNK_KEY_SIZE) {
        return std::nullopt;
    }
    ChunkKey key;
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

} // namespace nightjar
