/**
 * @file chunk_store.hpp
 * @brief Local persistent store of encrypted chunks
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Chunks are keyed by (fileId, chunkIndex) and hold ciphertext + nonce.
 * A chunk is immutable once written.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>

namespace nightjar {

/**
 * @brief Stored chunk value
 */
struct StoredChunk {
    std::vector<uint8_t> encrypted;     ///< Ciphertext
    std::vector<uint8_t> nonce;         ///< Nonce used for encryption

    /// Bytes counted for transfer statistics
    uint64_t wire_size() const { return encrypted.size() + nonce.size(); }
};

/**
 * @brief ChunkStore - SQLite-backed chunk storage
 *
 * Thread-safe: all operations serialize on one database mutex.
 */
class ChunkStore {
public:
    /**
     * @brief Open or create the chunk database
     * @param database_path SQLite file path (":memory:" for an in-memory store)
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit ChunkStore(const std::string& database_path);

    ~ChunkStore();

    // Disable copy and move
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;
    ChunkStore(ChunkStore&&) = delete;
    ChunkStore& operator=(ChunkStore&&) = delete;

    /**
     * @brief Store a chunk
     *
     * Writing an already present key leaves the original value untouched.
     * @return true if the chunk is present after the call
     */
    bool put(const std::string& file_id, uint32_t chunk_index, const StoredChunk& chunk);

    /**
     * @brief Fetch a chunk
     * @return Chunk, or std::nullopt if absent
     */
    std::optional<StoredChunk> get(const std::string& file_id, uint32_t chunk_index) const;

    bool has(const std::string& file_id, uint32_t chunk_index) const;

    bool remove(const std::string& file_id, uint32_t chunk_index);

    /**
     * @brief Delete every chunk of a file
     * @return Number of chunks removed
     */
    size_t remove_file(const std::string& file_id);

    /**
     * @brief Indices of locally held chunks for a file, ascending
     */
    std::vector<uint32_t> list_indices(const std::string& file_id) const;

    /**
     * @brief Total number of stored chunks
     */
    size_t count() const;

    /**
     * @brief Storage key "fileId:chunkIndex"
     */
    static std::string make_key(const std::string& file_id, uint32_t chunk_index);

private:
    std::string database_path_;

    /// SQLite database handle (opaque to keep sqlite3.h out of the header)
    void* db_connection_;

    mutable std::mutex db_mutex_;

    bool initialize_database();
};

} // namespace nightjar
