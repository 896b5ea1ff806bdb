/**
 * @file chunk_store.cpp
 * @brief Implementation of SQLite-backed chunk storage
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/chunk_store.hpp"
#include "nightjar/utilities.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace nightjar {

using utilities::log_error;

namespace {
    std::vector<uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + size);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ChunkStore::ChunkStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open chunk store database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize chunk store schema");
    }
}

ChunkStore::~ChunkStore() {
    if (db_connection_) {
        sqlite3_close(static_cast<sqlite3*>(db_connection_));
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool ChunkStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            encrypted BLOB NOT NULL,
            nonce BLOB NOT NULL,
            stored_at INTEGER NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
    )";

    int rc = sqlite3_exec(db, create_chunks_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            log_error("ChunkStore: Schema creation failed: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Chunk Operations
// ============================================================================

std::string ChunkStore::make_key(const std::string& file_id, uint32_t chunk_index) {
    return file_id + ":" + std::to_string(chunk_index);
}

bool ChunkStore::put(const std::string& file_id, uint32_t chunk_index, const StoredChunk& chunk) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    // Chunks are immutable: a second write of the same key is ignored
    const char* sql = R"(
        INSERT OR IGNORE INTO chunks (file_id, chunk_index, encrypted, nonce, stored_at)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("ChunkStore: Failed to prepare insert: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index));
    sqlite3_bind_blob(stmt, 3, chunk.encrypted.data(),
                      static_cast<int>(chunk.encrypted.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 4, chunk.nonce.data(),
                      static_cast<int>(chunk.nonce.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(utilities::current_time_ms()));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        log_error("ChunkStore: Failed to store " + make_key(file_id, chunk_index));
        return false;
    }
    return true;
}

std::optional<StoredChunk> ChunkStore::get(const std::string& file_id, uint32_t chunk_index) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT encrypted, nonce FROM chunks
        WHERE file_id = ? AND chunk_index = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index));

    std::optional<StoredChunk> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredChunk chunk;
        chunk.encrypted = column_blob(stmt, 0);
        chunk.nonce = column_blob(stmt, 1);
        result = std::move(chunk);
    }

    sqlite3_finalize(stmt);
    return result;
}

bool ChunkStore::has(const std::string& file_id, uint32_t chunk_index) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT 1 FROM chunks WHERE file_id = ? AND chunk_index = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index));

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

bool ChunkStore::remove(const std::string& file_id, uint32_t chunk_index) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "DELETE FROM chunks WHERE file_id = ? AND chunk_index = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

size_t ChunkStore::remove_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "DELETE FROM chunks WHERE file_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_changes(db));
}

std::vector<uint32_t> ChunkStore::list_indices(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<uint32_t> indices;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT chunk_index FROM chunks
        WHERE file_id = ?
        ORDER BY chunk_index ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return indices;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        indices.push_back(static_cast<uint32_t>(sqlite3_column_int64(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return indices;
}

size_t ChunkStore::count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM chunks", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return total;
}

} // namespace nightjar
