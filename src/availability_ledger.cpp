/**
 * @file availability_ledger.cpp
 * @brief Implementation of the chunk availability ledger
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/availability_ledger.hpp"
#include "nightjar/utilities.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace nightjar {

using utilities::log_error;
using utilities::log_warn;

namespace {
    std::string holders_to_json(const std::set<std::string>& holders) {
        json j = json::array();
        for (const auto& h : holders) {
            j.push_back(h);
        }
        return j.dump();
    }

    std::set<std::string> holders_from_json(const std::string& text) {
        std::set<std::string> holders;
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_array()) {
            log_warn("AvailabilityLedger: Ignoring corrupt holder list");
            return holders;
        }
        for (const auto& h : j) {
            if (h.is_string()) {
                holders.insert(h.get<std::string>());
            }
        }
        return holders;
    }

    AvailabilityEntry entry_from_row(sqlite3_stmt* stmt) {
        AvailabilityEntry entry;
        entry.file_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        entry.chunk_index = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
        entry.holders = holders_from_json(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
        entry.last_updated = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        return entry;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

AvailabilityLedger::AvailabilityLedger(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open availability ledger database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize availability ledger schema");
    }
}

AvailabilityLedger::~AvailabilityLedger() {
    if (db_connection_) {
        sqlite3_close(static_cast<sqlite3*>(db_connection_));
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool AvailabilityLedger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_availability_table = R"(
        CREATE TABLE IF NOT EXISTS chunk_availability (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            holders TEXT NOT NULL,
            last_updated INTEGER NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
        CREATE INDEX IF NOT EXISTS idx_availability_file ON chunk_availability(file_id);
    )";

    int rc = sqlite3_exec(db, create_availability_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            log_error("AvailabilityLedger: Schema creation failed: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Internal Row Access
// ============================================================================

std::optional<AvailabilityEntry> AvailabilityLedger::load_entry(
    const std::string& file_id,
    uint32_t chunk_index
) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT file_id, chunk_index, holders, last_updated
        FROM chunk_availability
        WHERE file_id = ? AND chunk_index = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_index));

    std::optional<AvailabilityEntry> entry;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        entry = entry_from_row(stmt);
    }

    sqlite3_finalize(stmt);
    return entry;
}

bool AvailabilityLedger::store_entry(const AvailabilityEntry& entry) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO chunk_availability (file_id, chunk_index, holders, last_updated)
        VALUES (?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("AvailabilityLedger: Failed to prepare upsert: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    std::string holders = holders_to_json(entry.holders);

    sqlite3_bind_text(stmt, 1, entry.file_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(entry.chunk_index));
    sqlite3_bind_text(stmt, 3, holders.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.last_updated));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

// ============================================================================
// Holder Updates
// ============================================================================

bool AvailabilityLedger::set_holders(
    const std::string& file_id,
    uint32_t chunk_index,
    const std::set<std::string>& holders,
    uint64_t last_updated
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    uint64_t timestamp = last_updated != 0 ? last_updated : utilities::current_time_ms();

    auto existing = load_entry(file_id, chunk_index);
    if (existing && existing->last_updated > timestamp) {
        return false;
    }

    AvailabilityEntry entry;
    entry.file_id = file_id;
    entry.chunk_index = chunk_index;
    entry.holders = holders;
    entry.last_updated = timestamp;

    return store_entry(entry);
}

bool AvailabilityLedger::add_holder(
    const std::string& file_id,
    uint32_t chunk_index,
    const std::string& holder
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto entry = load_entry(file_id, chunk_index);
    if (!entry) {
        entry = AvailabilityEntry{file_id, chunk_index, {}, 0};
    } else if (entry->holders.count(holder) > 0) {
        return true;
    }

    entry->holders.insert(holder);
    entry->last_updated = std::max(utilities::current_time_ms(), entry->last_updated + 1);

    return store_entry(*entry);
}

bool AvailabilityLedger::remove_holder(
    const std::string& file_id,
    uint32_t chunk_index,
    const std::string& holder
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto entry = load_entry(file_id, chunk_index);
    if (!entry || entry->holders.erase(holder) == 0) {
        return false;
    }

    entry->last_updated = std::max(utilities::current_time_ms(), entry->last_updated + 1);
    return store_entry(*entry);
}

size_t AvailabilityLedger::remove_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM chunk_availability WHERE file_id = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
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

// ============================================================================
// Queries
// ============================================================================

std::set<std::string> AvailabilityLedger::get_holders(
    const std::string& file_id,
    uint32_t chunk_index
) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto entry = load_entry(file_id, chunk_index);
    if (!entry) {
        return {};
    }
    return entry->holders;
}

std::optional<AvailabilityEntry> AvailabilityLedger::get_entry(
    const std::string& file_id,
    uint32_t chunk_index
) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return load_entry(file_id, chunk_index);
}

std::vector<AvailabilityEntry> AvailabilityLedger::get_file_entries(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<AvailabilityEntry> entries;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT file_id, chunk_index, holders, last_updated
        FROM chunk_availability
        WHERE file_id = ?
        ORDER BY chunk_index ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return entries;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        entries.push_back(entry_from_row(stmt));
    }

    sqlite3_finalize(stmt);
    return entries;
}

size_t AvailabilityLedger::count_holders(const std::string& file_id, uint32_t chunk_index) const {
    return get_holders(file_id, chunk_index).size();
}

} // namespace nightjar
