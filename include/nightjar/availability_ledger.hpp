/**
 * @file availability_ledger.hpp
 * @brief Chunk availability ledger (which peers hold which chunk)
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Maps fileId:chunkIndex to the set of holder public keys. Entries are
 * written by announce (self after store), by requesters after a fetch and
 * by seeding after a successful push. Holder sets are small and
 * self-correct through periodic re-announcement, so last-writer-wins on
 * lastUpdated is sufficient for whole-set replacement.
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <mutex>
#include <cstdint>

namespace nightjar {

/**
 * @brief Holder set of one chunk
 */
struct AvailabilityEntry {
    std::string file_id;
    uint32_t chunk_index = 0;
    std::set<std::string> holders;      ///< Holder public keys (hex)
    uint64_t last_updated = 0;          ///< ms since epoch
};

/**
 * @brief AvailabilityLedger - SQLite-backed holder tracking
 *
 * Thread-safe; one instance may be shared by several local components.
 */
class AvailabilityLedger {
public:
    /**
     * @brief Open or create the ledger database
     * @param database_path SQLite file path (":memory:" for in-memory)
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit AvailabilityLedger(const std::string& database_path);

    ~AvailabilityLedger();

    // Disable copy and move
    AvailabilityLedger(const AvailabilityLedger&) = delete;
    AvailabilityLedger& operator=(const AvailabilityLedger&) = delete;
    AvailabilityLedger(AvailabilityLedger&&) = delete;
    AvailabilityLedger& operator=(AvailabilityLedger&&) = delete;

    // ========================================================================
    // Holder Updates
    // ========================================================================

    /**
     * @brief Replace the holder set (idempotent upsert)
     *
     * An update whose last_updated is older than the stored entry is ignored.
     * @param last_updated Update time in ms; 0 means now
     * @return true if the stored entry now reflects this update
     */
    bool set_holders(
        const std::string& file_id,
        uint32_t chunk_index,
        const std::set<std::string>& holders,
        uint64_t last_updated = 0
    );

    /**
     * @brief Add one holder, merging with the current set
     */
    bool add_holder(const std::string& file_id, uint32_t chunk_index, const std::string& holder);

    /**
     * @brief Drop one holder whose copy was discarded
     * @return true if the holder was listed
     */
    bool remove_holder(const std::string& file_id, uint32_t chunk_index, const std::string& holder);

    /**
     * @brief Delete every entry of a file (permanent deletion only)
     * @return Number of entries removed
     */
    size_t remove_file(const std::string& file_id);

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Holders of a chunk, empty if unknown
     */
    std::set<std::string> get_holders(const std::string& file_id, uint32_t chunk_index) const;

    std::optional<AvailabilityEntry> get_entry(const std::string& file_id, uint32_t chunk_index) const;

    std::vector<AvailabilityEntry> get_file_entries(const std::string& file_id) const;

    size_t count_holders(const std::string& file_id, uint32_t chunk_index) const;

private:
    std::string database_path_;

    /// SQLite database handle
    void* db_connection_;

    mutable std::mutex db_mutex_;

    bool initialize_database();

    // Callers hold db_mutex_
    std::optional<AvailabilityEntry> load_entry(const std::string& file_id, uint32_t chunk_index) const;
    bool store_entry(const AvailabilityEntry& entry);
};

} // namespace nightjar
