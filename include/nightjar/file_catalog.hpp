/**
 * @file file_catalog.hpp
 * @brief Read-only view of file metadata owned by the replicated document layer
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "nightjar/chunk_codec.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <mutex>

namespace nightjar {

/**
 * @brief FileCatalog - source of file records for a storage scope
 *
 * The mesh never mutates file records; it only reads them to drive
 * downloads and seeding.
 */
class FileCatalog {
public:
    virtual ~FileCatalog() = default;

    /**
     * @brief All file records of a scope, including trashed ones
     */
    virtual std::vector<FileRecord> list_files(const std::string& scope_id) const = 0;

    virtual std::optional<FileRecord> get_file(const std::string& file_id) const = 0;
};

/**
 * @brief In-process catalog fed by the embedding application
 */
class InMemoryFileCatalog : public FileCatalog {
public:
    InMemoryFileCatalog() = default;

    std::vector<FileRecord> list_files(const std::string& scope_id) const override;
    std::optional<FileRecord> get_file(const std::string& file_id) const override;

    /**
     * @brief Insert or replace a record in a scope
     */
    void put_file(const std::string& scope_id, const FileRecord& record);

    /**
     * @brief Soft-delete (trash) a record
     * @return false if unknown
     */
    bool mark_deleted(const std::string& file_id, uint64_t deleted_at);

    /**
     * @brief Drop a record entirely (permanent deletion)
     */
    bool remove_file(const std::string& file_id);

private:
    struct Entry {
        std::string scope_id;
        FileRecord record;
    };

    std::map<std::string, Entry> files_;   ///< file_id -> entry
    mutable std::mutex files_mutex_;
};

} // namespace nightjar
