/**
 * @file file_catalog.cpp
 * @brief In-process file catalog
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/file_catalog.hpp"

namespace nightjar {

std::vector<FileRecord> InMemoryFileCatalog::list_files(const std::string& scope_id) const {
    std::lock_guard<std::mutex> lock(files_mutex_);

    std::vector<FileRecord> records;
    for (const auto& [file_id, entry] : files_) {
        if (entry.scope_id == scope_id) {
            records.push_back(entry.record);
        }
    }
    return records;
}

std::optional<FileRecord> InMemoryFileCatalog::get_file(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(files_mutex_);

    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

void InMemoryFileCatalog::put_file(const std::string& scope_id, const FileRecord& record) {
    std::lock_guard<std::mutex> lock(files_mutex_);
    files_[record.id] = Entry{scope_id, record};
}

bool InMemoryFileCatalog::mark_deleted(const std::string& file_id, uint64_t deleted_at) {
    std::lock_guard<std::mutex> lock(files_mutex_);

    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return false;
    }
    it->second.record.deleted_at = deleted_at;
    return true;
}

bool InMemoryFileCatalog::remove_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(files_mutex_);
    return files_.erase(file_id) > 0;
}

} // namespace nightjar
