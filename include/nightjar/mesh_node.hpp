/**
 * @file mesh_node.hpp
 * @brief Mesh node orchestrator - wires identity, swarm, storage and replication
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * MeshNode coordinates all subsystems of one peer:
 * - Peer identity (persistent Ed25519 key)
 * - Swarm membership and topic discovery
 * - Chunk store and availability ledger (SQLite)
 * - Chunk transfer (request / response / seed)
 * - Background seeding toward each workspace's redundancy target
 */

#pragma once

#include "nightjar/peer_identity.hpp"
#include "nightjar/swarm_manager.hpp"
#include "nightjar/topic_discovery.hpp"
#include "nightjar/chunk_codec.hpp"
#include "nightjar/chunk_store.hpp"
#include "nightjar/availability_ledger.hpp"
#include "nightjar/file_catalog.hpp"
#include "nightjar/chunk_transfer.hpp"
#include "nightjar/seeding_maintainer.hpp"
#include "nightjar/share_link.hpp"
#include "nightjar/mesh_config.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>

namespace nightjar {

struct MeshNodeOptions {
    std::filesystem::path data_dir;             ///< Empty uses config::get_data_directory()
    std::string display_name = "Nightjar";
    SwarmOptions swarm;
    SeedingOptions seeding;
    std::chrono::milliseconds request_timeout = config::CHUNK_REQUEST_TIMEOUT;
    bool enable_seeding = true;
};

/**
 * @brief Result of adding a local file to a workspace
 */
struct StoredFile {
    FileRecord record;
    ChunkKey key;
};

/**
 * @brief MeshNode statistics
 */
struct MeshNodeStats {
    size_t connected_peers = 0;
    size_t workspaces = 0;
    size_t stored_chunks = 0;
    TransferStats transfer;
    SeedingStats seeding;
    uint64_t uptime_seconds = 0;
};

/**
 * @brief MeshNode - one peer of the storage mesh
 *
 * Workspaces are the replication scopes: joining one joins its swarm topic
 * and registers it with the seeding maintainer.
 */
class MeshNode : public SwarmObserver {
public:
    /**
     * @param name Key file name for the node identity (validated identifier)
     * @param discovery Topic discovery shared with the swarm
     */
    MeshNode(
        const std::string& name,
        std::shared_ptr<TopicDiscovery> discovery,
        MeshNodeOptions options = MeshNodeOptions()
    );

    ~MeshNode() override;

    // Disable copy and move
    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;
    MeshNode(MeshNode&&) = delete;
    MeshNode& operator=(MeshNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Load identity, open storage, start swarm and seeding
     * @return true if started successfully, false otherwise
     */
    bool start();

    void stop();

    bool is_running() const;

    /**
     * @brief Public key hex (empty before start)
     */
    std::string get_peer_id() const;

    uint16_t get_port() const;

    // ========================================================================
    // Workspaces
    // ========================================================================

    /**
     * @brief Join a workspace's swarm topic and seed its files
     */
    bool join_workspace(
        const std::string& workspace_id,
        size_t redundancy_target = config::DEFAULT_REDUNDANCY_TARGET
    );

    bool leave_workspace(const std::string& workspace_id);

    std::vector<std::string> get_workspaces() const;

    /**
     * @brief Authenticated peers currently connected
     */
    std::vector<std::string> get_connected_peers() const;

    /**
     * @brief Dial a peer directly (bootstrap address, LAN peer)
     */
    bool connect_to_peer(const std::string& host, uint16_t port);

    // ========================================================================
    // Files
    // ========================================================================

    /**
     * @brief Encrypt, store and announce a file under a workspace
     * @return Record and key, or std::nullopt on failure
     */
    std::optional<StoredFile> add_file(
        const std::string& workspace_id,
        const std::string& name,
        const std::vector<uint8_t>& data
    );

    std::optional<StoredFile> add_file_from_path(
        const std::string& workspace_id,
        const std::filesystem::path& path
    );

    /**
     * @brief Record metadata for a file learned from another peer
     */
    void register_file(const std::string& workspace_id, const FileRecord& record);

    /**
     * @brief Fetch, decrypt and verify a registered file
     */
    DownloadResult fetch_file(const std::string& file_id, const ChunkKey& key);

    /**
     * @brief Move a file to the trash; trashed files are no longer seeded
     */
    bool trash_file(const std::string& file_id);

    /**
     * @brief Permanently delete a file: its record, local chunks and ledger entries
     * @return false if not started or the file is unknown
     */
    bool delete_file(const std::string& file_id);

    // ========================================================================
    // Sharing
    // ========================================================================

    /**
     * @brief Key-embedding workspace link carrying this node as bootstrap peer
     */
    std::optional<std::string> share_workspace(
        const std::string& workspace_id,
        const ChunkKey& key,
        Permission permission = Permission::EDITOR
    ) const;

    /**
     * @brief Join the workspace named by a link and dial its embedded address
     * @return Parsed link, or std::nullopt if invalid or joining failed
     */
    std::optional<ShareLink> join_from_link(const std::string& link);

    // ========================================================================
    // Replication
    // ========================================================================

    bool trigger_seeding();

    /**
     * @brief Run one seeding pass over every workspace now
     * @return Number of workspaces processed
     */
    size_t seed_now();

    // ========================================================================
    // Statistics and Monitoring
    // ========================================================================

    MeshNodeStats get_stats() const;

    void print_status() const;

    std::shared_ptr<InMemoryFileCatalog> get_catalog() const { return catalog_; }
    std::shared_ptr<ChunkStore> get_store() const { return store_; }
    std::shared_ptr<AvailabilityLedger> get_ledger() const { return ledger_; }
    std::shared_ptr<ChunkTransfer> get_transfer() const { return transfer_; }

    // ========================================================================
    // SwarmObserver
    // ========================================================================

    void on_peer_joined(const std::string& topic, const RemotePeer& peer) override;
    void on_peer_left(const std::string& topic, const std::string& peer_id) override;
    void on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) override;

private:
    std::string name_;
    std::shared_ptr<TopicDiscovery> discovery_;
    MeshNodeOptions options_;
    std::filesystem::path data_dir_;

    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;

    std::shared_ptr<const PeerIdentity> identity_;
    std::shared_ptr<SwarmManager> swarm_;
    std::shared_ptr<ChunkStore> store_;
    std::shared_ptr<AvailabilityLedger> ledger_;
    std::shared_ptr<InMemoryFileCatalog> catalog_;
    std::shared_ptr<ChunkTransfer> transfer_;
    std::unique_ptr<SeedingMaintainer> seeding_;

    struct Workspace {
        std::string topic;
        size_t redundancy_target = config::DEFAULT_REDUNDANCY_TARGET;
    };

    std::map<std::string, Workspace> workspaces_;   ///< workspace id -> topic and target
    mutable std::mutex workspaces_mutex_;

    bool initialize_identity();
    bool initialize_storage();
};

} // namespace nightjar
