/**
 * @file mesh_node.cpp
 * @brief Implementation of the mesh node orchestrator
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/mesh_node.hpp"
#include "nightjar/mesh_crypto.hpp"
#include "nightjar/utilities.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace nightjar {

using namespace nightjar::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

MeshNode::MeshNode(
    const std::string& name,
    std::shared_ptr<TopicDiscovery> discovery,
    MeshNodeOptions options
)
    : name_(name)
    , discovery_(std::move(discovery))
    , options_(std::move(options))
    , running_(false)
    , catalog_(std::make_shared<InMemoryFileCatalog>())
{
    if (!config::validate_identifier(name_)) {
        throw std::invalid_argument("Invalid node name: " + name_);
    }
    if (!discovery_) {
        throw std::invalid_argument("MeshNode: topic discovery is required");
    }

    data_dir_ = options_.data_dir.empty() ? config::get_data_directory() : options_.data_dir;
    log_info("MeshNode: Initializing node '" + name_ + "'");
}

MeshNode::~MeshNode() {
    if (running_) {
        log_warn("MeshNode: Destructor called while still running, forcing stop");
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool MeshNode::start() {
    if (running_) {
        log_warn("MeshNode: Already running");
        return false;
    }

    log_info("MeshNode: Starting...");

    try {
        if (!initialize_identity()) {
            log_error("MeshNode: Failed to initialize identity");
            return false;
        }

        if (!initialize_storage()) {
            log_error("MeshNode: Failed to open storage");
            return false;
        }

        // Transfer handlers must exist before the swarm dispatches anything
        swarm_ = std::make_shared<SwarmManager>(identity_, discovery_, options_.swarm);
        transfer_ = std::make_shared<ChunkTransfer>(store_, ledger_, swarm_, options_.request_timeout);
        seeding_ = std::make_unique<SeedingMaintainer>(
            catalog_, store_, ledger_, swarm_, transfer_, options_.seeding);

        swarm_->add_observer(this);
        if (!swarm_->start()) {
            log_error("MeshNode: Failed to start swarm");
            swarm_->remove_observer(this);
            return false;
        }

        {
            // Workspaces joined before start
            std::lock_guard<std::mutex> lock(workspaces_mutex_);
            for (const auto& [workspace_id, workspace] : workspaces_) {
                swarm_->join_topic(workspace.topic);
                seeding_->add_scope(workspace_id, workspace.redundancy_target);
            }
        }

        if (options_.enable_seeding) {
            seeding_->start();
        }

        running_ = true;
        start_time_ = std::chrono::steady_clock::now();

        log_info("MeshNode: Started as " + short_id(identity_->get_public_key_hex()) +
                 " on port " + std::to_string(swarm_->get_listen_port()));
        return true;

    } catch (const std::exception& e) {
        log_error("MeshNode: Exception during start: " + std::string(e.what()));
        if (swarm_) {
            swarm_->remove_observer(this);
            swarm_->stop();
        }
        return false;
    }
}

void MeshNode::stop() {
    if (!running_) {
        return;
    }

    log_info("MeshNode: Stopping...");
    running_ = false;

    if (seeding_) {
        seeding_->stop();
    }

    if (swarm_) {
        swarm_->remove_observer(this);
        swarm_->stop();
    }

    log_info("MeshNode: Stopped");
}

bool MeshNode::is_running() const {
    return running_;
}

std::string MeshNode::get_peer_id() const {
    return identity_ ? identity_->get_public_key_hex() : std::string();
}

uint16_t MeshNode::get_port() const {
    return swarm_ ? swarm_->get_listen_port() : 0;
}

bool MeshNode::initialize_identity() {
    auto identity = PeerIdentity::load_or_create(name_, data_dir_ / "keys", options_.display_name);
    if (!identity) {
        return false;
    }
    identity_ = std::make_shared<const PeerIdentity>(std::move(*identity));
    return true;
}

bool MeshNode::initialize_storage() {
    std::error_code ec;
    std::filesystem::create_directories(data_dir_ / "db", ec);
    if (ec) {
        log_error("MeshNode: Cannot create " + (data_dir_ / "db").string() + ": " + ec.message());
        return false;
    }

    // ChunkStore and AvailabilityLedger throw if the database cannot be opened
    store_ = std::make_shared<ChunkStore>((data_dir_ / "db" / (name_ + "_chunks.db")).string());
    ledger_ = std::make_shared<AvailabilityLedger>((data_dir_ / "db" / (name_ + "_ledger.db")).string());
    return true;
}

// ============================================================================
// Workspaces
// ============================================================================

bool MeshNode::join_workspace(const std::string& workspace_id, size_t redundancy_target) {
    if (workspace_id.empty()) {
        return false;
    }

    std::string topic = share_link::workspace_topic(workspace_id);
    {
        std::lock_guard<std::mutex> lock(workspaces_mutex_);
        workspaces_[workspace_id] = Workspace{topic, redundancy_target};
    }

    if (!running_) {
        return true;
    }

    seeding_->add_scope(workspace_id, redundancy_target);
    if (!swarm_->join_topic(topic)) {
        log_warn("MeshNode: Could not join topic for workspace " + short_id(workspace_id));
        return false;
    }

    log_info("MeshNode: Joined workspace " + short_id(workspace_id) +
             " (target " + std::to_string(redundancy_target) + ")");
    return true;
}

bool MeshNode::leave_workspace(const std::string& workspace_id) {
    std::string topic;
    {
        std::lock_guard<std::mutex> lock(workspaces_mutex_);
        auto it = workspaces_.find(workspace_id);
        if (it == workspaces_.end()) {
            return false;
        }
        topic = it->second.topic;
        workspaces_.erase(it);
    }

    if (running_) {
        seeding_->remove_scope(workspace_id);
        swarm_->leave_topic(topic);
    }
    return true;
}

std::vector<std::string> MeshNode::get_workspaces() const {
    std::lock_guard<std::mutex> lock(workspaces_mutex_);

    std::vector<std::string> result;
    for (const auto& [workspace_id, workspace] : workspaces_) {
        result.push_back(workspace_id);
    }
    return result;
}

std::vector<std::string> MeshNode::get_connected_peers() const {
    return running_ ? swarm_->get_connected_peers() : std::vector<std::string>();
}

bool MeshNode::connect_to_peer(const std::string& host, uint16_t port) {
    if (!running_) {
        return false;
    }
    return swarm_->connect_to_peer(host, port);
}

// ============================================================================
// Files
// ============================================================================

std::optional<StoredFile> MeshNode::add_file(
    const std::string& workspace_id,
    const std::string& name,
    const std::vector<uint8_t>& data
) {
    if (!running_) {
        log_error("MeshNode: Cannot add file - not started");
        return std::nullopt;
    }

    ChunkKey key = ChunkCodec::generate_key();
    auto encoded = ChunkCodec::encode_file(data, key);
    if (!encoded) {
        log_error("MeshNode: Failed to encode " + name);
        return std::nullopt;
    }

    StoredFile stored;
    stored.key = key;
    stored.record.id = MeshCrypto::bytes_to_hex(MeshCrypto::generate_random_bytes(16));
    stored.record.name = name;
    stored.record.chunk_count = static_cast<uint32_t>(encoded->chunks.size());
    stored.record.chunk_hashes = encoded->chunk_hashes;
    stored.record.file_hash = encoded->file_hash;
    stored.record.size_bytes = encoded->size_bytes;

    if (!transfer_->store_and_announce(stored.record.id, *encoded)) {
        log_error("MeshNode: Failed to store chunks for " + name);
        store_->remove_file(stored.record.id);
        return std::nullopt;
    }

    catalog_->put_file(workspace_id, stored.record);

    log_info("MeshNode: Added " + name + " (" + format_file_size(stored.record.size_bytes) + ", " +
             std::to_string(stored.record.chunk_count) + " chunks) as " + short_id(stored.record.id));

    if (seeding_ && seeding_->is_running()) {
        seeding_->trigger_seeding();
    }
    return stored;
}

std::optional<StoredFile> MeshNode::add_file_from_path(
    const std::string& workspace_id,
    const std::filesystem::path& path
) {
    auto content = read_file_binary(path.string());
    if (!content) {
        log_error("MeshNode: Cannot read " + path.string());
        return std::nullopt;
    }
    return add_file(workspace_id, path.filename().string(), *content);
}

void MeshNode::register_file(const std::string& workspace_id, const FileRecord& record) {
    catalog_->put_file(workspace_id, record);
}

DownloadResult MeshNode::fetch_file(const std::string& file_id, const ChunkKey& key) {
    DownloadResult result;
    if (!running_) {
        log_error("MeshNode: Cannot fetch file - not started");
        return result;
    }

    auto record = catalog_->get_file(file_id);
    if (!record) {
        log_warn("MeshNode: Unknown file " + short_id(file_id));
        return result;
    }

    return transfer_->download_file(*record, key);
}

bool MeshNode::trash_file(const std::string& file_id) {
    return catalog_->mark_deleted(file_id, current_time_ms());
}

bool MeshNode::delete_file(const std::string& file_id) {
    if (!running_) {
        log_error("MeshNode: Cannot delete file - not started");
        return false;
    }

    if (!catalog_->remove_file(file_id)) {
        log_warn("MeshNode: Unknown file " + short_id(file_id));
        return false;
    }

    size_t chunks = store_->remove_file(file_id);
    size_t entries = ledger_->remove_file(file_id);

    log_info("MeshNode: Deleted " + short_id(file_id) + " (" + std::to_string(chunks) + " chunks, " +
             std::to_string(entries) + " ledger entries)");
    return true;
}

// ============================================================================
// Sharing
// ============================================================================

std::optional<std::string> MeshNode::share_workspace(
    const std::string& workspace_id,
    const ChunkKey& key,
    Permission permission
) const {
    if (!running_) {
        return std::nullopt;
    }

    ShareLinkOptions options;
    options.entity_type = EntityType::WORKSPACE;
    options.entity_id = workspace_id;
    options.permission = permission;
    options.has_password = false;
    options.encryption_key.assign(key.begin(), key.end());
    options.swarm_peers.push_back(identity_->get_public_key_hex());
    options.topic_hash = share_link::workspace_topic(workspace_id);
    options.direct_address = options_.swarm.advertise_host + ":" + std::to_string(swarm_->get_listen_port());

    return share_link::generate(options);
}

std::optional<ShareLink> MeshNode::join_from_link(const std::string& link) {
    auto parsed = share_link::parse(link);
    if (!parsed) {
        log_warn("MeshNode: Invalid share link");
        return std::nullopt;
    }

    if (!join_workspace(parsed->entity_id)) {
        return std::nullopt;
    }

    std::vector<std::string> addresses = parsed->bootstrap_peers;
    if (parsed->direct_address) {
        addresses.insert(addresses.begin(), *parsed->direct_address);
    }

    for (const auto& endpoint : BootstrapTopicDiscovery::parse_endpoints(addresses)) {
        if (!connect_to_peer(endpoint.host, endpoint.port)) {
            log_debug("MeshNode: Could not dial " + endpoint.host + ":" + std::to_string(endpoint.port));
        }
    }

    return parsed;
}

// ============================================================================
// Replication
// ============================================================================

bool MeshNode::trigger_seeding() {
    return seeding_ && seeding_->trigger_seeding();
}

size_t MeshNode::seed_now() {
    return seeding_ ? seeding_->run_all_cycles() : 0;
}

// ============================================================================
// Statistics and Monitoring
// ============================================================================

MeshNodeStats MeshNode::get_stats() const {
    MeshNodeStats stats;
    {
        std::lock_guard<std::mutex> lock(workspaces_mutex_);
        stats.workspaces = workspaces_.size();
    }

    if (swarm_) stats.connected_peers = swarm_->get_connection_count();
    if (store_) stats.stored_chunks = store_->count();
    if (transfer_) stats.transfer = transfer_->get_stats();
    if (seeding_) stats.seeding = seeding_->get_stats();

    if (running_) {
        stats.uptime_seconds = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count());
    }
    return stats;
}

void MeshNode::print_status() const {
    auto stats = get_stats();

    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|                  Nightjar Mesh Node Status                     |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Peer ID:          " << std::left << std::setw(44) << short_id(get_peer_id(), 16) << " |\n";
    std::cout << "| Port:             " << std::left << std::setw(44) << get_port() << " |\n";
    std::cout << "| Status:           " << std::left << std::setw(44) << (running_ ? "RUNNING" : "STOPPED") << " |\n";
    std::cout << "| Uptime:           " << std::left << std::setw(44) << format_duration(stats.uptime_seconds) << " |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Connected Peers:  " << std::left << std::setw(44) << stats.connected_peers << " |\n";
    std::cout << "| Workspaces:       " << std::left << std::setw(44) << stats.workspaces << " |\n";
    std::cout << "| Stored Chunks:    " << std::left << std::setw(44) << stats.stored_chunks << " |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Chunks Served:    " << std::left << std::setw(44) << stats.transfer.chunks_served << " |\n";
    std::cout << "| Chunks Fetched:   " << std::left << std::setw(44) << stats.transfer.chunks_fetched << " |\n";
    std::cout << "| Chunks Seeded:    " << std::left << std::setw(44) << stats.seeding.chunks_seeded << " |\n";
    std::cout << "| Bytes Seeded:     " << std::left << std::setw(44) << format_file_size(stats.seeding.bytes_seeded) << " |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";
}

// ============================================================================
// SwarmObserver
// ============================================================================

void MeshNode::on_peer_joined(const std::string& topic, const RemotePeer& peer) {
    log_debug("MeshNode: " + peer.display_name + " (" + short_id(peer.peer_id) +
              ") joined " + short_id(topic));

    // A new holder candidate may close replication gaps
    trigger_seeding();
}

void MeshNode::on_peer_left(const std::string& topic, const std::string& peer_id) {
    log_debug("MeshNode: " + short_id(peer_id) + " left " + short_id(topic));
}

void MeshNode::on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) {
    auto transfer = transfer_;
    if (!transfer) {
        return;
    }

    if (!transfer->handle_message(peer_id, message.raw)) {
        log_debug("MeshNode: Ignoring '" + message.type + "' from " + short_id(peer_id));
    }
}

} // namespace nightjar
