/**
 * @file mesh_bridge.cpp
 * @brief Implementation of the local client bridge
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/mesh_bridge.hpp"
#include "nightjar/utilities.hpp"
#include <stdexcept>

namespace nightjar {

using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::log_error;
using utilities::short_id;

// ============================================================================
// Constructor / Destructor
// ============================================================================

MeshBridge::MeshBridge(
    SwarmFactory swarm_factory,
    LanDiscoveryFactory lan_factory,
    size_t max_clients
)
    : swarm_factory_(std::move(swarm_factory))
    , lan_factory_(std::move(lan_factory))
    , max_clients_(max_clients)
    , initialized_(false)
    , suspended_(false)
    , next_client_number_(0)
{
    if (!swarm_factory_) {
        throw std::invalid_argument("MeshBridge: swarm factory cannot be null");
    }
}

MeshBridge::~MeshBridge() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

std::shared_ptr<Swarm> MeshBridge::build_swarm(const std::shared_ptr<const PeerIdentity>& identity) {
    std::shared_ptr<Swarm> swarm;
    try {
        swarm = swarm_factory_(identity);
    } catch (const std::exception& e) {
        log_error("MeshBridge: Swarm factory failed: " + std::string(e.what()));
        return nullptr;
    }

    if (!swarm) {
        log_error("MeshBridge: Swarm factory returned no swarm");
        return nullptr;
    }

    swarm->add_observer(this);
    if (!swarm->start()) {
        swarm->remove_observer(this);
        log_error("MeshBridge: Swarm failed to start");
        return nullptr;
    }

    return swarm;
}

void MeshBridge::start_lan_discovery(const std::shared_ptr<Swarm>& swarm) {
    std::unique_ptr<LanDiscovery> lan;
    if (lan_factory_) {
        lan = lan_factory_(swarm->get_local_peer_id(), swarm->get_listen_port());
    }
    if (!lan) {
        lan = std::make_unique<UnavailableLanDiscovery>();
    }

    std::weak_ptr<Swarm> weak_swarm = swarm;
    lan->set_peer_callback([weak_swarm](const LanPeer& peer) {
        if (auto target = weak_swarm.lock()) {
            target->connect_to_peer(peer.host, peer.port);
        }
    });

    // Restricted hosts (no broadcast, port in use) degrade to unavailable
    if (lan->start() && lan->is_available()) {
        log_info("MeshBridge: LAN discovery active");
    } else {
        log_info("MeshBridge: LAN discovery unavailable");
    }

    std::lock_guard<std::mutex> lock(swarm_mutex_);
    lan_discovery_ = std::move(lan);
}

std::shared_ptr<Swarm> MeshBridge::teardown_swarm() {
    std::shared_ptr<Swarm> swarm;
    std::unique_ptr<LanDiscovery> lan;
    {
        std::lock_guard<std::mutex> lock(swarm_mutex_);
        swarm = std::move(swarm_);
        lan = std::move(lan_discovery_);
    }

    if (lan) {
        lan->stop();
    }
    if (swarm) {
        swarm->remove_observer(this);
        swarm->stop();
    }
    return swarm;
}

bool MeshBridge::initialize(std::shared_ptr<const PeerIdentity> identity) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (initialized_.load()) {
        return true;
    }
    if (!identity) {
        log_error("MeshBridge: Cannot initialize without an identity");
        return false;
    }

    auto swarm = build_swarm(identity);
    if (!swarm) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(swarm_mutex_);
        swarm_ = swarm;
    }
    start_lan_discovery(swarm);

    // Topics clients joined before the swarm existed
    for (const auto& topic : roster_.topics()) {
        if (!swarm->join_topic(topic)) {
            log_warn("MeshBridge: Failed to join swarm topic " + short_id(topic, 16));
        }
    }

    identity_ = std::move(identity);
    initialized_.store(true);
    log_info("MeshBridge: Initialized as " + short_id(swarm->get_local_peer_id()));
    return true;
}

void MeshBridge::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    teardown_swarm();

    std::vector<std::shared_ptr<LocalClient>> connections;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& [client_id, state] : clients_) {
            connections.push_back(state.connection);
        }
        clients_.clear();
    }
    roster_.clear();

    for (auto& connection : connections) {
        connection->close(close_reason::SHUTDOWN);
    }

    if (initialized_.exchange(false)) {
        log_info("MeshBridge: Shut down");
    }
    suspended_.store(false);
    saved_topics_.clear();
    saved_identity_.reset();
}

bool MeshBridge::suspend() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (!initialized_.load() || suspended_.load()) {
        return false;
    }

    auto swarm = get_swarm();
    std::set<std::string> topics;
    if (swarm) {
        for (const auto& topic : swarm->get_topics()) {
            topics.insert(topic);
        }
    }
    for (const auto& topic : roster_.topics()) {
        topics.insert(topic);
    }

    saved_topics_ = std::move(topics);
    saved_identity_ = identity_;

    teardown_swarm();
    suspended_.store(true);

    log_info("MeshBridge: Suspended (" + std::to_string(saved_topics_.size()) + " topics saved)");
    return true;
}

bool MeshBridge::resume() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (!suspended_.load()) {
        return false;
    }

    auto swarm = build_swarm(saved_identity_);
    if (!swarm) {
        log_warn("MeshBridge: Resume failed, staying suspended");
        return false;
    }

    std::set<std::string> topics = saved_topics_;
    for (const auto& topic : roster_.topics()) {
        topics.insert(topic);
    }

    for (const auto& topic : topics) {
        if (!swarm->join_topic(topic)) {
            log_warn("MeshBridge: Resume failed rejoining " + short_id(topic, 16) + ", staying suspended");
            swarm->remove_observer(this);
            swarm->stop();
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(swarm_mutex_);
        swarm_ = swarm;
    }
    start_lan_discovery(swarm);

    identity_ = saved_identity_;
    saved_identity_.reset();
    saved_topics_.clear();
    suspended_.store(false);

    log_info("MeshBridge: Resumed (" + std::to_string(topics.size()) + " topics rejoined)");
    return true;
}

bool MeshBridge::is_initialized() const {
    return initialized_.load();
}

bool MeshBridge::is_suspended() const {
    return suspended_.load();
}

bool MeshBridge::is_lan_discovery_available() const {
    std::lock_guard<std::mutex> lock(swarm_mutex_);
    return lan_discovery_ && lan_discovery_->is_available();
}

std::shared_ptr<Swarm> MeshBridge::get_swarm() const {
    std::lock_guard<std::mutex> lock(swarm_mutex_);
    return swarm_;
}

// ============================================================================
// Local Clients
// ============================================================================

std::optional<std::string> MeshBridge::add_client(std::shared_ptr<LocalClient> client) {
    if (!client) {
        return std::nullopt;
    }

    std::string client_id;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (clients_.size() < max_clients_) {
            client_id = "client-" + std::to_string(++next_client_number_);
            ClientState state;
            state.client_id = client_id;
            state.connection = client;
            clients_[client_id] = std::move(state);
        }
    }

    if (client_id.empty()) {
        log_warn("MeshBridge: Rejecting client, limit of " + std::to_string(max_clients_) + " reached");
        client->close(close_reason::TOO_MANY_CLIENTS);
        return std::nullopt;
    }

    log_debug("MeshBridge: Client " + client_id + " connected");
    return client_id;
}

void MeshBridge::remove_client(const std::string& client_id) {
    std::optional<PeerInfo> identity = client_identity(client_id);
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (clients_.erase(client_id) == 0) {
            return;
        }
    }

    const std::string departed = identity ? identity->peer_id : client_id;
    auto swarm = get_swarm();

    for (const auto& [topic, last_member] : roster_.leave_all(client_id)) {
        if (last_member) {
            if (swarm) {
                swarm->leave_topic(topic);
            }
        } else {
            send_to_topic(topic, PeerLeftMessage{topic, departed}.to_json());
        }
    }

    log_debug("MeshBridge: Client " + client_id + " disconnected");
}

void MeshBridge::handle_client_message(const std::string& client_id, const std::string& message) {
    if (!client_connection(client_id)) {
        return;
    }

    auto parsed = parse_client_message(message);
    if (!parsed) {
        log_warn("MeshBridge: Malformed message from " + client_id);
        send_error(client_id, "invalid_message");
        return;
    }

    try {
        if (auto* identity = std::get_if<IdentityMessage>(&*parsed)) {
            handle_identity(client_id, *identity);
        } else if (auto* join = std::get_if<JoinTopicMessage>(&*parsed)) {
            handle_join_topic(client_id, join->topic);
        } else if (auto* leave = std::get_if<LeaveTopicMessage>(&*parsed)) {
            handle_leave_topic(client_id, leave->topic);
        } else if (auto* sync = std::get_if<SyncMessage>(&*parsed)) {
            handle_sync(client_id, std::move(*sync));
        } else if (auto* awareness = std::get_if<AwarenessMessage>(&*parsed)) {
            handle_awareness(client_id, std::move(*awareness));
        } else if (auto* send = std::get_if<SendMessage>(&*parsed)) {
            handle_send(client_id, *send);
        } else if (auto* other = std::get_if<UnrecognizedMessage>(&*parsed)) {
            log_debug("MeshBridge: Ignoring '" + other->type + "' from " + client_id);
        }
    } catch (const std::exception& e) {
        log_error("MeshBridge: Error handling message from " + client_id + ": " + e.what());
        send_error(client_id, "internal_error", e.what());
    }
}

void MeshBridge::handle_identity(const std::string& client_id, const IdentityMessage& message) {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return;
    }

    it->second.identified = true;
    it->second.identity.peer_id = message.public_key.empty() ? client_id : message.public_key;
    it->second.identity.display_name = message.display_name;
    it->second.identity.color = message.color;

    log_debug("MeshBridge: Client " + client_id + " identified as " + message.display_name);
}

void MeshBridge::handle_join_topic(const std::string& client_id, const std::string& topic) {
    if (topic.empty() || topic.size() > config::MAX_TOPIC_LENGTH) {
        send_error(client_id, "invalid_topic");
        return;
    }

    auto result = roster_.join(topic, client_id);
    if (!result.joined) {
        return;
    }

    auto swarm = get_swarm();
    if (result.first_member && swarm) {
        if (!swarm->join_topic(topic)) {
            log_warn("MeshBridge: Failed to join swarm topic " + short_id(topic, 16));
            roster_.leave(topic, client_id);
            send_error(client_id, "invalid_topic");
            return;
        }
        log_info("MeshBridge: Joined swarm topic " + short_id(topic, 16));
    }

    // Roster for the joiner: other local clients plus remote swarm peers
    PeersListMessage roster;
    roster.topic = topic;
    for (const auto& member : roster_.members(topic)) {
        if (member == client_id) {
            continue;
        }
        auto identity = client_identity(member);
        if (identity) {
            roster.peers.push_back(*identity);
        }
    }
    if (swarm) {
        for (const auto& peer : swarm->get_peers(topic)) {
            roster.peers.push_back(PeerInfo{peer.peer_id, peer.display_name, peer.color});
        }
    }
    send_to_client(client_id, roster.to_json());

    auto identity = client_identity(client_id);
    if (identity) {
        send_to_topic(topic, PeerJoinedMessage{topic, *identity}.to_json(), client_id);
    }
}

void MeshBridge::handle_leave_topic(const std::string& client_id, const std::string& topic) {
    auto result = roster_.leave(topic, client_id);
    if (!result.left) {
        return;
    }

    if (result.last_member) {
        auto swarm = get_swarm();
        if (swarm) {
            swarm->leave_topic(topic);
            log_info("MeshBridge: Left swarm topic " + short_id(topic, 16));
        }
        return;
    }

    auto identity = client_identity(client_id);
    send_to_topic(topic, PeerLeftMessage{topic, identity ? identity->peer_id : client_id}.to_json());
}

void MeshBridge::handle_sync(const std::string& client_id, SyncMessage message) {
    if (!roster_.is_member(message.topic, client_id)) {
        log_debug("MeshBridge: Sync from " + client_id + " for a topic it has not joined");
        return;
    }

    auto identity = client_identity(client_id);
    message.from = identity ? identity->peer_id : client_id;

    send_to_topic(message.topic, message.to_json(), client_id);

    auto swarm = get_swarm();
    if (swarm) {
        swarm->broadcast_sync(message);
    }
}

void MeshBridge::handle_awareness(const std::string& client_id, AwarenessMessage message) {
    if (!roster_.is_member(message.topic, client_id)) {
        return;
    }

    auto identity = client_identity(client_id);
    message.from = identity ? identity->peer_id : client_id;

    send_to_topic(message.topic, message.to_json(), client_id);

    auto swarm = get_swarm();
    if (swarm) {
        swarm->broadcast_awareness(message);
    }
}

void MeshBridge::handle_send(const std::string& client_id, const SendMessage& message) {
    auto sender = client_identity(client_id);
    const std::string from = sender ? sender->peer_id : client_id;

    auto local_target = client_by_peer_id(message.to);
    if (local_target) {
        auto stamped = stamp_sender(message.payload_json, from);
        if (stamped) {
            send_to_client(*local_target, *stamped);
        }
        return;
    }

    auto swarm = get_swarm();
    if (swarm && swarm->send_to_peer(message.to, message.payload_json)) {
        return;
    }

    send_error(client_id, "peer_unreachable", message.to);
}

size_t MeshBridge::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

std::vector<std::string> MeshBridge::get_topics() const {
    return roster_.topics();
}

// ============================================================================
// SwarmObserver
// ============================================================================

void MeshBridge::on_peer_joined(const std::string& topic, const RemotePeer& peer) {
    send_to_topic(topic, PeerJoinedMessage{topic, PeerInfo{peer.peer_id, peer.display_name, peer.color}}.to_json());
}

void MeshBridge::on_peer_left(const std::string& topic, const std::string& peer_id) {
    send_to_topic(topic, PeerLeftMessage{topic, peer_id}.to_json());
}

void MeshBridge::on_sync(const std::string& /*peer_id*/, const SyncMessage& message) {
    send_to_topic(message.topic, message.to_json());
}

void MeshBridge::on_awareness(const std::string& /*peer_id*/, const AwarenessMessage& message) {
    send_to_topic(message.topic, message.to_json());
}

void MeshBridge::on_peer_list(const std::string& /*peer_id*/, const PeerListMessage& message) {
    send_to_topic(message.topic, message.to_json());
}

void MeshBridge::on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) {
    // Transfers are addressed by file, not topic: every client sees them
    auto stamped = stamp_sender(message.raw, peer_id);
    send_to_all(stamped ? *stamped : message.raw);
}

// ============================================================================
// Private Helpers
// ============================================================================

std::optional<PeerInfo> MeshBridge::client_identity(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    if (it == clients_.end() || !it->second.identified) {
        return std::nullopt;
    }
    return it->second.identity;
}

std::shared_ptr<LocalClient> MeshBridge::client_connection(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    return it == clients_.end() ? nullptr : it->second.connection;
}

std::optional<std::string> MeshBridge::client_by_peer_id(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    for (const auto& [client_id, state] : clients_) {
        if (state.identified && state.identity.peer_id == peer_id) {
            return client_id;
        }
    }
    return std::nullopt;
}

void MeshBridge::send_to_client(const std::string& client_id, const std::string& message) {
    auto connection = client_connection(client_id);
    if (connection && !connection->send(message)) {
        log_debug("MeshBridge: Send to " + client_id + " failed");
    }
}

void MeshBridge::send_to_topic(
    const std::string& topic,
    const std::string& message,
    const std::string& exclude_client
) {
    for (const auto& member : roster_.members(topic)) {
        if (member != exclude_client) {
            send_to_client(member, message);
        }
    }
}

void MeshBridge::send_to_all(const std::string& message) {
    std::vector<std::shared_ptr<LocalClient>> connections;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [client_id, state] : clients_) {
            connections.push_back(state.connection);
        }
    }

    for (auto& connection : connections) {
        connection->send(message);
    }
}

void MeshBridge::send_error(const std::string& client_id, const std::string& error, const std::string& detail) {
    send_to_client(client_id, ErrorMessage{error, detail}.to_json());
}

} // namespace nightjar
