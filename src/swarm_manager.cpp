/**
 * @file swarm_manager.cpp
 * @brief Implementation of the topic-based peer swarm
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/swarm_manager.hpp"
#include "nightjar/mesh_config.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>

namespace nightjar {

using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::log_error;
using utilities::short_id;

// ============================================================================
// Constructor / Destructor
// ============================================================================

SwarmManager::SwarmManager(
    std::shared_ptr<const PeerIdentity> identity,
    std::shared_ptr<TopicDiscovery> discovery,
    SwarmOptions options
)
    : identity_(std::move(identity))
    , discovery_(std::move(discovery))
    , options_(std::move(options))
    , local_peer_id_(identity_->get_public_key_hex())
    , io_context_()
    , running_(false)
    , listen_port_(0)
    , next_connection_id_(1)
{
}

SwarmManager::~SwarmManager() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SwarmManager::start() {
    if (running_.exchange(true)) {
        log_warn("SwarmManager: Already running");
        return false;
    }

    try {
        io_context_.restart();

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
            io_context_,
            asio::ip::tcp::endpoint(asio::ip::make_address(options_.listen_address), options_.listen_port)
        );
        listen_port_ = acceptor_->local_endpoint().port();

        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));

        start_accept();

        size_t num_threads = std::max<size_t>(1, options_.worker_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    log_error("SwarmManager: Worker thread error: " + std::string(e.what()));
                }
            });
        }

        log_info("SwarmManager: Peer " + short_id(local_peer_id_) + " listening on port " +
                 std::to_string(listen_port_.load()));
        return true;

    } catch (const std::exception& e) {
        log_error("SwarmManager: Failed to start: " + std::string(e.what()));
        running_ = false;
        acceptor_.reset();
        work_guard_.reset();
        return false;
    }
}

void SwarmManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    log_info("SwarmManager: Stopping...");

    // Tear down every discovery session
    std::set<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        topics.swap(topics_);
    }
    for (const auto& topic : topics) {
        discovery_->unannounce(topic, local_peer_id_);
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }

    std::vector<std::shared_ptr<PeerConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [id, conn] : connections_) {
            connections.push_back(conn);
        }
    }
    for (const auto& conn : connections) {
        conn->line->close("swarm stopped");
    }

    std::set<std::shared_ptr<PendingDial>> dials;
    {
        std::lock_guard<std::mutex> lock(dials_mutex_);
        dials.swap(dials_);
    }
    for (const auto& dial : dials) {
        asio::post(dial->socket.get_executor(), [this, dial]() {
            dial->deadline.cancel();
            abandon_dial(dial);
        });
    }

    // Workers exit once closing connections have flushed or lingered out
    work_guard_.reset();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear();
        peers_.clear();
    }
    acceptor_.reset();

    log_info("SwarmManager: Stopped");
}

bool SwarmManager::is_running() const {
    return running_;
}

uint16_t SwarmManager::get_listen_port() const {
    return listen_port_;
}

// ============================================================================
// Topics
// ============================================================================

bool SwarmManager::join_topic(const std::string& topic) {
    if (!running_) {
        return false;
    }

    if (!config::validate_topic(topic)) {
        log_warn("SwarmManager: Refusing to join invalid topic '" + topic + "'");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        if (!topics_.insert(topic).second) {
            return true;
        }
    }

    discovery_->announce(topic, local_peer_id_, {options_.advertise_host, listen_port_});
    log_info("SwarmManager: Joined topic " + short_id(topic));

    // Tell existing peers before dialing new ones; new connections get the
    // full topic set right after their handshake
    JoinTopicMessage join{topic};
    std::string serialized = join.to_json();
    for (const auto& conn : authenticated_connections()) {
        conn->line->send(serialized);
    }

    for (const auto& found : discovery_->lookup(topic)) {
        if (found.peer_id == local_peer_id_) {
            continue;
        }
        if (!found.peer_id.empty() && find_peer(found.peer_id)) {
            continue;
        }
        if (found.endpoint.host == options_.advertise_host && found.endpoint.port == listen_port_) {
            continue;
        }
        connect_to_peer(found.endpoint.host, found.endpoint.port);
    }

    return true;
}

bool SwarmManager::leave_topic(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        if (topics_.erase(topic) == 0) {
            return true;
        }
    }

    discovery_->unannounce(topic, local_peer_id_);

    LeaveTopicMessage leave{topic};
    std::string serialized = leave.to_json();
    for (const auto& conn : authenticated_connections()) {
        conn->line->send(serialized);
    }

    log_info("SwarmManager: Left topic " + short_id(topic));
    return true;
}

std::vector<std::string> SwarmManager::get_topics() const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    return std::vector<std::string>(topics_.begin(), topics_.end());
}

std::vector<RemotePeer> SwarmManager::get_peers(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);

    std::vector<RemotePeer> peers;
    for (const auto& [peer_id, conn_id] : peers_) {
        auto it = connections_.find(conn_id);
        if (it != connections_.end() && it->second->topics.count(topic) > 0) {
            peers.push_back(it->second->identity);
        }
    }
    return peers;
}

bool SwarmManager::has_topic(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    return topics_.count(topic) > 0;
}

// ============================================================================
// Messaging
// ============================================================================

size_t SwarmManager::send_to_topic(const std::string& topic, const std::string& message) {
    std::vector<std::shared_ptr<PeerConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [peer_id, conn_id] : peers_) {
            auto it = connections_.find(conn_id);
            if (it != connections_.end() && it->second->topics.count(topic) > 0) {
                targets.push_back(it->second);
            }
        }
    }

    size_t sent = 0;
    for (const auto& conn : targets) {
        if (conn->line->send(message)) {
            ++sent;
        }
    }
    return sent;
}

size_t SwarmManager::broadcast_sync(const SyncMessage& message) {
    if (!has_topic(message.topic)) {
        return 0;
    }
    SyncMessage outgoing = message;
    outgoing.from = local_peer_id_;
    return send_to_topic(message.topic, outgoing.to_json());
}

size_t SwarmManager::broadcast_awareness(const AwarenessMessage& message) {
    if (!has_topic(message.topic)) {
        return 0;
    }
    AwarenessMessage outgoing = message;
    outgoing.from = local_peer_id_;
    return send_to_topic(message.topic, outgoing.to_json());
}

bool SwarmManager::send_to_peer(const std::string& peer_id, const std::string& message) {
    auto conn = find_peer(peer_id);
    if (!conn) {
        log_debug("SwarmManager: No connection to peer " + short_id(peer_id));
        return false;
    }
    return conn->line->send(message);
}

// ============================================================================
// Peers
// ============================================================================

bool SwarmManager::connect_to_peer(const std::string& host, uint16_t port) {
    if (!running_) {
        return false;
    }

    auto dial = std::make_shared<PendingDial>(asio::make_strand(io_context_));
    dial->target = host + ":" + std::to_string(port);
    {
        std::lock_guard<std::mutex> lock(dials_mutex_);
        if (!running_) {
            return false;
        }
        dials_.insert(dial);
    }

    dial->deadline.expires_after(options_.connect_timeout);
    dial->deadline.async_wait([this, dial](const asio::error_code& error) {
        if (!error) {
            log_debug("SwarmManager: Connect to " + dial->target + " timed out");
            abandon_dial(dial);
        }
    });

    dial->resolver.async_resolve(host, std::to_string(port),
        [this, dial](const asio::error_code& error, asio::ip::tcp::resolver::results_type endpoints) {
            if (error) {
                finish_dial(dial, error);
                return;
            }
            asio::async_connect(dial->socket, endpoints,
                [this, dial](const asio::error_code& connect_error, const asio::ip::tcp::endpoint& /*endpoint*/) {
                    finish_dial(dial, connect_error);
                });
        });

    return true;
}

void SwarmManager::finish_dial(const std::shared_ptr<PendingDial>& dial, const asio::error_code& error) {
    dial->deadline.cancel();
    {
        std::lock_guard<std::mutex> lock(dials_mutex_);
        dials_.erase(dial);
    }

    if (error) {
        // Best effort: unreachable peers are expected
        log_debug("SwarmManager: Connect to " + dial->target + " failed: " + error.message());
        return;
    }

    if (!running_) {
        asio::error_code ec;
        dial->socket.close(ec);
        return;
    }

    log_debug("SwarmManager: Connected to " + dial->target);
    register_connection(std::move(dial->socket), true);
}

void SwarmManager::abandon_dial(const std::shared_ptr<PendingDial>& dial) {
    // Pending resolve/connect complete with operation_aborted
    dial->resolver.cancel();
    asio::error_code ec;
    dial->socket.close(ec);
}

std::vector<std::string> SwarmManager::get_connected_peers() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);

    std::vector<std::string> peers;
    peers.reserve(peers_.size());
    for (const auto& [peer_id, conn_id] : peers_) {
        peers.push_back(peer_id);
    }
    return peers;
}

std::string SwarmManager::get_local_peer_id() const {
    return local_peer_id_;
}

size_t SwarmManager::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void SwarmManager::add_observer(SwarmObserver* observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void SwarmManager::remove_observer(SwarmObserver* observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::vector<SwarmObserver*> SwarmManager::snapshot_observers() const {
    if (!running_) {
        return {};
    }
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return observers_;
}

// ============================================================================
// Connection handling
// ============================================================================

void SwarmManager::start_accept() {
    acceptor_->async_accept(
        [this](const asio::error_code& error, asio::ip::tcp::socket socket) {
            if (!error) {
                register_connection(std::move(socket), false);
            } else if (error != asio::error::operation_aborted) {
                log_warn("SwarmManager: Accept failed: " + error.message());
            }

            if (running_ && acceptor_ && acceptor_->is_open()) {
                start_accept();
            }
        });
}

void SwarmManager::register_connection(asio::ip::tcp::socket socket, bool outbound) {
    auto conn = std::make_shared<PeerConnection>();
    conn->id = next_connection_id_++;
    conn->outbound = outbound;
    conn->line = std::make_shared<LineConnection>(std::move(socket), config::MAX_WIRE_MESSAGE_SIZE);

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[conn->id] = conn;
    }

    uint64_t conn_id = conn->id;
    conn->line->start(
        [this, conn_id](const std::string& line) { handle_line(conn_id, line); },
        [this, conn_id](const std::string& reason) { handle_close(conn_id, reason); }
    );

    // Raced with stop(): its connection sweep may already be done
    if (!running_) {
        conn->line->close("swarm stopped");
        return;
    }

    // Identity goes first on every connection
    auto identity = identity_->create_identity_message(utilities::current_time_ms());
    conn->line->send(identity.to_json());
}

void SwarmManager::handle_line(uint64_t connection_id, const std::string& line) {
    auto conn = find_connection(connection_id);
    if (!conn) {
        return;
    }

    auto parsed = parse_swarm_message(line);
    if (!parsed) {
        log_warn("SwarmManager: Dropping malformed message from " + conn->line->remote_address());
        return;
    }

    if (auto* identity = std::get_if<IdentityMessage>(&*parsed)) {
        process_identity(conn, *identity);
        return;
    }

    std::string peer_id;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!conn->authenticated) {
            peer_id.clear();
        } else {
            peer_id = conn->identity.peer_id;
        }
    }

    if (peer_id.empty()) {
        log_debug("SwarmManager: Ignoring message from unauthenticated connection " +
                  conn->line->remote_address());
        return;
    }

    if (auto* join = std::get_if<JoinTopicMessage>(&*parsed)) {
        process_join_topic(conn, *join);
    } else if (auto* leave = std::get_if<LeaveTopicMessage>(&*parsed)) {
        process_leave_topic(conn, *leave);
    } else if (auto* sync = std::get_if<SyncMessage>(&*parsed)) {
        if (!has_topic(sync->topic)) {
            return;
        }
        sync->from = peer_id;
        for (auto* observer : snapshot_observers()) {
            observer->on_sync(peer_id, *sync);
        }
    } else if (auto* awareness = std::get_if<AwarenessMessage>(&*parsed)) {
        if (!has_topic(awareness->topic)) {
            return;
        }
        awareness->from = peer_id;
        for (auto* observer : snapshot_observers()) {
            observer->on_awareness(peer_id, *awareness);
        }
    } else if (auto* peer_list = std::get_if<PeerListMessage>(&*parsed)) {
        process_peer_list(conn, *peer_list);
    } else if (auto* other = std::get_if<UnrecognizedMessage>(&*parsed)) {
        for (auto* observer : snapshot_observers()) {
            observer->on_direct_message(peer_id, *other);
        }
    }
}

void SwarmManager::handle_close(uint64_t connection_id, const std::string& reason) {
    std::shared_ptr<PeerConnection> conn;
    bool was_active_peer = false;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return;
        }
        conn = it->second;
        connections_.erase(it);

        if (conn->authenticated && !conn->superseded) {
            auto peer_it = peers_.find(conn->identity.peer_id);
            if (peer_it != peers_.end() && peer_it->second == connection_id) {
                peers_.erase(peer_it);
                was_active_peer = true;
            }
        }
    }

    if (!was_active_peer) {
        return;
    }

    log_info("SwarmManager: Peer " + short_id(conn->identity.peer_id) + " disconnected (" + reason + ")");

    auto observers = snapshot_observers();
    for (const auto& topic : conn->topics) {
        for (auto* observer : observers) {
            observer->on_peer_left(topic, conn->identity.peer_id);
        }
    }
    for (auto* observer : observers) {
        observer->on_peer_disconnected(conn->identity.peer_id);
    }
}

std::shared_ptr<SwarmManager::PeerConnection> SwarmManager::find_connection(uint64_t connection_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<SwarmManager::PeerConnection> SwarmManager::find_peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto peer_it = peers_.find(peer_id);
    if (peer_it == peers_.end()) {
        return nullptr;
    }
    auto it = connections_.find(peer_it->second);
    return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<SwarmManager::PeerConnection>> SwarmManager::authenticated_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);

    std::vector<std::shared_ptr<PeerConnection>> result;
    for (const auto& [peer_id, conn_id] : peers_) {
        auto it = connections_.find(conn_id);
        if (it != connections_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

// ============================================================================
// Message processing
// ============================================================================

void SwarmManager::process_identity(const std::shared_ptr<PeerConnection>& conn, const IdentityMessage& msg) {
    if (!PeerIdentity::verify_identity_message(msg)) {
        log_warn("SwarmManager: Rejected unsigned or invalid identity from " +
                 conn->line->remote_address() + " claiming " + short_id(msg.public_key));
        return;
    }

    if (msg.public_key == local_peer_id_) {
        log_debug("SwarmManager: Closing connection to self");
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            conn->superseded = true;
        }
        conn->line->close("self connection");
        return;
    }

    std::shared_ptr<PeerConnection> to_close;
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);

        if (conn->authenticated) {
            if (conn->identity.peer_id != msg.public_key) {
                log_warn("SwarmManager: Ignoring identity change on authenticated connection");
            }
            return;
        }

        // Both sides keep the connection dialed by the smaller public key
        const std::string& preferred_initiator = std::min(local_peer_id_, msg.public_key);
        auto initiator_of = [&](const PeerConnection& c) {
            return c.outbound ? local_peer_id_ : msg.public_key;
        };

        auto peer_it = peers_.find(msg.public_key);
        std::shared_ptr<PeerConnection> existing;
        if (peer_it != peers_.end()) {
            auto it = connections_.find(peer_it->second);
            if (it != connections_.end()) {
                existing = it->second;
            }
        }

        if (existing) {
            bool new_preferred = initiator_of(*conn) == preferred_initiator;
            bool old_preferred = initiator_of(*existing) == preferred_initiator;
            if (new_preferred && !old_preferred) {
                existing->superseded = true;
                conn->topics = existing->topics;
                to_close = existing;
            } else {
                conn->superseded = true;
                to_close = conn;
            }
        }

        if (to_close != conn) {
            conn->authenticated = true;
            conn->identity = RemotePeer{msg.public_key, msg.display_name, msg.color};
            peers_[msg.public_key] = conn->id;
            accepted = true;
        }
    }

    if (to_close) {
        to_close->line->close("duplicate connection");
    }

    if (!accepted) {
        return;
    }

    log_info("SwarmManager: Authenticated peer " + short_id(msg.public_key) +
             " (" + msg.display_name + ")");

    for (auto* observer : snapshot_observers()) {
        observer->on_peer_identity(conn->identity);
    }

    // Share our topic memberships with the new peer
    for (const auto& topic : get_topics()) {
        conn->line->send(JoinTopicMessage{topic}.to_json());
    }
}

void SwarmManager::process_join_topic(const std::shared_ptr<PeerConnection>& conn, const JoinTopicMessage& msg) {
    if (!config::validate_topic(msg.topic)) {
        log_warn("SwarmManager: Ignoring join of invalid topic from " + short_id(conn->identity.peer_id));
        return;
    }

    bool inserted = false;
    RemotePeer peer;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        inserted = conn->topics.insert(msg.topic).second;
        peer = conn->identity;
    }

    if (!inserted) {
        return;
    }

    log_debug("SwarmManager: Peer " + short_id(peer.peer_id) + " joined topic " + short_id(msg.topic));

    for (auto* observer : snapshot_observers()) {
        observer->on_peer_joined(msg.topic, peer);
    }

    if (has_topic(msg.topic)) {
        share_peer_list(conn, msg.topic);
    }
}

void SwarmManager::process_leave_topic(const std::shared_ptr<PeerConnection>& conn, const LeaveTopicMessage& msg) {
    bool erased = false;
    std::string peer_id;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        erased = conn->topics.erase(msg.topic) > 0;
        peer_id = conn->identity.peer_id;
    }

    if (!erased) {
        return;
    }

    for (auto* observer : snapshot_observers()) {
        observer->on_peer_left(msg.topic, peer_id);
    }
}

void SwarmManager::share_peer_list(const std::shared_ptr<PeerConnection>& conn, const std::string& topic) {
    PeerListMessage list;
    list.topic = topic;
    list.peers.push_back(local_peer_id_);

    for (const auto& peer : get_peers(topic)) {
        if (peer.peer_id != conn->identity.peer_id) {
            list.peers.push_back(peer.peer_id);
        }
    }

    conn->line->send(list.to_json());
}

void SwarmManager::process_peer_list(const std::shared_ptr<PeerConnection>& conn, const PeerListMessage& msg) {
    for (auto* observer : snapshot_observers()) {
        observer->on_peer_list(conn->identity.peer_id, msg);
    }

    if (!has_topic(msg.topic)) {
        return;
    }

    for (const auto& peer_id : msg.peers) {
        if (peer_id == local_peer_id_ || find_peer(peer_id)) {
            continue;
        }

        auto endpoint = discovery_->resolve_peer(peer_id);
        if (!endpoint) {
            log_debug("SwarmManager: No address for listed peer " + short_id(peer_id));
            continue;
        }

        // Dials complete in the background; failures are swallowed
        connect_to_peer(endpoint->host, endpoint->port);
    }
}

} // namespace nightjar
