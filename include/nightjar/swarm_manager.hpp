/**
 * @file swarm_manager.hpp
 * @brief Topic-based peer swarm with signed identity handshake
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Owns one peer identity, the discovery sessions of joined topics and every
 * peer connection. Connections exchange newline-delimited JSON; the first
 * message on each side is a signed identity assertion. Until a connection
 * presents a valid one it contributes to no topic and no event.
 */

#pragma once

#include "nightjar/swarm.hpp"
#include "nightjar/peer_identity.hpp"
#include "nightjar/topic_discovery.hpp"
#include "nightjar/line_connection.hpp"
#include <asio.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <optional>

namespace nightjar {

/**
 * @brief Network options for a SwarmManager
 */
struct SwarmOptions {
    std::string listen_address = "0.0.0.0";     ///< Bind address
    uint16_t listen_port = 0;                   ///< 0 picks an ephemeral port
    std::string advertise_host = "127.0.0.1";   ///< Host announced to discovery
    size_t worker_threads = 2;                  ///< io_context threads
    std::chrono::milliseconds connect_timeout = config::CONNECTION_TIMEOUT;  ///< Resolve plus connect
};

/**
 * @brief SwarmManager - production Swarm over TCP
 *
 * Thread-safe. Observers are invoked on io_context threads without any
 * internal lock held.
 */
class SwarmManager : public Swarm {
public:
    SwarmManager(
        std::shared_ptr<const PeerIdentity> identity,
        std::shared_ptr<TopicDiscovery> discovery,
        SwarmOptions options = SwarmOptions()
    );

    ~SwarmManager() override;

    // Disable copy and move
    SwarmManager(const SwarmManager&) = delete;
    SwarmManager& operator=(const SwarmManager&) = delete;
    SwarmManager(SwarmManager&&) = delete;
    SwarmManager& operator=(SwarmManager&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool start() override;

    /**
     * @brief Leave every topic and close every peer socket
     */
    void stop() override;

    bool is_running() const override;

    uint16_t get_listen_port() const override;

    // ========================================================================
    // Topics
    // ========================================================================

    bool join_topic(const std::string& topic) override;
    bool leave_topic(const std::string& topic) override;
    std::vector<std::string> get_topics() const override;
    std::vector<RemotePeer> get_peers(const std::string& topic) const override;

    // ========================================================================
    // Messaging
    // ========================================================================

    size_t broadcast_sync(const SyncMessage& message) override;
    size_t broadcast_awareness(const AwarenessMessage& message) override;
    bool send_to_peer(const std::string& peer_id, const std::string& message) override;

    // ========================================================================
    // Peers
    // ========================================================================

    /**
     * @brief Dial host:port in the background
     * @return true if the attempt was started; the outcome shows up as a new peer
     */
    bool connect_to_peer(const std::string& host, uint16_t port) override;
    std::vector<std::string> get_connected_peers() const override;
    std::string get_local_peer_id() const override;

    /**
     * @brief Open connections including unauthenticated ones
     */
    size_t get_connection_count() const;

    const PeerIdentity& get_identity() const { return *identity_; }

    void add_observer(SwarmObserver* observer) override;
    void remove_observer(SwarmObserver* observer) override;

private:
    /**
     * @brief State of one peer connection
     */
    struct PeerConnection {
        uint64_t id = 0;
        std::shared_ptr<LineConnection> line;
        bool outbound = false;              ///< We dialed
        bool authenticated = false;
        bool superseded = false;            ///< Closed as a duplicate; no events on close
        RemotePeer identity;
        std::set<std::string> topics;       ///< Topics the remote peer has joined
    };

    std::shared_ptr<const PeerIdentity> identity_;
    std::shared_ptr<TopicDiscovery> discovery_;
    SwarmOptions options_;
    std::string local_peer_id_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_;
    std::atomic<uint16_t> listen_port_;
    std::atomic<uint64_t> next_connection_id_;

    /// Connections by local id, and authenticated peer id -> connection id
    std::map<uint64_t, std::shared_ptr<PeerConnection>> connections_;
    std::map<std::string, uint64_t> peers_;
    mutable std::mutex connections_mutex_;

    std::set<std::string> topics_;
    mutable std::mutex topics_mutex_;

    std::vector<SwarmObserver*> observers_;
    mutable std::mutex observers_mutex_;

    /**
     * @brief Outbound dial in progress; its handlers share one strand
     */
    struct PendingDial {
        explicit PendingDial(const asio::strand<asio::io_context::executor_type>& strand)
            : socket(strand), resolver(strand), deadline(strand) {}

        asio::ip::tcp::socket socket;
        asio::ip::tcp::resolver resolver;
        asio::steady_timer deadline;
        std::string target;                 ///< "host:port" for logging
    };

    std::set<std::shared_ptr<PendingDial>> dials_;
    std::mutex dials_mutex_;

    // ========================================================================
    // Connection handling
    // ========================================================================

    void start_accept();
    void finish_dial(const std::shared_ptr<PendingDial>& dial, const asio::error_code& error);
    void abandon_dial(const std::shared_ptr<PendingDial>& dial);
    void register_connection(asio::ip::tcp::socket socket, bool outbound);
    void handle_line(uint64_t connection_id, const std::string& line);
    void handle_close(uint64_t connection_id, const std::string& reason);

    std::shared_ptr<PeerConnection> find_connection(uint64_t connection_id) const;
    std::shared_ptr<PeerConnection> find_peer(const std::string& peer_id) const;
    std::vector<std::shared_ptr<PeerConnection>> authenticated_connections() const;

    // ========================================================================
    // Message processing
    // ========================================================================

    void process_identity(const std::shared_ptr<PeerConnection>& conn, const IdentityMessage& msg);
    void process_join_topic(const std::shared_ptr<PeerConnection>& conn, const JoinTopicMessage& msg);
    void process_leave_topic(const std::shared_ptr<PeerConnection>& conn, const LeaveTopicMessage& msg);
    void process_peer_list(const std::shared_ptr<PeerConnection>& conn, const PeerListMessage& msg);

    /**
     * @brief Send our known peers on a topic to a newly joined member
     */
    void share_peer_list(const std::shared_ptr<PeerConnection>& conn, const std::string& topic);

    bool has_topic(const std::string& topic) const;

    size_t send_to_topic(const std::string& topic, const std::string& message);

    std::vector<SwarmObserver*> snapshot_observers() const;
};

} // namespace nightjar
