/**
 * @file relay_server.hpp
 * @brief Relay for clients without direct swarm reachability
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Standalone server that runs its own swarm identity and accepts
 * newline-delimited JSON client connections over TCP. Clients must identify
 * within the authentication window, answer heartbeat pings, and stay within
 * per-client topic, payload and message-rate limits. Violations produce a
 * typed error message rather than a silent drop.
 */

#pragma once

#include "nightjar/swarm.hpp"
#include "nightjar/local_client.hpp"
#include "nightjar/line_connection.hpp"
#include "nightjar/topic_roster.hpp"
#include "nightjar/rate_limiter.hpp"
#include "nightjar/message_types.hpp"
#include "nightjar/mesh_config.hpp"
#include <asio.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>

namespace nightjar {

/// Error reasons sent to relay clients
namespace relay_error {
    constexpr const char* IDENTITY_REQUIRED = "identity_required";
    constexpr const char* INVALID_IDENTITY = "invalid_identity";
    constexpr const char* INVALID_TOPIC = "invalid_topic";
    constexpr const char* TOO_MANY_TOPICS = "too_many_topics";
    constexpr const char* SYNC_TOO_LARGE = "sync_too_large";
    constexpr const char* AWARENESS_TOO_LARGE = "awareness_too_large";
    constexpr const char* RATE_LIMITED = "rate_limited";
    constexpr const char* INVALID_MESSAGE = "invalid_message";
    constexpr const char* PEER_UNREACHABLE = "peer_unreachable";
}

struct RelayOptions {
    std::string listen_address = "0.0.0.0";
    uint16_t port = config::DEFAULT_RELAY_PORT;             ///< 0 picks an ephemeral port
    size_t worker_threads = 2;
    std::chrono::milliseconds auth_timeout = config::RELAY_AUTH_TIMEOUT;
    std::chrono::milliseconds heartbeat_interval = config::HEARTBEAT_INTERVAL;
    std::chrono::milliseconds heartbeat_timeout = config::HEARTBEAT_TIMEOUT;
    size_t max_topics_per_client = config::MAX_TOPICS_PER_CLIENT;
    size_t max_topic_length = config::MAX_TOPIC_LENGTH;
    size_t max_sync_size = config::MAX_SYNC_SIZE;
    size_t max_awareness_size = config::MAX_AWARENESS_SIZE;
    double rate_per_second = config::RELAY_RATE_PER_SECOND;
    double rate_burst = config::RELAY_RATE_BURST;
    size_t max_message_size = config::MAX_WIRE_MESSAGE_SIZE;
};

/**
 * @brief RelayServer - bridges remote clients onto the swarm
 *
 * Clients are known to each other by their relay client id ("client-N").
 */
class RelayServer : public SwarmObserver {
public:
    RelayServer(std::shared_ptr<Swarm> swarm, RelayOptions options = RelayOptions());

    ~RelayServer() override;

    // Disable copy and move
    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;
    RelayServer(RelayServer&&) = delete;
    RelayServer& operator=(RelayServer&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the swarm (if needed), the listener and the timers
     */
    bool start();

    void stop();

    bool is_running() const;

    /**
     * @brief Bound listener port
     */
    uint16_t get_port() const;

    // ========================================================================
    // Clients
    // ========================================================================

    /**
     * @brief Register a connected client and start its auth window
     * @return Assigned client id
     */
    std::string attach_client(std::shared_ptr<LocalClient> client);

    /**
     * @brief Clean up a disconnected client (idempotent)
     */
    void detach_client(const std::string& client_id);

    void handle_client_message(const std::string& client_id, const std::string& message);

    /**
     * @brief Close clients that have not identified within the auth window
     * @return Number of clients closed
     */
    size_t check_auth_timeouts(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Terminate clients silent past the heartbeat timeout, ping the rest
     * @return Number of clients terminated
     */
    size_t check_heartbeats(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    size_t client_count() const;

    bool is_authenticated(const std::string& client_id) const;

    std::vector<std::string> get_client_topics(const std::string& client_id) const;

    // ========================================================================
    // SwarmObserver
    // ========================================================================

    void on_peer_joined(const std::string& topic, const RemotePeer& peer) override;
    void on_peer_left(const std::string& topic, const std::string& peer_id) override;
    void on_sync(const std::string& peer_id, const SyncMessage& message) override;
    void on_awareness(const std::string& peer_id, const AwarenessMessage& message) override;
    void on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) override;

private:
    struct ClientState {
        std::string client_id;
        std::shared_ptr<LocalClient> connection;
        bool authenticated = false;
        std::string public_key;
        std::string display_name;
        std::string color;
        std::chrono::steady_clock::time_point connected_at;
        std::chrono::steady_clock::time_point last_pong;
    };

    std::shared_ptr<Swarm> swarm_;
    RelayOptions options_;

    // Network
    asio::io_context io_context_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::steady_timer> auth_timer_;
    std::unique_ptr<asio::steady_timer> heartbeat_timer_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_;
    std::atomic<uint16_t> port_;

    // Clients
    std::map<std::string, ClientState> clients_;
    uint64_t client_counter_;
    mutable std::mutex clients_mutex_;

    TopicRoster roster_;
    RateLimiter rate_limiter_;

    void start_accept();
    void schedule_auth_check();
    void schedule_heartbeat();

    void handle_identity(const std::string& client_id, const IdentityMessage& message);
    void handle_join_topic(const std::string& client_id, const std::string& topic);
    void handle_leave_topic(const std::string& client_id, const std::string& topic);
    void handle_sync(const std::string& client_id, SyncMessage message);
    void handle_awareness(const std::string& client_id, AwarenessMessage message);
    void handle_send(const std::string& client_id, const SendMessage& message);
    void handle_pong(const std::string& client_id);

    /**
     * @brief Close a client and clean it up as if it disconnected
     */
    void terminate_client(const std::string& client_id, const std::string& reason);

    std::optional<PeerInfo> client_info(const std::string& client_id) const;
    std::shared_ptr<LocalClient> client_connection(const std::string& client_id) const;

    void send_to_client(const std::string& client_id, const std::string& message);
    void send_error(const std::string& client_id, const std::string& error, const std::string& detail = "");

    /**
     * @brief Send to authenticated members of a topic
     */
    void send_to_topic(const std::string& topic, const std::string& message, const std::string& exclude_client = "");
};

} // namespace nightjar
