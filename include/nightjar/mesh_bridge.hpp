/**
 * @file mesh_bridge.hpp
 * @brief Multiplexes local application clients onto one swarm
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Local clients join topics through the bridge. The first local interest
 * in a topic joins the swarm topic and the last one to leave releases it.
 * Point-to-point swarm traffic (chunk transfer) is fanned out to every
 * local client, which matches responses by request id.
 *
 * suspend() tears down the swarm and LAN discovery while keeping the
 * identity and topic set; resume() rebuilds both.
 */

#pragma once

#include "nightjar/swarm.hpp"
#include "nightjar/peer_identity.hpp"
#include "nightjar/topic_roster.hpp"
#include "nightjar/lan_discovery.hpp"
#include "nightjar/local_client.hpp"
#include "nightjar/message_types.hpp"
#include "nightjar/mesh_config.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <optional>

namespace nightjar {

/// Builds a (not yet started) swarm for an identity
using SwarmFactory = std::function<std::shared_ptr<Swarm>(std::shared_ptr<const PeerIdentity> identity)>;

/// Builds LAN discovery announcing the swarm's listen port
using LanDiscoveryFactory = std::function<std::unique_ptr<LanDiscovery>(
    const std::string& local_peer_id, uint16_t swarm_port)>;

class MeshBridge : public SwarmObserver {
public:
    /**
     * @param lan_factory Optional; LAN discovery is unavailable without one
     */
    explicit MeshBridge(
        SwarmFactory swarm_factory,
        LanDiscoveryFactory lan_factory = nullptr,
        size_t max_clients = config::MAX_LOCAL_CLIENTS
    );

    ~MeshBridge() override;

    // Disable copy and move
    MeshBridge(const MeshBridge&) = delete;
    MeshBridge& operator=(const MeshBridge&) = delete;
    MeshBridge(MeshBridge&&) = delete;
    MeshBridge& operator=(MeshBridge&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Create and start the swarm for an identity
     * @return false if the swarm could not start (no-op if already initialized)
     */
    bool initialize(std::shared_ptr<const PeerIdentity> identity);

    void shutdown();

    /**
     * @brief Tear down the swarm, keeping identity and topics
     * @return false if not initialized or already suspended
     */
    bool suspend();

    /**
     * @brief Rebuild the swarm and rejoin every saved topic
     *
     * Saved state is cleared only when every step succeeds; on failure the
     * bridge stays suspended and resume() may be retried.
     * @return false if not suspended or rebuilding failed
     */
    bool resume();

    bool is_initialized() const;
    bool is_suspended() const;

    /**
     * @brief LAN discovery currently running
     */
    bool is_lan_discovery_available() const;

    /**
     * @brief Current swarm (nullptr while suspended or uninitialized)
     */
    std::shared_ptr<Swarm> get_swarm() const;

    // ========================================================================
    // Local Clients
    // ========================================================================

    /**
     * @brief Register a client connection
     * @return Client id, or std::nullopt if rejected (closed with too_many_clients)
     */
    std::optional<std::string> add_client(std::shared_ptr<LocalClient> client);

    /**
     * @brief Drop a client, leaving swarm topics it was the last member of
     */
    void remove_client(const std::string& client_id);

    /**
     * @brief Process one message from a client
     */
    void handle_client_message(const std::string& client_id, const std::string& message);

    size_t client_count() const;

    /**
     * @brief Topics with at least one local member
     */
    std::vector<std::string> get_topics() const;

    // ========================================================================
    // SwarmObserver
    // ========================================================================

    void on_peer_joined(const std::string& topic, const RemotePeer& peer) override;
    void on_peer_left(const std::string& topic, const std::string& peer_id) override;
    void on_sync(const std::string& peer_id, const SyncMessage& message) override;
    void on_awareness(const std::string& peer_id, const AwarenessMessage& message) override;
    void on_peer_list(const std::string& peer_id, const PeerListMessage& message) override;
    void on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) override;

private:
    struct ClientState {
        std::string client_id;
        std::shared_ptr<LocalClient> connection;
        bool identified = false;
        PeerInfo identity;          ///< peer_id is the client's public key
    };

    SwarmFactory swarm_factory_;
    LanDiscoveryFactory lan_factory_;
    size_t max_clients_;

    // Swarm (swapped by suspend/resume)
    std::shared_ptr<Swarm> swarm_;
    std::unique_ptr<LanDiscovery> lan_discovery_;
    mutable std::mutex swarm_mutex_;

    // Lifecycle, serialized by lifecycle_mutex_
    std::mutex lifecycle_mutex_;
    std::atomic<bool> initialized_;
    std::atomic<bool> suspended_;
    std::shared_ptr<const PeerIdentity> identity_;
    std::shared_ptr<const PeerIdentity> saved_identity_;
    std::set<std::string> saved_topics_;

    // Clients
    std::map<std::string, ClientState> clients_;
    uint64_t next_client_number_;
    mutable std::mutex clients_mutex_;

    TopicRoster roster_;

    // Client message handlers
    void handle_identity(const std::string& client_id, const IdentityMessage& message);
    void handle_join_topic(const std::string& client_id, const std::string& topic);
    void handle_leave_topic(const std::string& client_id, const std::string& topic);
    void handle_sync(const std::string& client_id, SyncMessage message);
    void handle_awareness(const std::string& client_id, AwarenessMessage message);
    void handle_send(const std::string& client_id, const SendMessage& message);

    /**
     * @brief Start swarm plus LAN discovery for an identity
     */
    std::shared_ptr<Swarm> build_swarm(const std::shared_ptr<const PeerIdentity>& identity);

    void start_lan_discovery(const std::shared_ptr<Swarm>& swarm);

    /**
     * @brief Stop and detach the current swarm and LAN discovery
     */
    std::shared_ptr<Swarm> teardown_swarm();

    std::optional<PeerInfo> client_identity(const std::string& client_id) const;
    std::shared_ptr<LocalClient> client_connection(const std::string& client_id) const;
    std::optional<std::string> client_by_peer_id(const std::string& peer_id) const;

    void send_to_client(const std::string& client_id, const std::string& message);
    void send_to_topic(const std::string& topic, const std::string& message, const std::string& exclude_client = "");
    void send_to_all(const std::string& message);
    void send_error(const std::string& client_id, const std::string& error, const std::string& detail = "");
};

} // namespace nightjar
