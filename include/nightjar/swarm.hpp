/**
 * @file swarm.hpp
 * @brief Swarm interfaces: point-to-point transport, swarm and observer
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SwarmManager is the production implementation. The bridge, the relay,
 * chunk transfer and seeding depend only on these interfaces so each can
 * be constructed against an isolated fake in tests.
 */

#pragma once

#include "nightjar/message_types.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace nightjar {

/**
 * @brief Authenticated remote peer as seen by the swarm
 */
struct RemotePeer {
    std::string peer_id;        ///< Public key hex
    std::string display_name;
    std::string color;
};

/**
 * @brief PeerTransport - point-to-point delivery by peer identity
 */
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    /**
     * @brief Deliver one serialized message to a connected peer
     * @return false if the peer is unknown, unauthenticated or the write failed
     */
    virtual bool send_to_peer(const std::string& peer_id, const std::string& message) = 0;

    /**
     * @brief Ids of authenticated, connected peers
     */
    virtual std::vector<std::string> get_connected_peers() const = 0;

    /**
     * @brief This process's own peer id
     */
    virtual std::string get_local_peer_id() const = 0;
};

/**
 * @brief SwarmObserver - one method per swarm event
 *
 * Methods are invoked on network threads; implementations must be
 * thread-safe. Default implementations ignore the event.
 */
class SwarmObserver {
public:
    virtual ~SwarmObserver() = default;

    /// A connection presented a valid signed identity
    virtual void on_peer_identity(const RemotePeer& /*peer*/) {}

    virtual void on_peer_joined(const std::string& /*topic*/, const RemotePeer& /*peer*/) {}

    virtual void on_peer_left(const std::string& /*topic*/, const std::string& /*peer_id*/) {}

    virtual void on_sync(const std::string& /*peer_id*/, const SyncMessage& /*message*/) {}

    virtual void on_awareness(const std::string& /*peer_id*/, const AwarenessMessage& /*message*/) {}

    virtual void on_peer_list(const std::string& /*peer_id*/, const PeerListMessage& /*message*/) {}

    /// Any message type the swarm does not interpret (chunk transfer and extensions)
    virtual void on_direct_message(const std::string& /*peer_id*/, const UnrecognizedMessage& /*message*/) {}

    virtual void on_peer_disconnected(const std::string& /*peer_id*/) {}
};

/**
 * @brief Swarm - topic membership plus peer connections
 */
class Swarm : public PeerTransport {
public:
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    /**
     * @brief Port accepting direct peer connections (0 if not listening)
     */
    virtual uint16_t get_listen_port() const = 0;

    /**
     * @brief Join a topic (idempotent)
     * @return true if joined or already a member
     */
    virtual bool join_topic(const std::string& topic) = 0;

    /**
     * @brief Leave a topic and tear down its discovery session (idempotent)
     */
    virtual bool leave_topic(const std::string& topic) = 0;

    virtual std::vector<std::string> get_topics() const = 0;

    /**
     * @brief Authenticated peers known to be members of a topic
     */
    virtual std::vector<RemotePeer> get_peers(const std::string& topic) const = 0;

    /**
     * @brief Send a sync message to every peer in its topic
     * @return Number of peers reached
     */
    virtual size_t broadcast_sync(const SyncMessage& message) = 0;

    virtual size_t broadcast_awareness(const AwarenessMessage& message) = 0;

    /**
     * @brief Open a direct connection (best effort)
     */
    virtual bool connect_to_peer(const std::string& host, uint16_t port) = 0;

    /**
     * @brief Register an observer (not owned; must outlive registration)
     */
    virtual void add_observer(SwarmObserver* observer) = 0;

    virtual void remove_observer(SwarmObserver* observer) = 0;
};

} // namespace nightjar
