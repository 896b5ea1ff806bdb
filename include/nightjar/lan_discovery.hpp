/**
 * @file lan_discovery.hpp
 * @brief Local network peer discovery
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Peers on the same LAN announce their swarm endpoint over UDP broadcast.
 * Where broadcast is not possible the bridge falls back to the unavailable
 * implementation, which never reports a peer.
 */

#pragma once

#include "nightjar/mesh_config.hpp"
#include <asio.hpp>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <chrono>
#include <optional>

namespace nightjar {

/**
 * @brief Peer seen on the local network
 */
struct LanPeer {
    std::string peer_id;                                ///< Public key hex
    std::string host;                                   ///< Sender address
    uint16_t port = 0;                                  ///< Swarm listen port
    std::chrono::steady_clock::time_point last_seen;
};

using LanPeerCallback = std::function<void(const LanPeer& peer)>;

/**
 * @brief Broadcast announcement payload
 */
struct LanAnnounce {
    std::string peer_id;
    uint16_t port = 0;
    uint64_t timestamp = 0;

    std::string to_json() const;
    static std::optional<LanAnnounce> from_json(const std::string& json_str);
};

/**
 * @brief LanDiscovery - abstract local network discovery
 */
class LanDiscovery {
public:
    virtual ~LanDiscovery() = default;

    /**
     * @return false if discovery cannot run on this host
     */
    virtual bool start() = 0;
    virtual void stop() = 0;

    virtual bool is_available() const = 0;

    /**
     * @brief Broadcast our endpoint once
     */
    virtual bool announce() = 0;

    virtual std::vector<LanPeer> get_peers() const = 0;

    virtual void set_peer_callback(LanPeerCallback callback) = 0;
};

/**
 * @brief No-op discovery for hosts without broadcast
 */
class UnavailableLanDiscovery : public LanDiscovery {
public:
    bool start() override { return false; }
    void stop() override {}
    bool is_available() const override { return false; }
    bool announce() override { return false; }
    std::vector<LanPeer> get_peers() const override { return {}; }
    void set_peer_callback(LanPeerCallback /*callback*/) override {}
};

/**
 * @brief UDP broadcast discovery
 *
 * Owns a single-threaded io_context. Announces every LAN_ANNOUNCE_INTERVAL
 * while running and reports each newly seen or moved peer to the callback.
 */
class UdpLanDiscovery : public LanDiscovery {
public:
    UdpLanDiscovery(
        std::string local_peer_id,
        uint16_t swarm_port,
        uint16_t discovery_port = config::LAN_DISCOVERY_PORT,
        std::chrono::milliseconds announce_interval = config::LAN_ANNOUNCE_INTERVAL
    );

    ~UdpLanDiscovery() override;

    // Disable copy and move
    UdpLanDiscovery(const UdpLanDiscovery&) = delete;
    UdpLanDiscovery& operator=(const UdpLanDiscovery&) = delete;
    UdpLanDiscovery(UdpLanDiscovery&&) = delete;
    UdpLanDiscovery& operator=(UdpLanDiscovery&&) = delete;

    bool start() override;
    void stop() override;
    bool is_available() const override;
    bool announce() override;
    std::vector<LanPeer> get_peers() const override;
    void set_peer_callback(LanPeerCallback callback) override;

    /**
     * @brief Forget peers not heard from within max_age
     */
    size_t cleanup_stale_peers(std::chrono::seconds max_age = std::chrono::minutes(1));

private:
    std::string local_peer_id_;
    uint16_t swarm_port_;
    uint16_t discovery_port_;
    std::chrono::milliseconds announce_interval_;

    asio::io_context io_context_;
    asio::ip::udp::socket socket_;
    asio::steady_timer announce_timer_;
    asio::ip::udp::endpoint sender_endpoint_;
    std::array<uint8_t, config::MAX_UDP_PACKET_SIZE> recv_buffer_;
    std::thread io_thread_;
    std::atomic<bool> running_;

    std::map<std::string, LanPeer> peers_;      ///< peer_id -> peer
    mutable std::mutex peers_mutex_;

    LanPeerCallback peer_callback_;
    std::mutex callback_mutex_;

    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    void schedule_announce();
};

/**
 * @brief UDP discovery if it starts, otherwise the unavailable variant
 */
std::unique_ptr<LanDiscovery> create_lan_discovery(
    const std::string& local_peer_id,
    uint16_t swarm_port,
    uint16_t discovery_port = config::LAN_DISCOVERY_PORT
);

} // namespace nightjar
