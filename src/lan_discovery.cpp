/**
 * @file lan_discovery.cpp
 * @brief Implementation of UDP broadcast LAN discovery
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/lan_discovery.hpp"
#include "nightjar/utilities.hpp"
#include <nlohmann/json.hpp>

namespace nightjar {

using json = nlohmann::json;
using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::log_error;

namespace {
constexpr const char* LAN_ANNOUNCE_TYPE = "lan-announce";
}

// ============================================================================
// LanAnnounce
// ============================================================================

std::string LanAnnounce::to_json() const {
    json j;
    j["type"] = LAN_ANNOUNCE_TYPE;
    j["peerId"] = peer_id;
    j["port"] = port;
    j["timestamp"] = timestamp;
    return j.dump();
}

std::optional<LanAnnounce> LanAnnounce::from_json(const std::string& json_str) {
    try {
        auto j = json::parse(json_str);
        if (j.value("type", "") != LAN_ANNOUNCE_TYPE) {
            return std::nullopt;
        }

        LanAnnounce announce;
        announce.peer_id = j.at("peerId").get<std::string>();
        announce.port = j.at("port").get<uint16_t>();
        announce.timestamp = j.value("timestamp", uint64_t(0));

        if (!config::validate_public_key_hex(announce.peer_id) || announce.port == 0) {
            return std::nullopt;
        }
        return announce;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// UdpLanDiscovery
// ============================================================================

UdpLanDiscovery::UdpLanDiscovery(
    std::string local_peer_id,
    uint16_t swarm_port,
    uint16_t discovery_port,
    std::chrono::milliseconds announce_interval
)
    : local_peer_id_(std::move(local_peer_id))
    , swarm_port_(swarm_port)
    , discovery_port_(discovery_port)
    , announce_interval_(announce_interval)
    , socket_(io_context_)
    , announce_timer_(io_context_)
    , running_(false)
{
}

UdpLanDiscovery::~UdpLanDiscovery() {
    stop();
}

bool UdpLanDiscovery::start() {
    if (running_.load()) {
        return true;
    }

    try {
        io_context_.restart();

        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::broadcast(true));
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), discovery_port_));

        running_.store(true);
        start_receive();
        schedule_announce();

        io_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("LanDiscovery: io_context exception: " + std::string(e.what()));
            }
        });

        log_info("LanDiscovery: Listening on UDP port " + std::to_string(discovery_port_));
        announce();
        return true;

    } catch (const std::exception& e) {
        log_warn("LanDiscovery: Unavailable: " + std::string(e.what()));
        running_.store(false);
        asio::error_code ignored;
        socket_.close(ignored);
        return false;
    }
}

void UdpLanDiscovery::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    asio::error_code ec;
    announce_timer_.cancel();
    socket_.close(ec);
    log_info("LanDiscovery: Stopped");
}

bool UdpLanDiscovery::is_available() const {
    return running_.load();
}

bool UdpLanDiscovery::announce() {
    if (!running_.load()) {
        return false;
    }

    LanAnnounce announcement;
    announcement.peer_id = local_peer_id_;
    announcement.port = swarm_port_;
    announcement.timestamp = utilities::current_time_ms();
    const std::string payload = announcement.to_json();

    try {
        asio::ip::udp::endpoint broadcast(asio::ip::address_v4::broadcast(), discovery_port_);
        socket_.send_to(asio::buffer(payload), broadcast);
        return true;
    } catch (const std::exception& e) {
        log_debug("LanDiscovery: Broadcast failed: " + std::string(e.what()));
        return false;
    }
}

std::vector<LanPeer> UdpLanDiscovery::get_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    std::vector<LanPeer> result;
    result.reserve(peers_.size());
    for (const auto& [peer_id, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

void UdpLanDiscovery::set_peer_callback(LanPeerCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    peer_callback_ = std::move(callback);
}

size_t UdpLanDiscovery::cleanup_stale_peers(std::chrono::seconds max_age) {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    for (auto it = peers_.begin(); it != peers_.end(); ) {
        if (now - it->second.last_seen > max_age) {
            it = peers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ============================================================================
// Private Methods - Network Operations
// ============================================================================

void UdpLanDiscovery::schedule_announce() {
    announce_timer_.expires_after(announce_interval_);
    announce_timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_.load()) {
            return;
        }
        announce();
        cleanup_stale_peers();
        schedule_announce();
    });
}

void UdpLanDiscovery::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        }
    );
}

void UdpLanDiscovery::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error) {
        if (error != asio::error::operation_aborted) {
            log_error("LanDiscovery: Receive error: " + error.message());
        }
        return;
    }

    auto announcement = LanAnnounce::from_json(
        std::string(recv_buffer_.begin(), recv_buffer_.begin() + bytes_transferred));

    if (announcement && announcement->peer_id != local_peer_id_) {
        LanPeer peer;
        peer.peer_id = announcement->peer_id;
        peer.host = sender_endpoint_.address().to_string();
        peer.port = announcement->port;
        peer.last_seen = std::chrono::steady_clock::now();

        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            auto it = peers_.find(peer.peer_id);
            changed = it == peers_.end() || it->second.host != peer.host || it->second.port != peer.port;
            peers_[peer.peer_id] = peer;
        }

        if (changed) {
            log_debug("LanDiscovery: Found " + utilities::short_id(peer.peer_id) + " at " +
                      peer.host + ":" + std::to_string(peer.port));

            LanPeerCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = peer_callback_;
            }
            if (callback) {
                try {
                    callback(peer);
                } catch (const std::exception& e) {
                    log_error("LanDiscovery: Peer callback failed: " + std::string(e.what()));
                }
            }
        }
    }

    if (running_.load()) {
        start_receive();
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<LanDiscovery> create_lan_discovery(
    const std::string& local_peer_id,
    uint16_t swarm_port,
    uint16_t discovery_port
) {
    auto udp = std::make_unique<UdpLanDiscovery>(local_peer_id, swarm_port, discovery_port);
    if (udp->start()) {
        return udp;
    }
    return std::make_unique<UnavailableLanDiscovery>();
}

} // namespace nightjar
