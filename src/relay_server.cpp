/**
 * @file relay_server.cpp
 * @brief Implementation of the client relay
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/relay_server.hpp"
#include "nightjar/peer_identity.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>
#include <stdexcept>

namespace nightjar {

using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::log_error;
using utilities::short_id;

namespace {
    constexpr auto AUTH_CHECK_INTERVAL = std::chrono::seconds(1);
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

RelayServer::RelayServer(std::shared_ptr<Swarm> swarm, RelayOptions options)
    : swarm_(std::move(swarm))
    , options_(std::move(options))
    , running_(false)
    , port_(0)
    , client_counter_(0)
    , rate_limiter_(options_.rate_per_second, options_.rate_burst)
{
    if (!swarm_) {
        throw std::invalid_argument("RelayServer: swarm cannot be null");
    }
    swarm_->add_observer(this);
}

RelayServer::~RelayServer() {
    stop();
    swarm_->remove_observer(this);
}

// ============================================================================
// Lifecycle
// ============================================================================

bool RelayServer::start() {
    if (running_.exchange(true)) {
        return true;
    }

    try {
        if (!swarm_->is_running() && !swarm_->start()) {
            throw std::runtime_error("swarm failed to start");
        }

        io_context_.restart();

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
            io_context_,
            asio::ip::tcp::endpoint(asio::ip::make_address(options_.listen_address), options_.port)
        );
        port_ = acceptor_->local_endpoint().port();

        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));
        auth_timer_ = std::make_unique<asio::steady_timer>(io_context_);
        heartbeat_timer_ = std::make_unique<asio::steady_timer>(io_context_);

        start_accept();
        schedule_auth_check();
        schedule_heartbeat();

        size_t num_threads = std::max<size_t>(1, options_.worker_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    log_error("RelayServer: Worker thread error: " + std::string(e.what()));
                }
            });
        }

        log_info("RelayServer: Listening on " + options_.listen_address + ":" + std::to_string(port_.load()) +
                 " as " + short_id(swarm_->get_local_peer_id()));
        return true;

    } catch (const std::exception& e) {
        log_error("RelayServer: Failed to start: " + std::string(e.what()));
        running_ = false;
        acceptor_.reset();
        work_guard_.reset();
        auth_timer_.reset();
        heartbeat_timer_.reset();
        return false;
    }
}

void RelayServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    log_info("RelayServer: Stopping...");

    std::vector<std::string> client_ids;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [client_id, state] : clients_) {
            client_ids.push_back(client_id);
        }
    }
    for (const auto& client_id : client_ids) {
        terminate_client(client_id, close_reason::SHUTDOWN);
    }

    asio::post(io_context_, [this]() {
        asio::error_code ec;
        if (acceptor_) {
            acceptor_->close(ec);
        }
        auth_timer_->cancel();
        heartbeat_timer_->cancel();
    });

    // Workers exit once shutdown notices have flushed or lingered out
    work_guard_.reset();
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    acceptor_.reset();
    auth_timer_.reset();
    heartbeat_timer_.reset();

    swarm_->stop();
    roster_.clear();
    rate_limiter_.clear();

    log_info("RelayServer: Stopped");
}

bool RelayServer::is_running() const {
    return running_.load();
}

uint16_t RelayServer::get_port() const {
    return port_.load();
}

void RelayServer::start_accept() {
    acceptor_->async_accept(
        [this](const asio::error_code& error, asio::ip::tcp::socket socket) {
            if (!error) {
                auto line = std::make_shared<LineConnection>(std::move(socket), options_.max_message_size);
                std::string client_id = attach_client(std::make_shared<LineClient>(line));

                line->start(
                    [this, client_id](const std::string& message) { handle_client_message(client_id, message); },
                    [this, client_id](const std::string& reason) {
                        log_debug("RelayServer: " + client_id + " closed: " + reason);
                        detach_client(client_id);
                    }
                );

                // Raced with stop(): its client sweep may already be done
                if (!running_) {
                    terminate_client(client_id, close_reason::SHUTDOWN);
                }
            } else if (error != asio::error::operation_aborted) {
                log_warn("RelayServer: Accept failed: " + error.message());
            }

            if (running_ && acceptor_ && acceptor_->is_open()) {
                start_accept();
            }
        });
}

void RelayServer::schedule_auth_check() {
    auth_timer_->expires_after(std::min<std::chrono::milliseconds>(AUTH_CHECK_INTERVAL, options_.auth_timeout));
    auth_timer_->async_wait([this](const asio::error_code& error) {
        if (error || !running_) {
            return;
        }
        check_auth_timeouts();
        schedule_auth_check();
    });
}

void RelayServer::schedule_heartbeat() {
    heartbeat_timer_->expires_after(options_.heartbeat_interval);
    heartbeat_timer_->async_wait([this](const asio::error_code& error) {
        if (error || !running_) {
            return;
        }
        check_heartbeats();
        rate_limiter_.cleanup_inactive();
        schedule_heartbeat();
    });
}

// ============================================================================
// Clients
// ============================================================================

std::string RelayServer::attach_client(std::shared_ptr<LocalClient> client) {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(clients_mutex_);

    ClientState state;
    state.client_id = "client-" + std::to_string(++client_counter_);
    state.connection = std::move(client);
    state.connected_at = now;
    state.last_pong = now;

    std::string client_id = state.client_id;
    clients_[client_id] = std::move(state);

    log_info("RelayServer: Client connected: " + client_id);
    return client_id;
}

void RelayServer::detach_client(const std::string& client_id) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (clients_.count(client_id) == 0) {
            return;
        }
    }

    // Leave while still registered so departures reach the other members
    for (const auto& topic : roster_.topics_of(client_id)) {
        handle_leave_topic(client_id, topic);
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.erase(client_id);
    }
    rate_limiter_.forget(client_id);

    log_info("RelayServer: Client disconnected: " + client_id);
}

void RelayServer::terminate_client(const std::string& client_id, const std::string& reason) {
    auto connection = client_connection(client_id);
    detach_client(client_id);
    if (connection) {
        connection->close(reason);
    }
}

void RelayServer::handle_client_message(const std::string& client_id, const std::string& message) {
    if (!client_connection(client_id)) {
        return;
    }

    if (!rate_limiter_.allow(client_id)) {
        send_error(client_id, relay_error::RATE_LIMITED);
        return;
    }

    auto parsed = parse_client_message(message);
    if (!parsed) {
        log_warn("RelayServer: Malformed message from " + client_id);
        send_error(client_id, relay_error::INVALID_MESSAGE);
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
        } else if (std::holds_alternative<PongMessage>(*parsed)) {
            handle_pong(client_id);
        } else if (auto* other = std::get_if<UnrecognizedMessage>(&*parsed)) {
            log_debug("RelayServer: Unknown message type from " + client_id + ": " + other->type);
        }
    } catch (const std::exception& e) {
        log_error("RelayServer: Error handling message from " + client_id + ": " + e.what());
        send_error(client_id, relay_error::INVALID_MESSAGE, e.what());
    }
}

void RelayServer::handle_identity(const std::string& client_id, const IdentityMessage& message) {
    // Unsigned identities are accepted; a signature that is present must verify
    if (!message.signature.empty() && !PeerIdentity::verify_identity_message(message)) {
        log_warn("RelayServer: Client " + client_id + " sent an identity with a bad signature");
        send_error(client_id, relay_error::INVALID_IDENTITY);
        return;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return;
    }

    it->second.authenticated = true;
    it->second.public_key = message.public_key;
    it->second.display_name = message.display_name;
    it->second.color = message.color;

    log_info("RelayServer: Client " + client_id + " identified as " + message.display_name);
}

void RelayServer::handle_join_topic(const std::string& client_id, const std::string& topic) {
    auto joiner = client_info(client_id);
    if (!joiner) {
        send_error(client_id, relay_error::IDENTITY_REQUIRED);
        return;
    }
    if (topic.empty() || topic.size() > options_.max_topic_length) {
        send_error(client_id, relay_error::INVALID_TOPIC);
        return;
    }
    if (roster_.is_member(topic, client_id)) {
        return;
    }
    if (roster_.topic_count(client_id) >= options_.max_topics_per_client) {
        send_error(client_id, relay_error::TOO_MANY_TOPICS);
        return;
    }

    auto result = roster_.join(topic, client_id);
    if (!result.joined) {
        return;
    }

    if (result.first_member && !swarm_->join_topic(topic)) {
        log_warn("RelayServer: Swarm rejected topic " + short_id(topic, 16));
    }

    log_info("RelayServer: Client " + client_id + " joined topic " + short_id(topic, 16) + "...");

    send_to_topic(topic, PeerJoinedMessage{topic, *joiner}.to_json(), client_id);

    PeersListMessage roster;
    roster.topic = topic;
    for (const auto& member : roster_.members(topic)) {
        if (member == client_id) {
            continue;
        }
        auto info = client_info(member);
        if (info) {
            roster.peers.push_back(*info);
        }
    }
    for (const auto& peer : swarm_->get_peers(topic)) {
        roster.peers.push_back(PeerInfo{peer.peer_id, peer.display_name, peer.color});
    }
    send_to_client(client_id, roster.to_json());
}

void RelayServer::handle_leave_topic(const std::string& client_id, const std::string& topic) {
    auto result = roster_.leave(topic, client_id);
    if (!result.left) {
        return;
    }

    if (result.last_member) {
        swarm_->leave_topic(topic);
    } else {
        send_to_topic(topic, PeerLeftMessage{topic, client_id}.to_json());
    }

    log_info("RelayServer: Client " + client_id + " left topic " + short_id(topic, 16) + "...");
}

void RelayServer::handle_sync(const std::string& client_id, SyncMessage message) {
    if (!roster_.is_member(message.topic, client_id)) {
        return;
    }
    if (message.data_json.size() > options_.max_sync_size) {
        send_error(client_id, relay_error::SYNC_TOO_LARGE);
        return;
    }

    message.from = client_id;
    send_to_topic(message.topic, message.to_json(), client_id);
    swarm_->broadcast_sync(message);
}

void RelayServer::handle_awareness(const std::string& client_id, AwarenessMessage message) {
    if (!roster_.is_member(message.topic, client_id)) {
        return;
    }
    if (message.state_json.size() > options_.max_awareness_size) {
        send_error(client_id, relay_error::AWARENESS_TOO_LARGE);
        return;
    }

    message.from = client_id;
    send_to_topic(message.topic, message.to_json(), client_id);
    swarm_->broadcast_awareness(message);
}

void RelayServer::handle_send(const std::string& client_id, const SendMessage& message) {
    if (!client_info(client_id)) {
        send_error(client_id, relay_error::IDENTITY_REQUIRED);
        return;
    }

    if (client_info(message.to)) {
        auto stamped = stamp_sender(message.payload_json, client_id);
        if (stamped) {
            send_to_client(message.to, *stamped);
        }
        return;
    }

    if (!swarm_->send_to_peer(message.to, message.payload_json)) {
        send_error(client_id, relay_error::PEER_UNREACHABLE, message.to);
    }
}

void RelayServer::handle_pong(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    if (it != clients_.end()) {
        it->second.last_pong = std::chrono::steady_clock::now();
    }
}

size_t RelayServer::check_auth_timeouts(std::chrono::steady_clock::time_point now) {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [client_id, state] : clients_) {
            if (!state.authenticated && now - state.connected_at >= options_.auth_timeout) {
                expired.push_back(client_id);
            }
        }
    }

    for (const auto& client_id : expired) {
        log_warn("RelayServer: Client " + client_id + " failed to authenticate within timeout, closing");
        terminate_client(client_id, close_reason::AUTH_TIMEOUT);
    }
    return expired.size();
}

size_t RelayServer::check_heartbeats(std::chrono::steady_clock::time_point now) {
    std::vector<std::string> stale;
    std::vector<std::shared_ptr<LocalClient>> live;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [client_id, state] : clients_) {
            if (now - state.last_pong > options_.heartbeat_timeout) {
                stale.push_back(client_id);
            } else {
                live.push_back(state.connection);
            }
        }
    }

    for (const auto& client_id : stale) {
        log_info("RelayServer: Terminating stale client: " + client_id);
        terminate_client(client_id, close_reason::HEARTBEAT_TIMEOUT);
    }

    const std::string ping = PingMessage{utilities::current_time_ms()}.to_json();
    for (auto& connection : live) {
        connection->send(ping);
    }

    return stale.size();
}

size_t RelayServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

bool RelayServer::is_authenticated(const std::string& client_id) const {
    return client_info(client_id).has_value();
}

std::vector<std::string> RelayServer::get_client_topics(const std::string& client_id) const {
    return roster_.topics_of(client_id);
}

// ============================================================================
// SwarmObserver
// ============================================================================

void RelayServer::on_peer_joined(const std::string& topic, const RemotePeer& peer) {
    send_to_topic(topic, PeerJoinedMessage{topic, PeerInfo{peer.peer_id, peer.display_name, peer.color}}.to_json());
}

void RelayServer::on_peer_left(const std::string& topic, const std::string& peer_id) {
    send_to_topic(topic, PeerLeftMessage{topic, peer_id}.to_json());
}

void RelayServer::on_sync(const std::string& /*peer_id*/, const SyncMessage& message) {
    send_to_topic(message.topic, message.to_json());
}

void RelayServer::on_awareness(const std::string& /*peer_id*/, const AwarenessMessage& message) {
    send_to_topic(message.topic, message.to_json());
}

void RelayServer::on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) {
    auto stamped = stamp_sender(message.raw, peer_id);
    const std::string& outgoing = stamped ? *stamped : message.raw;

    std::vector<std::shared_ptr<LocalClient>> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [client_id, state] : clients_) {
            if (state.authenticated) {
                targets.push_back(state.connection);
            }
        }
    }
    for (auto& connection : targets) {
        connection->send(outgoing);
    }
}

// ============================================================================
// Private Helpers
// ============================================================================

std::optional<PeerInfo> RelayServer::client_info(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    if (it == clients_.end() || !it->second.authenticated) {
        return std::nullopt;
    }
    return PeerInfo{client_id, it->second.display_name, it->second.color};
}

std::shared_ptr<LocalClient> RelayServer::client_connection(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);

    auto it = clients_.find(client_id);
    return it == clients_.end() ? nullptr : it->second.connection;
}

void RelayServer::send_to_client(const std::string& client_id, const std::string& message) {
    auto connection = client_connection(client_id);
    if (connection) {
        connection->send(message);
    }
}

void RelayServer::send_error(const std::string& client_id, const std::string& error, const std::string& detail) {
    send_to_client(client_id, ErrorMessage{error, detail}.to_json());
}

void RelayServer::send_to_topic(
    const std::string& topic,
    const std::string& message,
    const std::string& exclude_client
) {
    for (const auto& member : roster_.members(topic)) {
        if (member == exclude_client || !client_info(member)) {
            continue;
        }
        send_to_client(member, message);
    }
}

} // namespace nightjar
