/**
 * @file topic_discovery.cpp
 * @brief In-process and bootstrap-list discovery implementations
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/topic_discovery.hpp"
#include "nightjar/utilities.hpp"

namespace nightjar {

// ============================================================================
// TopicDirectory
// ============================================================================

bool TopicDirectory::announce(
    const std::string& topic,
    const std::string& peer_id,
    const PeerEndpoint& endpoint
) {
    if (topic.empty() || peer_id.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(directory_mutex_);
    topics_[topic][peer_id] = endpoint;
    endpoints_[peer_id] = endpoint;
    return true;
}

void TopicDirectory::unannounce(const std::string& topic, const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(directory_mutex_);

    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return;
    }

    it->second.erase(peer_id);
    if (it->second.empty()) {
        topics_.erase(it);
    }

    // Keep the address while the peer still announces another topic
    for (const auto& [name, peers] : topics_) {
        if (peers.count(peer_id) > 0) {
            return;
        }
    }
    endpoints_.erase(peer_id);
}

std::vector<DiscoveredPeer> TopicDirectory::lookup(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(directory_mutex_);

    std::vector<DiscoveredPeer> peers;
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return peers;
    }

    for (const auto& [peer_id, endpoint] : it->second) {
        peers.push_back({peer_id, endpoint});
    }
    return peers;
}

std::optional<PeerEndpoint> TopicDirectory::resolve_peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(directory_mutex_);

    auto it = endpoints_.find(peer_id);
    if (it == endpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TopicDirectory::announced_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(directory_mutex_);

    auto it = topics_.find(topic);
    return it == topics_.end() ? 0 : it->second.size();
}

// ============================================================================
// BootstrapTopicDiscovery
// ============================================================================

BootstrapTopicDiscovery::BootstrapTopicDiscovery(std::vector<PeerEndpoint> bootstrap)
    : bootstrap_(std::move(bootstrap))
{
}

bool BootstrapTopicDiscovery::announce(
    const std::string& topic,
    const std::string& /*peer_id*/,
    const PeerEndpoint& /*endpoint*/
) {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    announced_topics_.insert(topic);
    return true;
}

void BootstrapTopicDiscovery::unannounce(const std::string& topic, const std::string& /*peer_id*/) {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    announced_topics_.erase(topic);
}

std::vector<DiscoveredPeer> BootstrapTopicDiscovery::lookup(const std::string& topic) const {
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        if (announced_topics_.count(topic) == 0) {
            return {};
        }
    }

    std::vector<DiscoveredPeer> peers;
    for (const auto& endpoint : bootstrap_) {
        peers.push_back({"", endpoint});
    }
    return peers;
}

std::optional<PeerEndpoint> BootstrapTopicDiscovery::resolve_peer(const std::string& /*peer_id*/) const {
    return std::nullopt;
}

std::vector<PeerEndpoint> BootstrapTopicDiscovery::parse_endpoints(const std::vector<std::string>& entries) {
    std::vector<PeerEndpoint> endpoints;

    for (const auto& raw : entries) {
        std::string entry = utilities::trim_string(raw);
        auto colon = entry.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= entry.size()) {
            utilities::log_warn("BootstrapTopicDiscovery: Skipping malformed address '" + entry + "'");
            continue;
        }

        try {
            int port = std::stoi(entry.substr(colon + 1));
            if (port <= 0 || port > 65535) {
                continue;
            }
            endpoints.push_back({entry.substr(0, colon), static_cast<uint16_t>(port)});
        } catch (const std::exception&) {
            utilities::log_warn("BootstrapTopicDiscovery: Invalid port in '" + entry + "'");
        }
    }

    return endpoints;
}

} // namespace nightjar
