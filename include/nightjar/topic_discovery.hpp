/**
 * @file topic_discovery.hpp
 * @brief Topic-based peer discovery (DHT boundary)
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The swarm treats discovery as a black box: announce interest in a topic,
 * look up peers announcing the same topic, resolve a peer id to an address.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <mutex>
#include <memory>
#include <cstdint>

namespace nightjar {

/**
 * @brief Network address of a swarm peer
 */
struct PeerEndpoint {
    std::string host;
    uint16_t port = 0;

    bool operator==(const PeerEndpoint& other) const {
        return host == other.host && port == other.port;
    }
};

/**
 * @brief Peer found through discovery
 */
struct DiscoveredPeer {
    std::string peer_id;        ///< Public key hex (may be empty for bootstrap entries)
    PeerEndpoint endpoint;
};

/**
 * @brief TopicDiscovery - discovery session interface
 */
class TopicDiscovery {
public:
    virtual ~TopicDiscovery() = default;

    /**
     * @brief Start announcing this peer on a topic
     */
    virtual bool announce(const std::string& topic, const std::string& peer_id,
                          const PeerEndpoint& endpoint) = 0;

    /**
     * @brief Stop announcing on a topic (tears down the session)
     */
    virtual void unannounce(const std::string& topic, const std::string& peer_id) = 0;

    /**
     * @brief Peers currently announcing a topic
     */
    virtual std::vector<DiscoveredPeer> lookup(const std::string& topic) const = 0;

    /**
     * @brief Address of a peer announcing any topic
     */
    virtual std::optional<PeerEndpoint> resolve_peer(const std::string& peer_id) const = 0;
};

/**
 * @brief TopicDirectory - in-process discovery shared by several swarms
 *
 * Serves peers running in the same process (tests, the relay's embedded
 * swarm and co-located nodes). One shared_ptr is handed to every swarm.
 */
class TopicDirectory : public TopicDiscovery {
public:
    TopicDirectory() = default;

    bool announce(const std::string& topic, const std::string& peer_id,
                  const PeerEndpoint& endpoint) override;
    void unannounce(const std::string& topic, const std::string& peer_id) override;
    std::vector<DiscoveredPeer> lookup(const std::string& topic) const override;
    std::optional<PeerEndpoint> resolve_peer(const std::string& peer_id) const override;

    /**
     * @brief Number of peers announcing a topic
     */
    size_t announced_count(const std::string& topic) const;

private:
    std::map<std::string, std::map<std::string, PeerEndpoint>> topics_;    ///< topic -> peer -> endpoint
    std::map<std::string, PeerEndpoint> endpoints_;                        ///< peer -> endpoint
    mutable std::mutex directory_mutex_;
};

/**
 * @brief BootstrapTopicDiscovery - fixed bootstrap addresses
 *
 * Every lookup returns the configured bootstrap endpoints (e.g. from a
 * share link's addr: parameter); announcing is local bookkeeping only.
 */
class BootstrapTopicDiscovery : public TopicDiscovery {
public:
    explicit BootstrapTopicDiscovery(std::vector<PeerEndpoint> bootstrap);

    bool announce(const std::string& topic, const std::string& peer_id,
                  const PeerEndpoint& endpoint) override;
    void unannounce(const std::string& topic, const std::string& peer_id) override;
    std::vector<DiscoveredPeer> lookup(const std::string& topic) const override;
    std::optional<PeerEndpoint> resolve_peer(const std::string& peer_id) const override;

    /**
     * @brief Parse "host:port" entries, skipping malformed ones
     */
    static std::vector<PeerEndpoint> parse_endpoints(const std::vector<std::string>& entries);

private:
    std::vector<PeerEndpoint> bootstrap_;
    std::set<std::string> announced_topics_;
    mutable std::mutex topics_mutex_;
};

} // namespace nightjar
