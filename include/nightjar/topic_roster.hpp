/**
 * @file topic_roster.hpp
 * @brief Topic membership of local clients
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Shared by the bridge and the relay. Reports first-interest and
 * last-member transitions so the caller joins or leaves the underlying
 * swarm topic exactly once.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>

namespace nightjar {

class TopicRoster {
public:
    struct JoinResult {
        bool joined = false;            ///< false if already a member
        bool first_member = false;      ///< Topic had no members before
    };

    struct LeaveResult {
        bool left = false;              ///< false if not a member
        bool last_member = false;       ///< Topic has no members now
    };

    TopicRoster() = default;

    // Disable copy and move
    TopicRoster(const TopicRoster&) = delete;
    TopicRoster& operator=(const TopicRoster&) = delete;
    TopicRoster(TopicRoster&&) = delete;
    TopicRoster& operator=(TopicRoster&&) = delete;

    JoinResult join(const std::string& topic, const std::string& client_id);

    LeaveResult leave(const std::string& topic, const std::string& client_id);

    /**
     * @brief Remove a client from every topic
     * @return Topics the client was in, each with its last-member flag
     */
    std::vector<std::pair<std::string, bool>> leave_all(const std::string& client_id);

    std::vector<std::string> members(const std::string& topic) const;

    std::vector<std::string> topics_of(const std::string& client_id) const;

    size_t topic_count(const std::string& client_id) const;

    bool is_member(const std::string& topic, const std::string& client_id) const;

    /**
     * @brief Topics with at least one member
     */
    std::vector<std::string> topics() const;

    void clear();

private:
    std::map<std::string, std::set<std::string>> members_;     ///< topic -> clients
    std::map<std::string, std::set<std::string>> memberships_; ///< client -> topics
    mutable std::mutex roster_mutex_;

    LeaveResult leave_locked(const std::string& topic, const std::string& client_id);
};

} // namespace nightjar
