/**
 * @file topic_roster.cpp
 * @brief Implementation of local topic membership bookkeeping
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/topic_roster.hpp"

namespace nightjar {

TopicRoster::JoinResult TopicRoster::join(const std::string& topic, const std::string& client_id) {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    JoinResult result;
    auto& members = members_[topic];
    result.first_member = members.empty();
    result.joined = members.insert(client_id).second;
    if (!result.joined) {
        result.first_member = false;
        return result;
    }

    memberships_[client_id].insert(topic);
    return result;
}

TopicRoster::LeaveResult TopicRoster::leave(const std::string& topic, const std::string& client_id) {
    std::lock_guard<std::mutex> lock(roster_mutex_);
    return leave_locked(topic, client_id);
}

TopicRoster::LeaveResult TopicRoster::leave_locked(const std::string& topic, const std::string& client_id) {
    LeaveResult result;

    auto it = members_.find(topic);
    if (it == members_.end() || it->second.erase(client_id) == 0) {
        return result;
    }

    result.left = true;
    if (it->second.empty()) {
        members_.erase(it);
        result.last_member = true;
    }

    auto membership = memberships_.find(client_id);
    if (membership != memberships_.end()) {
        membership->second.erase(topic);
        if (membership->second.empty()) {
            memberships_.erase(membership);
        }
    }

    return result;
}

std::vector<std::pair<std::string, bool>> TopicRoster::leave_all(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    std::vector<std::pair<std::string, bool>> left;

    auto membership = memberships_.find(client_id);
    if (membership == memberships_.end()) {
        return left;
    }

    std::set<std::string> topics = membership->second;
    for (const auto& topic : topics) {
        auto result = leave_locked(topic, client_id);
        if (result.left) {
            left.emplace_back(topic, result.last_member);
        }
    }
    return left;
}

std::vector<std::string> TopicRoster::members(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    auto it = members_.find(topic);
    if (it == members_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> TopicRoster::topics_of(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    auto it = memberships_.find(client_id);
    if (it == memberships_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

size_t TopicRoster::topic_count(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    auto it = memberships_.find(client_id);
    return it == memberships_.end() ? 0 : it->second.size();
}

bool TopicRoster::is_member(const std::string& topic, const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    auto it = members_.find(topic);
    return it != members_.end() && it->second.count(client_id) > 0;
}

std::vector<std::string> TopicRoster::topics() const {
    std::lock_guard<std::mutex> lock(roster_mutex_);

    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& [topic, members] : members_) {
        result.push_back(topic);
    }
    return result;
}

void TopicRoster::clear() {
    std::lock_guard<std::mutex> lock(roster_mutex_);
    members_.clear();
    memberships_.clear();
}

} // namespace nightjar
