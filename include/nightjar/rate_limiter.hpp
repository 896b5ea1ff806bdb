/**
 * @file rate_limiter.hpp
 * @brief Per-client token bucket for relay message admission
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Sustained rate and burst default to the relay constants (100 msg/s,
 * burst of 200). Buckets are keyed by relay client id.
 */

#pragma once

#include "nightjar/mesh_config.hpp"
#include <string>
#include <chrono>
#include <mutex>
#include <map>

namespace nightjar {

/**
 * @brief Token bucket state for one client
 */
struct TokenBucket {
    double tokens;                                      ///< Currently available
    std::chrono::steady_clock::time_point last_refill;
    std::chrono::steady_clock::time_point last_seen;

    explicit TokenBucket(double burst)
        : tokens(burst)
        , last_refill(std::chrono::steady_clock::now())
        , last_seen(last_refill)
    {}
};

/**
 * @brief RateLimiter - token bucket admission per client
 *
 * Thread-safe. A client starts with a full bucket; each admitted message
 * consumes one token and tokens refill continuously up to the burst size.
 */
class RateLimiter {
public:
    explicit RateLimiter(
        double rate_per_second = config::RELAY_RATE_PER_SECOND,
        double burst_capacity = config::RELAY_RATE_BURST
    );

    // Disable copy and move
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    /**
     * @brief Admit one message (consumes a token when allowed)
     * @return false if the client exceeded its rate
     */
    bool allow(const std::string& client_id);

    /**
     * @brief Tokens available to a client (burst capacity if untracked)
     */
    double available_tokens(const std::string& client_id);

    /**
     * @brief Stop tracking a client (on disconnect)
     */
    void forget(const std::string& client_id);

    size_t tracked_count() const;

    /**
     * @brief Drop buckets of clients idle longer than the threshold
     * @return Number of buckets removed
     */
    size_t cleanup_inactive(std::chrono::seconds idle_threshold = std::chrono::minutes(5));

    void clear();

private:
    double rate_per_second_;
    double burst_capacity_;

    std::map<std::string, TokenBucket> buckets_;    ///< client_id -> bucket
    mutable std::mutex buckets_mutex_;

    /**
     * @brief Add tokens for the time elapsed since the last refill
     */
    void refill(TokenBucket& bucket) const;
};

} // namespace nightjar
