/**
 * @file rate_limiter.cpp
 * @brief Implementation of per-client token bucket admission
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/rate_limiter.hpp"
#include <algorithm>

namespace nightjar {

RateLimiter::RateLimiter(double rate_per_second, double burst_capacity)
    : rate_per_second_(rate_per_second)
    , burst_capacity_(burst_capacity)
{
}

// ============================================================================
// Admission
// ============================================================================

bool RateLimiter::allow(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(buckets_mutex_);

    auto it = buckets_.find(client_id);
    if (it == buckets_.end()) {
        it = buckets_.emplace(client_id, TokenBucket(burst_capacity_)).first;
    }

    TokenBucket& bucket = it->second;
    refill(bucket);
    bucket.last_seen = std::chrono::steady_clock::now();

    if (bucket.tokens < 1.0) {
        return false;
    }

    bucket.tokens -= 1.0;
    return true;
}

double RateLimiter::available_tokens(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(buckets_mutex_);

    auto it = buckets_.find(client_id);
    if (it == buckets_.end()) {
        return burst_capacity_;
    }

    refill(it->second);
    return it->second.tokens;
}

void RateLimiter::refill(TokenBucket& bucket) const {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = now - bucket.last_refill;

    bucket.tokens = std::min(burst_capacity_, bucket.tokens + elapsed.count() * rate_per_second_);
    bucket.last_refill = now;
}

// ============================================================================
// Bookkeeping
// ============================================================================

void RateLimiter::forget(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    buckets_.erase(client_id);
}

size_t RateLimiter::tracked_count() const {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    return buckets_.size();
}

size_t RateLimiter::cleanup_inactive(std::chrono::seconds idle_threshold) {
    std::lock_guard<std::mutex> lock(buckets_mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (now - it->second.last_seen > idle_threshold) {
            it = buckets_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    return removed;
}

void RateLimiter::clear() {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    buckets_.clear();
}

} // namespace nightjar
