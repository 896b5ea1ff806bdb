/**
 * @file seeding_maintainer.cpp
 * @brief Implementation of background replication maintenance
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/seeding_maintainer.hpp"
#include "nightjar/message_types.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>
#include <stdexcept>

namespace nightjar {

using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::log_error;
using utilities::short_id;

// ============================================================================
// Constructor / Destructor
// ============================================================================

SeedingMaintainer::SeedingMaintainer(
    std::shared_ptr<FileCatalog> catalog,
    std::shared_ptr<ChunkStore> store,
    std::shared_ptr<AvailabilityLedger> ledger,
    std::shared_ptr<PeerTransport> transport,
    std::shared_ptr<ChunkTransfer> transfer,
    SeedingOptions options
)
    : catalog_(std::move(catalog))
    , store_(std::move(store))
    , ledger_(std::move(ledger))
    , transport_(std::move(transport))
    , transfer_(std::move(transfer))
    , options_(options)
    , running_(false)
    , trigger_pending_(false)
    , last_sent_total_(0)
    , last_received_total_(0)
{
    if (!catalog_ || !store_ || !ledger_ || !transport_) {
        throw std::invalid_argument("SeedingMaintainer: catalog, store, ledger and transport are required");
    }
    if (options_.max_concurrent_seeds == 0) {
        options_.max_concurrent_seeds = 1;
    }
}

SeedingMaintainer::~SeedingMaintainer() {
    stop();
}

// ============================================================================
// Scopes
// ============================================================================

void SeedingMaintainer::add_scope(const std::string& scope_id, size_t redundancy_target) {
    std::lock_guard<std::mutex> lock(scopes_mutex_);
    scopes_[scope_id] = redundancy_target;
}

void SeedingMaintainer::remove_scope(const std::string& scope_id) {
    std::lock_guard<std::mutex> lock(scopes_mutex_);
    scopes_.erase(scope_id);
}

bool SeedingMaintainer::set_redundancy_target(const std::string& scope_id, size_t redundancy_target) {
    std::lock_guard<std::mutex> lock(scopes_mutex_);

    auto it = scopes_.find(scope_id);
    if (it == scopes_.end()) {
        return false;
    }
    it->second = redundancy_target;
    return true;
}

size_t SeedingMaintainer::get_redundancy_target(const std::string& scope_id) const {
    std::lock_guard<std::mutex> lock(scopes_mutex_);

    auto it = scopes_.find(scope_id);
    return it == scopes_.end() ? config::DEFAULT_REDUNDANCY_TARGET : it->second;
}

std::vector<std::string> SeedingMaintainer::get_scopes() const {
    std::lock_guard<std::mutex> lock(scopes_mutex_);

    std::vector<std::string> result;
    for (const auto& [scope_id, target] : scopes_) {
        result.push_back(scope_id);
    }
    return result;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SeedingMaintainer::start() {
    if (running_.load()) {
        return true;
    }

    running_.store(true);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        trigger_pending_ = false;
    }

    worker_ = std::thread([this]() { worker_loop(); });

    log_info("SeedingMaintainer: Started (interval " +
             utilities::format_duration(
             std::chrono::duration_cast<std::chrono::seconds>(options_.seed_interval).count()) + ")");
    return true;
}

void SeedingMaintainer::stop() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    log_info("SeedingMaintainer: Stopped");
}

bool SeedingMaintainer::is_running() const {
    return running_.load();
}

bool SeedingMaintainer::trigger_seeding() {
    if (!running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        trigger_pending_ = true;
    }
    wake_cv_.notify_all();
    return true;
}

void SeedingMaintainer::worker_loop() {
    using clock = std::chrono::steady_clock;

    auto next_seed = clock::now() + options_.initial_delay;
    auto next_sample = clock::now() + options_.bandwidth_sample_interval;

    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        wake_cv_.wait_until(lock, std::min(next_seed, next_sample), [this]() {
            return !running_.load() || trigger_pending_;
        });

        if (!running_.load()) {
            break;
        }

        auto now = clock::now();
        bool seed_due = trigger_pending_ || now >= next_seed;
        bool sample_due = now >= next_sample;
        trigger_pending_ = false;

        lock.unlock();
        try {
            if (seed_due) {
                run_all_cycles();
            }
            if (sample_due) {
                take_bandwidth_sample();
            }
        } catch (const std::exception& e) {
            log_error("SeedingMaintainer: Cycle failed: " + std::string(e.what()));
        }
        lock.lock();

        if (seed_due) {
            next_seed = clock::now() + options_.seed_interval;
        }
        if (sample_due) {
            next_sample = clock::now() + options_.bandwidth_sample_interval;
        }
    }
}

// ============================================================================
// Cycles
// ============================================================================

size_t SeedingMaintainer::effective_target(size_t target, size_t connected_peers) {
    return std::min(target, connected_peers + 1);
}

std::vector<std::string> SeedingMaintainer::remote_peers() const {
    const std::string self = transport_->get_local_peer_id();

    std::vector<std::string> peers;
    for (auto& peer_id : transport_->get_connected_peers()) {
        if (peer_id != self) {
            peers.push_back(std::move(peer_id));
        }
    }
    return peers;
}

std::vector<UnderReplicatedChunk> SeedingMaintainer::find_under_replicated(const std::string& scope_id) const {
    std::vector<UnderReplicatedChunk> result;

    auto connected = remote_peers();
    size_t target = effective_target(get_redundancy_target(scope_id), connected.size());
    if (target <= 1) {
        return result;
    }

    for (const auto& record : catalog_->list_files(scope_id)) {
        if (record.is_deleted()) {
            continue;
        }

        for (uint32_t index : store_->list_indices(record.id)) {
            if (index >= record.chunk_count) {
                continue;
            }

            auto holders = ledger_->get_holders(record.id, index);
            if (holders.size() >= target) {
                continue;
            }

            UnderReplicatedChunk chunk;
            chunk.file_id = record.id;
            chunk.chunk_index = index;
            chunk.replication = holders.size();
            chunk.target = target;
            for (const auto& peer_id : connected) {
                if (holders.count(peer_id) == 0) {
                    chunk.peers_without.push_back(peer_id);
                }
            }

            if (!chunk.peers_without.empty()) {
                result.push_back(std::move(chunk));
            }
        }
    }

    std::stable_sort(result.begin(), result.end(),
        [](const UnderReplicatedChunk& a, const UnderReplicatedChunk& b) {
            return a.replication < b.replication;
        });

    return result;
}

size_t SeedingMaintainer::seed_chunk(const UnderReplicatedChunk& chunk) {
    auto stored = store_->get(chunk.file_id, chunk.chunk_index);
    if (!stored) {
        return 0;
    }

    ChunkSeed seed;
    seed.file_id = chunk.file_id;
    seed.chunk_index = chunk.chunk_index;
    seed.encrypted = stored->encrypted;
    seed.nonce = stored->nonce;
    seed.timestamp = utilities::current_time_ms();
    const std::string message = seed.to_json();

    size_t needed = chunk.target - chunk.replication;
    size_t count = std::min(needed, chunk.peers_without.size());
    size_t seeded = 0;

    for (size_t i = 0; i < count; ++i) {
        const auto& peer_id = chunk.peers_without[i];

        if (!transport_->send_to_peer(peer_id, message)) {
            log_debug("SeedingMaintainer: Seed to " + short_id(peer_id) + " failed");
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.failed_seeds++;
            continue;
        }

        // The target becomes a holder when its chunk-seed-ack arrives
        ++seeded;

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.chunks_seeded++;
        stats_.bytes_seeded += stored->wire_size();
    }

    return seeded;
}

bool SeedingMaintainer::run_cycle(const std::string& scope_id) {
    {
        std::lock_guard<std::mutex> lock(scopes_mutex_);
        if (scopes_.count(scope_id) == 0) {
            return false;
        }
        if (!active_scopes_.insert(scope_id).second) {
            log_debug("SeedingMaintainer: Cycle already running for " + short_id(scope_id));
            return false;
        }
    }

    size_t under_replicated = 0;
    size_t seeded = 0;

    try {
        auto chunks = find_under_replicated(scope_id);
        under_replicated = chunks.size();

        // Pushed in batches so one cycle cannot monopolize the transport
        for (size_t start = 0; start < chunks.size(); start += options_.max_concurrent_seeds) {
            size_t end = std::min(chunks.size(), start + options_.max_concurrent_seeds);
            for (size_t i = start; i < end; ++i) {
                seeded += seed_chunk(chunks[i]);
            }
        }
    } catch (const std::exception& e) {
        log_error("SeedingMaintainer: Cycle for " + short_id(scope_id) + " failed: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.last_seed_run = utilities::current_time_ms();
        stats_.under_replicated_count = under_replicated;
        if (under_replicated > 0) {
            stats_.seed_cycles++;
        }
    }

    if (seeded > 0) {
        log_info("SeedingMaintainer: Seeded " + std::to_string(seeded) + " chunk copies for " +
                 short_id(scope_id) + " (" + std::to_string(under_replicated) + " under-replicated)");
    }

    std::lock_guard<std::mutex> lock(scopes_mutex_);
    active_scopes_.erase(scope_id);
    return true;
}

size_t SeedingMaintainer::run_all_cycles() {
    size_t ran = 0;
    for (const auto& scope_id : get_scopes()) {
        if (run_cycle(scope_id)) {
            ++ran;
        }
    }
    return ran;
}

// ============================================================================
// Statistics
// ============================================================================

SeedingStats SeedingMaintainer::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SeedingMaintainer::take_bandwidth_sample() {
    uint64_t served = 0;
    uint64_t fetched = 0;
    if (transfer_) {
        auto transfer_stats = transfer_->get_stats();
        served = transfer_stats.bytes_served;
        fetched = transfer_stats.bytes_fetched;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);

    uint64_t sent_total = served + stats_.bytes_seeded;

    BandwidthSample sample;
    sample.timestamp = utilities::current_time_ms();
    sample.bytes_sent = sent_total >= last_sent_total_ ? sent_total - last_sent_total_ : 0;
    sample.bytes_received = fetched >= last_received_total_ ? fetched - last_received_total_ : 0;

    last_sent_total_ = sent_total;
    last_received_total_ = fetched;

    bandwidth_samples_.push_back(sample);
    while (bandwidth_samples_.size() > options_.max_bandwidth_samples) {
        bandwidth_samples_.pop_front();
    }
}

std::vector<BandwidthSample> SeedingMaintainer::get_bandwidth_history() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return std::vector<BandwidthSample>(bandwidth_samples_.begin(), bandwidth_samples_.end());
}

} // namespace nightjar
