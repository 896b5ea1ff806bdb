/**
 * @file seeding_maintainer.hpp
 * @brief Background replication maintenance for locally held chunks
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Periodically compares the holder count of every locally held chunk with
 * the scope's redundancy target and pushes chunk-seed messages to connected
 * peers that lack the chunk. Targets are clamped to the number of peers that
 * are actually online, so the mesh converges to min(target, online + 1).
 * A target counts as a holder only after it acknowledges storing the chunk.
 */

#pragma once

#include "nightjar/file_catalog.hpp"
#include "nightjar/chunk_store.hpp"
#include "nightjar/availability_ledger.hpp"
#include "nightjar/chunk_transfer.hpp"
#include "nightjar/swarm.hpp"
#include "nightjar/mesh_config.hpp"
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>

namespace nightjar {

/**
 * @brief Runtime options, defaulting to the config constants
 */
struct SeedingOptions {
    std::chrono::milliseconds seed_interval = config::SEED_INTERVAL;
    std::chrono::milliseconds initial_delay = config::INITIAL_SEED_DELAY;
    std::chrono::milliseconds bandwidth_sample_interval = config::BANDWIDTH_SAMPLE_INTERVAL;
    size_t max_concurrent_seeds = config::MAX_CONCURRENT_SEEDS;
    size_t max_bandwidth_samples = config::MAX_BANDWIDTH_SAMPLES;
};

/**
 * @brief Chunk whose holder count is below the effective target
 */
struct UnderReplicatedChunk {
    std::string file_id;
    uint32_t chunk_index = 0;
    size_t replication = 0;                 ///< Current holder count
    size_t target = 0;                      ///< Effective target
    std::vector<std::string> peers_without; ///< Connected peers lacking the chunk
};

struct SeedingStats {
    uint64_t chunks_seeded = 0;
    uint64_t bytes_seeded = 0;              ///< Ciphertext plus nonce
    uint64_t seed_cycles = 0;
    uint64_t failed_seeds = 0;
    size_t under_replicated_count = 0;      ///< Found by the most recent cycle
    uint64_t last_seed_run = 0;             ///< Unix ms, 0 if never
};

struct BandwidthSample {
    uint64_t timestamp = 0;
    uint64_t bytes_sent = 0;        ///< Since the previous sample
    uint64_t bytes_received = 0;
};

/**
 * @brief SeedingMaintainer - keeps chunks replicated across the mesh
 *
 * Each registered scope (a workspace) has its own redundancy target.
 * Cycles for one scope never overlap; different scopes run independently.
 */
class SeedingMaintainer {
public:
    /**
     * @param transfer Optional; supplies served/fetched byte counters for
     *                 bandwidth samples
     */
    SeedingMaintainer(
        std::shared_ptr<FileCatalog> catalog,
        std::shared_ptr<ChunkStore> store,
        std::shared_ptr<AvailabilityLedger> ledger,
        std::shared_ptr<PeerTransport> transport,
        std::shared_ptr<ChunkTransfer> transfer = nullptr,
        SeedingOptions options = SeedingOptions()
    );

    ~SeedingMaintainer();

    // Disable copy and move
    SeedingMaintainer(const SeedingMaintainer&) = delete;
    SeedingMaintainer& operator=(const SeedingMaintainer&) = delete;
    SeedingMaintainer(SeedingMaintainer&&) = delete;
    SeedingMaintainer& operator=(SeedingMaintainer&&) = delete;

    // ========================================================================
    // Scopes
    // ========================================================================

    void add_scope(const std::string& scope_id, size_t redundancy_target = config::DEFAULT_REDUNDANCY_TARGET);

    void remove_scope(const std::string& scope_id);

    /**
     * @return false if the scope is unknown
     */
    bool set_redundancy_target(const std::string& scope_id, size_t redundancy_target);

    size_t get_redundancy_target(const std::string& scope_id) const;

    std::vector<std::string> get_scopes() const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the background cycle thread
     *
     * The first cycle runs after the initial delay, then every seed interval.
     */
    bool start();

    void stop();

    bool is_running() const;

    /**
     * @brief Wake the background thread for an immediate cycle
     * @return false if not running
     */
    bool trigger_seeding();

    // ========================================================================
    // Cycles
    // ========================================================================

    /**
     * @brief Run one seeding cycle for a scope on the calling thread
     * @return false if a cycle for this scope is already in progress or the
     *         scope is unknown
     */
    bool run_cycle(const std::string& scope_id);

    /**
     * @brief Run a cycle for every registered scope
     * @return Number of cycles actually run
     */
    size_t run_all_cycles();

    /**
     * @brief Target clamped to the peers that can hold a copy
     * @return min(target, connected_peers + 1)
     */
    static size_t effective_target(size_t target, size_t connected_peers);

    /**
     * @brief Locally held chunks below the effective target, fewest holders first
     *
     * Returns nothing when the effective target is 1 or less.
     */
    std::vector<UnderReplicatedChunk> find_under_replicated(const std::string& scope_id) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    SeedingStats get_stats() const;

    /**
     * @brief Record bytes sent/received since the previous sample
     */
    void take_bandwidth_sample();

    std::vector<BandwidthSample> get_bandwidth_history() const;

private:
    std::shared_ptr<FileCatalog> catalog_;
    std::shared_ptr<ChunkStore> store_;
    std::shared_ptr<AvailabilityLedger> ledger_;
    std::shared_ptr<PeerTransport> transport_;
    std::shared_ptr<ChunkTransfer> transfer_;
    SeedingOptions options_;

    // Scopes
    std::map<std::string, size_t> scopes_;         ///< scope_id -> redundancy target
    std::set<std::string> active_scopes_;          ///< Cycles in progress
    mutable std::mutex scopes_mutex_;

    // Background thread
    std::thread worker_;
    std::atomic<bool> running_;
    bool trigger_pending_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // Statistics
    SeedingStats stats_;
    std::deque<BandwidthSample> bandwidth_samples_;
    uint64_t last_sent_total_;
    uint64_t last_received_total_;
    mutable std::mutex stats_mutex_;

    void worker_loop();

    /**
     * @brief Push one chunk to peers lacking it
     * @return Number of seeds handed to the transport
     */
    size_t seed_chunk(const UnderReplicatedChunk& chunk);

    std::vector<std::string> remote_peers() const;
};

} // namespace nightjar
