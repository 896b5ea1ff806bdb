/**
 * @file chunk_transfer.hpp
 * @brief Peer chunk transfer protocol (request / response / seed)
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Serves local chunks to peers, fetches missing chunks from holders one
 * candidate at a time with a per-request timeout, and announces every
 * chunk stored locally to the availability ledger.
 */

#pragma once

#include "nightjar/chunk_codec.hpp"
#include "nightjar/chunk_store.hpp"
#include "nightjar/availability_ledger.hpp"
#include "nightjar/swarm.hpp"
#include "nightjar/mesh_config.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <optional>
#include <set>

namespace nightjar {

/**
 * @brief Transfer counters for this process
 */
struct TransferStats {
    uint64_t chunks_served = 0;
    uint64_t bytes_served = 0;
    uint64_t chunks_fetched = 0;        ///< Via response or seed push
    uint64_t bytes_fetched = 0;
    uint64_t chunks_seeded_in = 0;      ///< Received as unsolicited seeds
    uint64_t requests_sent = 0;
    uint64_t requests_timed_out = 0;
};

/**
 * @brief Outcome of downloading a whole file
 */
struct DownloadResult {
    bool success = false;
    std::vector<uint8_t> data;                  ///< Verified content when success
    std::vector<uint32_t> unavailable_chunks;   ///< No holder answered
    std::vector<uint32_t> decrypt_failures;     ///< Authentication failed
    std::vector<ChunkError> integrity_errors;   ///< Reassembly findings
};

/**
 * @brief ChunkTransfer - point-to-point chunk exchange
 *
 * Thread-safe. Concurrent requests for different chunks are matched to
 * responses by request id.
 */
class ChunkTransfer {
public:
    ChunkTransfer(
        std::shared_ptr<ChunkStore> store,
        std::shared_ptr<AvailabilityLedger> ledger,
        std::shared_ptr<PeerTransport> transport,
        std::chrono::milliseconds request_timeout = config::CHUNK_REQUEST_TIMEOUT
    );

    ~ChunkTransfer();

    // Disable copy and move
    ChunkTransfer(const ChunkTransfer&) = delete;
    ChunkTransfer& operator=(const ChunkTransfer&) = delete;
    ChunkTransfer(ChunkTransfer&&) = delete;
    ChunkTransfer& operator=(ChunkTransfer&&) = delete;

    // ========================================================================
    // Serving
    // ========================================================================

    /**
     * @brief Look up a chunk for a peer
     * @return Chunk, or std::nullopt if this peer does not hold it
     */
    std::optional<StoredChunk> handle_chunk_request(const std::string& file_id, uint32_t chunk_index);

    // ========================================================================
    // Fetching
    // ========================================================================

    /**
     * @brief Obtain a chunk, locally or from a peer
     *
     * Candidates are tried in order (all connected peers when no hints are
     * given). Each waits at most the request timeout. A fetched chunk is
     * stored and announced before returning.
     * @return Chunk, or std::nullopt when no candidate supplied it
     */
    std::optional<StoredChunk> request_chunk(
        const std::string& file_id,
        uint32_t chunk_index,
        const std::vector<std::string>& holder_hints = {}
    );

    /**
     * @brief Fetch, decrypt and verify an entire file
     *
     * Holder hints come from the availability ledger; each chunk is
     * attempted up to MAX_CHUNK_RETRIES times. A fetched copy that fails
     * decryption or its hash is removed from the store and the ledger, and
     * the next attempt skips the holder that served it.
     */
    DownloadResult download_file(const FileRecord& record, const ChunkKey& key);

    // ========================================================================
    // Announcing
    // ========================================================================

    /**
     * @brief Add this peer as holder of every locally present chunk
     * @return Number of chunks announced
     */
    size_t announce_availability(const std::string& file_id, uint32_t chunk_count);

    /**
     * @brief Store freshly encoded chunks and announce them
     */
    bool store_and_announce(const std::string& file_id, const EncodedFile& encoded);

    // ========================================================================
    // Wire
    // ========================================================================

    /**
     * @brief Process an incoming point-to-point message
     * @return true if it was a chunk transfer message
     */
    bool handle_message(const std::string& peer_id, const std::string& message);

    TransferStats get_stats() const;

    size_t pending_request_count() const;

    std::string get_local_peer_id() const;

    /**
     * @brief Process-unique request id "req_<ms>_<counter>_<random>"
     */
    std::string generate_request_id();

private:
    /**
     * @brief Request awaiting a chunk-response
     */
    struct PendingRequest {
        std::string request_id;
        std::string file_id;
        uint32_t chunk_index = 0;
        std::string target_peer;
        uint64_t sent_at = 0;
        std::optional<StoredChunk> result;
    };

    std::shared_ptr<ChunkStore> store_;
    std::shared_ptr<AvailabilityLedger> ledger_;
    std::shared_ptr<PeerTransport> transport_;
    std::chrono::milliseconds request_timeout_;

    std::map<std::string, std::shared_ptr<PendingRequest>> pending_;
    mutable std::mutex pending_mutex_;
    std::condition_variable pending_cv_;

    TransferStats stats_;
    mutable std::mutex stats_mutex_;

    std::atomic<uint64_t> request_counter_;

    /**
     * @brief Chunk received from a peer, with the peer that sent it
     */
    struct FetchedChunk {
        StoredChunk chunk;
        std::string source;
    };

    /**
     * @brief Ask candidates in turn, skipping excluded peers
     */
    std::optional<FetchedChunk> fetch_remote(
        const std::string& file_id,
        uint32_t chunk_index,
        const std::vector<std::string>& holder_hints,
        const std::set<std::string>& excluded
    );

    void process_request(const std::string& peer_id, const ChunkRequest& request);
    void process_response(const std::string& peer_id, ChunkResponse response);
    void process_seed(const std::string& peer_id, const ChunkSeed& seed);
    void process_seed_ack(const std::string& peer_id, const ChunkSeedAck& ack);

    /**
     * @brief Store a received chunk, announce it and count it as fetched
     */
    bool accept_chunk(const std::string& file_id, uint32_t chunk_index, const StoredChunk& chunk);
};

} // namespace nightjar
