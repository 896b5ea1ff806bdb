/**
 * @file chunk_transfer.cpp
 * @brief Implementation of the peer chunk transfer protocol
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/chunk_transfer.hpp"
#include "nightjar/utilities.hpp"
#include <algorithm>
#include <set>

namespace nightjar {

using utilities::log_debug;
using utilities::log_info;
using utilities::log_warn;
using utilities::short_id;

// ============================================================================
// Constructor / Destructor
// ============================================================================

ChunkTransfer::ChunkTransfer(
    std::shared_ptr<ChunkStore> store,
    std::shared_ptr<AvailabilityLedger> ledger,
    std::shared_ptr<PeerTransport> transport,
    std::chrono::milliseconds request_timeout
)
    : store_(std::move(store))
    , ledger_(std::move(ledger))
    , transport_(std::move(transport))
    , request_timeout_(request_timeout)
    , request_counter_(0)
{
}

ChunkTransfer::~ChunkTransfer() {
    // Release any waiter still blocked on a response
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.clear();
    pending_cv_.notify_all();
}

std::string ChunkTransfer::get_local_peer_id() const {
    return transport_->get_local_peer_id();
}

std::string ChunkTransfer::generate_request_id() {
    return "req_" + std::to_string(utilities::current_time_ms()) + "_" +
           std::to_string(++request_counter_) + "_" +
           utilities::generate_random_string(6);
}

// ============================================================================
// Serving
// ============================================================================

std::optional<StoredChunk> ChunkTransfer::handle_chunk_request(
    const std::string& file_id,
    uint32_t chunk_index
) {
    auto chunk = store_->get(file_id, chunk_index);
    if (!chunk) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.chunks_served++;
    stats_.bytes_served += chunk->wire_size();
    return chunk;
}

void ChunkTransfer::process_request(const std::string& peer_id, const ChunkRequest& request) {
    auto chunk = handle_chunk_request(request.file_id, request.chunk_index);
    if (!chunk) {
        // Absent: stay silent so the requester moves on after its timeout
        log_debug("ChunkTransfer: No chunk " + ChunkStore::make_key(request.file_id, request.chunk_index) +
                  " for " + short_id(peer_id));
        return;
    }

    ChunkResponse response;
    response.request_id = request.request_id;
    response.file_id = request.file_id;
    response.chunk_index = request.chunk_index;
    response.encrypted = std::move(chunk->encrypted);
    response.nonce = std::move(chunk->nonce);
    response.timestamp = utilities::current_time_ms();

    if (!transport_->send_to_peer(peer_id, response.to_json())) {
        log_warn("ChunkTransfer: Failed to send chunk-response to " + short_id(peer_id));
    }
}

// ============================================================================
// Fetching
// ============================================================================

std::optional<StoredChunk> ChunkTransfer::request_chunk(
    const std::string& file_id,
    uint32_t chunk_index,
    const std::vector<std::string>& holder_hints
) {
    // Never fetch what we already own
    auto local = store_->get(file_id, chunk_index);
    if (local) {
        return local;
    }

    auto fetched = fetch_remote(file_id, chunk_index, holder_hints, {});
    if (!fetched) {
        return std::nullopt;
    }
    return std::move(fetched->chunk);
}

std::optional<ChunkTransfer::FetchedChunk> ChunkTransfer::fetch_remote(
    const std::string& file_id,
    uint32_t chunk_index,
    const std::vector<std::string>& holder_hints,
    const std::set<std::string>& excluded
) {
    const std::string self = transport_->get_local_peer_id();
    std::vector<std::string> candidates = holder_hints.empty()
        ? transport_->get_connected_peers()
        : holder_hints;

    std::set<std::string> tried;
    for (const auto& peer_id : candidates) {
        if (peer_id == self || excluded.count(peer_id) > 0 || !tried.insert(peer_id).second) {
            continue;
        }

        auto pending = std::make_shared<PendingRequest>();
        pending->request_id = generate_request_id();
        pending->file_id = file_id;
        pending->chunk_index = chunk_index;
        pending->target_peer = peer_id;
        pending->sent_at = utilities::current_time_ms();

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[pending->request_id] = pending;
        }

        ChunkRequest request{file_id, chunk_index, pending->request_id};
        bool sent = transport_->send_to_peer(peer_id, request.to_json());

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            if (sent) {
                stats_.requests_sent++;
            }
        }

        std::optional<StoredChunk> result;
        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            if (sent) {
                pending_cv_.wait_for(lock, request_timeout_, [&]() {
                    return pending->result.has_value() || pending_.count(pending->request_id) == 0;
                });
            }
            result = pending->result;
            pending_.erase(pending->request_id);
        }

        if (!sent) {
            log_debug("ChunkTransfer: Holder " + short_id(peer_id) + " unreachable, trying next");
            continue;
        }

        if (!result) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.requests_timed_out++;
            log_debug("ChunkTransfer: Request " + pending->request_id + " to " + short_id(peer_id) +
                      " timed out");
            continue;
        }

        accept_chunk(file_id, chunk_index, *result);
        return FetchedChunk{std::move(*result), peer_id};
    }

    log_debug("ChunkTransfer: Chunk " + ChunkStore::make_key(file_id, chunk_index) +
              " unavailable from " + std::to_string(tried.size()) + " candidates");
    return std::nullopt;
}

void ChunkTransfer::process_response(const std::string& peer_id, ChunkResponse response) {
    std::lock_guard<std::mutex> lock(pending_mutex_);

    auto it = pending_.find(response.request_id);
    if (it == pending_.end() || it->second->result) {
        // Late or duplicate response
        log_debug("ChunkTransfer: Discarding response " + response.request_id + " from " + short_id(peer_id));
        return;
    }

    auto& pending = it->second;
    if (pending->file_id != response.file_id || pending->chunk_index != response.chunk_index) {
        log_warn("ChunkTransfer: Response " + response.request_id + " does not match its request");
        return;
    }

    pending->result = StoredChunk{std::move(response.encrypted), std::move(response.nonce)};
    pending_cv_.notify_all();
}

DownloadResult ChunkTransfer::download_file(const FileRecord& record, const ChunkKey& key) {
    DownloadResult result;
    std::vector<DecryptedChunk> decrypted;
    const std::string self = transport_->get_local_peer_id();

    for (uint32_t index = 0; index < record.chunk_count; ++index) {
        const std::string* expected_hash =
            index < record.chunk_hashes.size() ? &record.chunk_hashes[index] : nullptr;

        std::optional<std::vector<uint8_t>> plaintext;
        std::optional<std::vector<uint8_t>> mismatched;
        bool decrypt_failed = false;

        // Holders that served a copy failing verification
        std::set<std::string> rejected;

        for (int attempt = 0; attempt < config::MAX_CHUNK_RETRIES && !plaintext; ++attempt) {
            std::string source = self;
            auto chunk = store_->get(record.id, index);
            if (!chunk) {
                std::vector<std::string> hints;
                for (const auto& holder : ledger_->get_holders(record.id, index)) {
                    if (holder != self && rejected.count(holder) == 0) {
                        hints.push_back(holder);
                    }
                }

                auto fetched = fetch_remote(record.id, index, hints, rejected);
                if (!fetched) {
                    continue;
                }
                chunk = std::move(fetched->chunk);
                source = fetched->source;
            }

            auto opened = ChunkCodec::decrypt(chunk->encrypted, chunk->nonce, key);
            bool hash_ok = opened && (!expected_hash || ChunkCodec::hash(*opened) == *expected_hash);
            if (hash_ok) {
                plaintext = std::move(opened);
                break;
            }

            if (opened) {
                mismatched = std::move(opened);
            } else {
                decrypt_failed = true;
            }

            // A copy held from before this download is the caller's own data
            if (source == self) {
                break;
            }

            // Discard the fetched copy so it is neither served nor announced
            log_warn("ChunkTransfer: Chunk " + ChunkStore::make_key(record.id, index) + " from " +
                     short_id(source) + " failed verification, trying another holder");
            store_->remove(record.id, index);
            ledger_->remove_holder(record.id, index, self);
            rejected.insert(source);
        }

        if (plaintext) {
            decrypted.push_back({index, std::move(*plaintext)});
        } else if (mismatched) {
            // Reassembly reports the mismatch with its index
            decrypted.push_back({index, std::move(*mismatched)});
        } else if (decrypt_failed) {
            result.decrypt_failures.push_back(index);
        } else {
            result.unavailable_chunks.push_back(index);
        }
    }

    if (!result.unavailable_chunks.empty() || !result.decrypt_failures.empty()) {
        log_warn("ChunkTransfer: Download of " + record.name + " incomplete: " +
                 std::to_string(result.unavailable_chunks.size()) + " unavailable, " +
                 std::to_string(result.decrypt_failures.size()) + " failed decryption");
        return result;
    }

    auto reassembled = ChunkCodec::reassemble(std::move(decrypted), record.chunk_hashes, record.size_bytes);
    result.integrity_errors = std::move(reassembled.errors);
    result.success = reassembled.valid;
    if (result.success) {
        result.data = std::move(reassembled.data);
        log_info("ChunkTransfer: Downloaded " + record.name + " (" +
                 utilities::format_file_size(record.size_bytes) + ")");
    }

    return result;
}

// ============================================================================
// Announcing
// ============================================================================

size_t ChunkTransfer::announce_availability(const std::string& file_id, uint32_t chunk_count) {
    const std::string self = transport_->get_local_peer_id();
    size_t announced = 0;

    for (uint32_t index = 0; index < chunk_count; ++index) {
        if (store_->has(file_id, index) && ledger_->add_holder(file_id, index, self)) {
            ++announced;
        }
    }

    return announced;
}

bool ChunkTransfer::store_and_announce(const std::string& file_id, const EncodedFile& encoded) {
    for (uint32_t index = 0; index < encoded.chunks.size(); ++index) {
        const auto& chunk = encoded.chunks[index];
        if (!store_->put(file_id, index, StoredChunk{chunk.ciphertext, chunk.nonce})) {
            return false;
        }
    }

    announce_availability(file_id, static_cast<uint32_t>(encoded.chunks.size()));
    return true;
}

bool ChunkTransfer::accept_chunk(const std::string& file_id, uint32_t chunk_index, const StoredChunk& chunk) {
    if (!store_->put(file_id, chunk_index, chunk)) {
        return false;
    }

    ledger_->add_holder(file_id, chunk_index, transport_->get_local_peer_id());

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.chunks_fetched++;
    stats_.bytes_fetched += chunk.wire_size();
    return true;
}

// ============================================================================
// Wire
// ============================================================================

void ChunkTransfer::process_seed(const std::string& peer_id, const ChunkSeed& seed) {
    if (seed.nonce.size() != config::CHUNK_NONCE_SIZE || seed.encrypted.size() < config::CHUNK_TAG_SIZE) {
        log_warn("ChunkTransfer: Rejecting malformed seed " + ChunkStore::make_key(seed.file_id, seed.chunk_index) +
                 " from " + short_id(peer_id));
        return;
    }

    StoredChunk chunk{seed.encrypted, seed.nonce};
    if (!accept_chunk(seed.file_id, seed.chunk_index, chunk)) {
        log_warn("ChunkTransfer: Failed to store seeded chunk from " + short_id(peer_id));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.chunks_seeded_in++;
    }

    ChunkSeedAck ack{seed.file_id, seed.chunk_index, utilities::current_time_ms()};
    if (!transport_->send_to_peer(peer_id, ack.to_json())) {
        log_debug("ChunkTransfer: Could not acknowledge seed from " + short_id(peer_id));
    }
}

void ChunkTransfer::process_seed_ack(const std::string& peer_id, const ChunkSeedAck& ack) {
    // Only chunks we hold can have been seeded by us
    if (!store_->has(ack.file_id, ack.chunk_index)) {
        log_debug("ChunkTransfer: Ignoring seed ack for unknown chunk " +
                  ChunkStore::make_key(ack.file_id, ack.chunk_index));
        return;
    }

    ledger_->add_holder(ack.file_id, ack.chunk_index, peer_id);
}

bool ChunkTransfer::handle_message(const std::string& peer_id, const std::string& message) {
    auto parsed = parse_transfer_message(message);
    if (!parsed) {
        return false;
    }

    if (auto* request = std::get_if<ChunkRequest>(&*parsed)) {
        process_request(peer_id, *request);
    } else if (auto* response = std::get_if<ChunkResponse>(&*parsed)) {
        process_response(peer_id, std::move(*response));
    } else if (auto* seed = std::get_if<ChunkSeed>(&*parsed)) {
        process_seed(peer_id, *seed);
    } else if (auto* ack = std::get_if<ChunkSeedAck>(&*parsed)) {
        process_seed_ack(peer_id, *ack);
    }

    return true;
}

TransferStats ChunkTransfer::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

size_t ChunkTransfer::pending_request_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace nightjar
