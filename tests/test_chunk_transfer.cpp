/**
 * @file test_chunk_transfer.cpp
 * @brief Unit tests for ChunkTransfer
 *
 * Tests the chunk exchange protocol including:
 * - Serving locally held chunks
 * - Fetching from holders with per-request timeouts and fallback
 * - Unsolicited seed pushes
 * - Whole-file download with integrity reporting
 */

#include <gtest/gtest.h>
#include "nightjar/chunk_transfer.hpp"
#include "mesh_test_support.hpp"
#include <chrono>
#include <set>
#include <thread>

using namespace nightjar;
using namespace nightjar::test_support;

namespace {

/**
 * @brief One mesh participant wired to the shared fake network
 */
struct TestPeer {
    std::string id;
    std::shared_ptr<FakeNetwork> network;
    std::shared_ptr<ChunkStore> store;
    std::shared_ptr<AvailabilityLedger> ledger;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<ChunkTransfer> transfer;

    TestPeer(const std::string& peer_id, std::shared_ptr<FakeNetwork> net, std::chrono::milliseconds timeout)
        : id(peer_id)
        , network(std::move(net))
        , store(std::make_shared<ChunkStore>(":memory:"))
        , ledger(std::make_shared<AvailabilityLedger>(":memory:"))
        , transport(std::make_shared<FakeTransport>(peer_id, network))
        , transfer(std::make_shared<ChunkTransfer>(store, ledger, transport, timeout))
    {
        ChunkTransfer* target = transfer.get();
        network->attach(id, [target](const std::string& from, const std::string& message) {
            target->handle_message(from, message);
        });
    }

    ~TestPeer() {
        network->detach(id);
    }
};

constexpr auto SHORT_TIMEOUT = std::chrono::milliseconds(200);

} // namespace

class ChunkTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(MeshCrypto::initialize());
        network_ = std::make_shared<FakeNetwork>();
        alice_ = std::make_unique<TestPeer>("alice", network_, SHORT_TIMEOUT);
        bob_ = std::make_unique<TestPeer>("bob", network_, SHORT_TIMEOUT);
    }

    void TearDown() override {
        bob_.reset();
        alice_.reset();
    }

    /**
     * @brief Encode a file into a peer's store and return its record
     */
    FileRecord add_file(TestPeer& owner, const std::string& file_id, size_t size, const ChunkKey& key) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>(i * 31 + 7);
        }
        data_ = data;

        auto encoded = ChunkCodec::encode_file(data, key, 1024);
        EXPECT_TRUE(encoded.has_value());
        EXPECT_TRUE(owner.transfer->store_and_announce(file_id, *encoded));

        FileRecord record;
        record.id = file_id;
        record.name = file_id + ".bin";
        record.chunk_count = static_cast<uint32_t>(encoded->chunks.size());
        record.chunk_hashes = encoded->chunk_hashes;
        record.file_hash = encoded->file_hash;
        record.size_bytes = encoded->size_bytes;
        return record;
    }

    static StoredChunk make_chunk(uint8_t fill) {
        return StoredChunk{std::vector<uint8_t>(48, fill), std::vector<uint8_t>(12, fill)};
    }

    std::shared_ptr<FakeNetwork> network_;
    std::unique_ptr<TestPeer> alice_;
    std::unique_ptr<TestPeer> bob_;
    std::vector<uint8_t> data_;
};

// ============================================================================
// Serving Tests
// ============================================================================

TEST_F(ChunkTransferTest, ServeHeldChunk) {
    alice_->store->put("file1", 0, make_chunk(0x11));

    auto chunk = alice_->transfer->handle_chunk_request("file1", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->encrypted, make_chunk(0x11).encrypted);

    auto stats = alice_->transfer->get_stats();
    EXPECT_EQ(stats.chunks_served, 1u);
    EXPECT_EQ(stats.bytes_served, make_chunk(0x11).wire_size());
}

TEST_F(ChunkTransferTest, ServeMissingChunkIsAbsence) {
    EXPECT_FALSE(alice_->transfer->handle_chunk_request("file1", 0).has_value());
    EXPECT_EQ(alice_->transfer->get_stats().chunks_served, 0u);
}

// ============================================================================
// Fetching Tests
// ============================================================================

TEST_F(ChunkTransferTest, RequestFromHolder) {
    alice_->store->put("file1", 2, make_chunk(0x22));

    auto chunk = bob_->transfer->request_chunk("file1", 2, {"alice"});
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->encrypted, make_chunk(0x22).encrypted);

    // Stored and announced locally
    EXPECT_TRUE(bob_->store->has("file1", 2));
    EXPECT_EQ(bob_->ledger->get_holders("file1", 2).count("bob"), 1u);
    EXPECT_EQ(bob_->transfer->get_stats().chunks_fetched, 1u);
    EXPECT_EQ(bob_->transfer->pending_request_count(), 0u);
}

TEST_F(ChunkTransferTest, LocalChunkIsNeverFetched) {
    bob_->store->put("file1", 0, make_chunk(0x01));

    auto chunk = bob_->transfer->request_chunk("file1", 0, {"alice"});
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(bob_->transport->sent_total(), 0u);
}

TEST_F(ChunkTransferTest, FallsBackAfterTimeout) {
    TestPeer carol("carol", network_, SHORT_TIMEOUT);
    network_->set_silent("carol", true);
    alice_->store->put("file1", 0, make_chunk(0x33));

    auto started = std::chrono::steady_clock::now();
    auto chunk = bob_->transfer->request_chunk("file1", 0, {"carol", "alice"});
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(chunk.has_value());
    EXPECT_GE(elapsed, SHORT_TIMEOUT);

    auto stats = bob_->transfer->get_stats();
    EXPECT_EQ(stats.requests_sent, 2u);
    EXPECT_EQ(stats.requests_timed_out, 1u);
}

TEST_F(ChunkTransferTest, FallsBackPastUnreachableHolder) {
    alice_->store->put("file1", 0, make_chunk(0x44));

    auto chunk = bob_->transfer->request_chunk("file1", 0, {"nobody", "alice"});
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(bob_->transfer->get_stats().requests_timed_out, 0u);
}

TEST_F(ChunkTransferTest, ExhaustedCandidatesYieldAbsence) {
    auto chunk = bob_->transfer->request_chunk("file1", 0, {"alice"});
    EXPECT_FALSE(chunk.has_value());
    EXPECT_EQ(bob_->transfer->get_stats().requests_timed_out, 1u);
    EXPECT_EQ(bob_->transfer->pending_request_count(), 0u);
}

TEST_F(ChunkTransferTest, EmptyHintsUseConnectedPeers) {
    alice_->store->put("file1", 5, make_chunk(0x55));

    auto chunk = bob_->transfer->request_chunk("file1", 5);
    ASSERT_TRUE(chunk.has_value());
}

TEST_F(ChunkTransferTest, SelfAndDuplicateHintsSkipped) {
    auto chunk = bob_->transfer->request_chunk("file1", 0, {"bob", "alice", "alice"});
    EXPECT_FALSE(chunk.has_value());
    EXPECT_EQ(bob_->transport->sent_count(message_type::CHUNK_REQUEST), 1u);
}

TEST_F(ChunkTransferTest, ConcurrentRequestsMatchById) {
    for (uint32_t i = 0; i < 8; ++i) {
        alice_->store->put("file1", i, make_chunk(static_cast<uint8_t>(i)));
    }

    std::vector<std::thread> threads;
    std::atomic<int> mismatches(0);
    for (uint32_t i = 0; i < 8; ++i) {
        threads.emplace_back([this, i, &mismatches]() {
            auto chunk = bob_->transfer->request_chunk("file1", i, {"alice"});
            if (!chunk || chunk->encrypted[0] != static_cast<uint8_t>(i)) {
                mismatches++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(bob_->store->count(), 8u);
}

TEST_F(ChunkTransferTest, UnmatchedResponseIgnored) {
    ChunkResponse response;
    response.request_id = "req_unknown";
    response.file_id = "file1";
    response.encrypted = {1, 2, 3};
    response.nonce = std::vector<uint8_t>(12, 0);

    EXPECT_TRUE(bob_->transfer->handle_message("alice", response.to_json()));
    EXPECT_FALSE(bob_->store->has("file1", 0));
}

TEST_F(ChunkTransferTest, NonTransferMessagesNotHandled) {
    EXPECT_FALSE(bob_->transfer->handle_message("alice", R"({"type":"sync","topic":"t"})"));
    EXPECT_FALSE(bob_->transfer->handle_message("alice", "garbage"));
}

TEST_F(ChunkTransferTest, RequestIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 500; ++i) {
        ids.insert(bob_->transfer->generate_request_id());
    }
    EXPECT_EQ(ids.size(), 500u);
    EXPECT_EQ(ids.begin()->rfind("req_", 0), 0u);
}

// ============================================================================
// Seed Tests
// ============================================================================

TEST_F(ChunkTransferTest, SeedIsStoredAndAnnounced) {
    ChunkSeed seed;
    seed.file_id = "file1";
    seed.chunk_index = 3;
    seed.encrypted = make_chunk(0x77).encrypted;
    seed.nonce = make_chunk(0x77).nonce;

    EXPECT_TRUE(alice_->transport->send_to_peer("bob", seed.to_json()));

    EXPECT_TRUE(bob_->store->has("file1", 3));
    EXPECT_EQ(bob_->ledger->get_holders("file1", 3), (std::set<std::string>{"bob"}));
    EXPECT_EQ(bob_->transfer->get_stats().chunks_seeded_in, 1u);
    EXPECT_EQ(bob_->transport->sent_count(message_type::CHUNK_SEED_ACK), 1u);

    // Alice never held the chunk, so the receipt is not taken as a holder claim
    EXPECT_EQ(alice_->ledger->count_holders("file1", 3), 0u);
}

TEST_F(ChunkTransferTest, SeedAckRecordsTargetAsHolder) {
    alice_->store->put("file1", 0, make_chunk(0x42));
    alice_->transfer->announce_availability("file1", 1);

    ChunkSeed seed;
    seed.file_id = "file1";
    seed.chunk_index = 0;
    seed.encrypted = make_chunk(0x42).encrypted;
    seed.nonce = make_chunk(0x42).nonce;
    ASSERT_TRUE(alice_->transport->send_to_peer("bob", seed.to_json()));

    EXPECT_EQ(alice_->ledger->get_holders("file1", 0), (std::set<std::string>{"alice", "bob"}));
}

TEST_F(ChunkTransferTest, MalformedSeedIsNeitherStoredNorAcknowledged) {
    alice_->store->put("file1", 0, make_chunk(0x42));
    alice_->transfer->announce_availability("file1", 1);

    ChunkSeed seed;
    seed.file_id = "file1";
    seed.chunk_index = 0;
    seed.encrypted = make_chunk(0x42).encrypted;
    seed.nonce = {1, 2, 3};
    ASSERT_TRUE(alice_->transport->send_to_peer("bob", seed.to_json()));

    EXPECT_FALSE(bob_->store->has("file1", 0));
    EXPECT_EQ(bob_->transport->sent_count(message_type::CHUNK_SEED_ACK), 0u);
    EXPECT_EQ(alice_->ledger->get_holders("file1", 0), (std::set<std::string>{"alice"}));
}

TEST_F(ChunkTransferTest, AnnounceOnlyHeldChunks) {
    bob_->store->put("file1", 0, make_chunk(0));
    bob_->store->put("file1", 2, make_chunk(2));

    EXPECT_EQ(bob_->transfer->announce_availability("file1", 4), 2u);
    EXPECT_EQ(bob_->ledger->count_holders("file1", 1), 0u);
    EXPECT_EQ(bob_->ledger->count_holders("file1", 2), 1u);
}

// ============================================================================
// Download Tests
// ============================================================================

TEST_F(ChunkTransferTest, DownloadWholeFile) {
    auto key = ChunkCodec::generate_key();
    auto record = add_file(*alice_, "file1", 5000, key);
    ASSERT_EQ(record.chunk_count, 5u);

    auto result = bob_->transfer->download_file(record, key);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.data, data_);
    EXPECT_TRUE(result.unavailable_chunks.empty());
    EXPECT_EQ(bob_->store->list_indices("file1").size(), 5u);
}

TEST_F(ChunkTransferTest, DownloadUsesLedgerHints) {
    TestPeer carol("carol", network_, SHORT_TIMEOUT);
    network_->set_silent("carol", true);

    auto key = ChunkCodec::generate_key();
    auto record = add_file(*alice_, "file1", 1500, key);
    for (uint32_t i = 0; i < record.chunk_count; ++i) {
        bob_->ledger->add_holder("file1", i, "alice");
    }

    auto result = bob_->transfer->download_file(record, key);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(bob_->transport->sent_count(message_type::CHUNK_REQUEST), record.chunk_count);
    EXPECT_EQ(bob_->transfer->get_stats().requests_timed_out, 0u);
}

TEST_F(ChunkTransferTest, DownloadWithWrongKeyReportsDecryptFailures) {
    auto record = add_file(*alice_, "file1", 2048, ChunkCodec::generate_key());

    auto result = bob_->transfer->download_file(record, ChunkCodec::generate_key());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.decrypt_failures, (std::vector<uint32_t>{0, 1}));
    EXPECT_TRUE(result.data.empty());

    // Unverifiable copies are discarded rather than kept and announced
    EXPECT_EQ(bob_->store->count(), 0u);
    EXPECT_EQ(bob_->ledger->count_holders("file1", 0), 0u);
}

TEST_F(ChunkTransferTest, TamperedCopyReplacedFromAnotherHolder) {
    TestPeer carol("carol", network_, SHORT_TIMEOUT);

    auto key = ChunkCodec::generate_key();
    auto record = add_file(*alice_, "file1", 3000, key);
    ASSERT_EQ(record.chunk_count, 3u);

    // Bob holds every chunk, but his copy of chunk 0 was altered
    for (uint32_t i = 0; i < record.chunk_count; ++i) {
        auto chunk = alice_->store->get("file1", i);
        ASSERT_TRUE(chunk.has_value());
        if (i == 0) {
            chunk->encrypted[5] ^= 0xFF;
        }
        bob_->store->put("file1", i, *chunk);
        carol.ledger->add_holder("file1", i, "bob");
    }

    auto result = carol.transfer->download_file(record, key);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, data_);
    EXPECT_TRUE(result.decrypt_failures.empty());

    // The bad copy was replaced by Alice's
    EXPECT_EQ(carol.store->get("file1", 0)->encrypted, alice_->store->get("file1", 0)->encrypted);
    EXPECT_EQ(carol.ledger->get_holders("file1", 0), (std::set<std::string>{"bob", "carol"}));
    EXPECT_EQ(carol.transport->sent_count(message_type::CHUNK_REQUEST), 4u);
    EXPECT_EQ(alice_->transfer->get_stats().chunks_served, 1u);
}

TEST_F(ChunkTransferTest, DownloadReportsHashMismatchIndex) {
    auto key = ChunkCodec::generate_key();
    auto record = add_file(*alice_, "file1", 3000, key);
    record.chunk_hashes[1] = std::string(64, '0');

    auto result = bob_->transfer->download_file(record, key);
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.integrity_errors.size(), 1u);
    EXPECT_EQ(result.integrity_errors[0].index, 1u);
}

TEST_F(ChunkTransferTest, DownloadWithoutHoldersReportsUnavailable) {
    alice_.reset();

    FileRecord record;
    record.id = "ghost";
    record.name = "ghost.bin";
    record.chunk_count = 2;
    record.chunk_hashes = {std::string(64, 'a'), std::string(64, 'b')};
    record.size_bytes = 2000;

    auto result = bob_->transfer->download_file(record, ChunkCodec::generate_key());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.unavailable_chunks, (std::vector<uint32_t>{0, 1}));
    EXPECT_TRUE(result.decrypt_failures.empty());
}
