/**
 * @file test_seeding_maintainer.cpp
 * @brief Unit tests for SeedingMaintainer
 *
 * Tests replication maintenance including:
 * - Effective target clamping to online peers
 * - Seed pushes to peers lacking a chunk
 * - Holders recorded only on acknowledgement
 * - Convergence over repeated cycles and new peers
 * - Single-flight cycles per scope
 * - Background triggering and bandwidth sampling
 */

#include <gtest/gtest.h>
#include "nightjar/seeding_maintainer.hpp"
#include "mesh_test_support.hpp"
#include <chrono>
#include <future>
#include <set>
#include <thread>

using namespace nightjar;
using namespace nightjar::test_support;

namespace {

const std::string WORKSPACE = "workspace-1";

/**
 * @brief Peer with its own store, ledger, transfer and seeding maintainer
 */
struct SeedingPeer {
    std::string id;
    std::shared_ptr<FakeNetwork> network;
    std::shared_ptr<InMemoryFileCatalog> catalog;
    std::shared_ptr<ChunkStore> store;
    std::shared_ptr<AvailabilityLedger> ledger;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<ChunkTransfer> transfer;
    std::unique_ptr<SeedingMaintainer> seeding;

    SeedingPeer(const std::string& peer_id, std::shared_ptr<FakeNetwork> net, SeedingOptions options = SeedingOptions())
        : id(peer_id)
        , network(std::move(net))
        , catalog(std::make_shared<InMemoryFileCatalog>())
        , store(std::make_shared<ChunkStore>(":memory:"))
        , ledger(std::make_shared<AvailabilityLedger>(":memory:"))
        , transport(std::make_shared<FakeTransport>(peer_id, network))
        , transfer(std::make_shared<ChunkTransfer>(store, ledger, transport, std::chrono::milliseconds(200)))
        , seeding(std::make_unique<SeedingMaintainer>(catalog, store, ledger, transport, transfer, options))
    {
        ChunkTransfer* target = transfer.get();
        network->attach(id, [target](const std::string& from, const std::string& message) {
            target->handle_message(from, message);
        });
    }

    ~SeedingPeer() {
        seeding.reset();
        network->detach(id);
    }

    size_t holders(const std::string& file_id, uint32_t index) const {
        return ledger->count_holders(file_id, index);
    }
};

} // namespace

class SeedingMaintainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(MeshCrypto::initialize());
        network_ = std::make_shared<FakeNetwork>();
        alice_ = std::make_unique<SeedingPeer>("alice", network_);
        alice_->seeding->add_scope(WORKSPACE, 3);
    }

    void TearDown() override {
        alice_.reset();
    }

    /**
     * @brief Give a peer a file of the given chunk count in the workspace
     */
    FileRecord add_file(SeedingPeer& owner, const std::string& file_id, uint32_t chunks) {
        auto key = ChunkCodec::generate_key();
        std::vector<uint8_t> data(static_cast<size_t>(chunks) * 256, 0x5A);
        auto encoded = ChunkCodec::encode_file(data, key, 256);
        EXPECT_TRUE(encoded.has_value());
        EXPECT_TRUE(owner.transfer->store_and_announce(file_id, *encoded));

        FileRecord record;
        record.id = file_id;
        record.name = file_id;
        record.chunk_count = chunks;
        record.chunk_hashes = encoded->chunk_hashes;
        record.file_hash = encoded->file_hash;
        record.size_bytes = data.size();
        owner.catalog->put_file(WORKSPACE, record);
        return record;
    }

    std::shared_ptr<FakeNetwork> network_;
    std::unique_ptr<SeedingPeer> alice_;
};

// ============================================================================
// Target Tests
// ============================================================================

TEST_F(SeedingMaintainerTest, EffectiveTargetClamp) {
    EXPECT_EQ(SeedingMaintainer::effective_target(5, 1), 2u);
    EXPECT_EQ(SeedingMaintainer::effective_target(3, 0), 1u);
    EXPECT_EQ(SeedingMaintainer::effective_target(3, 10), 3u);
}

TEST_F(SeedingMaintainerTest, ScopeTargets) {
    EXPECT_EQ(alice_->seeding->get_redundancy_target(WORKSPACE), 3u);
    EXPECT_TRUE(alice_->seeding->set_redundancy_target(WORKSPACE, 4));
    EXPECT_EQ(alice_->seeding->get_redundancy_target(WORKSPACE), 4u);

    EXPECT_FALSE(alice_->seeding->set_redundancy_target("unknown", 2));
    EXPECT_EQ(alice_->seeding->get_redundancy_target("unknown"), config::DEFAULT_REDUNDANCY_TARGET);

    alice_->seeding->remove_scope(WORKSPACE);
    EXPECT_TRUE(alice_->seeding->get_scopes().empty());
    EXPECT_FALSE(alice_->seeding->run_cycle(WORKSPACE));
}

TEST_F(SeedingMaintainerTest, RequiresDependencies) {
    EXPECT_THROW(SeedingMaintainer(nullptr, alice_->store, alice_->ledger, alice_->transport),
                 std::invalid_argument);
}

// ============================================================================
// Cycle Tests
// ============================================================================

TEST_F(SeedingMaintainerTest, AloneIsNoop) {
    add_file(*alice_, "file1", 2);

    EXPECT_TRUE(alice_->seeding->find_under_replicated(WORKSPACE).empty());
    EXPECT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
    EXPECT_EQ(alice_->transport->sent_total(), 0u);
}

TEST_F(SeedingMaintainerTest, ClampedTargetWithOnePeerOnline) {
    SeedingPeer bob("bob", network_);
    alice_->seeding->set_redundancy_target(WORKSPACE, 5);
    add_file(*alice_, "file1", 2);

    auto under = alice_->seeding->find_under_replicated(WORKSPACE);
    ASSERT_EQ(under.size(), 2u);
    EXPECT_EQ(under[0].target, 2u);
    EXPECT_EQ(under[0].replication, 1u);
    EXPECT_EQ(under[0].peers_without, (std::vector<std::string>{"bob"}));

    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));

    EXPECT_EQ(alice_->holders("file1", 0), 2u);
    EXPECT_EQ(alice_->holders("file1", 1), 2u);
    EXPECT_TRUE(bob.store->has("file1", 0));
    EXPECT_TRUE(bob.store->has("file1", 1));
    EXPECT_TRUE(alice_->seeding->find_under_replicated(WORKSPACE).empty());
}

TEST_F(SeedingMaintainerTest, CiphertextReplicatedVerbatim) {
    SeedingPeer bob("bob", network_);
    add_file(*alice_, "file1", 1);

    alice_->seeding->run_cycle(WORKSPACE);

    auto original = alice_->store->get("file1", 0);
    auto copy = bob.store->get("file1", 0);
    ASSERT_TRUE(original.has_value());
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy->encrypted, original->encrypted);
    EXPECT_EQ(copy->nonce, original->nonce);
}

TEST_F(SeedingMaintainerTest, ConvergesAsPeersJoin) {
    auto bob = std::make_unique<SeedingPeer>("bob", network_);
    add_file(*alice_, "F", 4);

    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(alice_->holders("F", i), 2u) << "chunk " << i;
    }
    EXPECT_EQ(bob->store->list_indices("F").size(), 4u);

    // Nothing left to do until another peer appears
    size_t sent_before = alice_->transport->sent_total();
    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
    EXPECT_EQ(alice_->transport->sent_total(), sent_before);

    SeedingPeer carol("carol", network_);
    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(alice_->holders("F", i), 3u) << "chunk " << i;
    }
    EXPECT_EQ(carol.store->list_indices("F").size(), 4u);

    auto stats = alice_->seeding->get_stats();
    EXPECT_EQ(stats.chunks_seeded, 8u);
    EXPECT_EQ(stats.failed_seeds, 0u);
    EXPECT_GT(stats.bytes_seeded, 0u);
}

TEST_F(SeedingMaintainerTest, ConvergesToTargetWithManyPeers) {
    std::vector<std::unique_ptr<SeedingPeer>> peers;
    for (int i = 0; i < 5; ++i) {
        peers.push_back(std::make_unique<SeedingPeer>("peer" + std::to_string(i), network_));
    }
    add_file(*alice_, "file1", 3);

    for (int cycle = 0; cycle < 3; ++cycle) {
        alice_->seeding->run_cycle(WORKSPACE);
    }

    for (uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(alice_->holders("file1", i), 3u);
    }
    EXPECT_EQ(alice_->seeding->get_stats().chunks_seeded, 6u);
}

TEST_F(SeedingMaintainerTest, TrashedFilesAreSkipped) {
    SeedingPeer bob("bob", network_);
    add_file(*alice_, "file1", 2);
    alice_->catalog->mark_deleted("file1", 1234);

    EXPECT_TRUE(alice_->seeding->find_under_replicated(WORKSPACE).empty());
    alice_->seeding->run_cycle(WORKSPACE);
    EXPECT_EQ(bob.store->count(), 0u);
}

TEST_F(SeedingMaintainerTest, FailedSendLeavesLedgerUntouched) {
    SeedingPeer bob("bob", network_);
    network_->set_unreachable("bob", true);
    add_file(*alice_, "file1", 1);

    alice_->seeding->run_cycle(WORKSPACE);

    EXPECT_EQ(alice_->holders("file1", 0), 1u);
    auto stats = alice_->seeding->get_stats();
    EXPECT_EQ(stats.failed_seeds, 1u);
    EXPECT_EQ(stats.chunks_seeded, 0u);
}

TEST_F(SeedingMaintainerTest, UnacknowledgedSeedIsNotAHolder) {
    SeedingPeer bob("bob", network_);
    network_->set_silent("bob", true);
    add_file(*alice_, "file1", 1);

    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));

    // Handed to the transport, but Bob never stored it
    EXPECT_EQ(alice_->seeding->get_stats().chunks_seeded, 1u);
    EXPECT_FALSE(bob.store->has("file1", 0));
    EXPECT_EQ(alice_->holders("file1", 0), 1u);
    EXPECT_EQ(alice_->seeding->find_under_replicated(WORKSPACE).size(), 1u);

    // The next cycle retries and the acknowledgement records Bob
    network_->set_silent("bob", false);
    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
    EXPECT_TRUE(bob.store->has("file1", 0));
    EXPECT_EQ(alice_->ledger->get_holders("file1", 0), (std::set<std::string>{"alice", "bob"}));
    EXPECT_EQ(alice_->seeding->get_stats().chunks_seeded, 2u);
}

TEST_F(SeedingMaintainerTest, RejectedSeedIsNotAHolder) {
    SeedingPeer bob("bob", network_);

    // A corrupt local copy the target refuses to store
    alice_->store->put("file1", 0, StoredChunk{std::vector<uint8_t>(48, 0x01), std::vector<uint8_t>(5, 0x02)});
    alice_->ledger->add_holder("file1", 0, "alice");
    FileRecord record;
    record.id = "file1";
    record.name = "file1";
    record.chunk_count = 1;
    record.size_bytes = 32;
    alice_->catalog->put_file(WORKSPACE, record);

    ASSERT_TRUE(alice_->seeding->run_cycle(WORKSPACE));

    EXPECT_FALSE(bob.store->has("file1", 0));
    EXPECT_EQ(alice_->ledger->get_holders("file1", 0), (std::set<std::string>{"alice"}));
}

TEST_F(SeedingMaintainerTest, FewestHoldersFirst) {
    SeedingPeer bob("bob", network_);
    SeedingPeer carol("carol", network_);
    add_file(*alice_, "file1", 2);
    alice_->ledger->add_holder("file1", 0, "bob");

    auto under = alice_->seeding->find_under_replicated(WORKSPACE);
    ASSERT_EQ(under.size(), 2u);
    EXPECT_EQ(under[0].chunk_index, 1u);
    EXPECT_EQ(under[1].chunk_index, 0u);
    EXPECT_EQ(under[1].peers_without, (std::vector<std::string>{"carol"}));
}

TEST_F(SeedingMaintainerTest, CycleIsSingleFlightPerScope) {
    SeedingPeer bob("bob", network_);
    add_file(*alice_, "file1", 1);

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first(true);

    network_->set_delivery_hook([&]() {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
    });

    std::thread cycle([this]() { alice_->seeding->run_cycle(WORKSPACE); });
    entered.get_future().wait();

    EXPECT_FALSE(alice_->seeding->run_cycle(WORKSPACE));

    release.set_value();
    cycle.join();
    network_->set_delivery_hook(nullptr);

    // Released scope runs again
    EXPECT_TRUE(alice_->seeding->run_cycle(WORKSPACE));
}

TEST_F(SeedingMaintainerTest, RunAllCycles) {
    alice_->seeding->add_scope("workspace-2", 2);
    EXPECT_EQ(alice_->seeding->run_all_cycles(), 2u);
}

// ============================================================================
// Background Tests
// ============================================================================

TEST_F(SeedingMaintainerTest, TriggerWakesBackgroundCycle) {
    SeedingOptions options;
    options.initial_delay = std::chrono::hours(1);
    options.seed_interval = std::chrono::hours(1);
    auto carol = std::make_unique<SeedingPeer>("carol", network_, options);
    carol->seeding->add_scope(WORKSPACE, 2);
    add_file(*carol, "file1", 1);

    SeedingPeer bob("bob", network_);
    alice_.reset();

    EXPECT_FALSE(carol->seeding->trigger_seeding());
    ASSERT_TRUE(carol->seeding->start());
    EXPECT_TRUE(carol->seeding->is_running());
    ASSERT_TRUE(carol->seeding->trigger_seeding());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (carol->seeding->get_stats().chunks_seeded == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    EXPECT_EQ(carol->seeding->get_stats().chunks_seeded, 1u);
    EXPECT_TRUE(bob.store->has("file1", 0));

    carol->seeding->stop();
    EXPECT_FALSE(carol->seeding->is_running());
}

TEST_F(SeedingMaintainerTest, BandwidthSamples) {
    SeedingPeer bob("bob", network_);
    add_file(*alice_, "file1", 2);
    alice_->seeding->run_cycle(WORKSPACE);

    alice_->seeding->take_bandwidth_sample();
    alice_->seeding->take_bandwidth_sample();

    auto history = alice_->seeding->get_bandwidth_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].bytes_sent, alice_->seeding->get_stats().bytes_seeded);
    EXPECT_EQ(history[1].bytes_sent, 0u);
    EXPECT_LE(history[0].timestamp, history[1].timestamp);
}

TEST_F(SeedingMaintainerTest, BandwidthHistoryIsBounded) {
    SeedingOptions options;
    options.max_bandwidth_samples = 3;
    SeedingPeer bob("bob", network_, options);

    for (int i = 0; i < 10; ++i) {
        bob.seeding->take_bandwidth_sample();
    }
    EXPECT_EQ(bob.seeding->get_bandwidth_history().size(), 3u);
}
