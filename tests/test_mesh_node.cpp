/**
 * @file test_mesh_node.cpp
 * @brief Integration tests for MeshNode over loopback
 *
 * Tests the assembled node including:
 * - Identity persistence across restarts
 * - Adding, fetching, trashing and deleting files
 * - Seeding a workspace to a second node
 * - Joining a workspace from a share link
 */

#include <gtest/gtest.h>
#include "nightjar/mesh_node.hpp"
#include "nightjar/mesh_crypto.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

using namespace nightjar;
namespace fs = std::filesystem;

namespace {

bool wait_for(const std::function<bool()>& condition,
              std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

} // anonymous namespace

class MeshNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        MeshCrypto::initialize();
        test_dir_ = fs::temp_directory_path() / ("nightjar_node_test_" + MeshCrypto::bytes_to_hex(
            MeshCrypto::generate_random_bytes(6)));
        fs::create_directories(test_dir_);
        directory_ = std::make_shared<TopicDirectory>();
    }

    void TearDown() override {
        for (auto& node : nodes_) {
            node->stop();
        }
        nodes_.clear();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    MeshNode& make_node(const std::string& name) {
        MeshNodeOptions options;
        options.data_dir = test_dir_ / name;
        options.display_name = name;
        options.swarm.listen_address = "127.0.0.1";
        options.swarm.advertise_host = "127.0.0.1";
        options.swarm.worker_threads = 1;
        options.request_timeout = std::chrono::milliseconds(2000);
        options.enable_seeding = false;

        nodes_.push_back(std::make_unique<MeshNode>(name, directory_, options));
        return *nodes_.back();
    }

    static std::vector<uint8_t> sample_data(size_t size) {
        return MeshCrypto::generate_random_bytes(size);
    }

    static bool connected(const MeshNode& a, const MeshNode& b) {
        auto peers = a.get_connected_peers();
        return std::find(peers.begin(), peers.end(), b.get_peer_id()) != peers.end();
    }

    static constexpr const char* WORKSPACE = "0123456789abcdef0123456789abcdef";

    fs::path test_dir_;
    std::shared_ptr<TopicDirectory> directory_;
    std::vector<std::unique_ptr<MeshNode>> nodes_;
};

TEST_F(MeshNodeTest, InvalidConstructionThrows) {
    EXPECT_THROW(MeshNode("../escape", directory_), std::invalid_argument);
    EXPECT_THROW(MeshNode("alice", nullptr), std::invalid_argument);
}

TEST_F(MeshNodeTest, IdentitySurvivesRestart) {
    auto& node = make_node("alice");
    EXPECT_TRUE(node.get_peer_id().empty());

    ASSERT_TRUE(node.start());
    EXPECT_FALSE(node.start());
    std::string peer_id = node.get_peer_id();
    EXPECT_EQ(peer_id.size(), 64u);
    EXPECT_NE(node.get_port(), 0);

    node.stop();
    EXPECT_FALSE(node.is_running());
    ASSERT_TRUE(node.start());
    EXPECT_EQ(node.get_peer_id(), peer_id);
}

TEST_F(MeshNodeTest, AddFileRequiresStart) {
    auto& node = make_node("alice");
    EXPECT_FALSE(node.add_file(WORKSPACE, "early.bin", sample_data(100)).has_value());
}

TEST_F(MeshNodeTest, AddAndFetchLocalFile) {
    auto& node = make_node("alice");
    ASSERT_TRUE(node.start());
    ASSERT_TRUE(node.join_workspace(WORKSPACE));

    auto data = sample_data(config::CHUNK_SIZE + 4096);
    auto stored = node.add_file(WORKSPACE, "report.pdf", data);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->record.chunk_count, 2u);
    EXPECT_EQ(stored->record.size_bytes, data.size());
    EXPECT_EQ(node.get_store()->count(), 2u);
    EXPECT_EQ(node.get_ledger()->get_holders(stored->record.id, 0),
              (std::set<std::string>{node.get_peer_id()}));

    auto result = node.fetch_file(stored->record.id, stored->key);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, data);

    auto stats = node.get_stats();
    EXPECT_EQ(stats.workspaces, 1u);
    EXPECT_EQ(stats.stored_chunks, 2u);
}

TEST_F(MeshNodeTest, FetchUnknownFileFails) {
    auto& node = make_node("alice");
    ASSERT_TRUE(node.start());

    auto result = node.fetch_file("missing", ChunkCodec::generate_key());
    EXPECT_FALSE(result.success);
}

TEST_F(MeshNodeTest, FetchFromPeer) {
    auto& alice = make_node("alice");
    auto& bob = make_node("bob");
    ASSERT_TRUE(alice.start());
    ASSERT_TRUE(bob.start());
    ASSERT_TRUE(alice.join_workspace(WORKSPACE));
    ASSERT_TRUE(bob.join_workspace(WORKSPACE));
    ASSERT_TRUE(wait_for([&]() { return connected(bob, alice); }));

    auto data = sample_data(5000);
    auto stored = alice.add_file(WORKSPACE, "notes.txt", data);
    ASSERT_TRUE(stored.has_value());

    bob.register_file(WORKSPACE, stored->record);
    auto result = bob.fetch_file(stored->record.id, stored->key);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, data);
    EXPECT_TRUE(bob.get_store()->has(stored->record.id, 0));
    EXPECT_GE(alice.get_stats().transfer.chunks_served, 1u);
}

TEST_F(MeshNodeTest, SeedingReplicatesToPeer) {
    auto& alice = make_node("alice");
    auto& bob = make_node("bob");
    ASSERT_TRUE(alice.start());
    ASSERT_TRUE(bob.start());
    ASSERT_TRUE(alice.join_workspace(WORKSPACE, 3));
    ASSERT_TRUE(bob.join_workspace(WORKSPACE, 3));
    ASSERT_TRUE(wait_for([&]() { return connected(alice, bob); }));

    auto stored = alice.add_file(WORKSPACE, "photo.jpg", sample_data(config::CHUNK_SIZE * 2 + 10));
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->record.chunk_count, 3u);

    EXPECT_EQ(alice.seed_now(), 1u);

    const std::string& file_id = stored->record.id;
    ASSERT_TRUE(wait_for([&]() { return bob.get_store()->list_indices(file_id).size() == 3; }));

    // Bob is recorded as a holder once his acknowledgements arrive
    ASSERT_TRUE(wait_for([&]() {
        for (uint32_t index = 0; index < 3; ++index) {
            if (alice.get_ledger()->count_holders(file_id, index) != 2) {
                return false;
            }
        }
        return true;
    }));

    for (uint32_t index = 0; index < 3; ++index) {
        EXPECT_EQ(bob.get_store()->get(file_id, index)->encrypted,
                  alice.get_store()->get(file_id, index)->encrypted);
    }
    EXPECT_EQ(alice.get_stats().seeding.chunks_seeded, 3u);

    // Target is clamped to the two nodes online: nothing more to do
    alice.seed_now();
    EXPECT_EQ(alice.get_stats().seeding.chunks_seeded, 3u);
}

TEST_F(MeshNodeTest, TrashedFilesAreNotSeeded) {
    auto& alice = make_node("alice");
    auto& bob = make_node("bob");
    ASSERT_TRUE(alice.start());
    ASSERT_TRUE(bob.start());
    ASSERT_TRUE(alice.join_workspace(WORKSPACE));
    ASSERT_TRUE(bob.join_workspace(WORKSPACE));
    ASSERT_TRUE(wait_for([&]() { return connected(alice, bob); }));

    auto stored = alice.add_file(WORKSPACE, "old.txt", sample_data(100));
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(alice.trash_file(stored->record.id));

    alice.seed_now();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(bob.get_store()->count(), 0u);
    EXPECT_EQ(alice.get_stats().seeding.chunks_seeded, 0u);
}

TEST_F(MeshNodeTest, TrashKeepsEntriesDeleteRemovesThem) {
    auto& node = make_node("alice");
    ASSERT_TRUE(node.start());
    ASSERT_TRUE(node.join_workspace(WORKSPACE));

    auto stored = node.add_file(WORKSPACE, "draft.txt", sample_data(config::CHUNK_SIZE + 1));
    ASSERT_TRUE(stored.has_value());
    const std::string& file_id = stored->record.id;
    ASSERT_EQ(stored->record.chunk_count, 2u);

    // Trash is reversible: record, chunks and ledger entries all stay
    ASSERT_TRUE(node.trash_file(file_id));
    auto trashed = node.get_catalog()->get_file(file_id);
    ASSERT_TRUE(trashed.has_value());
    EXPECT_TRUE(trashed->is_deleted());
    EXPECT_EQ(node.get_store()->list_indices(file_id).size(), 2u);
    EXPECT_EQ(node.get_ledger()->count_holders(file_id, 0), 1u);

    ASSERT_TRUE(node.delete_file(file_id));
    EXPECT_FALSE(node.get_catalog()->get_file(file_id).has_value());
    EXPECT_TRUE(node.get_store()->list_indices(file_id).empty());
    EXPECT_EQ(node.get_ledger()->count_holders(file_id, 0), 0u);
    EXPECT_EQ(node.get_ledger()->count_holders(file_id, 1), 0u);

    EXPECT_FALSE(node.delete_file(file_id));
    EXPECT_FALSE(node.fetch_file(file_id, stored->key).success);
}

TEST_F(MeshNodeTest, JoinFromShareLink) {
    auto& alice = make_node("alice");
    auto& bob = make_node("bob");
    ASSERT_TRUE(alice.start());
    ASSERT_TRUE(bob.start());
    ASSERT_TRUE(alice.join_workspace(WORKSPACE));

    auto key = ChunkCodec::generate_key();
    auto link = alice.share_workspace(WORKSPACE, key, Permission::VIEWER);
    ASSERT_TRUE(link.has_value());

    auto parsed = bob.join_from_link(*link);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->entity_type, EntityType::WORKSPACE);
    EXPECT_EQ(parsed->permission, Permission::VIEWER);
    ASSERT_TRUE(parsed->encryption_key.has_value());
    EXPECT_TRUE(std::equal(key.begin(), key.end(), parsed->encryption_key->begin()));
    EXPECT_EQ(parsed->swarm_peers, (std::vector<std::string>{alice.get_peer_id()}));
    EXPECT_EQ(parsed->topic, share_link::workspace_topic(WORKSPACE));

    EXPECT_EQ(bob.get_workspaces(), (std::vector<std::string>{WORKSPACE}));
    EXPECT_TRUE(wait_for([&]() { return connected(bob, alice); }));

    EXPECT_FALSE(bob.join_from_link("nightjar://w/garbage").has_value());
}

TEST_F(MeshNodeTest, LeaveWorkspace) {
    auto& node = make_node("alice");
    ASSERT_TRUE(node.start());
    ASSERT_TRUE(node.join_workspace(WORKSPACE));

    EXPECT_TRUE(node.leave_workspace(WORKSPACE));
    EXPECT_FALSE(node.leave_workspace(WORKSPACE));
    EXPECT_TRUE(node.get_workspaces().empty());
    EXPECT_EQ(node.seed_now(), 0u);
}
