/**
 * @file test_swarm_manager.cpp
 * @brief Loopback tests for SwarmManager
 *
 * Tests the TCP swarm including:
 * - Topic rendezvous through an in-process directory
 * - Sync, awareness and direct message delivery
 * - Leave and disconnect notifications
 * - Rejection of unsigned and forged identities
 */

#include <gtest/gtest.h>
#include "nightjar/swarm_manager.hpp"
#include "nightjar/topic_discovery.hpp"
#include "nightjar/share_link.hpp"
#include "nightjar/mesh_crypto.hpp"
#include "nightjar/utilities.hpp"
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace nightjar;

namespace {

/// Poll a condition until it holds or the deadline passes
bool wait_for(const std::function<bool()>& condition,
              std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

class RecordingObserver : public SwarmObserver {
public:
    void on_peer_identity(const RemotePeer& peer) override {
        std::lock_guard<std::mutex> lock(mutex_);
        identities.push_back(peer.peer_id);
    }

    void on_peer_joined(const std::string& topic, const RemotePeer& peer) override {
        std::lock_guard<std::mutex> lock(mutex_);
        joined.emplace_back(topic, peer.peer_id);
    }

    void on_peer_left(const std::string& topic, const std::string& peer_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        left.emplace_back(topic, peer_id);
    }

    void on_sync(const std::string& peer_id, const SyncMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        syncs.emplace_back(peer_id, message);
    }

    void on_awareness(const std::string& /*peer_id*/, const AwarenessMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        awareness.push_back(message);
    }

    void on_direct_message(const std::string& peer_id, const UnrecognizedMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        direct.emplace_back(peer_id, message);
    }

    void on_peer_disconnected(const std::string& peer_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected.push_back(peer_id);
    }

    template <typename Fn>
    auto read(Fn fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn();
    }

    std::vector<std::string> identities;
    std::vector<std::pair<std::string, std::string>> joined;
    std::vector<std::pair<std::string, std::string>> left;
    std::vector<std::pair<std::string, SyncMessage>> syncs;
    std::vector<AwarenessMessage> awareness;
    std::vector<std::pair<std::string, UnrecognizedMessage>> direct;
    std::vector<std::string> disconnected;

private:
    mutable std::mutex mutex_;
};

} // anonymous namespace

class SwarmManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MeshCrypto::initialize();
        directory_ = std::make_shared<TopicDirectory>();
        topic_ = share_link::derive_topic("swarm-manager-test");
    }

    void TearDown() override {
        for (auto& swarm : swarms_) {
            swarm->stop();
        }
    }

    std::shared_ptr<SwarmManager> make_swarm(const std::string& name) {
        SwarmOptions options;
        options.listen_address = "127.0.0.1";
        options.listen_port = 0;
        options.advertise_host = "127.0.0.1";
        options.worker_threads = 1;

        auto swarm = std::make_shared<SwarmManager>(
            std::make_shared<const PeerIdentity>(name), directory_, options);
        EXPECT_TRUE(swarm->start());
        swarms_.push_back(swarm);
        return swarm;
    }

    /// Observer owned by the fixture so it outlives the swarms it watches
    RecordingObserver& observe(SwarmManager& swarm) {
        observers_.push_back(std::make_unique<RecordingObserver>());
        swarm.add_observer(observers_.back().get());
        return *observers_.back();
    }

    static bool has_peer(const Swarm& swarm, const std::string& topic, const std::string& peer_id) {
        for (const auto& peer : swarm.get_peers(topic)) {
            if (peer.peer_id == peer_id) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<TopicDirectory> directory_;
    std::string topic_;
    std::vector<std::shared_ptr<SwarmManager>> swarms_;
    std::vector<std::unique_ptr<RecordingObserver>> observers_;
};

TEST_F(SwarmManagerTest, StartAndStop) {
    auto swarm = make_swarm("Solo");

    EXPECT_TRUE(swarm->is_running());
    EXPECT_NE(swarm->get_listen_port(), 0);
    EXPECT_EQ(swarm->get_local_peer_id(), swarm->get_identity().get_public_key_hex());
    EXPECT_FALSE(swarm->start());

    EXPECT_TRUE(swarm->join_topic(topic_));
    EXPECT_EQ(directory_->announced_count(topic_), 1u);

    swarm->stop();
    EXPECT_FALSE(swarm->is_running());
    EXPECT_TRUE(swarm->get_topics().empty());
    EXPECT_EQ(directory_->announced_count(topic_), 0u);
    EXPECT_FALSE(swarm->join_topic(topic_));
}

TEST_F(SwarmManagerTest, JoinValidatesTopic) {
    auto swarm = make_swarm("Solo");

    EXPECT_FALSE(swarm->join_topic("not-a-topic"));
    EXPECT_FALSE(swarm->join_topic(std::string(64, 'g')));
    EXPECT_TRUE(swarm->join_topic(topic_));
    EXPECT_TRUE(swarm->join_topic(topic_));
    EXPECT_EQ(swarm->get_topics(), (std::vector<std::string>{topic_}));
}

TEST_F(SwarmManagerTest, PeersMeetOnSharedTopic) {
    auto alice = make_swarm("Alice");
    auto bob = make_swarm("Bob");
    auto& alice_events = observe(*alice);

    ASSERT_TRUE(alice->join_topic(topic_));
    ASSERT_TRUE(bob->join_topic(topic_));

    ASSERT_TRUE(wait_for([&]() { return has_peer(*alice, topic_, bob->get_local_peer_id()); }));
    ASSERT_TRUE(wait_for([&]() { return has_peer(*bob, topic_, alice->get_local_peer_id()); }));

    EXPECT_EQ(alice->get_connected_peers(), (std::vector<std::string>{bob->get_local_peer_id()}));
    EXPECT_TRUE(wait_for([&]() {
        return alice_events.read([&]() {
            return alice_events.joined.size() == 1 && alice_events.joined[0].second == bob->get_local_peer_id();
        });
    }));

    auto peers = alice->get_peers(topic_);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].display_name, "Bob");
}

TEST_F(SwarmManagerTest, SyncAndAwarenessReachTopicMembers) {
    auto alice = make_swarm("Alice");
    auto bob = make_swarm("Bob");
    auto& bob_events = observe(*bob);

    alice->join_topic(topic_);
    bob->join_topic(topic_);
    ASSERT_TRUE(wait_for([&]() { return has_peer(*alice, topic_, bob->get_local_peer_id()); }));

    SyncMessage sync;
    sync.topic = topic_;
    sync.data_json = "{\"update\":[4,5,6]}";
    sync.from = "forged-sender";
    EXPECT_EQ(alice->broadcast_sync(sync), 1u);

    AwarenessMessage awareness;
    awareness.topic = topic_;
    awareness.state_json = "{\"cursor\":12}";
    EXPECT_EQ(alice->broadcast_awareness(awareness), 1u);

    ASSERT_TRUE(wait_for([&]() {
        return bob_events.read([&]() { return !bob_events.syncs.empty() && !bob_events.awareness.empty(); });
    }));

    bob_events.read([&]() {
        EXPECT_EQ(bob_events.syncs[0].first, alice->get_local_peer_id());
        EXPECT_EQ(bob_events.syncs[0].second.from, alice->get_local_peer_id());
        EXPECT_EQ(bob_events.syncs[0].second.topic, topic_);
        EXPECT_EQ(bob_events.awareness[0].from, alice->get_local_peer_id());
        return true;
    });

    // Topics we have not joined are not broadcast
    SyncMessage other = sync;
    other.topic = share_link::derive_topic("elsewhere");
    EXPECT_EQ(alice->broadcast_sync(other), 0u);
}

TEST_F(SwarmManagerTest, DirectMessagesDeliveredByPeerId) {
    auto alice = make_swarm("Alice");
    auto bob = make_swarm("Bob");
    auto& bob_events = observe(*bob);

    alice->join_topic(topic_);
    bob->join_topic(topic_);
    ASSERT_TRUE(wait_for([&]() { return has_peer(*alice, topic_, bob->get_local_peer_id()); }));

    ChunkRequest request;
    request.file_id = "file-1";
    request.chunk_index = 2;
    request.request_id = "req-9";
    EXPECT_TRUE(alice->send_to_peer(bob->get_local_peer_id(), request.to_json()));
    EXPECT_FALSE(alice->send_to_peer(std::string(64, 'a'), request.to_json()));

    ASSERT_TRUE(wait_for([&]() { return bob_events.read([&]() { return !bob_events.direct.empty(); }); }));

    bob_events.read([&]() {
        EXPECT_EQ(bob_events.direct[0].first, alice->get_local_peer_id());
        EXPECT_EQ(bob_events.direct[0].second.type, message_type::CHUNK_REQUEST);
        auto parsed = ChunkRequest::from_json(bob_events.direct[0].second.raw);
        EXPECT_EQ(parsed ? parsed->request_id : "", "req-9");
        return true;
    });
}

TEST_F(SwarmManagerTest, LeaveAndDisconnectNotify) {
    auto alice = make_swarm("Alice");
    auto bob = make_swarm("Bob");
    auto& alice_events = observe(*alice);

    alice->join_topic(topic_);
    bob->join_topic(topic_);
    ASSERT_TRUE(wait_for([&]() { return has_peer(*alice, topic_, bob->get_local_peer_id()); }));

    bob->leave_topic(topic_);
    ASSERT_TRUE(wait_for([&]() { return !has_peer(*alice, topic_, bob->get_local_peer_id()); }));
    ASSERT_TRUE(wait_for([&]() { return alice_events.read([&]() { return alice_events.left.size() == 1; }); }));

    bob->stop();
    ASSERT_TRUE(wait_for([&]() {
        return alice_events.read([&]() { return alice_events.disconnected.size() == 1; });
    }));
    EXPECT_TRUE(alice->get_connected_peers().empty());
}

TEST_F(SwarmManagerTest, DialsRunInBackground) {
    // Unroutable documentation addresses: these dials can only fail or time out
    directory_->announce(topic_, "unreachable-a", {"192.0.2.1", 9});
    directory_->announce(topic_, "unreachable-b", {"192.0.2.2", 9});

    auto alice = make_swarm("Alice");
    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(alice->connect_to_peer("192.0.2.3", 9));
    EXPECT_TRUE(alice->join_topic(topic_));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));

    // The single worker thread still serves real peers
    auto bob = make_swarm("Bob");
    ASSERT_TRUE(bob->join_topic(topic_));
    EXPECT_TRUE(wait_for([&]() {
        return has_peer(*alice, topic_, bob->get_local_peer_id()) &&
               has_peer(*bob, topic_, alice->get_local_peer_id());
    }));

    started = std::chrono::steady_clock::now();
    alice->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, config::CLOSE_LINGER + std::chrono::seconds(1));
}

TEST_F(SwarmManagerTest, ThreePeersFormFullMesh) {
    auto alice = make_swarm("Alice");
    auto bob = make_swarm("Bob");
    auto carol = make_swarm("Carol");

    alice->join_topic(topic_);
    bob->join_topic(topic_);
    carol->join_topic(topic_);

    for (const auto& swarm : swarms_) {
        ASSERT_TRUE(wait_for([&]() { return swarm->get_peers(topic_).size() == 2; }))
            << swarm->get_identity().get_display_name() << " sees " << swarm->get_peers(topic_).size();
    }
}

TEST_F(SwarmManagerTest, SelfConnectionDropped) {
    auto alice = make_swarm("Alice");

    EXPECT_TRUE(alice->connect_to_peer("127.0.0.1", alice->get_listen_port()));
    EXPECT_TRUE(wait_for([&]() { return alice->get_connection_count() == 0; }));
    EXPECT_TRUE(alice->get_connected_peers().empty());
}

TEST_F(SwarmManagerTest, ForgedIdentityRejected) {
    auto alice = make_swarm("Alice");
    auto& alice_events = observe(*alice);
    alice->join_topic(topic_);

    PeerIdentity victim("Victim");
    PeerIdentity mallory("Mallory");

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), alice->get_listen_port()));

    // The swarm speaks first with its own signed identity
    asio::streambuf buffer;
    asio::read_until(socket, buffer, '\n');
    std::istream stream(&buffer);
    std::string line;
    std::getline(stream, line);
    auto greeting = IdentityMessage::from_json(line);
    ASSERT_TRUE(greeting.has_value());
    EXPECT_EQ(greeting->public_key, alice->get_local_peer_id());
    EXPECT_TRUE(PeerIdentity::verify_identity_message(*greeting));

    // Claim the victim's key with Mallory's signature, then an unsigned claim
    auto forged = mallory.create_identity_message(utilities::current_time_ms());
    forged.public_key = victim.get_public_key_hex();
    IdentityMessage unsigned_claim;
    unsigned_claim.public_key = victim.get_public_key_hex();
    unsigned_claim.display_name = "Victim";

    SyncMessage sync;
    sync.topic = topic_;
    sync.data_json = "{\"evil\":true}";

    const std::string outgoing = forged.to_json() + "\n" +
                                 unsigned_claim.to_json() + "\n" +
                                 JoinTopicMessage{topic_}.to_json() + "\n" +
                                 sync.to_json() + "\n";
    asio::write(socket, asio::buffer(outgoing));

    EXPECT_TRUE(wait_for([&]() { return alice->get_connection_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_TRUE(alice->get_connected_peers().empty());
    EXPECT_TRUE(alice->get_peers(topic_).empty());
    alice_events.read([&]() {
        EXPECT_TRUE(alice_events.identities.empty());
        EXPECT_TRUE(alice_events.joined.empty());
        EXPECT_TRUE(alice_events.syncs.empty());
        return true;
    });

    socket.close();
}
