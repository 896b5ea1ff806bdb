/**
 * @file test_mesh_bridge.cpp
 * @brief Unit tests for MeshBridge
 *
 * Tests local client multiplexing including:
 * - One swarm topic join per topic regardless of local interest
 * - Roster, join and leave notifications between local clients
 * - Sync fan-out to local members and the swarm
 * - Client limit enforcement
 * - Suspend / resume with saved state
 */

#include <gtest/gtest.h>
#include "nightjar/mesh_bridge.hpp"
#include "nightjar/mesh_crypto.hpp"
#include "mesh_test_support.hpp"
#include <memory>
#include <vector>

using namespace nightjar;
using namespace nightjar::test_support;

class MeshBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        MeshCrypto::initialize();
        identity_ = std::make_shared<const PeerIdentity>("Bridge Host");
    }

    /// Factory handing out FakeSwarms, recording each one built
    SwarmFactory factory() {
        return [this](std::shared_ptr<const PeerIdentity> identity) -> std::shared_ptr<Swarm> {
            auto swarm = std::make_shared<FakeSwarm>(identity->get_public_key_hex());
            swarm->fail_start = fail_next_start_;
            swarm->fail_join = fail_next_join_;
            swarms_.push_back(swarm);
            return swarm;
        };
    }

    std::unique_ptr<MeshBridge> make_bridge(size_t max_clients = config::MAX_LOCAL_CLIENTS) {
        auto bridge = std::make_unique<MeshBridge>(factory(), nullptr, max_clients);
        EXPECT_TRUE(bridge->initialize(identity_));
        return bridge;
    }

    std::pair<std::string, std::shared_ptr<FakeClient>> connect(MeshBridge& bridge, const std::string& name = "") {
        auto client = std::make_shared<FakeClient>();
        auto client_id = bridge.add_client(client);
        EXPECT_TRUE(client_id.has_value());
        if (!name.empty()) {
            IdentityMessage identity;
            identity.public_key = name + "-key";
            identity.display_name = name;
            bridge.handle_client_message(*client_id, identity.to_json());
        }
        return {client_id.value_or(""), client};
    }

    static std::string join(const std::string& topic) {
        return JoinTopicMessage{topic}.to_json();
    }

    static std::string sync(const std::string& topic, const std::string& data_json = "{\"op\":1}") {
        SyncMessage message;
        message.topic = topic;
        message.data_json = data_json;
        return message.to_json();
    }

    FakeSwarm& current_swarm() {
        return *swarms_.back();
    }

    std::shared_ptr<const PeerIdentity> identity_;
    std::vector<std::shared_ptr<FakeSwarm>> swarms_;
    bool fail_next_start_ = false;
    bool fail_next_join_ = false;
};

TEST_F(MeshBridgeTest, InitializeStartsSwarm) {
    auto bridge = make_bridge();

    EXPECT_TRUE(bridge->is_initialized());
    EXPECT_FALSE(bridge->is_suspended());
    ASSERT_EQ(swarms_.size(), 1u);
    EXPECT_TRUE(current_swarm().is_running());
    EXPECT_EQ(current_swarm().observer_count(), 1u);
    EXPECT_EQ(bridge->get_swarm()->get_local_peer_id(), identity_->get_public_key_hex());

    // Second initialize is a no-op
    EXPECT_TRUE(bridge->initialize(identity_));
    EXPECT_EQ(swarms_.size(), 1u);
}

TEST_F(MeshBridgeTest, InitializeFailsWhenSwarmCannotStart) {
    fail_next_start_ = true;
    MeshBridge bridge(factory());

    EXPECT_FALSE(bridge.initialize(identity_));
    EXPECT_FALSE(bridge.is_initialized());
    EXPECT_EQ(bridge.get_swarm(), nullptr);
}

TEST_F(MeshBridgeTest, NullFactoryThrows) {
    EXPECT_THROW(MeshBridge(nullptr), std::invalid_argument);
}

TEST_F(MeshBridgeTest, LanDiscoveryUnavailableWithoutFactory) {
    auto bridge = make_bridge();
    EXPECT_FALSE(bridge->is_lan_discovery_available());
}

TEST_F(MeshBridgeTest, ClientIdsAreSequential) {
    auto bridge = make_bridge();

    auto [first, client1] = connect(*bridge);
    auto [second, client2] = connect(*bridge);

    EXPECT_EQ(first, "client-1");
    EXPECT_EQ(second, "client-2");
    EXPECT_EQ(bridge->client_count(), 2u);
}

TEST_F(MeshBridgeTest, ClientLimitRejectsExtraClient) {
    auto bridge = make_bridge(2);
    connect(*bridge);
    connect(*bridge);

    auto rejected = std::make_shared<FakeClient>();
    EXPECT_FALSE(bridge->add_client(rejected).has_value());
    EXPECT_TRUE(rejected->is_closed());
    EXPECT_EQ(rejected->close_reason(), close_reason::TOO_MANY_CLIENTS);
    EXPECT_EQ(bridge->client_count(), 2u);
}

TEST_F(MeshBridgeTest, SwarmTopicJoinedOncePerTopic) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");

    bridge->handle_client_message(id1, join("doc-1"));
    bridge->handle_client_message(id2, join("doc-1"));
    bridge->handle_client_message(id2, join("doc-1"));

    EXPECT_EQ(current_swarm().join_calls("doc-1"), 1u);
    EXPECT_EQ(bridge->get_topics(), (std::vector<std::string>{"doc-1"}));
}

TEST_F(MeshBridgeTest, LastLeaveReleasesSwarmTopic) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");

    bridge->handle_client_message(id1, join("doc-1"));
    bridge->handle_client_message(id2, join("doc-1"));

    bridge->handle_client_message(id1, LeaveTopicMessage{"doc-1"}.to_json());
    EXPECT_EQ(current_swarm().leave_calls("doc-1"), 0u);

    auto left = client2->of_type(message_type::PEER_LEFT);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(PeerLeftMessage::from_json(left[0])->peer_id, "alice-key");

    bridge->handle_client_message(id2, LeaveTopicMessage{"doc-1"}.to_json());
    EXPECT_EQ(current_swarm().leave_calls("doc-1"), 1u);
    EXPECT_TRUE(bridge->get_topics().empty());
}

TEST_F(MeshBridgeTest, JoinSendsRosterAndAnnouncesJoiner) {
    auto bridge = make_bridge();
    current_swarm().add_remote_peer("doc-1", RemotePeer{"remote-key", "Remote", "#00ff00"});

    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");

    bridge->handle_client_message(id1, join("doc-1"));
    client1->clear();

    bridge->handle_client_message(id2, join("doc-1"));

    auto rosters = client2->of_type(message_type::PEERS_LIST);
    ASSERT_EQ(rosters.size(), 1u);
    auto roster = PeersListMessage::from_json(rosters[0]);
    ASSERT_TRUE(roster.has_value());
    ASSERT_EQ(roster->peers.size(), 2u);
    EXPECT_EQ(roster->peers[0].peer_id, "alice-key");
    EXPECT_EQ(roster->peers[1].peer_id, "remote-key");

    auto joined = client1->of_type(message_type::PEER_JOINED);
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(PeerJoinedMessage::from_json(joined[0])->peer.display_name, "bob");
    EXPECT_TRUE(client2->of_type(message_type::PEER_JOINED).empty());
}

TEST_F(MeshBridgeTest, InvalidTopicRejected) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge);

    bridge->handle_client_message(id, join(""));
    bridge->handle_client_message(id, join(std::string(config::MAX_TOPIC_LENGTH + 1, 't')));

    EXPECT_EQ(client->errors(), (std::vector<std::string>{"invalid_topic", "invalid_topic"}));
    EXPECT_TRUE(bridge->get_topics().empty());
}

TEST_F(MeshBridgeTest, SwarmJoinFailureRejectsTopic) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge, "alice");

    current_swarm().fail_join = true;
    bridge->handle_client_message(id, join("doc-1"));

    EXPECT_EQ(client->errors(), (std::vector<std::string>{"invalid_topic"}));
    EXPECT_TRUE(client->of_type(message_type::PEERS_LIST).empty());
    EXPECT_TRUE(bridge->get_topics().empty());

    // Not left as a member, so a retry is a fresh first join
    current_swarm().fail_join = false;
    bridge->handle_client_message(id, join("doc-1"));
    EXPECT_EQ(current_swarm().join_calls("doc-1"), 1u);
    EXPECT_EQ(client->of_type(message_type::PEERS_LIST).size(), 1u);
    EXPECT_EQ(bridge->get_topics(), (std::vector<std::string>{"doc-1"}));
}

TEST_F(MeshBridgeTest, MalformedMessageReportsError) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge);

    bridge->handle_client_message(id, "not json");
    EXPECT_EQ(client->errors(), (std::vector<std::string>{"invalid_message"}));
}

TEST_F(MeshBridgeTest, SyncFansOutLocallyAndToSwarm) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");
    auto [id3, client3] = connect(*bridge, "carol");

    bridge->handle_client_message(id1, join("doc-1"));
    bridge->handle_client_message(id2, join("doc-1"));
    bridge->handle_client_message(id3, join("doc-2"));

    bridge->handle_client_message(id1, sync("doc-1"));

    auto received = client2->of_type(message_type::SYNC);
    ASSERT_EQ(received.size(), 1u);
    auto message = SyncMessage::from_json(received[0]);
    EXPECT_EQ(message->from, "alice-key");
    EXPECT_EQ(message->topic, "doc-1");

    EXPECT_TRUE(client1->of_type(message_type::SYNC).empty());
    EXPECT_TRUE(client3->of_type(message_type::SYNC).empty());

    auto broadcast = current_swarm().syncs();
    ASSERT_EQ(broadcast.size(), 1u);
    EXPECT_EQ(broadcast[0].from, "alice-key");
}

TEST_F(MeshBridgeTest, SyncForUnjoinedTopicDropped) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");
    bridge->handle_client_message(id2, join("doc-1"));

    bridge->handle_client_message(id1, sync("doc-1"));

    EXPECT_TRUE(client2->of_type(message_type::SYNC).empty());
    EXPECT_TRUE(current_swarm().syncs().empty());
}

TEST_F(MeshBridgeTest, SwarmEventsReachTopicMembers) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");
    bridge->handle_client_message(id1, join("doc-1"));
    client1->clear();

    SyncMessage remote_sync;
    remote_sync.topic = "doc-1";
    remote_sync.data_json = "[1,2,3]";
    remote_sync.from = "remote-key";

    current_swarm().emit([&](SwarmObserver& observer) {
        observer.on_peer_joined("doc-1", RemotePeer{"remote-key", "Remote", ""});
        observer.on_sync("remote-key", remote_sync);
        observer.on_peer_left("doc-1", "remote-key");
    });

    EXPECT_EQ(client1->of_type(message_type::PEER_JOINED).size(), 1u);
    EXPECT_EQ(client1->of_type(message_type::SYNC).size(), 1u);
    EXPECT_EQ(client1->of_type(message_type::PEER_LEFT).size(), 1u);
    EXPECT_TRUE(client2->messages().empty());
}

TEST_F(MeshBridgeTest, DirectMessagesReachEveryClient) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge);
    auto [id2, client2] = connect(*bridge);

    ChunkRequest request;
    request.file_id = "file-1";
    request.chunk_index = 0;
    request.request_id = "req-1";
    const std::string raw = request.to_json();

    current_swarm().emit([&](SwarmObserver& observer) {
        observer.on_direct_message("remote-key", UnrecognizedMessage{message_type::CHUNK_REQUEST, raw});
    });

    for (const auto& client : {client1, client2}) {
        auto received = client->of_type(message_type::CHUNK_REQUEST);
        ASSERT_EQ(received.size(), 1u);
        auto parsed = ChunkRequest::from_json(received[0]);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed->request_id, "req-1");
        EXPECT_NE(received[0].find("remote-key"), std::string::npos);
    }
}

TEST_F(MeshBridgeTest, SendRoutesToLocalOrSwarmPeer) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");
    current_swarm().reachable_peers.insert("remote-key");

    const std::string payload = "{\"type\":\"chunk-request\",\"fileId\":\"f\",\"chunkIndex\":0,\"requestId\":\"r\"}";

    bridge->handle_client_message(id1, SendMessage{"bob-key", payload}.to_json());
    EXPECT_EQ(client2->of_type(message_type::CHUNK_REQUEST).size(), 1u);

    bridge->handle_client_message(id1, SendMessage{"remote-key", payload}.to_json());
    ASSERT_EQ(current_swarm().direct_messages().size(), 1u);
    EXPECT_EQ(current_swarm().direct_messages()[0].first, "remote-key");

    bridge->handle_client_message(id1, SendMessage{"nobody", payload}.to_json());
    EXPECT_EQ(client1->errors(), (std::vector<std::string>{"peer_unreachable"}));
}

TEST_F(MeshBridgeTest, DisconnectCleansUpTopics) {
    auto bridge = make_bridge();
    auto [id1, client1] = connect(*bridge, "alice");
    auto [id2, client2] = connect(*bridge, "bob");

    bridge->handle_client_message(id1, join("doc-1"));
    bridge->handle_client_message(id1, join("doc-2"));
    bridge->handle_client_message(id2, join("doc-2"));

    bridge->remove_client(id1);

    EXPECT_EQ(bridge->client_count(), 1u);
    EXPECT_EQ(current_swarm().leave_calls("doc-1"), 1u);
    EXPECT_EQ(current_swarm().leave_calls("doc-2"), 0u);
    EXPECT_EQ(client2->of_type(message_type::PEER_LEFT).size(), 1u);
    EXPECT_EQ(bridge->get_topics(), (std::vector<std::string>{"doc-2"}));

    // Messages from a removed client are ignored
    bridge->handle_client_message(id1, join("doc-3"));
    EXPECT_EQ(current_swarm().join_calls("doc-3"), 0u);
}

TEST_F(MeshBridgeTest, ShutdownClosesClients) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge);

    bridge->shutdown();

    EXPECT_TRUE(client->is_closed());
    EXPECT_EQ(client->close_reason(), close_reason::SHUTDOWN);
    EXPECT_EQ(bridge->client_count(), 0u);
    EXPECT_FALSE(bridge->is_initialized());
    EXPECT_EQ(current_swarm().stop_calls(), 1u);
}

TEST_F(MeshBridgeTest, SuspendAndResumeRejoinTopics) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge, "alice");
    bridge->handle_client_message(id, join("doc-1"));
    bridge->handle_client_message(id, join("doc-2"));

    auto first = swarms_.back();
    ASSERT_TRUE(bridge->suspend());
    EXPECT_TRUE(bridge->is_suspended());
    EXPECT_EQ(bridge->get_swarm(), nullptr);
    EXPECT_FALSE(first->is_running());
    EXPECT_EQ(first->observer_count(), 0u);
    EXPECT_FALSE(bridge->suspend());

    ASSERT_TRUE(bridge->resume());
    ASSERT_EQ(swarms_.size(), 2u);
    auto& second = current_swarm();
    EXPECT_TRUE(second.is_running());
    EXPECT_EQ(second.join_calls("doc-1"), 1u);
    EXPECT_EQ(second.join_calls("doc-2"), 1u);
    EXPECT_EQ(second.get_local_peer_id(), first->get_local_peer_id());
    EXPECT_FALSE(bridge->is_suspended());
    EXPECT_FALSE(bridge->resume());

    // The client survived the cycle
    EXPECT_EQ(bridge->client_count(), 1u);
    EXPECT_FALSE(client->is_closed());
}

TEST_F(MeshBridgeTest, SuspendRequiresInitialization) {
    MeshBridge bridge(factory());
    EXPECT_FALSE(bridge.suspend());
    EXPECT_FALSE(bridge.resume());
}

TEST_F(MeshBridgeTest, FailedResumeKeepsSavedState) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge, "alice");
    bridge->handle_client_message(id, join("doc-1"));
    ASSERT_TRUE(bridge->suspend());

    fail_next_start_ = true;
    EXPECT_FALSE(bridge->resume());
    EXPECT_TRUE(bridge->is_suspended());

    fail_next_start_ = false;
    fail_next_join_ = true;
    EXPECT_FALSE(bridge->resume());
    EXPECT_TRUE(bridge->is_suspended());
    EXPECT_FALSE(current_swarm().is_running());

    fail_next_join_ = false;
    ASSERT_TRUE(bridge->resume());
    EXPECT_EQ(current_swarm().join_calls("doc-1"), 1u);
    EXPECT_EQ(swarms_.size(), 4u);
}

TEST_F(MeshBridgeTest, TopicsJoinedWhileSuspendedRejoinOnResume) {
    auto bridge = make_bridge();
    auto [id, client] = connect(*bridge, "alice");
    ASSERT_TRUE(bridge->suspend());

    bridge->handle_client_message(id, join("doc-late"));
    EXPECT_EQ(bridge->get_topics(), (std::vector<std::string>{"doc-late"}));

    ASSERT_TRUE(bridge->resume());
    EXPECT_EQ(current_swarm().join_calls("doc-late"), 1u);
}
