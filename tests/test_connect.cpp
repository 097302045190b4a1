#include <gtest/gtest.h>
#include "net/candidate.hpp"
#include "session/connector.hpp"
#include "session/peer_connection.hpp"
#include "support/sim_network.hpp"
#include "support/test_util.hpp"

using namespace agora;
using namespace agora::session;
using agora::test::run_until_complete;

namespace {

using udp = boost::asio::ip::udp;
using ConnectResult = std::expected<std::shared_ptr<PeerConnection>, ErrorCode>;

// Carries advertisements between connectors through the wire codec
class LoopbackSignaler : public CandidateSignaler {
public:
    explicit LoopbackSignaler(asio::any_io_executor ex) : executor_(std::move(ex)) {}

    void attach(const PeerId& id, std::weak_ptr<Connector> connector) { connectors_[id] = std::move(connector); }

    void advertise(const PeerId& peer, const net::CandidateAdvertisement& advertisement) override {
        ++advertisements;
        auto it = connectors_.find(peer);
        if (it == connectors_.end()) return;

        auto encoded = advertisement.encode();
        ASSERT_TRUE(encoded.has_value());
        asio::post(executor_, [weak = it->second, data = std::move(*encoded)]() {
            auto decoded = net::CandidateAdvertisement::decode(data);
            if (auto connector = weak.lock(); connector && decoded) {
                connector->on_remote_candidates(*decoded);
            }
        });
    }

    size_t advertisements = 0;

private:
    asio::any_io_executor executor_;
    std::map<PeerId, std::weak_ptr<Connector>> connectors_;
};

struct Peer {
    std::shared_ptr<const PeerIdentity> identity;
    std::shared_ptr<Connector> connector;
    std::shared_ptr<PeerConnection> connection;
};

}  // namespace

class ConnectTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<sim::SimNetwork>(io_.get_executor());
        signaler_ = std::make_shared<LoopbackSignaler>(io_.get_executor());

        for (const char* address : {"198.51.100.1", "198.51.100.2"}) {
            auto ip = asio::ip::make_address(address);
            network_->add_host(ip, sim::NatBehavior::NONE);
            auto server = std::make_shared<sim::SimStunServer>(network_, udp::endpoint(ip, 3478));
            server->start();
            stun_servers_.push_back(server);
        }

        config_ = test::fast_config();
        config_.stun.servers = {"198.51.100.1:3478", "198.51.100.2:3478"};
    }

    void TearDown() override {
        for (auto* peer : {&a_, &b_}) {
            if (peer->connection) run_until_complete(io_, peer->connection->close());
            if (peer->connector) peer->connector->stop();
        }
        for (auto& server : stun_servers_) server->stop();
        if (turn_) turn_->stop();
        test::run_for(io_, std::chrono::milliseconds(50));
    }

    void add_turn_server() {
        auto ip = asio::ip::make_address("198.51.100.3");
        network_->add_host(ip, sim::NatBehavior::NONE);
        turn_ = std::make_shared<sim::SimTurnServer>(network_, udp::endpoint(ip, 3478), "agora", "s3cret");
        turn_->start();
        config_.turn.servers = {TurnServerConfig{"198.51.100.3", 3478, "agora", "s3cret"}};
    }

    Peer make_peer(const char* local, sim::NatBehavior nat, const char* public_address = nullptr) {
        auto local_ip = asio::ip::make_address(local);
        network_->add_host(local_ip, nat,
                           public_address ? asio::ip::make_address(public_address) : asio::ip::address());

        ConnectorEnvironment env;
        env.open_socket = [network = network_, local_ip](asio::any_io_executor, uint16_t port) {
            return network->open_socket(local_ip, port);
        };
        env.local_addresses = [local_ip]() { return std::vector<asio::ip::address>{local_ip}; };
        env.port_mapping = false;

        Peer peer;
        peer.identity = std::make_shared<const PeerIdentity>(PeerIdentity::generate());
        peer.connector = std::make_shared<Connector>(io_.get_executor(), peer.identity, config_, signaler_, env);
        signaler_->attach(peer.identity->peer_id(), peer.connector);
        return peer;
    }

    // Both sides dial each other, as the discovery layer would arrange
    void connect_both(ConnectOptions options = {}) {
        connect_both(options, options);
    }

    void connect_both(ConnectOptions a_options, ConnectOptions b_options) {
        std::optional<ConnectResult> ra, rb;
        asio::co_spawn(io_, a_.connector->connect(b_.identity->peer_id(), {}, a_options),
                       [&](std::exception_ptr, ConnectResult r) { ra = std::move(r); });
        asio::co_spawn(io_, b_.connector->connect(a_.identity->peer_id(), {}, b_options),
                       [&](std::exception_ptr, ConnectResult r) { rb = std::move(r); });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
        while ((!ra || !rb) && std::chrono::steady_clock::now() < deadline) {
            if (io_.stopped()) io_.restart();
            io_.run_one_for(std::chrono::milliseconds(50));
        }
        ASSERT_TRUE(ra && rb) << "connect did not finish";
        ASSERT_TRUE(ra->has_value()) << error_code_to_string(ra->error());
        ASSERT_TRUE(rb->has_value()) << error_code_to_string(rb->error());
        a_.connection = **ra;
        b_.connection = **rb;
    }

    std::expected<std::vector<uint8_t>, ErrorCode> receive(const std::shared_ptr<PeerConnection>& connection) {
        return run_until_complete(io_, connection->receive(), std::chrono::seconds(2));
    }

    // Runs the loop until pred holds or the deadline passes
    template<typename Pred>
    bool run_until(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred() && std::chrono::steady_clock::now() < deadline) {
            if (io_.stopped()) io_.restart();
            io_.run_one_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    asio::io_context io_;
    std::shared_ptr<sim::SimNetwork> network_;
    std::shared_ptr<LoopbackSignaler> signaler_;
    std::vector<std::shared_ptr<sim::SimStunServer>> stun_servers_;
    std::shared_ptr<sim::SimTurnServer> turn_;
    ConnectivityConfig config_;
    Peer a_;
    Peer b_;
};

TEST_F(ConnectTest, FullConePeersConnectDirectly) {
    add_turn_server();
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");
    a_.connector->start();

    connect_both();

    EXPECT_FALSE(a_.connection->used_relay());
    EXPECT_FALSE(b_.connection->used_relay());
    EXPECT_EQ(a_.connection->peer_id(), b_.identity->peer_id());
    EXPECT_EQ(b_.connection->peer_id(), a_.identity->peer_id());
    EXPECT_EQ(a_.connection->peer_fingerprint(), b_.identity->fingerprint());
    EXPECT_EQ(b_.connection->peer_fingerprint(), a_.identity->fingerprint());
    EXPECT_NE(a_.connection->role(), b_.connection->role());
    EXPECT_EQ(a_.connector->active_attempts(), 0u);
    EXPECT_TRUE(a_.connector->nat_assessment().has_value());

    // Allocations gathered as fallback are given back once a direct pair wins
    EXPECT_TRUE(run_until([&] { return turn_->active_allocations() == 0; }));
    EXPECT_GT(turn_->allocations_created(), 0u);
    EXPECT_EQ(turn_->relayed_packets(), 0u);

    auto pair = a_.connection->selected_pair();
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair->remote.address.address(), asio::ip::make_address("203.0.113.2"));

    ASSERT_TRUE(run_until_complete(io_, a_.connection->send(test::bytes("hello bob"))).has_value());
    auto at_b = receive(b_.connection);
    ASSERT_TRUE(at_b.has_value());
    EXPECT_EQ(*at_b, test::bytes("hello bob"));

    ASSERT_TRUE(run_until_complete(io_, b_.connection->send(test::bytes("hello alice"))).has_value());
    auto at_a = receive(a_.connection);
    ASSERT_TRUE(at_a.has_value());
    EXPECT_EQ(*at_a, test::bytes("hello alice"));
}

TEST_F(ConnectTest, KeyRotationOverLiveConnection) {
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");
    connect_both();

    auto epoch = a_.connection->rotate_keys();
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(*epoch, 2u);

    ASSERT_TRUE(run_until_complete(io_, a_.connection->send(test::bytes("after rotation"))).has_value());
    auto at_b = receive(b_.connection);
    ASSERT_TRUE(at_b.has_value());
    EXPECT_EQ(*at_b, test::bytes("after rotation"));
    EXPECT_EQ(b_.connection->current_epoch(), 2u);

    ASSERT_TRUE(run_until_complete(io_, b_.connection->send(test::bytes("ack"))).has_value());
    EXPECT_EQ(*receive(a_.connection), test::bytes("ack"));
}

TEST_F(ConnectTest, SymmetricToFirewallUsesRelay) {
    add_turn_server();
    a_ = make_peer("10.0.0.2", sim::NatBehavior::SYMMETRIC, "203.0.113.10");
    b_ = make_peer("192.0.2.20", sim::NatBehavior::FIREWALL);

    connect_both();

    EXPECT_TRUE(a_.connection->used_relay() || b_.connection->used_relay());
    EXPECT_GT(turn_->relayed_packets(), 0u);

    ASSERT_TRUE(run_until_complete(io_, a_.connection->send(test::bytes("through the relay"))).has_value());
    auto at_b = receive(b_.connection);
    ASSERT_TRUE(at_b.has_value());
    EXPECT_EQ(*at_b, test::bytes("through the relay"));
    EXPECT_EQ(a_.connection->peer_fingerprint(), b_.identity->fingerprint());
}

TEST_F(ConnectTest, ForcedRelay) {
    add_turn_server();
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");

    connect_both(ConnectOptions{true});

    EXPECT_TRUE(a_.connection->used_relay());
    EXPECT_TRUE(b_.connection->used_relay());
    EXPECT_NE(a_.connection->selected_pair()->path, net::DIRECT_PATH);
}

TEST_F(ConnectTest, RelayOnEitherEndCountsAsRelayed) {
    add_turn_server();
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");

    // Only a is restricted to its relay; b reaches it through a's relayed address
    connect_both(ConnectOptions{true}, ConnectOptions{});

    auto at_a = a_.connection->selected_pair();
    auto at_b = b_.connection->selected_pair();
    ASSERT_TRUE(at_a.has_value());
    ASSERT_TRUE(at_b.has_value());
    EXPECT_EQ(at_a->local.kind, net::CandidateKind::RELAYED);
    EXPECT_EQ(at_b->remote.kind, net::CandidateKind::RELAYED);
    EXPECT_TRUE(a_.connection->used_relay());
    EXPECT_TRUE(b_.connection->used_relay());

    ASSERT_TRUE(run_until_complete(io_, b_.connection->send(test::bytes("via a's relay"))).has_value());
    auto at_a_data = receive(a_.connection);
    ASSERT_TRUE(at_a_data.has_value());
    EXPECT_EQ(*at_a_data, test::bytes("via a's relay"));
}

TEST_F(ConnectTest, RejectedFramesCloseChannelAndReleaseRelay) {
    add_turn_server();
    config_.session.max_consecutive_rejections = 4;
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");

    connect_both(ConnectOptions{true});
    ASSERT_TRUE(a_.connection->used_relay());
    const auto allocations = turn_->active_allocations();
    ASSERT_GT(allocations, 0u);

    // Flip the last tag byte of every raw secure frame on its way to a
    network_->set_rewriter([](const udp::endpoint&, const udp::endpoint&, std::vector<uint8_t>& data) {
        if (!data.empty() && data.front() == static_cast<uint8_t>(DatagramType::SECURE_FRAME)) {
            data.back() ^= 0x01;
        }
    });
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(run_until_complete(io_, b_.connection->send(test::bytes("tampered"))).has_value());
    }

    ASSERT_TRUE(run_until([&] { return !a_.connection->is_open(); }));
    EXPECT_TRUE(run_until([&] { return turn_->active_allocations() < allocations; }));
    EXPECT_TRUE(b_.connection->is_open());

    auto sent = run_until_complete(io_, a_.connection->send(test::bytes("after close")));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error(), ErrorCode::CHANNEL_CLOSED);

    // Dropping the other side without close() gives its relay back too
    b_.connection.reset();
    EXPECT_TRUE(run_until([&] { return turn_->active_allocations() == 0; }));
}

TEST_F(ConnectTest, InterfaceChangeRefreshesNatAssessment) {
    config_.ice.interface_poll_interval = std::chrono::seconds(1);
    const auto home = asio::ip::make_address("192.168.1.2");
    const auto mobile = asio::ip::make_address("10.9.0.2");
    network_->add_host(home, sim::NatBehavior::FULL_CONE, asio::ip::make_address("203.0.113.1"));
    network_->add_host(mobile, sim::NatBehavior::SYMMETRIC, asio::ip::make_address("203.0.113.99"));

    auto current = std::make_shared<asio::ip::address>(home);
    ConnectorEnvironment env;
    env.open_socket = [network = network_, current](asio::any_io_executor, uint16_t port) {
        return network->open_socket(*current, port);
    };
    env.local_addresses = [current]() { return std::vector<asio::ip::address>{*current}; };
    env.port_mapping = false;

    a_.identity = std::make_shared<const PeerIdentity>(PeerIdentity::generate());
    a_.connector = std::make_shared<Connector>(io_.get_executor(), a_.identity, config_, signaler_, env);
    a_.connector->start();
    test::run_for(io_, std::chrono::milliseconds(1200));
    EXPECT_FALSE(a_.connector->nat_assessment().has_value());

    *current = mobile;
    ASSERT_TRUE(run_until([&] { return a_.connector->nat_assessment().has_value(); }));
    EXPECT_EQ(a_.connector->nat_assessment()->type, net::NatType::SYMMETRIC);
    EXPECT_FALSE(a_.connector->nat_assessment()->can_hole_punch);

    *current = home;
    ASSERT_TRUE(run_until([&] {
        auto assessment = a_.connector->nat_assessment();
        return assessment && assessment->type == net::NatType::FULL_CONE;
    }));
    EXPECT_EQ(a_.connector->nat_assessment()->public_address->address(), asio::ip::make_address("203.0.113.1"));
}

TEST_F(ConnectTest, ConnectToSelfIsRejected) {
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");

    auto self = run_until_complete(io_, a_.connector->connect(a_.identity->peer_id(), {}));
    ASSERT_FALSE(self.has_value());
    EXPECT_EQ(self.error(), ErrorCode::INVALID_ARGUMENT);

    auto empty = run_until_complete(io_, a_.connector->connect("", {}));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConnectTest, CancelAbortsAttempt) {
    add_turn_server();
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    const PeerId absent = "12D3KooWbzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz";

    std::optional<ConnectResult> result;
    asio::co_spawn(io_, a_.connector->connect(absent, {}),
                   [&](std::exception_ptr, ConnectResult r) { result = std::move(r); });
    test::run_for(io_, std::chrono::milliseconds(100));
    EXPECT_EQ(a_.connector->active_attempts(), 1u);

    // A second attempt to the same peer is refused while one runs
    auto duplicate = run_until_complete(io_, a_.connector->connect(absent, {}));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error(), ErrorCode::INVALID_ARGUMENT);

    a_.connector->cancel(absent);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!result && std::chrono::steady_clock::now() < deadline) {
        io_.run_one_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error(), ErrorCode::CANCELLED);
    EXPECT_EQ(a_.connector->active_attempts(), 0u);
    EXPECT_GT(turn_->allocations_created(), 0u);
    EXPECT_TRUE(run_until([&] { return turn_->active_allocations() == 0; }));
}

TEST_F(ConnectTest, UnreachablePeer) {
    config_.ice.connect_timeout = std::chrono::milliseconds(1500);
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");

    net::Candidate nowhere;
    nowhere.address = udp::endpoint(asio::ip::make_address("192.0.2.99"), 40000);
    nowhere.base = nowhere.address;
    nowhere.priority = net::candidate_priority(net::CandidateKind::HOST, ice::LOCAL_PREF_MAX);

    auto result = run_until_complete(io_, a_.connector->connect("12D3KooWbzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz",
                                                                {nowhere}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TRANSPORT_UNREACHABLE);
    EXPECT_EQ(a_.connector->active_attempts(), 0u);
    EXPECT_GT(signaler_->advertisements, 0u);
}

TEST_F(ConnectTest, TrickledCandidatesAreKeptForLaterConnect) {
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");

    // b dials first; a only learns b's candidates through the signaler
    std::optional<ConnectResult> rb;
    asio::co_spawn(io_, b_.connector->connect(a_.identity->peer_id(), {}),
                   [&](std::exception_ptr, ConnectResult r) { rb = std::move(r); });
    test::run_for(io_, std::chrono::milliseconds(200));
    EXPECT_EQ(a_.connector->active_attempts(), 0u);

    auto ra = run_until_complete(io_, a_.connector->connect(b_.identity->peer_id(), {}),
                                 std::chrono::seconds(10));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!rb && std::chrono::steady_clock::now() < deadline) {
        io_.run_one_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(ra.has_value()) << error_code_to_string(ra.error());
    ASSERT_TRUE(rb && rb->has_value());
    a_.connection = *ra;
    b_.connection = **rb;
    EXPECT_EQ(a_.connection->peer_id(), b_.identity->peer_id());
}

TEST_F(ConnectTest, ClosedConnectionRefusesTraffic) {
    a_ = make_peer("192.168.1.2", sim::NatBehavior::FULL_CONE, "203.0.113.1");
    b_ = make_peer("192.168.2.2", sim::NatBehavior::FULL_CONE, "203.0.113.2");
    connect_both();

    run_until_complete(io_, a_.connection->close());
    EXPECT_FALSE(a_.connection->is_open());

    auto sent = run_until_complete(io_, a_.connection->send(test::bytes("late")));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error(), ErrorCode::CHANNEL_CLOSED);

    auto received = run_until_complete(io_, a_.connection->receive());
    ASSERT_FALSE(received.has_value());
    EXPECT_EQ(received.error(), ErrorCode::CHANNEL_CLOSED);
    EXPECT_FALSE(a_.connection->rotate_keys().has_value());
}
