#include <gtest/gtest.h>
#include "net/candidate.hpp"
#include "net/ice_agent.hpp"
#include "net/ice_checklist.hpp"
#include "support/sim_network.hpp"
#include "support/test_util.hpp"

#include <algorithm>

using namespace agora;
using namespace agora::net;
using agora::test::run_until_complete;

namespace {

udp::endpoint ep(const char* addr, uint16_t port) {
    return udp::endpoint(asio::ip::make_address(addr), port);
}

Candidate make_candidate(CandidateKind kind, udp::endpoint address, uint32_t local_pref = ice::LOCAL_PREF_MAX,
                         udp::endpoint base = {}) {
    Candidate c;
    c.kind = kind;
    c.address = address;
    c.base = base == udp::endpoint{} ? address : base;
    c.priority = candidate_priority(kind, local_pref);
    return c;
}

}  // namespace

// ============================================================================
// Priorities
// ============================================================================

TEST(CandidatePriorityTest, TypePreferenceDominates) {
    EXPECT_EQ(candidate_priority(CandidateKind::HOST, 65535), 2130706431u);
    EXPECT_EQ(candidate_priority(CandidateKind::RELAYED, 0), 255u);
    EXPECT_GT(candidate_priority(CandidateKind::PEER_REFLEXIVE, 0),
              candidate_priority(CandidateKind::SERVER_REFLEXIVE, 65535));
    EXPECT_GT(candidate_priority(CandidateKind::SERVER_REFLEXIVE, 0),
              candidate_priority(CandidateKind::RELAYED, 65535));
    EXPECT_EQ(local_preference(candidate_priority(CandidateKind::HOST, 1234)), 1234u);
}

TEST(CandidatePriorityTest, PairPriorityFormula) {
    EXPECT_EQ(pair_priority(10, 20), (uint64_t{10} << 32) + 40);
    EXPECT_EQ(pair_priority(20, 10), (uint64_t{10} << 32) + 40 + 1);
    EXPECT_GT(pair_priority(100, 100), pair_priority(1, 1000));
}

// ============================================================================
// Advertisement codec
// ============================================================================

TEST(CandidateAdvertisementTest, EncodeDecode) {
    CandidateAdvertisement adv;
    adv.peer_id = "12D3KooWexample";
    adv.candidates.push_back(make_candidate(CandidateKind::HOST, ep("192.168.1.5", 40000)));
    adv.candidates.push_back(make_candidate(CandidateKind::SERVER_REFLEXIVE, ep("203.0.113.9", 50123)));
    adv.candidates.push_back(make_candidate(CandidateKind::RELAYED, ep("2001:db8::7", 49152), 65000));

    auto encoded = adv.encode();
    ASSERT_TRUE(encoded.has_value());
    auto decoded = CandidateAdvertisement::decode(*encoded);
    ASSERT_TRUE(decoded.has_value());

    EXPECT_EQ(decoded->peer_id, adv.peer_id);
    ASSERT_EQ(decoded->candidates.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(decoded->candidates[i].kind, adv.candidates[i].kind);
        EXPECT_EQ(decoded->candidates[i].address, adv.candidates[i].address);
        EXPECT_EQ(decoded->candidates[i].priority, adv.candidates[i].priority);
    }
}

TEST(CandidateAdvertisementTest, TooManyCandidates) {
    CandidateAdvertisement adv;
    adv.peer_id = "peer";
    for (uint16_t i = 0; i < protocol::MAX_CANDIDATES + 1; ++i) {
        adv.candidates.push_back(make_candidate(CandidateKind::HOST, ep("10.0.0.1", 1000 + i)));
    }
    auto encoded = adv.encode();
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error(), ErrorCode::MESSAGE_TOO_LARGE);
}

TEST(CandidateAdvertisementTest, MalformedInput) {
    CandidateAdvertisement adv;
    adv.peer_id = "peer";
    adv.candidates.push_back(make_candidate(CandidateKind::HOST, ep("10.0.0.1", 1000)));
    auto encoded = *adv.encode();

    auto wrong_version = encoded;
    wrong_version[0] = 0x7F;
    auto v = CandidateAdvertisement::decode(wrong_version);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error(), ErrorCode::UNSUPPORTED_VERSION);

    auto trailing = encoded;
    trailing.push_back(0);
    auto t = CandidateAdvertisement::decode(trailing);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error(), ErrorCode::INVALID_MESSAGE);

    // version | u16 len | "peer" | u16 count | kind
    auto bad_kind = encoded;
    bad_kind[1 + 2 + 4 + 2] = 9;
    EXPECT_FALSE(CandidateAdvertisement::decode(bad_kind).has_value());

    std::vector<uint8_t> truncated(encoded.begin(), encoded.end() - 3);
    EXPECT_FALSE(CandidateAdvertisement::decode(truncated).has_value());

    CandidateAdvertisement anonymous;
    auto empty_id = CandidateAdvertisement::decode(*anonymous.encode());
    ASSERT_FALSE(empty_id.has_value());
    EXPECT_EQ(empty_id.error(), ErrorCode::INVALID_MESSAGE);
}

// ============================================================================
// CheckList
// ============================================================================

class CheckListTest : public ::testing::Test {
protected:
    Candidate local_host_ = make_candidate(CandidateKind::HOST, ep("192.168.1.10", 40000));
    Candidate remote_host_ = make_candidate(CandidateKind::HOST, ep("192.168.2.20", 40001));
    Candidate remote_srflx_ = make_candidate(CandidateKind::SERVER_REFLEXIVE, ep("203.0.113.20", 50001));
    Candidate remote_relay_ = make_candidate(CandidateKind::RELAYED, ep("198.51.100.3", 49999));
};

TEST_F(CheckListTest, PairsSortedByPriority) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_remote(remote_relay_);
    list.add_remote(remote_srflx_);
    auto created = list.add_local(local_host_, DIRECT_PATH);
    EXPECT_EQ(created.size(), 2u);
    EXPECT_EQ(list.add_remote(remote_host_).size(), 1u);

    const auto& pairs = list.pairs();
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].remote.kind, CandidateKind::HOST);
    EXPECT_EQ(pairs[1].remote.kind, CandidateKind::SERVER_REFLEXIVE);
    EXPECT_EQ(pairs[2].remote.kind, CandidateKind::RELAYED);
    EXPECT_EQ(pairs[0].priority, pair_priority(local_host_.priority, remote_host_.priority));

    // Same remote signalled twice makes no new pair
    EXPECT_TRUE(list.add_remote(remote_host_).empty());
    EXPECT_EQ(list.pairs().size(), 3u);
}

TEST_F(CheckListTest, RoleSwapsPairPriorityOperands) {
    CheckList controlled(IceRole::CONTROLLED, 4);
    controlled.add_local(local_host_, DIRECT_PATH);
    controlled.add_remote(remote_srflx_);
    EXPECT_EQ(controlled.pairs()[0].priority, pair_priority(remote_srflx_.priority, local_host_.priority));
}

TEST_F(CheckListTest, InFlightIsBounded) {
    CheckList list(IceRole::CONTROLLING, 2);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);
    list.add_remote(remote_srflx_);
    list.add_remote(remote_relay_);

    auto first = list.next_check();
    auto second = list.next_check();
    ASSERT_TRUE(first && second);
    EXPECT_FALSE(list.next_check().has_value());
    EXPECT_EQ(list.in_flight(), 2u);

    EXPECT_TRUE(list.on_failure(*first));
    auto third = list.next_check();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(list.find_pair(*third)->remote.kind, CandidateKind::RELAYED);
    EXPECT_EQ(list.find_pair(*third)->attempts, 1u);
}

TEST_F(CheckListTest, TriggeredChecksGoFirst) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);
    list.add_remote(remote_relay_);

    auto relay_pair = list.find_pair(DIRECT_PATH, remote_relay_.address);
    ASSERT_TRUE(relay_pair.has_value());
    EXPECT_TRUE(list.trigger(*relay_pair));
    EXPECT_EQ(list.next_check(), relay_pair);
}

TEST_F(CheckListTest, FailedPairCanBeRetriggered) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);

    auto id = *list.next_check();
    list.on_failure(id);
    EXPECT_TRUE(list.all_failed());

    EXPECT_TRUE(list.trigger(id));
    EXPECT_EQ(list.find_pair(id)->state, PairState::WAITING);
    EXPECT_EQ(list.next_check(), id);
    EXPECT_EQ(list.find_pair(id)->attempts, 2u);
}

TEST_F(CheckListTest, PromotesExactlyOnce) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);
    list.add_remote(remote_srflx_);

    auto a = *list.next_check();
    auto b = *list.next_check();
    EXPECT_TRUE(list.on_success(b, std::chrono::milliseconds(12)));
    EXPECT_TRUE(list.on_success(a, std::chrono::milliseconds(5)));
    EXPECT_EQ(list.best_succeeded(), a);

    EXPECT_TRUE(list.promote(a));
    EXPECT_FALSE(list.promote(b));
    EXPECT_EQ(list.selected(), a);
    EXPECT_EQ(list.selected_pair()->rtt, std::chrono::milliseconds(5));
    EXPECT_TRUE(list.selected_pair()->nominated);
    EXPECT_EQ(list.find_pair(b)->state, PairState::FAILED);

    // Nothing more is scheduled or paired
    EXPECT_FALSE(list.next_check().has_value());
    EXPECT_TRUE(list.add_remote(remote_relay_).empty());
    EXPECT_FALSE(list.trigger(b));
}

TEST_F(CheckListTest, NeverPromotesUncheckedOrFailedPair) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);

    auto id = *list.next_check();
    EXPECT_FALSE(list.promote(id));
    list.on_failure(id);
    EXPECT_FALSE(list.promote(id));
    EXPECT_FALSE(list.on_success(id, std::chrono::milliseconds(1)));
    EXPECT_FALSE(list.selected().has_value());
    EXPECT_TRUE(list.exhausted());
}

TEST_F(CheckListTest, ControlledNomination) {
    CheckList list(IceRole::CONTROLLED, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);
    list.add_remote(remote_srflx_);

    auto srflx_pair = *list.find_pair(DIRECT_PATH, remote_srflx_.address);
    EXPECT_FALSE(list.nominate(srflx_pair));
    EXPECT_TRUE(list.find_pair(srflx_pair)->nominated);
    EXPECT_EQ(list.next_check(), srflx_pair);

    list.on_success(srflx_pair, std::chrono::milliseconds(3));
    EXPECT_FALSE(list.selected().has_value());

    // Nominating a succeeded pair promotes it
    EXPECT_TRUE(list.nominate(srflx_pair));
    EXPECT_EQ(list.selected(), srflx_pair);
    EXPECT_TRUE(list.nominate(srflx_pair));
    EXPECT_FALSE(list.nominate(*list.find_pair(DIRECT_PATH, remote_host_.address)));
}

TEST_F(CheckListTest, ReflexiveLocalCollapsesOntoBase) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_remote(remote_host_);

    auto srflx = make_candidate(CandidateKind::SERVER_REFLEXIVE, ep("203.0.113.10", 50000),
                                ice::LOCAL_PREF_MAX, local_host_.address);
    EXPECT_TRUE(list.add_local(srflx, DIRECT_PATH).empty());
    ASSERT_EQ(list.pairs().size(), 1u);
    EXPECT_EQ(list.pairs()[0].local.address, local_host_.address);
}

TEST_F(CheckListTest, ReflexiveOnlyPathUsesItsBase) {
    CheckList list(IceRole::CONTROLLING, 4);
    auto srflx = make_candidate(CandidateKind::SERVER_REFLEXIVE, ep("203.0.113.10", 50000),
                                ice::LOCAL_PREF_MAX, local_host_.address);
    list.add_local(srflx, DIRECT_PATH);
    list.add_remote(remote_host_);

    ASSERT_EQ(list.pairs().size(), 1u);
    EXPECT_EQ(list.pairs()[0].local.kind, CandidateKind::HOST);
    EXPECT_EQ(list.pairs()[0].local.address, local_host_.address);
}

TEST_F(CheckListTest, ForceRelaySkipsDirectPath) {
    CheckList list(IceRole::CONTROLLING, 4, true);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_local(make_candidate(CandidateKind::RELAYED, ep("198.51.100.3", 49000)), 1);
    list.add_remote(remote_host_);

    ASSERT_EQ(list.pairs().size(), 1u);
    EXPECT_EQ(list.pairs()[0].path, 1u);
    EXPECT_EQ(list.pairs()[0].local.kind, CandidateKind::RELAYED);
}

TEST_F(CheckListTest, UnpairableCandidates) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);

    EXPECT_TRUE(list.add_remote(make_candidate(CandidateKind::HOST, ep("2001:db8::20", 40001))).empty());

    auto tcp = remote_host_;
    tcp.transport = TransportProtocol::TCP;
    EXPECT_TRUE(list.add_remote(tcp).empty());
    EXPECT_TRUE(list.pairs().empty());
    EXPECT_TRUE(list.exhausted());
    EXPECT_FALSE(list.all_failed());
}

TEST_F(CheckListTest, PeerReflexiveRemoteIsUpgradedBySignalling) {
    CheckList list(IceRole::CONTROLLED, 4);
    EXPECT_FALSE(list.add_peer_reflexive(remote_srflx_.address, 0, DIRECT_PATH).has_value());

    list.add_local(local_host_, DIRECT_PATH);
    auto priority = candidate_priority(CandidateKind::PEER_REFLEXIVE, 100);
    auto id = list.add_peer_reflexive(remote_srflx_.address, priority, DIRECT_PATH);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(list.find_pair(*id)->remote.kind, CandidateKind::PEER_REFLEXIVE);
    EXPECT_EQ(list.find_pair(*id)->remote.priority, priority);
    EXPECT_EQ(list.add_peer_reflexive(remote_srflx_.address, priority, DIRECT_PATH), id);

    EXPECT_TRUE(list.add_remote(remote_srflx_).empty());
    ASSERT_EQ(list.pairs().size(), 1u);
    EXPECT_EQ(list.find_pair(*id)->remote.kind, CandidateKind::SERVER_REFLEXIVE);
    EXPECT_EQ(list.find_pair(*id)->priority, pair_priority(remote_srflx_.priority, local_host_.priority));
}

TEST_F(CheckListTest, PairsKeyedByPath) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);
    list.add_local(make_candidate(CandidateKind::RELAYED, ep("198.51.100.3", 49000)), 1);
    list.add_remote(remote_srflx_);

    auto direct = list.find_pair(DIRECT_PATH, remote_srflx_.address);
    auto relayed = list.find_pair(1, remote_srflx_.address);
    ASSERT_TRUE(direct && relayed);
    EXPECT_NE(*direct, *relayed);
    EXPECT_EQ(list.pairs().front().id, *direct);
}

TEST_F(CheckListTest, StreamPathPairsOnlyWithItsPeer) {
    CheckList list(IceRole::CONTROLLING, 4);
    list.add_local(local_host_, DIRECT_PATH);

    auto tcp_remote = remote_host_;
    tcp_remote.transport = TransportProtocol::TCP;
    tcp_remote.priority = tcp_candidate_priority(CandidateKind::HOST, ice::LOCAL_PREF_MAX);
    auto other_tcp = tcp_remote;
    other_tcp.address = ep("192.168.2.21", 40002);
    list.add_remote(tcp_remote);
    list.add_remote(other_tcp);
    EXPECT_TRUE(list.pairs().empty());

    auto tcp_local = local_host_;
    tcp_local.transport = TransportProtocol::TCP;
    tcp_local.address = ep("192.168.1.10", 45000);
    tcp_local.base = tcp_local.address;
    tcp_local.priority = tcp_candidate_priority(CandidateKind::HOST, ice::LOCAL_PREF_MAX);

    auto created = list.add_stream(tcp_local, STREAM_PATH_BASE, tcp_remote.address);
    ASSERT_EQ(created.size(), 1u);
    const auto* stream_pair = list.find_pair(created[0]);
    ASSERT_NE(stream_pair, nullptr);
    EXPECT_EQ(stream_pair->path, STREAM_PATH_BASE);
    EXPECT_EQ(stream_pair->remote.address, tcp_remote.address);
    EXPECT_FALSE(list.find_pair(STREAM_PATH_BASE, other_tcp.address).has_value());

    // UDP remotes stay on the socket path
    list.add_remote(remote_srflx_);
    EXPECT_FALSE(list.find_pair(STREAM_PATH_BASE, remote_srflx_.address).has_value());
    auto direct = list.find_pair(DIRECT_PATH, remote_srflx_.address);
    ASSERT_TRUE(direct.has_value());
    EXPECT_GT(list.find_pair(*direct)->priority, list.find_pair(created[0])->priority);

    // An accepted stream from an unsignalled port learns its remote from the first check
    const auto accepted_peer = ep("192.168.2.20", 51234);
    EXPECT_TRUE(list.add_stream(tcp_local, STREAM_PATH_BASE + 1, accepted_peer).empty());
    auto prflx = list.add_peer_reflexive(accepted_peer, 0, STREAM_PATH_BASE + 1);
    ASSERT_TRUE(prflx.has_value());
    EXPECT_EQ(list.find_pair(*prflx)->remote.transport, TransportProtocol::TCP);
    EXPECT_EQ(list.find_pair(*prflx)->remote.kind, CandidateKind::PEER_REFLEXIVE);
}

TEST_F(CheckListTest, ForceRelaySkipsStreams) {
    CheckList list(IceRole::CONTROLLING, 4, true);
    auto tcp_remote = remote_host_;
    tcp_remote.transport = TransportProtocol::TCP;
    list.add_remote(tcp_remote);

    auto tcp_local = local_host_;
    tcp_local.transport = TransportProtocol::TCP;
    EXPECT_TRUE(list.add_stream(tcp_local, STREAM_PATH_BASE, tcp_remote.address).empty());
}

// ============================================================================
// IceAgent on the simulated network
// ============================================================================

class IceAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<sim::SimNetwork>(io_.get_executor());
        network_->add_host(address_a_, sim::NatBehavior::NONE);
        network_->add_host(address_b_, sim::NatBehavior::NONE);
        config_ = test::fast_config();
    }

    std::shared_ptr<IceAgent> make_agent(asio::ip::address local, IceRole role) {
        auto mux = std::make_shared<DatagramMux>(io_.get_executor(), network_->open(local, 0));
        return std::make_shared<IceAgent>(mux, config_, IceOptions{role, false},
                                          [local]() { return std::vector<asio::ip::address>{local}; });
    }

    // Each agent's local candidates trickle to the other
    void signal(const std::shared_ptr<IceAgent>& from, const std::shared_ptr<IceAgent>& to) {
        std::weak_ptr<IceAgent> weak = to;
        from->set_local_candidate_handler([weak](const std::vector<Candidate>& all) {
            if (auto agent = weak.lock()) agent->add_remote_candidates(all);
        });
    }

    using Result = std::expected<CandidatePair, ErrorCode>;

    std::pair<Result, Result> run_both(std::shared_ptr<IceAgent> a, std::shared_ptr<IceAgent> b) {
        std::optional<Result> ra, rb;
        asio::co_spawn(io_, a->run(), [&](std::exception_ptr, Result r) { ra = r; });
        asio::co_spawn(io_, b->run(), [&](std::exception_ptr, Result r) { rb = r; });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while ((!ra || !rb) && std::chrono::steady_clock::now() < deadline) {
            if (io_.stopped()) io_.restart();
            io_.run_one_for(std::chrono::milliseconds(50));
        }
        if (!ra || !rb) throw std::runtime_error("ICE agents did not finish");
        return {*ra, *rb};
    }

    void close(std::shared_ptr<IceAgent> agent) {
        run_until_complete(io_, agent->close());
    }

    asio::io_context io_;
    std::shared_ptr<sim::SimNetwork> network_;
    ConnectivityConfig config_;

    asio::ip::address address_a_ = asio::ip::make_address("192.0.2.10");
    asio::ip::address address_b_ = asio::ip::make_address("192.0.2.20");
};

TEST_F(IceAgentTest, HostCandidatesConnect) {
    auto a = make_agent(address_a_, IceRole::CONTROLLING);
    auto b = make_agent(address_b_, IceRole::CONTROLLED);
    signal(a, b);
    signal(b, a);

    auto [ra, rb] = run_both(a, b);
    ASSERT_TRUE(ra.has_value()) << error_code_to_string(ra.error());
    ASSERT_TRUE(rb.has_value()) << error_code_to_string(rb.error());

    EXPECT_EQ(ra->remote.address, b->mux()->local_endpoint());
    EXPECT_EQ(rb->remote.address, a->mux()->local_endpoint());
    EXPECT_EQ(ra->path, DIRECT_PATH);
    EXPECT_FALSE(a->used_relay());
    EXPECT_TRUE(a->gathering_done());

    // Datagrams now flow on the selected path
    ASSERT_TRUE(a->send(test::bytes("hello")));
    auto received = run_until_complete(io_, b->receive_until(std::chrono::steady_clock::now() +
                                                             std::chrono::seconds(1)));
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, test::bytes("hello"));

    close(a);
    close(b);
    EXPECT_FALSE(a->send(test::bytes("late")));
}

TEST_F(IceAgentTest, UnreachableRemoteFails) {
    auto a = make_agent(address_a_, IceRole::CONTROLLING);
    Candidate nowhere = make_candidate(CandidateKind::HOST, ep("192.0.2.99", 40000));
    a->add_remote_candidates({nowhere});

    auto started = std::chrono::steady_clock::now();
    auto result = run_until_complete(io_, a->run());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TRANSPORT_UNREACHABLE);
    EXPECT_LT(std::chrono::steady_clock::now() - started, config_.ice.connect_timeout);
    EXPECT_TRUE(a->checklist().all_failed());
    close(a);
}

TEST_F(IceAgentTest, NoRemoteCandidatesTimesOut) {
    config_.ice.connect_timeout = std::chrono::milliseconds(300);
    auto a = make_agent(address_a_, IceRole::CONTROLLING);

    auto result = run_until_complete(io_, a->run());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TRANSPORT_UNREACHABLE);
    close(a);
}

TEST_F(IceAgentTest, CancelStopsTheAttempt) {
    auto a = make_agent(address_a_, IceRole::CONTROLLING);
    auto canceller = [a]() -> asio::awaitable<void> {
        co_await test::sleep_for(std::chrono::milliseconds(100));
        a->cancel();
    };
    asio::co_spawn(io_, canceller(), asio::detached);

    auto result = run_until_complete(io_, a->run());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CANCELLED);
    close(a);

    // A cancelled agent does not restart
    auto again = run_until_complete(io_, a->run());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), ErrorCode::CANCELLED);
}

TEST_F(IceAgentTest, RoleNames) {
    EXPECT_EQ(ice_role_to_string(IceRole::CONTROLLING), "controlling");
    EXPECT_EQ(pair_state_to_string(PairState::SUCCEEDED), "succeeded");
    EXPECT_EQ(candidate_kind_to_string(CandidateKind::SERVER_REFLEXIVE), "srflx");
}

// ============================================================================
// TCP candidates over loopback
// ============================================================================

class TcpCandidateTest : public IceAgentTest {
protected:
    void SetUp() override {
        IceAgentTest::SetUp();
        config_.ice.tcp_candidates = true;
        config_.ice.tcp_connect_timeout = std::chrono::milliseconds(500);
    }

    std::shared_ptr<IceAgent> make_loopback_agent(IceRole role) {
        auto socket = UdpDatagramSocket::open(io_.get_executor(), 0);
        if (!socket) throw std::runtime_error("cannot open UDP socket");
        auto mux = std::make_shared<DatagramMux>(io_.get_executor(), *socket);
        return std::make_shared<IceAgent>(mux, config_, IceOptions{role, false}, []() {
            return std::vector<asio::ip::address>{asio::ip::make_address("127.0.0.1")};
        });
    }

    // Only TCP candidates reach the other side, so UDP never pairs
    void signal_tcp(const std::shared_ptr<IceAgent>& from, const std::shared_ptr<IceAgent>& to) {
        std::weak_ptr<IceAgent> weak = to;
        from->set_local_candidate_handler([weak](const std::vector<Candidate>& all) {
            std::vector<Candidate> tcp;
            for (const auto& c : all) {
                if (c.transport == TransportProtocol::TCP) tcp.push_back(c);
            }
            if (auto agent = weak.lock(); agent && !tcp.empty()) agent->add_remote_candidates(tcp);
        });
    }
};

TEST_F(TcpCandidateTest, StreamCarriesChecksAndDatagrams) {
    auto a = make_loopback_agent(IceRole::CONTROLLING);
    auto b = make_loopback_agent(IceRole::CONTROLLED);
    signal_tcp(a, b);
    signal_tcp(b, a);

    auto [ra, rb] = run_both(a, b);
    ASSERT_TRUE(ra.has_value()) << error_code_to_string(ra.error());
    ASSERT_TRUE(rb.has_value()) << error_code_to_string(rb.error());

    EXPECT_EQ(ra->local.transport, TransportProtocol::TCP);
    EXPECT_EQ(ra->remote.transport, TransportProtocol::TCP);
    EXPECT_TRUE(is_stream_path(ra->path));
    EXPECT_TRUE(is_stream_path(rb->path));
    EXPECT_FALSE(a->used_relay());

    auto advertised = std::count_if(a->local_candidates().begin(), a->local_candidates().end(),
                                    [](const Candidate& c) { return c.transport == TransportProtocol::TCP; });
    EXPECT_EQ(advertised, 1);

    ASSERT_TRUE(a->send(test::bytes("over tcp")));
    auto at_b = run_until_complete(io_, b->receive_until(std::chrono::steady_clock::now() +
                                                         std::chrono::seconds(2)));
    ASSERT_TRUE(at_b.has_value());
    EXPECT_EQ(*at_b, test::bytes("over tcp"));

    ASSERT_TRUE(b->send(test::bytes("and back")));
    auto at_a = run_until_complete(io_, a->receive_until(std::chrono::steady_clock::now() +
                                                         std::chrono::seconds(2)));
    ASSERT_TRUE(at_a.has_value());
    EXPECT_EQ(*at_a, test::bytes("and back"));

    close(a);
    close(b);
    EXPECT_FALSE(a->send(test::bytes("late")));
}

TEST_F(TcpCandidateTest, ClosedPortIsUnreachable) {
    config_.ice.connect_timeout = std::chrono::milliseconds(1500);
    config_.ice.tcp_connect_attempts = 1;
    auto a = make_loopback_agent(IceRole::CONTROLLING);

    // Bound, never listening
    asio::ip::tcp::socket idle(io_);
    idle.open(asio::ip::tcp::v4());
    idle.bind(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

    Candidate nowhere = make_candidate(CandidateKind::HOST,
                                       udp::endpoint(asio::ip::make_address("127.0.0.1"),
                                                     idle.local_endpoint().port()));
    nowhere.transport = TransportProtocol::TCP;
    a->add_remote_candidates({nowhere});

    auto result = run_until_complete(io_, a->run());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TRANSPORT_UNREACHABLE);
    EXPECT_TRUE(a->checklist().pairs().empty());
    close(a);
}
