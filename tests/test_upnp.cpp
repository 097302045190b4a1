#include <gtest/gtest.h>
#include "common/binary_codec.hpp"
#include "net/upnp_mapper.hpp"
#include "support/test_util.hpp"

using namespace agora;
using namespace agora::net;
using agora::test::run_until_complete;

namespace {

// NAT-PMP gateway on loopback (RFC 6886 sections 3.2 and 3.3)
class FakeNatPmpGateway : public std::enable_shared_from_this<FakeNatPmpGateway> {
public:
    explicit FakeNatPmpGateway(asio::io_context& io)
        : socket_(io, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    void start() {
        asio::co_spawn(socket_.get_executor(), [self = shared_from_this()]() { return self->serve(); },
                       asio::detached);
    }

    void stop() {
        boost::system::error_code ec;
        socket_.close(ec);
    }

    uint16_t port() const { return socket_.local_endpoint().port(); }

    uint16_t result_code = 0;
    uint32_t external_ip = asio::ip::make_address_v4("203.0.113.77").to_uint();
    uint16_t external_offset = 1000;

    size_t address_requests = 0;
    size_t map_requests = 0;
    std::optional<uint32_t> last_lifetime;

private:
    asio::awaitable<void> serve() {
        auto self = shared_from_this();
        std::array<uint8_t, 64> buffer{};
        udp::endpoint from;

        for (;;) {
            boost::system::error_code ec;
            auto n = co_await socket_.async_receive_from(asio::buffer(buffer), from,
                                                         asio::redirect_error(asio::use_awaitable, ec));
            if (ec) break;
            if (n < 2 || buffer[0] != 0) continue;

            wire::BinaryWriter w;
            if (buffer[1] == 0) {
                ++address_requests;
                w.write_u8(0);
                w.write_u8(128);
                w.write_u16(result_code);
                w.write_u32(42);  // seconds since epoch reset
                w.write_u32(external_ip);
            } else if (buffer[1] == 1 && n >= 12) {
                ++map_requests;
                wire::BinaryReader r(std::span<const uint8_t>(buffer.data(), n));
                r.skip(4);
                auto internal = *r.read_u16();
                r.skip(2);
                auto lifetime = *r.read_u32();
                last_lifetime = lifetime;

                w.write_u8(0);
                w.write_u8(129);
                w.write_u16(result_code);
                w.write_u32(42);
                w.write_u16(internal);
                w.write_u16(lifetime == 0 ? 0 : static_cast<uint16_t>(internal + external_offset));
                w.write_u32(lifetime);
            } else {
                continue;
            }
            socket_.send_to(asio::buffer(w.data()), from, 0, ec);
        }
    }

    udp::socket socket_;
};

}  // namespace

class UpnpMapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway_ = std::make_shared<FakeNatPmpGateway>(io_);
        gateway_->start();

        config_.enabled = true;
        config_.igd = false;
        config_.natpmp_gateway = "127.0.0.1";
        config_.natpmp_port = gateway_->port();
        config_.discovery_timeout = std::chrono::milliseconds(600);
        config_.lease = std::chrono::seconds(1200);
    }

    void TearDown() override {
        gateway_->stop();
        test::run_for(io_, std::chrono::milliseconds(10));
    }

    asio::io_context io_;
    std::shared_ptr<FakeNatPmpGateway> gateway_;
    UpnpConfig config_;
};

TEST_F(UpnpMapperTest, NatPmpMapping) {
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    auto mapping = run_until_complete(io_, mapper->try_map(40000));

    ASSERT_TRUE(mapping.has_value());
    EXPECT_EQ(mapping->protocol, MappingProtocol::NAT_PMP);
    EXPECT_EQ(mapping->external, udp::endpoint(asio::ip::make_address("203.0.113.77"), 41000));
    EXPECT_EQ(mapping->internal_port, 40000);
    EXPECT_EQ(mapping->lease, std::chrono::seconds(1200));
    EXPECT_EQ(mapping->gateway.port(), gateway_->port());
    EXPECT_EQ(gateway_->address_requests, 1u);
    EXPECT_EQ(gateway_->map_requests, 1u);
    EXPECT_EQ(gateway_->last_lifetime, 1200u);
}

TEST_F(UpnpMapperTest, ReleaseSendsZeroLifetime) {
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    auto mapping = run_until_complete(io_, mapper->try_map(40001));
    ASSERT_TRUE(mapping.has_value());

    run_until_complete(io_, mapper->release(*mapping));
    EXPECT_EQ(gateway_->map_requests, 2u);
    EXPECT_EQ(gateway_->last_lifetime, 0u);
}

TEST_F(UpnpMapperTest, GatewayErrorMeansNoMapping) {
    gateway_->result_code = 3;  // network failure
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    auto mapping = run_until_complete(io_, mapper->try_map(40002));

    EXPECT_FALSE(mapping.has_value());
    EXPECT_EQ(gateway_->map_requests, 0u);
}

TEST_F(UpnpMapperTest, ZeroExternalAddressMeansNoMapping) {
    gateway_->external_ip = 0;
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    EXPECT_FALSE(run_until_complete(io_, mapper->try_map(40003)).has_value());
}

TEST_F(UpnpMapperTest, SilentGatewayTimesOut) {
    gateway_->stop();
    config_.discovery_timeout = std::chrono::milliseconds(300);
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);

    auto started = std::chrono::steady_clock::now();
    auto mapping = run_until_complete(io_, mapper->try_map(40004));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(mapping.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(UpnpMapperTest, DisabledMapperDoesNothing) {
    config_.enabled = false;
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    EXPECT_FALSE(run_until_complete(io_, mapper->try_map(40005)).has_value());
    EXPECT_EQ(gateway_->address_requests, 0u);
}

TEST_F(UpnpMapperTest, InvalidGatewayAddress) {
    config_.natpmp_gateway = "not-an-address";
    auto mapper = std::make_shared<UpnpMapper>(io_.get_executor(), config_);
    EXPECT_FALSE(run_until_complete(io_, mapper->try_natpmp(40006)).has_value());
}

TEST(UpnpRouteTableTest, ParseDefaultGateway) {
    const char* table =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n"
        "eth0\t00000000\t0101A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n";

    auto gateway = UpnpMapper::parse_default_gateway(table);
    ASSERT_TRUE(gateway.has_value());
    EXPECT_EQ(*gateway, asio::ip::make_address_v4("192.168.1.1"));
}

TEST(UpnpRouteTableTest, NoDefaultRoute) {
    const char* table =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n";

    EXPECT_FALSE(UpnpMapper::parse_default_gateway(table).has_value());
    EXPECT_FALSE(UpnpMapper::parse_default_gateway("").has_value());
}

TEST(UpnpMapperNamesTest, ProtocolNames) {
    EXPECT_EQ(mapping_protocol_to_string(MappingProtocol::UPNP_IGD), "upnp-igd");
    EXPECT_EQ(mapping_protocol_to_string(MappingProtocol::NAT_PMP), "nat-pmp");
}
