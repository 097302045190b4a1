#include <gtest/gtest.h>
#include "common/binary_codec.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/retry.hpp"

#include <cstdio>
#include <fstream>

using namespace agora;
using namespace agora::wire;

// ============================================================================
// Binary codec
// ============================================================================

TEST(BinaryCodecTest, IntegersAreBigEndian) {
    BinaryWriter writer;
    writer.write_u16(0x0102);
    writer.write_u32(0x03040506);
    writer.write_u64(0x0708090A0B0C0D0EULL);

    std::vector<uint8_t> expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                     0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E};
    EXPECT_EQ(writer.data(), expected);

    BinaryReader reader(writer.data());
    EXPECT_EQ(*reader.read_u16(), 0x0102);
    EXPECT_EQ(*reader.read_u32(), 0x03040506u);
    EXPECT_EQ(*reader.read_u64(), 0x0708090A0B0C0D0EULL);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(BinaryCodecTest, StringsAndAddresses) {
    BinaryWriter writer;
    writer.write_string("12D3KooWexample");
    writer.write_address(boost::asio::ip::make_address("192.0.2.7"));
    writer.write_address(boost::asio::ip::make_address("2001:db8::1"));

    BinaryReader reader(writer.data());
    EXPECT_EQ(*reader.read_string(), "12D3KooWexample");
    EXPECT_EQ(*reader.read_address(), boost::asio::ip::make_address("192.0.2.7"));
    EXPECT_EQ(*reader.read_address(), boost::asio::ip::make_address("2001:db8::1"));
}

TEST(BinaryCodecTest, EndpointsAndPadding) {
    BinaryWriter writer;
    writer.write_u8(0xAA);
    writer.write_padding(4);
    EXPECT_EQ(writer.size(), 4u);
    writer.write_padding(4);
    EXPECT_EQ(writer.size(), 4u);
    writer.write_endpoint(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("198.51.100.9"), 3478));

    BinaryReader reader(writer.data());
    EXPECT_EQ(*reader.read_u8(), 0xAA);
    EXPECT_TRUE(reader.skip_padding(4));
    EXPECT_EQ(reader.position(), 4u);
    auto ep = reader.read_endpoint();
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->port(), 3478);
    EXPECT_EQ(ep->address().to_string(), "198.51.100.9");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(BinaryCodecTest, ShortInputFails) {
    std::vector<uint8_t> data = {0x00, 0x05, 'a', 'b'};
    BinaryReader reader(data);
    auto str = reader.read_string();
    EXPECT_FALSE(str.has_value());

    std::vector<uint8_t> bad_family = {9, 1, 2, 3, 4};
    BinaryReader reader2(bad_family);
    auto addr = reader2.read_address();
    ASSERT_FALSE(addr.has_value());
    EXPECT_EQ(addr.error(), ErrorCode::INVALID_MESSAGE);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggerTest, PlainConsoleSinkAndModuleLevels) {
    auto& manager = LogManager::instance();

    LogConfig config;
    config.global_level = LogLevel::WARN;
    config.console_color = false;
    config.module_levels["net"] = LogLevel::DEBUG;
    manager.init(config);

    EXPECT_EQ(manager.resolve_module_level("net.ice"), LogLevel::DEBUG);
    EXPECT_EQ(manager.resolve_module_level("session.keys"), LogLevel::WARN);
    Logger::get("net.ice").debug("plain console sink {}", 1);

    LogConfig restore;
    restore.global_level = LogLevel::WARN;
    manager.init(restore);
    EXPECT_EQ(manager.resolve_module_level("net.ice"), LogLevel::WARN);
}

// ============================================================================
// Retry backoff
// ============================================================================

TEST(RetryTest, RetransmitDoublesWithoutJitter) {
    RetryState retry(RetryPolicy::retransmit(std::chrono::milliseconds(100), 3));

    ASSERT_TRUE(retry.should_retry());
    EXPECT_EQ(retry.next_delay(), std::chrono::milliseconds(100));
    EXPECT_EQ(retry.next_delay(), std::chrono::milliseconds(200));
    EXPECT_EQ(retry.next_delay(), std::chrono::milliseconds(400));
    EXPECT_FALSE(retry.should_retry());
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ConfigTest, DefaultsAreValid) {
    ConnectivityConfig config;
    EXPECT_FALSE(config.validate().has_value());
    EXPECT_FALSE(config.stun.servers.empty());
    EXPECT_TRUE(config.turn.servers.empty());
    EXPECT_EQ(config.session.rotation_interval, std::chrono::seconds(3600));
    EXPECT_EQ(config.session.overlap_window, std::chrono::seconds(30));
}

TEST(ConfigTest, ParseAllSections) {
    auto config = ConnectivityConfig::parse(R"({
        "log": {"level": "debug", "modules": {"net.ice": "trace"}},
        "stun": {"servers": ["192.0.2.1:3478"], "timeout_ms": 200, "retransmits": 3},
        "turn": {
            "servers": [{"host": "turn.example.org", "port": 5349, "username": "u", "password": "p"}],
            "lifetime": 300, "refresh_margin": 30
        },
        "upnp": {"enabled": false, "igd": false, "natpmp_gateway": "192.168.1.1"},
        "ice": {"bind_port": 40000, "max_in_flight": 2, "check_timeout_ms": 250},
        "handshake": {"timeout_ms": 4000, "retransmit_ms": 200},
        "session": {"rotation_interval": 600, "overlap_window": 10, "max_consecutive_rejections": 8}
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log.global_level, LogLevel::DEBUG);
    EXPECT_EQ(config->log.module_levels.at("net.ice"), LogLevel::TRACE);
    ASSERT_EQ(config->stun.servers.size(), 1u);
    EXPECT_EQ(config->stun.servers[0], "192.0.2.1:3478");
    EXPECT_EQ(config->stun.timeout, std::chrono::milliseconds(200));
    EXPECT_EQ(config->stun.retransmits, 3u);
    ASSERT_EQ(config->turn.servers.size(), 1u);
    EXPECT_EQ(config->turn.servers[0].host, "turn.example.org");
    EXPECT_EQ(config->turn.servers[0].port, 5349);
    EXPECT_EQ(config->turn.lifetime, std::chrono::seconds(300));
    EXPECT_FALSE(config->upnp.enabled);
    EXPECT_FALSE(config->upnp.igd);
    EXPECT_EQ(config->upnp.natpmp_gateway, "192.168.1.1");
    EXPECT_EQ(config->ice.bind_port, 40000);
    EXPECT_EQ(config->ice.max_in_flight, 2u);
    EXPECT_EQ(config->ice.check_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config->handshake.timeout, std::chrono::milliseconds(4000));
    EXPECT_EQ(config->session.rotation_interval, std::chrono::seconds(600));
    EXPECT_EQ(config->session.max_consecutive_rejections, 8u);
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto overlap = ConnectivityConfig::parse(R"({"session": {"rotation_interval": 10, "overlap_window": 10}})");
    ASSERT_FALSE(overlap.has_value());
    EXPECT_EQ(overlap.error(), ConfigError::INVALID_VALUE);

    auto in_flight = ConnectivityConfig::parse(R"({"ice": {"max_in_flight": 0}})");
    ASSERT_FALSE(in_flight.has_value());
    EXPECT_EQ(in_flight.error(), ConfigError::INVALID_VALUE);

    auto rejections = ConnectivityConfig::parse(R"({"session": {"max_consecutive_rejections": 0}})");
    ASSERT_FALSE(rejections.has_value());
    EXPECT_EQ(rejections.error(), ConfigError::INVALID_VALUE);

    auto tcp = ConnectivityConfig::parse(R"({"ice": {"tcp_connect_attempts": 0}})");
    ASSERT_FALSE(tcp.has_value());
    EXPECT_EQ(tcp.error(), ConfigError::INVALID_VALUE);

    auto tcp_off = ConnectivityConfig::parse(R"({"ice": {"tcp_candidates": false, "tcp_connect_attempts": 0}})");
    ASSERT_TRUE(tcp_off.has_value());
    EXPECT_FALSE(tcp_off->ice.tcp_candidates);

    auto turn = ConnectivityConfig::parse(R"({"turn": {"servers": [{"username": "x"}]}})");
    ASSERT_FALSE(turn.has_value());
    EXPECT_EQ(turn.error(), ConfigError::INVALID_VALUE);
}

TEST(ConfigTest, RejectsMalformedJson) {
    auto config = ConnectivityConfig::parse("{ not json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::PARSE_ERROR);
}

TEST(ConfigTest, LoadFromFile) {
    auto missing = ConnectivityConfig::load("/nonexistent/agora.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ConfigError::FILE_NOT_FOUND);

    std::string path = ::testing::TempDir() + "agora_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"ice": {"bind_port": 41000}})";
    }
    auto config = ConnectivityConfig::load(path);
    std::remove(path.c_str());

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->ice.bind_port, 41000);
}
