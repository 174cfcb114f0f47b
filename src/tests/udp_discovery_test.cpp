#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "core/types.hpp"
#include "discovery/udp_discovery.hpp"
#include "network/wire.hpp"
#include "test_utils.hpp"

using namespace pasteall;
using namespace pasteall::discovery;
using boost::asio::ip::udp;

class UdpDiscoveryTest : public ::testing::Test {
protected:
  core::DeviceInfo local;
  std::unique_ptr<UdpDiscovery> discovery;
  std::mutex mutex;
  std::vector<core::DeviceInfo> reported;

  void SetUp() override {
    test::init_logging();
    local = core::DeviceInfo::create("local", core::DeviceType::Desktop, "bG9jYWw=");

    UdpDiscoveryOptions options;
    options.listen_address = "127.0.0.1";
    options.listen_port = 0;
    options.broadcast_address = "127.0.0.1";
    options.broadcast_port = 47999;
    options.interval = std::chrono::milliseconds(200);
    discovery = std::make_unique<UdpDiscovery>(local, options);

    ASSERT_TRUE(discovery->start([this](const core::DeviceInfo& device) {
      std::lock_guard<std::mutex> lock(mutex);
      reported.push_back(device);
    }));
    ASSERT_NE(discovery->bound_port(), 0);
  }

  void TearDown() override {
    discovery->stop();
  }

  void send_datagram(const std::string& data) {
    boost::asio::io_context io;
    udp::socket socket(io, udp::endpoint(udp::v4(), 0));
    socket.send_to(boost::asio::buffer(data),
                   udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), discovery->bound_port()));
  }

  std::size_t reported_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return reported.size();
  }

  static network::DiscoveryPacket packet_for(const std::string& id) {
    network::DiscoveryPacket packet;
    packet.device_id = id;
    packet.device_name = "peer-" + id;
    packet.public_key = "cGVlcg==";
    packet.timestamp = core::unix_timestamp();
    packet.device_type = core::DeviceType::Mobile;
    packet.port = 45680;
    packet.transfer_port = 45681;
    return packet;
  }
};

TEST_F(UdpDiscoveryTest, AnnouncementFromPeerIsReported) {
  send_datagram(network::serialize(packet_for("peer-1")));

  ASSERT_TRUE(test::wait_until([this] { return reported_count() == 1; }));
  auto device = discovery->get_device("peer-1");
  ASSERT_TRUE(device);
  EXPECT_EQ(device->name, "peer-peer-1");
  EXPECT_EQ(device->device_type, core::DeviceType::Mobile);
  EXPECT_EQ(device->ip_address.value_or(""), "127.0.0.1");
  EXPECT_EQ(device->pairing_port, 45680);
  EXPECT_TRUE(device->online);
  EXPECT_EQ(device->pairing_status, core::PairingStatus::Unpaired);
}

TEST_F(UdpDiscoveryTest, AdvertisedAddressWins) {
  auto packet = packet_for("peer-2");
  packet.ip_address = "10.1.2.3";
  send_datagram(network::serialize(packet));

  ASSERT_TRUE(test::wait_until([this] { return reported_count() == 1; }));
  EXPECT_EQ(discovery->get_device("peer-2")->ip_address.value_or(""), "10.1.2.3");
}

TEST_F(UdpDiscoveryTest, OwnAndMalformedPacketsAreIgnored) {
  send_datagram(network::serialize(packet_for(local.id)));
  send_datagram("definitely not json");
  send_datagram(R"({"type":"discovery","device_id":"x"})");
  // Marker sent last, the socket delivers in order on loopback
  send_datagram(network::serialize(packet_for("marker")));

  ASSERT_TRUE(test::wait_until([this] { return reported_count() >= 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(reported_count(), 1u);
  EXPECT_FALSE(discovery->get_device(local.id));
  EXPECT_EQ(discovery->get_devices().size(), 1u);
}

TEST_F(UdpDiscoveryTest, RepeatedAnnouncementsKeepPairingStatus) {
  send_datagram(network::serialize(packet_for("peer-3")));
  ASSERT_TRUE(test::wait_until([this] { return reported_count() == 1; }));
  ASSERT_TRUE(discovery->set_pairing_status("peer-3", core::PairingStatus::Paired, true));

  auto packet = packet_for("peer-3");
  packet.device_name = "renamed";
  send_datagram(network::serialize(packet));
  ASSERT_TRUE(test::wait_until([this] { return reported_count() == 2; }));

  auto device = discovery->get_device("peer-3");
  EXPECT_EQ(device->name, "renamed");
  EXPECT_EQ(device->pairing_status, core::PairingStatus::Paired);
  EXPECT_TRUE(device->trusted);
  EXPECT_EQ(discovery->get_devices().size(), 1u);
}

TEST_F(UdpDiscoveryTest, StartStopAreIdempotent) {
  EXPECT_TRUE(discovery->start(nullptr));
  EXPECT_TRUE(discovery->is_running());
  EXPECT_TRUE(discovery->announce_now());

  discovery->stop();
  discovery->stop();
  EXPECT_FALSE(discovery->is_running());
  EXPECT_FALSE(discovery->announce_now());
}
