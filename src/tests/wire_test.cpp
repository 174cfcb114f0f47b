#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/error.hpp"
#include "network/framing.hpp"
#include "network/wire.hpp"
#include "test_utils.hpp"

using namespace pasteall;
using namespace pasteall::network;

class WireTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_logging();
  }

  static core::DeviceInfo make_device() {
    core::DeviceInfo device;
    device.id = "device-1";
    device.name = "Laptop";
    device.device_type = core::DeviceType::Desktop;
    device.public_key = "cHVibGljLWtleQ==";
    device.signing_public_key = "c2lnbmluZw==";
    device.app_version = "1.2.3";
    device.transfer_port = 45681;
    device.set_online(true);
    return device;
  }
};

TEST_F(WireTest, LengthPrefixIsBigEndian) {
  const auto prefix = encode_length(0x01020304);
  EXPECT_EQ(prefix[0], 0x01);
  EXPECT_EQ(prefix[1], 0x02);
  EXPECT_EQ(prefix[2], 0x03);
  EXPECT_EQ(prefix[3], 0x04);
  EXPECT_EQ(decode_length(prefix), 0x01020304u);
}

TEST_F(WireTest, FrameCarriesPrefixAndBody) {
  const auto frame = encode_frame("{}");
  ASSERT_EQ(frame.size(), LENGTH_PREFIX_SIZE + 2);
  EXPECT_EQ(frame[3], 2);
  EXPECT_EQ(frame[4], '{');
}

TEST_F(WireTest, FrameLengthLimits) {
  EXPECT_THROW(check_frame_length(0, MAX_FRAME_SIZE), core::NetworkError);
  EXPECT_THROW(check_frame_length(65 * 1024, 64 * 1024), core::NetworkError);
  EXPECT_NO_THROW(check_frame_length(64 * 1024, 64 * 1024));
  EXPECT_THROW(encode_frame(std::string(100, 'x'), 99), core::NetworkError);
}

TEST_F(WireTest, DiscoveryPacketFieldNames) {
  const auto packet = DiscoveryPacket::from_device(make_device(), 45680);
  const auto j = nlohmann::json::parse(serialize(packet));

  EXPECT_EQ(j.at("type"), "discovery");
  EXPECT_EQ(j.at("device_id"), "device-1");
  EXPECT_EQ(j.at("device_name"), "Laptop");
  EXPECT_EQ(j.at("device_type"), "Desktop");
  EXPECT_EQ(j.at("port"), 45680);
  EXPECT_EQ(j.at("protocol_version"), "1.0");
  EXPECT_TRUE(j.contains("capabilities"));
  EXPECT_TRUE(j.contains("timestamp"));
  EXPECT_FALSE(j.contains("ip_address"));
}

TEST_F(WireTest, DiscoveryPacketToDevice) {
  const auto parsed = parse_discovery_packet(serialize(DiscoveryPacket::from_device(make_device(), 45680)));
  const auto device = parsed.to_device_info();

  EXPECT_EQ(device.id, "device-1");
  EXPECT_EQ(device.pairing_port, 45680);
  EXPECT_EQ(device.transfer_port, 45681);
  EXPECT_EQ(device.signing_public_key, "c2lnbmluZw==");
  EXPECT_EQ(device.app_version, "1.2.3");
  EXPECT_TRUE(device.online);
  EXPECT_EQ(device.pairing_status, core::PairingStatus::Unpaired);
}

TEST_F(WireTest, MalformedDiscoveryPacketsAreRejected) {
  EXPECT_THROW(parse_discovery_packet("not json"), core::SerializationError);
  EXPECT_THROW(parse_discovery_packet("[1,2,3]"), core::SerializationError);
  EXPECT_THROW(parse_discovery_packet(R"({"type":"discovery"})"), core::SerializationError);

  auto j = nlohmann::json::parse(serialize(DiscoveryPacket::from_device(make_device(), 1)));
  j["type"] = "pairing_request";
  EXPECT_THROW(parse_discovery_packet(j.dump()), core::SerializationError);

  j["type"] = "discovery";
  j["port"] = "not a number";
  EXPECT_THROW(parse_discovery_packet(j.dump()), core::SerializationError);
}

TEST_F(WireTest, MinimalPairingRequestParses) {
  const auto request = parse_auth_request(
    R"({"type":"pairing_request","device_id":"abc","nonce":"bm9uY2U=","signature":"c2ln"})");
  EXPECT_EQ(request.device_id, "abc");
  EXPECT_EQ(request.signed_payload(), "type=pairing_request\ndevice_id=abc\nnonce=bm9uY2U=\n");
  EXPECT_FALSE(request.public_key);
  EXPECT_FALSE(request.sealed_pin);
}

TEST_F(WireTest, SignedPayloadCoversKeysPinAndPorts) {
  AuthRequestPacket request;
  request.device_id = "abc";
  request.nonce = "bm9uY2U=";
  const auto bare = request.signed_payload();

  auto with_key = request;
  with_key.public_key = "a2V5";
  EXPECT_NE(with_key.signed_payload(), bare);

  auto swapped_key = with_key;
  swapped_key.public_key = "b3RoZXI=";
  EXPECT_NE(swapped_key.signed_payload(), with_key.signed_payload());

  auto with_pin = with_key;
  with_pin.sealed_pin = "cGlu";
  EXPECT_NE(with_pin.signed_payload(), with_key.signed_payload());

  auto with_ports = with_pin;
  with_ports.port = 45680;
  EXPECT_NE(with_ports.signed_payload(), with_pin.signed_payload());
  with_ports.transfer_port = 45681;
  auto other_port = with_ports;
  other_port.transfer_port = 45682;
  EXPECT_NE(other_port.signed_payload(), with_ports.signed_payload());

  auto with_signing_key = with_ports;
  with_signing_key.signing_public_key = "c2lnbmluZw==";
  EXPECT_NE(with_signing_key.signed_payload(), with_ports.signed_payload());

  // The signature itself is never part of the payload
  auto signed_twice = with_signing_key;
  signed_twice.signature = "different";
  EXPECT_EQ(signed_twice.signed_payload(), with_signing_key.signed_payload());
}

TEST_F(WireTest, PairingRequestOptionalsSurvive) {
  AuthRequestPacket request;
  request.device_id = "abc";
  request.nonce = "n";
  request.signature = "s";
  request.device_type = core::DeviceType::Mobile;
  request.sealed_pin = "sealed";
  request.port = 5000;

  const auto parsed = parse_auth_request(serialize(request));
  EXPECT_EQ(parsed.device_type, core::DeviceType::Mobile);
  EXPECT_EQ(parsed.sealed_pin, "sealed");
  EXPECT_EQ(parsed.port, 5000);
  EXPECT_THROW(parse_auth_request(R"({"type":"pairing_request","device_id":"","nonce":"n","signature":"s"})"),
               core::SerializationError);
}

TEST_F(WireTest, PairingResponseWireFormat) {
  const auto j = nlohmann::json::parse(serialize(PairingResponse{true, "123456"}));
  EXPECT_EQ(j.at("accepted"), true);
  EXPECT_EQ(j.at("pin"), "123456");

  const auto rejected = parse_pairing_response(R"({"accepted":false})");
  EXPECT_FALSE(rejected.accepted);
  EXPECT_TRUE(rejected.pin.empty());
  EXPECT_THROW(parse_pairing_response(R"({"pin":"1"})"), core::SerializationError);
}

TEST_F(WireTest, FileHeaderDefaults) {
  const auto header = parse_file_header(R"({"transfer_id":"t1","file_name":"a.txt","file_size":42})");
  EXPECT_EQ(header.file_size, 42u);
  EXPECT_EQ(header.content_type, CONTENT_TYPE_FILE);
  EXPECT_FALSE(header.encrypted);
  EXPECT_FALSE(header.sender_id);
  EXPECT_THROW(parse_file_header(R"({"transfer_id":"t1","file_name":"a.txt","file_size":"big"})"),
               core::SerializationError);
}
