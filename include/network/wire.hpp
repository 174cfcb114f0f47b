#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace pasteall {
namespace network {

constexpr const char* PROTOCOL_VERSION = "1.0";
constexpr const char* DISCOVERY_PACKET_TYPE = "discovery";
constexpr const char* PAIRING_REQUEST_TYPE = "pairing_request";
constexpr const char* CONTENT_TYPE_FILE = "file";
constexpr const char* CONTENT_TYPE_CLIPBOARD = "clipboard";

// UDP presence announcement
struct DiscoveryPacket {
  std::string type = DISCOVERY_PACKET_TYPE;
  std::string device_id;
  std::string device_name;
  std::string public_key;
  std::uint64_t timestamp = 0;
  core::DeviceType device_type = core::DeviceType::Unknown;
  // Pairing port of the sender
  std::uint16_t port = 0;
  std::optional<std::string> ip_address;
  core::DeviceCapabilities capabilities;
  std::optional<std::string> app_version;
  std::optional<std::string> system_version;
  std::string protocol_version = PROTOCOL_VERSION;
  std::optional<std::string> signing_public_key;
  std::optional<std::uint16_t> transfer_port;

  static DiscoveryPacket from_device(const core::DeviceInfo& device, std::uint16_t pairing_port);
  // Online, seen now, unpaired
  core::DeviceInfo to_device_info() const;
};

// First message of the pairing handshake
struct AuthRequestPacket {
  std::string type = PAIRING_REQUEST_TYPE;
  std::string device_id;
  // Base64, single use
  std::string nonce;
  // Base64 Ed25519 signature over signed_payload()
  std::string signature;
  std::optional<std::string> device_name;
  std::optional<core::DeviceType> device_type;
  std::optional<std::string> public_key;
  std::optional<std::string> signing_public_key;
  // Base64 sealed box holding the initiator's PIN
  std::optional<std::string> sealed_pin;
  std::optional<std::uint16_t> port;
  std::optional<std::uint16_t> transfer_port;

  // Canonical text of every field except the signature, one "key=value" line
  // per present field in declaration order
  std::string signed_payload() const;
};

struct PairingResponse {
  bool accepted = false;
  std::string pin;
};

// Precedes every streamed file
struct FileHeader {
  std::string transfer_id;
  std::string file_name;
  std::uint64_t file_size = 0;
  std::optional<std::string> sender_id;
  std::string content_type = CONTENT_TYPE_FILE;
  bool encrypted = false;
};

// ---- SERIALIZATION ----
std::string serialize(const DiscoveryPacket& packet);
std::string serialize(const AuthRequestPacket& packet);
std::string serialize(const PairingResponse& response);
std::string serialize(const FileHeader& header);

// ---- PARSING ----
// All parsers throw SerializationError on malformed or mistyped input
DiscoveryPacket parse_discovery_packet(const std::string& data);
AuthRequestPacket parse_auth_request(const std::string& data);
PairingResponse parse_pairing_response(const std::string& data);
FileHeader parse_file_header(const std::string& data);

} // namespace network
} // namespace pasteall
