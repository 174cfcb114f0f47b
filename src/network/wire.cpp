#include "network/wire.hpp"
#include "core/error.hpp"
#include <sstream>
#include <nlohmann/json.hpp>

namespace pasteall {
namespace network {

using nlohmann::json;

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

// Wraps nlohmann failures so callers only see SerializationError
template <typename Fn>
auto parse_json(const std::string& data, const char* what, Fn&& fn) -> decltype(fn(std::declval<const json&>())) {
  try {
    const json j = json::parse(data);
    if (!j.is_object()) {
      throw core::SerializationError(std::string(what) + " is not a JSON object");
    }
    return fn(j);
  } catch (const json::exception& e) {
    throw core::SerializationError(std::string("Malformed ") + what + ": " + e.what());
  }
}

} // namespace

//==============================================
// DISCOVERY PACKET
//==============================================

DiscoveryPacket DiscoveryPacket::from_device(const core::DeviceInfo& device, std::uint16_t pairing_port) {
  DiscoveryPacket packet;
  packet.device_id = device.id;
  packet.device_name = device.name;
  packet.public_key = device.public_key;
  packet.timestamp = core::unix_timestamp();
  packet.device_type = device.device_type;
  packet.port = pairing_port;
  packet.ip_address = device.ip_address;
  packet.capabilities = device.capabilities;
  packet.app_version = device.app_version;
  packet.system_version = device.system_version;
  packet.signing_public_key = device.signing_public_key;
  if (device.transfer_port != 0) {
    packet.transfer_port = device.transfer_port;
  }
  return packet;
}

core::DeviceInfo DiscoveryPacket::to_device_info() const {
  core::DeviceInfo device;
  device.id = device_id;
  device.name = device_name;
  device.device_type = device_type;
  device.public_key = public_key;
  device.signing_public_key = signing_public_key;
  device.ip_address = ip_address;
  device.capabilities = capabilities;
  device.app_version = app_version;
  device.system_version = system_version;
  device.pairing_port = port;
  device.transfer_port = transfer_port.value_or(0);
  device.set_online(true);
  return device;
}

std::string serialize(const DiscoveryPacket& packet) {
  json j{
    {"type", packet.type},
    {"device_id", packet.device_id},
    {"device_name", packet.device_name},
    {"public_key", packet.public_key},
    {"timestamp", packet.timestamp},
    {"device_type", packet.device_type},
    {"port", packet.port},
    {"capabilities", packet.capabilities},
    {"protocol_version", packet.protocol_version}
  };
  put_optional(j, "ip_address", packet.ip_address);
  put_optional(j, "app_version", packet.app_version);
  put_optional(j, "system_version", packet.system_version);
  put_optional(j, "signing_public_key", packet.signing_public_key);
  put_optional(j, "transfer_port", packet.transfer_port);
  return j.dump();
}

DiscoveryPacket parse_discovery_packet(const std::string& data) {
  return parse_json(data, "discovery packet", [](const json& j) {
    DiscoveryPacket packet;
    j.at("type").get_to(packet.type);
    if (packet.type != DISCOVERY_PACKET_TYPE) {
      throw core::SerializationError("Unexpected packet type: " + packet.type);
    }
    j.at("device_id").get_to(packet.device_id);
    if (packet.device_id.empty()) {
      throw core::SerializationError("Discovery packet without device id");
    }
    j.at("device_name").get_to(packet.device_name);
    j.at("public_key").get_to(packet.public_key);
    j.at("timestamp").get_to(packet.timestamp);
    j.at("device_type").get_to(packet.device_type);
    j.at("port").get_to(packet.port);
    packet.capabilities = j.value("capabilities", core::DeviceCapabilities{});
    packet.protocol_version = j.value("protocol_version", std::string(PROTOCOL_VERSION));
    packet.ip_address = get_optional<std::string>(j, "ip_address");
    packet.app_version = get_optional<std::string>(j, "app_version");
    packet.system_version = get_optional<std::string>(j, "system_version");
    packet.signing_public_key = get_optional<std::string>(j, "signing_public_key");
    packet.transfer_port = get_optional<std::uint16_t>(j, "transfer_port");
    return packet;
  });
}

//==============================================
// PAIRING
//==============================================

std::string serialize(const AuthRequestPacket& packet) {
  json j{
    {"type", packet.type},
    {"device_id", packet.device_id},
    {"nonce", packet.nonce},
    {"signature", packet.signature}
  };
  put_optional(j, "device_name", packet.device_name);
  put_optional(j, "device_type", packet.device_type);
  put_optional(j, "public_key", packet.public_key);
  put_optional(j, "signing_public_key", packet.signing_public_key);
  put_optional(j, "sealed_pin", packet.sealed_pin);
  put_optional(j, "port", packet.port);
  put_optional(j, "transfer_port", packet.transfer_port);
  return j.dump();
}

std::string AuthRequestPacket::signed_payload() const {
  std::ostringstream out;
  out << "type=" << type << '\n'
      << "device_id=" << device_id << '\n'
      << "nonce=" << nonce << '\n';
  if (device_name) {
    out << "device_name=" << *device_name << '\n';
  }
  if (device_type) {
    out << "device_type=" << core::device_type_to_string(*device_type) << '\n';
  }
  if (public_key) {
    out << "public_key=" << *public_key << '\n';
  }
  if (signing_public_key) {
    out << "signing_public_key=" << *signing_public_key << '\n';
  }
  if (sealed_pin) {
    out << "sealed_pin=" << *sealed_pin << '\n';
  }
  if (port) {
    out << "port=" << *port << '\n';
  }
  if (transfer_port) {
    out << "transfer_port=" << *transfer_port << '\n';
  }
  return out.str();
}

AuthRequestPacket parse_auth_request(const std::string& data) {
  return parse_json(data, "pairing request", [](const json& j) {
    AuthRequestPacket packet;
    j.at("type").get_to(packet.type);
    if (packet.type != PAIRING_REQUEST_TYPE) {
      throw core::SerializationError("Unexpected packet type: " + packet.type);
    }
    j.at("device_id").get_to(packet.device_id);
    j.at("nonce").get_to(packet.nonce);
    j.at("signature").get_to(packet.signature);
    if (packet.device_id.empty() || packet.nonce.empty()) {
      throw core::SerializationError("Pairing request without device id or nonce");
    }
    packet.device_name = get_optional<std::string>(j, "device_name");
    packet.device_type = get_optional<core::DeviceType>(j, "device_type");
    packet.public_key = get_optional<std::string>(j, "public_key");
    packet.signing_public_key = get_optional<std::string>(j, "signing_public_key");
    packet.sealed_pin = get_optional<std::string>(j, "sealed_pin");
    packet.port = get_optional<std::uint16_t>(j, "port");
    packet.transfer_port = get_optional<std::uint16_t>(j, "transfer_port");
    return packet;
  });
}

std::string serialize(const PairingResponse& response) {
  return json{{"accepted", response.accepted}, {"pin", response.pin}}.dump();
}

PairingResponse parse_pairing_response(const std::string& data) {
  return parse_json(data, "pairing response", [](const json& j) {
    PairingResponse response;
    j.at("accepted").get_to(response.accepted);
    response.pin = j.value("pin", std::string());
    return response;
  });
}

//==============================================
// TRANSFER
//==============================================

std::string serialize(const FileHeader& header) {
  json j{
    {"transfer_id", header.transfer_id},
    {"file_name", header.file_name},
    {"file_size", header.file_size},
    {"content_type", header.content_type},
    {"encrypted", header.encrypted}
  };
  put_optional(j, "sender_id", header.sender_id);
  return j.dump();
}

FileHeader parse_file_header(const std::string& data) {
  return parse_json(data, "file header", [](const json& j) {
    FileHeader header;
    j.at("transfer_id").get_to(header.transfer_id);
    j.at("file_name").get_to(header.file_name);
    j.at("file_size").get_to(header.file_size);
    header.sender_id = get_optional<std::string>(j, "sender_id");
    header.content_type = j.value("content_type", std::string(CONTENT_TYPE_FILE));
    header.encrypted = j.value("encrypted", false);
    if (header.transfer_id.empty()) {
      throw core::SerializationError("File header without transfer id");
    }
    return header;
  });
}

} // namespace network
} // namespace pasteall
