#include "core/types.hpp"
#include <chrono>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace pasteall::core {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& value) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    value = it->get<T>();
  } else {
    value.reset();
  }
}

} // namespace

//==============================================
// DEVICE
//==============================================

bool DeviceCapabilities::operator==(const DeviceCapabilities& other) const {
  return supports_files == other.supports_files &&
         supports_images == other.supports_images &&
         supports_ble == other.supports_ble &&
         supports_wifi_direct == other.supports_wifi_direct &&
         supports_nfc == other.supports_nfc &&
         supports_background == other.supports_background &&
         max_file_size == other.max_file_size;
}

DeviceInfo DeviceInfo::create(const std::string& name, DeviceType type, const std::string& public_key) {
  DeviceInfo device;
  device.id = generate_uuid();
  device.name = name;
  device.device_type = type;
  device.public_key = public_key;
  device.set_online(true);
  return device;
}

void DeviceInfo::update_from(const DeviceInfo& other) {
  name = other.name;
  device_type = other.device_type;
  online = other.online;
  capabilities = other.capabilities;

  if (!other.public_key.empty()) {
    public_key = other.public_key;
  }
  if (other.signing_public_key) {
    signing_public_key = other.signing_public_key;
  }
  if (other.ip_address) {
    ip_address = other.ip_address;
  }
  if (other.app_version) {
    app_version = other.app_version;
  }
  if (other.system_version) {
    system_version = other.system_version;
  }
  if (other.description) {
    description = other.description;
  }
  if (other.last_seen != 0) {
    last_seen = other.last_seen;
  }
  if (other.pairing_port != 0) {
    pairing_port = other.pairing_port;
  }
  if (other.transfer_port != 0) {
    transfer_port = other.transfer_port;
  }
}

void DeviceInfo::set_online(bool value) {
  online = value;
  if (online) {
    last_seen = unix_timestamp();
  }
}

//==============================================
// TRANSFER
//==============================================

double TransferProgress::percentage() const {
  if (total_bytes == 0) {
    return status == TransferStatus::Completed ? 100.0 : 0.0;
  }
  return static_cast<double>(transferred_bytes) * 100.0 / static_cast<double>(total_bytes);
}

bool TransferProgress::is_finished() const {
  return status == TransferStatus::Completed ||
         status == TransferStatus::Failed ||
         status == TransferStatus::Canceled;
}

//==============================================
// HELPERS
//==============================================

std::uint64_t unix_timestamp() {
  return static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string generate_uuid() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

std::string device_type_to_string(DeviceType type) {
  switch (type) {
    case DeviceType::Desktop: return "Desktop";
    case DeviceType::Mobile:  return "Mobile";
    case DeviceType::Unknown: return "Unknown";
  }
  return "Unknown";
}

DeviceType device_type_from_string(const std::string& value) {
  if (value == "Desktop" || value == "desktop") {
    return DeviceType::Desktop;
  }
  if (value == "Mobile" || value == "mobile") {
    return DeviceType::Mobile;
  }
  return DeviceType::Unknown;
}

std::string pairing_status_to_string(PairingStatus status) {
  switch (status) {
    case PairingStatus::Unpaired:        return "Unpaired";
    case PairingStatus::RequestSent:     return "RequestSent";
    case PairingStatus::RequestReceived: return "RequestReceived";
    case PairingStatus::Paired:          return "Paired";
  }
  return "Unknown";
}

std::string transfer_status_to_string(TransferStatus status) {
  switch (status) {
    case TransferStatus::Starting:   return "Starting";
    case TransferStatus::InProgress: return "InProgress";
    case TransferStatus::Completed:  return "Completed";
    case TransferStatus::Failed:     return "Failed";
    case TransferStatus::Canceled:   return "Canceled";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, DeviceType type) {
  return os << device_type_to_string(type);
}

std::ostream& operator<<(std::ostream& os, PairingStatus status) {
  return os << pairing_status_to_string(status);
}

std::ostream& operator<<(std::ostream& os, TransferStatus status) {
  return os << transfer_status_to_string(status);
}

//==============================================
// JSON
//==============================================

void to_json(nlohmann::json& j, const DeviceCapabilities& caps) {
  j = nlohmann::json{
    {"supports_files", caps.supports_files},
    {"supports_images", caps.supports_images},
    {"supports_ble", caps.supports_ble},
    {"supports_wifi_direct", caps.supports_wifi_direct},
    {"supports_nfc", caps.supports_nfc},
    {"supports_background", caps.supports_background},
    {"max_file_size", caps.max_file_size}
  };
}

// Missing keys keep their defaults
void from_json(const nlohmann::json& j, DeviceCapabilities& caps) {
  DeviceCapabilities defaults;
  caps.supports_files = j.value("supports_files", defaults.supports_files);
  caps.supports_images = j.value("supports_images", defaults.supports_images);
  caps.supports_ble = j.value("supports_ble", defaults.supports_ble);
  caps.supports_wifi_direct = j.value("supports_wifi_direct", defaults.supports_wifi_direct);
  caps.supports_nfc = j.value("supports_nfc", defaults.supports_nfc);
  caps.supports_background = j.value("supports_background", defaults.supports_background);
  caps.max_file_size = j.value("max_file_size", defaults.max_file_size);
}

void to_json(nlohmann::json& j, const DeviceInfo& device) {
  j = nlohmann::json{
    {"id", device.id},
    {"name", device.name},
    {"device_type", device.device_type},
    {"public_key", device.public_key},
    {"online", device.online},
    {"last_seen", device.last_seen},
    {"capabilities", device.capabilities},
    {"pairing_status", device.pairing_status},
    {"trusted", device.trusted},
    {"pairing_port", device.pairing_port},
    {"transfer_port", device.transfer_port}
  };
  put_optional(j, "signing_public_key", device.signing_public_key);
  put_optional(j, "ip_address", device.ip_address);
  put_optional(j, "app_version", device.app_version);
  put_optional(j, "system_version", device.system_version);
  put_optional(j, "description", device.description);
}

void from_json(const nlohmann::json& j, DeviceInfo& device) {
  j.at("id").get_to(device.id);
  j.at("name").get_to(device.name);
  device.device_type = j.value("device_type", DeviceType::Unknown);
  device.public_key = j.value("public_key", std::string());
  device.online = j.value("online", false);
  device.last_seen = j.value("last_seen", std::uint64_t{0});
  device.capabilities = j.value("capabilities", DeviceCapabilities{});
  device.pairing_status = j.value("pairing_status", PairingStatus::Unpaired);
  device.trusted = j.value("trusted", false);
  device.pairing_port = j.value("pairing_port", std::uint16_t{0});
  device.transfer_port = j.value("transfer_port", std::uint16_t{0});
  get_optional(j, "signing_public_key", device.signing_public_key);
  get_optional(j, "ip_address", device.ip_address);
  get_optional(j, "app_version", device.app_version);
  get_optional(j, "system_version", device.system_version);
  get_optional(j, "description", device.description);
}

} // namespace pasteall::core
