#ifndef PASTEALL_CORE_TYPES_HPP
#define PASTEALL_CORE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace pasteall::core {

//==============================================
// DEVICE
//==============================================

enum class DeviceType {
    Desktop,
    Mobile,
    Unknown
};

NLOHMANN_JSON_SERIALIZE_ENUM(DeviceType, {
    {DeviceType::Unknown, "Unknown"},
    {DeviceType::Desktop, "Desktop"},
    {DeviceType::Mobile, "Mobile"},
})

enum class PairingStatus {
    Unpaired,
    RequestSent,
    RequestReceived,
    Paired
};

NLOHMANN_JSON_SERIALIZE_ENUM(PairingStatus, {
    {PairingStatus::Unpaired, "Unpaired"},
    {PairingStatus::RequestSent, "RequestSent"},
    {PairingStatus::RequestReceived, "RequestReceived"},
    {PairingStatus::Paired, "Paired"},
})

struct DeviceCapabilities {
    bool supports_files = true;
    bool supports_images = true;
    bool supports_ble = false;
    bool supports_wifi_direct = true;
    bool supports_nfc = false;
    bool supports_background = true;
    // In MiB
    std::uint64_t max_file_size = 1024;

    bool operator==(const DeviceCapabilities& other) const;
};

struct DeviceInfo {
    std::string id;
    std::string name;
    DeviceType device_type = DeviceType::Unknown;
    // Base64 X25519 public key
    std::string public_key;
    // Base64 Ed25519 verification key
    std::optional<std::string> signing_public_key;
    std::optional<std::string> ip_address;
    bool online = false;
    // Unix seconds
    std::uint64_t last_seen = 0;
    DeviceCapabilities capabilities;
    PairingStatus pairing_status = PairingStatus::Unpaired;
    bool trusted = false;
    std::optional<std::string> app_version;
    std::optional<std::string> system_version;
    std::optional<std::string> description;
    // 0 when the peer did not advertise one
    std::uint16_t pairing_port = 0;
    std::uint16_t transfer_port = 0;

    // New device with a random id, online and seen now
    static DeviceInfo create(const std::string& name, DeviceType type, const std::string& public_key);

    // Overwrites the mutable fields from a fresher observation of the same device.
    // Identity, pairing status and trust are kept.
    void update_from(const DeviceInfo& other);

    void set_online(bool online);
};

//==============================================
// TRANSFER
//==============================================

enum class TransferStatus {
    Starting,
    InProgress,
    Completed,
    Failed,
    Canceled
};

enum class TransferDirection {
    Outgoing,
    Incoming
};

struct TransferProgress {
    std::string id;
    std::string device_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    TransferStatus status = TransferStatus::Starting;
    TransferDirection direction = TransferDirection::Outgoing;
    // Set when status is Failed
    std::string reason;

    double percentage() const;
    bool is_finished() const;
};

//==============================================
// HELPERS
//==============================================

std::uint64_t unix_timestamp();
std::string generate_uuid();

std::string device_type_to_string(DeviceType type);
DeviceType device_type_from_string(const std::string& value);
std::string pairing_status_to_string(PairingStatus status);
std::string transfer_status_to_string(TransferStatus status);

std::ostream& operator<<(std::ostream& os, DeviceType type);
std::ostream& operator<<(std::ostream& os, PairingStatus status);
std::ostream& operator<<(std::ostream& os, TransferStatus status);

void to_json(nlohmann::json& j, const DeviceCapabilities& caps);
void from_json(const nlohmann::json& j, DeviceCapabilities& caps);
void to_json(nlohmann::json& j, const DeviceInfo& device);
void from_json(const nlohmann::json& j, DeviceInfo& device);

} // namespace pasteall::core

#endif // PASTEALL_CORE_TYPES_HPP
