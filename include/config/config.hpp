#ifndef PASTEALL_CONFIG_HPP
#define PASTEALL_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace pasteall::config {

constexpr std::uint16_t DEFAULT_DISCOVERY_PORT = 45678;
constexpr std::uint16_t DEFAULT_PAIRING_PORT = 45680;

/**
 * Node settings. Every key is optional in the JSON file; absent keys keep the
 * defaults below.
 */
struct Config {
    // Empty: taken from the stored identity, or generated on first start
    std::string device_id;
    std::string device_name = "pasteall";
    core::DeviceType device_type = core::DeviceType::Desktop;

    std::uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;
    std::uint16_t pairing_port = DEFAULT_PAIRING_PORT;
    // 0 means pairing_port + 1
    std::uint16_t transfer_port = 0;
    std::string broadcast_address = "255.255.255.255";
    std::chrono::milliseconds discovery_interval{5000};
    // Devices silent for this long are shown offline
    std::chrono::seconds stale_after{30};

    std::chrono::milliseconds io_timeout{10000};
    std::string download_dir = "downloads";
    std::string storage_path = ".pasteall";
    core::DeviceCapabilities capabilities;

    // Accept every pairing request that carries a PIN without asking
    bool auto_accept_pairing = false;
    // How long an interactive pairing request waits for an answer
    std::chrono::seconds pairing_approval_timeout{60};

    std::string log_level = "info";
    std::string log_file;

    std::uint16_t effective_transfer_port() const;

    // Throws ConfigError on the first invalid value
    void validate() const;

    // Throws ConfigError when the file is unreadable or malformed
    static Config load(const std::string& path);
    void save(const std::string& path) const;
};

void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

} // namespace pasteall::config

#endif // PASTEALL_CONFIG_HPP
