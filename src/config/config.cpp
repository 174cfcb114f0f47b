#include "config/config.hpp"
#include "core/error.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <fstream>
#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>

namespace pasteall::config {

std::uint16_t Config::effective_transfer_port() const {
    return transfer_port != 0 ? transfer_port : static_cast<std::uint16_t>(pairing_port + 1);
}

void Config::validate() const {
    if (device_name.empty()) {
        throw core::ConfigError("device_name must not be empty");
    }
    if (pairing_port == 0 || discovery_port == 0) {
        throw core::ConfigError("discovery_port and pairing_port must be non-zero");
    }
    if (transfer_port == 0 && pairing_port == 65535) {
        throw core::ConfigError("transfer_port cannot default to pairing_port + 1");
    }
    if (effective_transfer_port() == pairing_port) {
        throw core::ConfigError("transfer_port must differ from pairing_port");
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(broadcast_address, ec);
    if (ec) {
        throw core::ConfigError("Invalid broadcast_address '" + broadcast_address + "'");
    }

    if (discovery_interval.count() <= 0 || io_timeout.count() <= 0) {
        throw core::ConfigError("Intervals and timeouts must be positive");
    }
    if (download_dir.empty() || storage_path.empty()) {
        throw core::ConfigError("download_dir and storage_path must not be empty");
    }

    // Throws for unknown names
    logging::parse_severity(log_level);
}

Config Config::load(const std::string& path) {
    BOOST_LOG_TRIVIAL(info) << "Config: Loading " << path;

    std::ifstream file(path);
    if (!file) {
        throw core::ConfigError("Cannot open config file " + path);
    }

    Config config;
    try {
        config = nlohmann::json::parse(file).get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigError("Malformed config file " + path + ": " + e.what());
    }
    config.validate();
    return config;
}

void Config::save(const std::string& path) const {
    const auto parent = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw core::ConfigError("Cannot write config file " + path);
    }
    file << nlohmann::json(*this).dump(2) << '\n';
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"device_id", config.device_id},
        {"device_name", config.device_name},
        {"device_type", config.device_type},
        {"discovery_port", config.discovery_port},
        {"pairing_port", config.pairing_port},
        {"transfer_port", config.transfer_port},
        {"broadcast_address", config.broadcast_address},
        {"discovery_interval_ms", config.discovery_interval.count()},
        {"stale_after_s", config.stale_after.count()},
        {"io_timeout_ms", config.io_timeout.count()},
        {"download_dir", config.download_dir},
        {"storage_path", config.storage_path},
        {"capabilities", config.capabilities},
        {"auto_accept_pairing", config.auto_accept_pairing},
        {"pairing_approval_timeout_s", config.pairing_approval_timeout.count()},
        {"log_level", config.log_level},
        {"log_file", config.log_file}
    };
}

void from_json(const nlohmann::json& j, Config& config) {
    const Config defaults;
    config.device_id = j.value("device_id", defaults.device_id);
    config.device_name = j.value("device_name", defaults.device_name);
    config.device_type = j.value("device_type", defaults.device_type);
    config.discovery_port = j.value("discovery_port", defaults.discovery_port);
    config.pairing_port = j.value("pairing_port", defaults.pairing_port);
    config.transfer_port = j.value("transfer_port", defaults.transfer_port);
    config.broadcast_address = j.value("broadcast_address", defaults.broadcast_address);
    config.discovery_interval = std::chrono::milliseconds(
        j.value("discovery_interval_ms", static_cast<std::int64_t>(defaults.discovery_interval.count())));
    config.stale_after = std::chrono::seconds(
        j.value("stale_after_s", static_cast<std::int64_t>(defaults.stale_after.count())));
    config.io_timeout = std::chrono::milliseconds(
        j.value("io_timeout_ms", static_cast<std::int64_t>(defaults.io_timeout.count())));
    config.download_dir = j.value("download_dir", defaults.download_dir);
    config.storage_path = j.value("storage_path", defaults.storage_path);
    config.capabilities = j.value("capabilities", defaults.capabilities);
    config.auto_accept_pairing = j.value("auto_accept_pairing", defaults.auto_accept_pairing);
    config.pairing_approval_timeout = std::chrono::seconds(
        j.value("pairing_approval_timeout_s", static_cast<std::int64_t>(defaults.pairing_approval_timeout.count())));
    config.log_level = j.value("log_level", defaults.log_level);
    config.log_file = j.value("log_file", defaults.log_file);
}

} // namespace pasteall::config
