#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config/config.hpp"
#include "core/event_channel.hpp"
#include "core/types.hpp"
#include "crypto/crypto_engine.hpp"
#include "discovery/discovery_service.hpp"
#include "pairing/pairing_manager.hpp"
#include "store/device_store.hpp"
#include "transfer/transfer_service.hpp"

namespace pasteall {
namespace node {

constexpr const char* APP_VERSION = "0.1.0";

// Builds the discovery transport once the local device is known
using DiscoveryFactory = std::function<std::unique_ptr<discovery::DiscoveryService>(const core::DeviceInfo& local_device)>;

/**
 * Composition root of a running device.
 *
 * Owns the store, the crypto identity, the event channel and every service,
 * and hands them to each other by reference. Service callbacks are bridged into
 * the event channel.
 */
class Node {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Uses UdpDiscovery built from config when no factory is given
  explicit Node(config::Config config, DiscoveryFactory discovery_factory = nullptr);
  ~Node();

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts pairing listener, transfer server and discovery
  bool start();
  // Stops every service in reverse order
  bool shutdown();
  bool is_started() const { return started_; }


  // ---- PAIRING APPROVAL ----
  // Answers a waiting PairingRequestEvent, false when nothing is waiting for device_id
  bool respond_to_pairing(const std::string& device_id, bool accept);
  std::vector<std::string> pending_pairing_requests() const;


  // ---- LOOKUP ----
  // Discovered devices first, then paired ones
  std::optional<core::DeviceInfo> find_device(const std::string& device_id) const;
  // Marks devices silent for longer than the configured window offline
  std::size_t refresh_devices();


  // ---- GETTERS ----
  const config::Config& get_config() const { return config_; }
  const core::DeviceInfo& get_local_device() const { return local_device_; }
  crypto::CryptoEngine& get_crypto() { return *crypto_; }
  core::EventChannel& get_events() { return events_; }
  store::DeviceStore& get_store() { return *store_; }
  discovery::DiscoveryService& get_discovery() { return *discovery_; }
  pairing::PairingManager& get_pairing() { return *pairing_; }
  transfer::TransferService& get_transfer() { return *transfer_; }

private:
  // ---- PARAMETERS ----
  config::Config config_;
  std::unique_ptr<store::FileDeviceStore> store_;
  std::unique_ptr<crypto::CryptoEngine> crypto_;
  core::DeviceInfo local_device_;
  core::EventChannel events_;

  std::unique_ptr<discovery::DiscoveryService> discovery_;
  std::unique_ptr<pairing::PairingManager> pairing_;
  std::unique_ptr<transfer::TransferService> transfer_;

  bool started_ = false;

  mutable std::mutex approvals_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::promise<bool>>> approvals_;


  // ---- SETUP ----
  // Loads the persisted identity or creates and saves a new one
  void load_identity();
  void build_local_device();
  void wire_callbacks();


  // ---- CALLBACK BRIDGES ----
  void on_device_discovered(const core::DeviceInfo& device);
  void on_pairing_status(const core::DeviceInfo& device, core::PairingStatus status);
  bool on_pairing_request(const core::DeviceInfo& device, const std::string& pin);
};

} // namespace node
} // namespace pasteall
