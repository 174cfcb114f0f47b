#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "discovery/device_table.hpp"
#include "discovery/discovery_service.hpp"

namespace pasteall {
namespace discovery {

constexpr const char* BLE_SERVICE_UUID = "00001000-0000-1000-8000-00805f9b34fb";
constexpr const char* BLE_DEVICE_INFO_CHAR_UUID = "00001001-0000-1000-8000-00805f9b34fb";

struct BlePeripheral {
  std::string address;
  std::string name;
};

// Platform Bluetooth stack as seen by discovery. Methods may throw NetworkError.
class BleCentral {
public:
  virtual ~BleCentral() = default;

  virtual std::vector<BlePeripheral> scan(std::chrono::milliseconds duration) = 0;
  virtual void connect(const BlePeripheral& peripheral) = 0;
  virtual std::vector<std::string> services(const BlePeripheral& peripheral) = 0;
  virtual std::vector<std::uint8_t> read_characteristic(const BlePeripheral& peripheral,
                                                        const std::string& service_uuid,
                                                        const std::string& characteristic_uuid) = 0;
  virtual void disconnect(const BlePeripheral& peripheral) = 0;
};

struct BleDiscoveryOptions {
  std::chrono::milliseconds scan_duration{5000};
  std::chrono::milliseconds rescan_interval{30000};
};

/**
 * Discovery over BLE. Each scan round connects to every peripheral, reads the
 * device info characteristic of the PasteAll service and disconnects.
 * Peripherals without the service or with unreadable info are skipped.
 */
class BleDiscovery : public DiscoveryService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BleDiscovery(const core::DeviceInfo& local_device, std::shared_ptr<BleCentral> central,
               BleDiscoveryOptions options = {});
  ~BleDiscovery() override;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start(DeviceCallback callback) override;
  void stop() override;
  bool is_running() const override { return is_running_; }


  // ---- DEVICE TABLE ----
  std::vector<core::DeviceInfo> get_devices() const override;
  std::optional<core::DeviceInfo> get_device(const std::string& device_id) const override;
  bool set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) override;
  std::size_t mark_stale(std::chrono::seconds max_age) override;


  // ---- SCANNING ----
  // Runs one scan round on the calling thread, returns how many devices were reported
  std::size_t scan_once();

private:
  // ---- PARAMETERS ----
  std::string local_id_;
  std::shared_ptr<BleCentral> central_;
  BleDiscoveryOptions options_;
  DeviceTable devices_;
  DeviceCallback callback_;

  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> scan_thread_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;


  // ---- SCANNING ----
  void scan_loop();
  std::optional<core::DeviceInfo> read_device(const BlePeripheral& peripheral);
};

} // namespace discovery
} // namespace pasteall
