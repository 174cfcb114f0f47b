#include "discovery/ble_discovery.hpp"
#include "core/error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace pasteall {
namespace discovery {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BleDiscovery::BleDiscovery(const core::DeviceInfo& local_device, std::shared_ptr<BleCentral> central,
                           BleDiscoveryOptions options)
  : local_id_(local_device.id)
  , central_(std::move(central))
  , options_(options) {
  if (!central_) {
    throw core::DiscoveryError("BLE discovery requires a central");
  }
  BOOST_LOG_TRIVIAL(info) << "BLE discovery: Initializing for device " << local_id_;
}

BleDiscovery::~BleDiscovery() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool BleDiscovery::start(DeviceCallback callback) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "BLE discovery: Already running";
    return true;
  }

  callback_ = std::move(callback);
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = false;
  }
  is_running_ = true;
  scan_thread_ = std::make_unique<std::thread>(&BleDiscovery::scan_loop, this);

  BOOST_LOG_TRIVIAL(info) << "BLE discovery: Started";
  return true;
}

void BleDiscovery::stop() {
  if (!scan_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "BLE discovery: Stopping";
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (scan_thread_->joinable()) {
    scan_thread_->join();
  }
  scan_thread_.reset();
  is_running_ = false;
  BOOST_LOG_TRIVIAL(info) << "BLE discovery: Stopped";
}


//==============================================
// DEVICE TABLE
//==============================================

std::vector<core::DeviceInfo> BleDiscovery::get_devices() const {
  return devices_.list();
}

std::optional<core::DeviceInfo> BleDiscovery::get_device(const std::string& device_id) const {
  return devices_.find(device_id);
}

bool BleDiscovery::set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) {
  return devices_.set_pairing_status(device_id, status, trusted);
}

std::size_t BleDiscovery::mark_stale(std::chrono::seconds max_age) {
  return devices_.mark_stale(max_age, core::unix_timestamp());
}


//==============================================
// SCANNING
//==============================================

void BleDiscovery::scan_loop() {
  while (true) {
    try {
      scan_once();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "BLE discovery: Scan round failed: " << e.what();
    }

    std::unique_lock<std::mutex> lock(stop_mutex_);
    if (stop_cv_.wait_for(lock, options_.rescan_interval, [this]() { return stop_requested_; })) {
      break;
    }
    BOOST_LOG_TRIVIAL(debug) << "BLE discovery: Rescanning";
  }
}

std::size_t BleDiscovery::scan_once() {
  const auto peripherals = central_->scan(options_.scan_duration);
  BOOST_LOG_TRIVIAL(debug) << "BLE discovery: Scan found " << peripherals.size() << " peripherals";

  std::size_t reported = 0;
  for (const auto& peripheral : peripherals) {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      if (stop_requested_) {
        break;
      }
    }

    auto device = read_device(peripheral);
    if (!device || device->id == local_id_) {
      continue;
    }

    const core::DeviceInfo stored = devices_.upsert(*device);
    ++reported;
    if (callback_) {
      try {
        callback_(stored);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "BLE discovery: Device callback threw: " << e.what();
      }
    }
  }
  return reported;
}

std::optional<core::DeviceInfo> BleDiscovery::read_device(const BlePeripheral& peripheral) {
  try {
    central_->connect(peripheral);
  } catch (const core::Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "BLE discovery: Cannot connect to " << peripheral.address << ": " << e.what();
    return std::nullopt;
  }

  std::optional<core::DeviceInfo> device;
  try {
    const auto services = central_->services(peripheral);
    if (std::find(services.begin(), services.end(), BLE_SERVICE_UUID) != services.end()) {
      const auto data = central_->read_characteristic(peripheral, BLE_SERVICE_UUID, BLE_DEVICE_INFO_CHAR_UUID);
      auto info = nlohmann::json::parse(data.begin(), data.end()).get<core::DeviceInfo>();
      if (info.id.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "BLE discovery: Device info from " << peripheral.address << " has no id";
      } else {
        info.set_online(true);
        info.pairing_status = core::PairingStatus::Unpaired;
        info.trusted = false;
        device = std::move(info);
      }
    }
  } catch (const core::Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "BLE discovery: Cannot read " << peripheral.address << ": " << e.what();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "BLE discovery: Malformed device info from " << peripheral.address << ": " << e.what();
  }

  try {
    central_->disconnect(peripheral);
  } catch (const core::Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "BLE discovery: Disconnect from " << peripheral.address << " failed: " << e.what();
  }
  return device;
}

} // namespace discovery
} // namespace pasteall
